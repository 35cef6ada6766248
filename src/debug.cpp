/*
 * debug.cpp - Channel-filtered diagnostic logging
 * This file is part of TagSplice.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * TagSplice is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#include "tagsplice.h"
#include <ctime>

std::ofstream Debug::m_logfile;
std::mutex Debug::m_mutex;
std::unordered_set<std::string> Debug::m_enabled_channels;

void Debug::init(const std::string& logfile, const std::vector<std::string>& channels) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!logfile.empty()) {
        if (m_logfile.is_open()) {
            m_logfile.close();
        }
        m_logfile.open(logfile, std::ios::out | std::ios::app);
        if (!m_logfile.is_open()) {
            std::cerr << "Debug::init() - cannot open log file " << logfile
                      << ", logging to stderr" << std::endl;
        }
    }
    m_enabled_channels.insert(channels.begin(), channels.end());
}

void Debug::initFromEnvironment() {
    const char* channels = std::getenv("TAGSPLICE_DEBUG");
    if (!channels || !*channels) {
        return;
    }
    const char* logfile = std::getenv("TAGSPLICE_DEBUG_FILE");
    init(logfile ? logfile : "", parseChannelList(channels));
}

void Debug::shutdown() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_logfile.is_open()) {
        m_logfile.close();
    }
    m_enabled_channels.clear();
}

bool Debug::isChannelEnabled(const std::string& channel) {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_enabled_channels.count("all") > 0 || m_enabled_channels.count(channel) > 0;
}

std::vector<std::string> Debug::parseChannelList(const std::string& list) {
    std::vector<std::string> channels;
    std::istringstream in(list);
    std::string item;
    while (std::getline(in, item, ',')) {
        size_t first = item.find_first_not_of(" \t");
        if (first == std::string::npos) {
            continue;
        }
        size_t last = item.find_last_not_of(" \t");
        channels.push_back(item.substr(first, last - first + 1));
    }
    return channels;
}

void Debug::write(const std::string& channel, const std::string& function, int line, const std::string& message) {
    auto now = std::chrono::system_clock::now();
    auto us = std::chrono::duration_cast<std::chrono::microseconds>(now.time_since_epoch()) % 1000000;
    auto timer = std::chrono::system_clock::to_time_t(now);
    std::tm bt{};
    localtime_r(&timer, &bt);

    std::ostringstream ss;
    ss << std::put_time(&bt, "%H:%M:%S") << '.' << std::setfill('0') << std::setw(6) << us.count()
       << " [" << channel << "]";
    if (!function.empty()) {
        ss << " " << function << ":" << line;
    }
    ss << ": " << message << '\n';

    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_logfile.is_open()) {
        m_logfile << ss.str();
        m_logfile.flush();
    } else {
        std::cerr << ss.str();
    }
}

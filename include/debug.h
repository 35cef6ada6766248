/*
 * debug.h - Channel-filtered diagnostic logging
 * This file is part of TagSplice.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * TagSplice is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef DEBUG_H
#define DEBUG_H

// No direct includes - all includes should be in tagsplice.h

/**
 * @brief Process-wide diagnostic log
 *
 * Messages go to a named channel ("storage", "unsynch", "io", "raii") and
 * are dropped unless that channel, or "all", has been enabled. Output goes
 * to the log file given to init(), or to stderr when there is none. Lines
 * look like:
 *
 *   14:03:07.123456 [storage] flush:88: growing region by 90 bytes
 *
 * All members are safe to call from any thread.
 */
class Debug {
public:
    /**
     * @brief Enable channels and optionally direct output to a file
     * @param logfile File to append to; empty means stderr
     * @param channels Channels to enable in addition to those already on
     */
    static void init(const std::string& logfile, const std::vector<std::string>& channels);

    /**
     * @brief init() from TAGSPLICE_DEBUG (a comma-separated channel list)
     *        and TAGSPLICE_DEBUG_FILE; does nothing if TAGSPLICE_DEBUG is unset
     */
    static void initFromEnvironment();

    /**
     * @brief Close the log file and disable every channel
     */
    static void shutdown();

    static bool isChannelEnabled(const std::string& channel);

    /**
     * @brief Split "a, b,,c" into {"a", "b", "c"}
     */
    static std::vector<std::string> parseChannelList(const std::string& list);

    template<typename... Args>
    static inline void log(const std::string& channel, Args&&... args) {
        if (isChannelEnabled(channel)) {
            write(channel, "", 0, format(std::forward<Args>(args)...));
        }
    }

    // Use DEBUG_LOG rather than calling this directly.
    template<typename... Args>
    static inline void logAt(const std::string& channel, const char* function, int line, Args&&... args) {
        if (isChannelEnabled(channel)) {
            write(channel, function, line, format(std::forward<Args>(args)...));
        }
    }

private:
    template<typename... Args>
    static std::string format(Args&&... args) {
        std::ostringstream ss;
        if constexpr (sizeof...(args) > 0) {
            (ss << ... << args);
        }
        return ss.str();
    }

    static void write(const std::string& channel, const std::string& function, int line, const std::string& message);

    static std::ofstream m_logfile;
    static std::mutex m_mutex;
    static std::unordered_set<std::string> m_enabled_channels;
};

// Log with the calling function and line number
#define DEBUG_LOG(channel, ...) Debug::logAt(channel, __FUNCTION__, __LINE__, __VA_ARGS__)

#endif // DEBUG_H

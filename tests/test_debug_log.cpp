/*
 * test_debug_log.cpp - Tests for channel-filtered debug logging
 * This file is part of TagSplice.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * TagSplice is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#include "tagsplice.h"
#include "test_framework.h"

using namespace TestFramework;

namespace {

// Each test starts and ends with logging switched off.
class LogTestCase : public TestCase {
public:
    explicit LogTestCase(const std::string& name) : TestCase(name) {}
protected:
    void setUp() override {
        Debug::shutdown();
        m_log = std::make_unique<TempFile>("tagsplice_debug");
    }

    void tearDown() override {
        Debug::shutdown();
        m_log.reset();
    }

    std::unique_ptr<TempFile> m_log;
};

size_t countLines(const std::string& text) {
    return static_cast<size_t>(std::count(text.begin(), text.end(), '\n'));
}

} // namespace

class Debug_ParseChannelList : public TestCase {
public:
    Debug_ParseChannelList() : TestCase("Debug_ParseChannelList") {}
protected:
    void runTest() override {
        std::vector<std::string> channels = Debug::parseChannelList(" storage, unsynch,,io ,");
        ASSERT_EQUALS(3u, channels.size(), "empty items are skipped");
        ASSERT_EQUALS(std::string("storage"), channels[0], "leading blank trimmed");
        ASSERT_EQUALS(std::string("unsynch"), channels[1], "second channel");
        ASSERT_EQUALS(std::string("io"), channels[2], "trailing blank trimmed");
        ASSERT_TRUE(Debug::parseChannelList("").empty(), "empty list");
    }
};

class Debug_OnlyEnabledChannelsAreWritten : public LogTestCase {
public:
    Debug_OnlyEnabledChannelsAreWritten() : LogTestCase("Debug_OnlyEnabledChannelsAreWritten") {}
protected:
    void runTest() override {
        Debug::init(m_log->path(), { "storage" });
        ASSERT_TRUE(Debug::isChannelEnabled("storage"), "storage enabled");
        ASSERT_FALSE(Debug::isChannelEnabled("unsynch"), "unsynch not enabled");

        Debug::log("storage", "region ", 4, "..", 13);
        Debug::log("unsynch", "dropped");
        Debug::shutdown();

        std::string contents = m_log->contents();
        ASSERT_EQUALS(1u, countLines(contents), "one line written");
        ASSERT_TRUE(contents.find("[storage]: region 4..13") != std::string::npos,
                    "channel and message, got: " + contents);
        ASSERT_TRUE(contents.find("dropped") == std::string::npos, "disabled channel is silent");
    }
};

class Debug_AllEnablesEveryChannel : public LogTestCase {
public:
    Debug_AllEnablesEveryChannel() : LogTestCase("Debug_AllEnablesEveryChannel") {}
protected:
    void runTest() override {
        Debug::init(m_log->path(), { "all" });
        Debug::log("io", "first");
        Debug::log("raii", "second");
        Debug::shutdown();

        ASSERT_EQUALS(2u, countLines(m_log->contents()), "both channels written");
        ASSERT_FALSE(Debug::isChannelEnabled("io"), "shutdown disables channels");
    }
};

class Debug_MacroAddsLocation : public LogTestCase {
public:
    Debug_MacroAddsLocation() : LogTestCase("Debug_MacroAddsLocation") {}
protected:
    void runTest() override {
        Debug::init(m_log->path(), { "unsynch" });
        int expected_line = __LINE__ + 1;
        DEBUG_LOG("unsynch", "inserted ", 3, " stuffing bytes");
        Debug::shutdown();

        std::string contents = m_log->contents();
        std::string location = std::string("runTest:") + std::to_string(expected_line) + ": ";
        ASSERT_TRUE(contents.find("[unsynch] " + location + "inserted 3 stuffing bytes") != std::string::npos,
                    "function and line in the log line, got: " + contents);
    }
};

class Debug_InitFromEnvironment : public LogTestCase {
public:
    Debug_InitFromEnvironment() : LogTestCase("Debug_InitFromEnvironment") {}
protected:
    void runTest() override {
        unsetenv("TAGSPLICE_DEBUG");
        Debug::initFromEnvironment();
        ASSERT_FALSE(Debug::isChannelEnabled("storage"), "unset variable enables nothing");

        setenv("TAGSPLICE_DEBUG", "storage,io", 1);
        setenv("TAGSPLICE_DEBUG_FILE", m_log->path().c_str(), 1);
        Debug::initFromEnvironment();
        unsetenv("TAGSPLICE_DEBUG");
        unsetenv("TAGSPLICE_DEBUG_FILE");

        ASSERT_TRUE(Debug::isChannelEnabled("storage"), "storage from the environment");
        ASSERT_TRUE(Debug::isChannelEnabled("io"), "io from the environment");
        ASSERT_FALSE(Debug::isChannelEnabled("raii"), "raii not listed");

        Debug::log("io", "to the file");
        Debug::shutdown();
        ASSERT_TRUE(m_log->contents().find("[io]: to the file") != std::string::npos,
                    "TAGSPLICE_DEBUG_FILE selects the log file");
    }
};

int main(int argc, char* argv[]) {
    (void)argc;
    (void)argv;

    TestSuite suite("Debug Log Tests");

    suite.addTest(std::make_unique<Debug_ParseChannelList>());
    suite.addTest(std::make_unique<Debug_OnlyEnabledChannelsAreWritten>());
    suite.addTest(std::make_unique<Debug_AllEnablesEveryChannel>());
    suite.addTest(std::make_unique<Debug_MacroAddsLocation>());
    suite.addTest(std::make_unique<Debug_InitFromEnvironment>());

    auto results = suite.runAll();
    suite.printResults(results);

    return suite.getFailureCount(results) > 0 ? 1 : 0;
}

/*
 * test_raii_file_handle.cpp - Unit tests for RAIIFileHandle
 * This file is part of TagSplice.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * TagSplice is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#include "tagsplice.h"
#include "test_framework.h"

using TagSplice::IO::RAIIFileHandle;
using namespace TestFramework;

class RAIIFileHandle_DefaultIsEmpty : public TestCase {
public:
    RAIIFileHandle_DefaultIsEmpty() : TestCase("RAIIFileHandle_DefaultIsEmpty") {}
protected:
    void runTest() override {
        RAIIFileHandle handle;
        ASSERT_FALSE(handle.is_valid(), "default handle is invalid");
        ASSERT_NULL(handle.get(), "get() is null");
        ASSERT_EQUALS(0, handle.close(), "closing an empty handle succeeds");

        errno = 0;
        ASSERT_EQUALS(-1, handle.truncate(0), "truncate without a stream");
        ASSERT_EQUALS(EBADF, errno, "EBADF from truncate");
        errno = 0;
        ASSERT_EQUALS(static_cast<off_t>(-1), handle.size(), "size without a stream");
        ASSERT_EQUALS(EBADF, errno, "EBADF from size");
    }
};

class RAIIFileHandle_OpenAndClose : public TestCase {
public:
    RAIIFileHandle_OpenAndClose() : TestCase("RAIIFileHandle_OpenAndClose") {}
protected:
    void runTest() override {
        TempFile temp("tagsplice_raii");
        RAIIFileHandle handle;
        ASSERT_TRUE(handle.open(temp.path().c_str(), "r+b"), "open existing file");
        ASSERT_TRUE(handle.is_valid(), "valid after open");
        ASSERT_EQUALS(0, handle.close(), "close succeeds");
        ASSERT_FALSE(handle.is_valid(), "invalid after close");
        ASSERT_EQUALS(0, handle.close(), "second close is harmless");
    }
};

class RAIIFileHandle_OpenFailureSetsErrno : public TestCase {
public:
    RAIIFileHandle_OpenFailureSetsErrno() : TestCase("RAIIFileHandle_OpenFailureSetsErrno") {}
protected:
    void runTest() override {
        RAIIFileHandle handle;
        errno = 0;
        ASSERT_FALSE(handle.open("/nonexistent/dir/file", "r+b"), "missing file");
        ASSERT_EQUALS(ENOENT, errno, "errno describes the failure");
        ASSERT_FALSE(handle.is_valid(), "still invalid");

        ASSERT_FALSE(handle.open(nullptr, "r+b"), "null filename");
        ASSERT_EQUALS(EINVAL, errno, "EINVAL for bad parameters");
    }
};

class RAIIFileHandle_ReopenClosesPrevious : public TestCase {
public:
    RAIIFileHandle_ReopenClosesPrevious() : TestCase("RAIIFileHandle_ReopenClosesPrevious") {}
protected:
    void runTest() override {
        TempFile first("tagsplice_raii", "first");
        TempFile second("tagsplice_raii", "second!");
        RAIIFileHandle handle;
        ASSERT_TRUE(handle.open(first.path().c_str(), "r+b"), "open first");
        ASSERT_TRUE(handle.open(second.path().c_str(), "r+b"), "open second");
        ASSERT_EQUALS(static_cast<off_t>(7), handle.size(), "handle now refers to the second file");
    }
};

class RAIIFileHandle_MoveTransfersOwnership : public TestCase {
public:
    RAIIFileHandle_MoveTransfersOwnership() : TestCase("RAIIFileHandle_MoveTransfersOwnership") {}
protected:
    void runTest() override {
        TempFile temp("tagsplice_raii");
        RAIIFileHandle first;
        ASSERT_TRUE(first.open(temp.path().c_str(), "r+b"), "open");
        FILE* raw = first.get();

        RAIIFileHandle second(std::move(first));
        ASSERT_TRUE(second.get() == raw, "moved handle holds the FILE*");
        ASSERT_FALSE(first.is_valid(), "source is empty after move");

        RAIIFileHandle third;
        third = std::move(second);
        ASSERT_TRUE(third.get() == raw, "move assignment");
        ASSERT_FALSE(second.is_valid(), "source is empty after move assignment");
    }
};

class RAIIFileHandle_TruncateGrowsAndShrinks : public TestCase {
public:
    RAIIFileHandle_TruncateGrowsAndShrinks() : TestCase("RAIIFileHandle_TruncateGrowsAndShrinks") {}
protected:
    void runTest() override {
        TempFile temp("tagsplice_raii", "abcdef");
        RAIIFileHandle handle;
        ASSERT_TRUE(handle.open(temp.path().c_str(), "r+b"), "open");
        ASSERT_EQUALS(static_cast<off_t>(6), handle.size(), "initial size");

        ASSERT_EQUALS(0, handle.truncate(9), "grow");
        ASSERT_EQUALS(static_cast<off_t>(9), handle.size(), "grown size");

        ASSERT_EQUALS(0, handle.truncate(2), "shrink");
        ASSERT_EQUALS(static_cast<off_t>(2), handle.size(), "shrunk size");

        errno = 0;
        ASSERT_EQUALS(-1, handle.truncate(-1), "negative length");
        ASSERT_EQUALS(EINVAL, errno, "EINVAL for a negative length");

        handle.close();
        ASSERT_EQUALS(std::string("ab"), temp.contents(), "contents on disk");
    }
};

class RAIIFileHandle_PendingWritesReachTheFile : public TestCase {
public:
    RAIIFileHandle_PendingWritesReachTheFile() : TestCase("RAIIFileHandle_PendingWritesReachTheFile") {}
protected:
    void runTest() override {
        TempFile temp("tagsplice_raii");
        RAIIFileHandle handle;
        ASSERT_TRUE(handle.open(temp.path().c_str(), "w+b"), "open");
        ASSERT_EQUALS(4u, fwrite("data", 1, 4, handle.get()), "buffered write");

        // Both calls flush stdio first, so the buffered bytes count.
        ASSERT_EQUALS(static_cast<off_t>(4), handle.size(), "size includes buffered bytes");
        ASSERT_EQUALS(0, handle.truncate(6), "grow after buffered write");
        handle.close();

        ASSERT_EQUALS(std::string("data") + std::string(2, '\0'), temp.contents(), "zero-filled growth");
    }
};

int main(int argc, char* argv[]) {
    (void)argc;
    (void)argv;

    Debug::initFromEnvironment();

    TestSuite suite("RAIIFileHandle Unit Tests");

    suite.addTest(std::make_unique<RAIIFileHandle_DefaultIsEmpty>());
    suite.addTest(std::make_unique<RAIIFileHandle_OpenAndClose>());
    suite.addTest(std::make_unique<RAIIFileHandle_OpenFailureSetsErrno>());
    suite.addTest(std::make_unique<RAIIFileHandle_ReopenClosesPrevious>());
    suite.addTest(std::make_unique<RAIIFileHandle_MoveTransfersOwnership>());
    suite.addTest(std::make_unique<RAIIFileHandle_TruncateGrowsAndShrinks>());
    suite.addTest(std::make_unique<RAIIFileHandle_PendingWritesReachTheFile>());

    auto results = suite.runAll();
    suite.printResults(results);

    return suite.getFailureCount(results) > 0 ? 1 : 0;
}

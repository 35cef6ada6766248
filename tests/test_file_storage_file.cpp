/*
 * test_file_storage_file.cpp - Tests for the stdio-backed StorageFile and on-disk commits
 * This file is part of TagSplice.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * TagSplice is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#include "tagsplice.h"
#include "test_framework.h"

using namespace TagSplice;
using namespace TagSplice::IO;
using namespace TestFramework;

namespace {

// Test case with a fresh temporary file.
class TempFileTestCase : public TestCase {
public:
    explicit TempFileTestCase(const std::string& name) : TestCase(name) {}
protected:
    void setUp() override {
        m_temp = std::make_unique<TempFile>("tagsplice_test");
    }

    void tearDown() override {
        m_temp.reset();
    }

    const char* path() const { return m_temp->path().c_str(); }

    std::unique_ptr<TempFile> m_temp;
};

} // namespace

class FileStorageFile_OpenMissingFileFails : public TestCase {
public:
    FileStorageFile_OpenMissingFileFails() : TestCase("FileStorageFile_OpenMissingFileFails") {}
protected:
    void runTest() override {
        TestPatterns::assertThrows<Core::InvalidMediaException>(
            []() { File::FileStorageFile::open("/nonexistent/dir/tagsplice.mp3"); },
            "Could not open file", "opening a missing file fails");
    }
};

class FileStorageFile_ReadWriteSeek : public TempFileTestCase {
public:
    FileStorageFile_ReadWriteSeek() : TempFileTestCase("FileStorageFile_ReadWriteSeek") {}
protected:
    void runTest() override {
        m_temp->setContents("0123456789");
        auto file = File::FileStorageFile::open(path());

        ASSERT_EQUALS(10u, file->length(), "length of existing file");
        ASSERT_EQUALS(4u, file->seek(4, SEEK_SET), "SEEK_SET");
        char buffer[4] = {};
        file->readExact(buffer, 3);
        ASSERT_EQUALS(std::string("456"), std::string(buffer, 3), "read after seek");

        // Write straight after a read without an explicit seek.
        file->writeAll("xy", 2);
        ASSERT_EQUALS(9u, file->tell(), "position after write");
        file->readExact(buffer, 1);
        ASSERT_EQUALS('9', buffer[0], "read straight after a write");

        ASSERT_EQUALS(8u, file->seek(-2, SEEK_END), "SEEK_END");
        ASSERT_EQUALS(5u, file->seek(-3, SEEK_CUR), "SEEK_CUR");
        file->flush();

        ASSERT_EQUALS(std::string("0123456xy9"), m_temp->contents(), "contents on disk");
    }
};

class FileStorageFile_SetLengthGrowsAndTruncates : public TempFileTestCase {
public:
    FileStorageFile_SetLengthGrowsAndTruncates() : TempFileTestCase("FileStorageFile_SetLengthGrowsAndTruncates") {}
protected:
    void runTest() override {
        auto file = File::FileStorageFile::create(path());
        file->writeAll("abc", 3);

        file->setLength(6);
        ASSERT_EQUALS(6u, file->length(), "grown");
        ASSERT_EQUALS(3u, file->tell(), "setLength keeps the position");
        file->seek(0, SEEK_SET);
        char buffer[6] = { 1, 1, 1, 1, 1, 1 };
        file->readExact(buffer, 6);
        ASSERT_EQUALS(std::string("abc", 3) + std::string(3, '\0'), std::string(buffer, 6), "zero-filled growth");

        file->setLength(2);
        ASSERT_EQUALS(2u, file->length(), "truncated");
        file->flush();
        ASSERT_EQUALS(std::string("ab"), m_temp->contents(), "contents on disk after truncate");
    }
};

class FileStorageFile_ReadExactFailsAtEof : public TempFileTestCase {
public:
    FileStorageFile_ReadExactFailsAtEof() : TempFileTestCase("FileStorageFile_ReadExactFailsAtEof") {}
protected:
    void runTest() override {
        m_temp->setContents("abc");
        auto file = File::FileStorageFile::open(path());
        StorageFile* raw = file.get();

        char buffer[8];
        ASSERT_EQUALS(3u, raw->read(buffer, sizeof(buffer)), "short read at end of file");
        ASSERT_EQUALS(0u, raw->read(buffer, sizeof(buffer)), "end of file");
        raw->seek(1, SEEK_SET);
        TestPatterns::assertThrows<Core::IOException>(
            [raw, &buffer]() { raw->readExact(buffer, 4); },
            "unexpected end of file", "readExact past the end");
        TestPatterns::assertThrows<Core::InvalidSeekException>(
            [raw]() { raw->seek(-1, SEEK_SET); },
            "negative position", "seek before the start of the file");
    }
};

class FileStorageFile_CommitOnDisk : public TempFileTestCase {
public:
    FileStorageFile_CommitOnDisk() : TempFileTestCase("FileStorageFile_CommitOnDisk") {}
protected:
    void runTest() override {
        // A 10-byte tag followed by 200 KiB of "audio" so relocation spans several chunks.
        std::string audio;
        for (int i = 0; i < 200 * 1024; ++i) {
            audio.push_back(static_cast<char>('A' + i % 26));
        }
        m_temp->setContents("[old tag.]" + audio);

        Storage::PlainStorage storage(File::FileStorageFile::open(path()), Storage::Region(0, 10));
        {
            auto writer = storage.writer();
            std::string tag(100, 'T');
            writer->write(tag.data(), tag.size());
            writer->flush();
        }
        storage.file().flush();
        ASSERT_EQUALS(std::string(100, 'T') + audio, m_temp->contents(), "grown tag on disk");

        {
            auto writer = storage.writer();
            writer->write("[t]", 3);
            writer->flush();
        }
        ASSERT_EQUALS(std::string("[t]") + audio, m_temp->contents(), "shrunk tag on disk");
        ASSERT_EQUALS(Storage::Region(0, 3), storage.region(), "region after both commits");
    }
};

int main(int argc, char* argv[]) {
    (void)argc;
    (void)argv;

    Debug::initFromEnvironment();

    TestSuite suite("FileStorageFile Tests");

    suite.addTest(std::make_unique<FileStorageFile_OpenMissingFileFails>());
    suite.addTest(std::make_unique<FileStorageFile_ReadWriteSeek>());
    suite.addTest(std::make_unique<FileStorageFile_SetLengthGrowsAndTruncates>());
    suite.addTest(std::make_unique<FileStorageFile_ReadExactFailsAtEof>());
    suite.addTest(std::make_unique<FileStorageFile_CommitOnDisk>());

    auto results = suite.runAll();
    suite.printResults(results);

    return suite.getFailureCount(results) > 0 ? 1 : 0;
}

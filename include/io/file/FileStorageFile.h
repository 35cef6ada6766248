/*
 * FileStorageFile.h - On-disk StorageFile implementation
 * This file is part of TagSplice.
 * Copyright © 2025-2026 Kirn Gill <segin2005@gmail.com>
 *
 * TagSplice is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 *
 * Permission to use, copy, modify, and/or distribute this software for
 * any purpose with or without fee is hereby granted, provided that
 * the above copyright notice and this permission notice appear in all
 * copies.
 *
 * THE SOFTWARE IS PROVIDED "AS IS" AND THE AUTHOR DISCLAIMS ALL
 * WARRANTIES WITH REGARD TO THIS SOFTWARE INCLUDING ALL IMPLIED
 * WARRANTIES OF MERCHANTABILITY AND FITNESS. IN NO EVENT SHALL THE
 * AUTHOR BE LIABLE FOR ANY SPECIAL, DIRECT, INDIRECT, OR CONSEQUENTIAL
 * DAMAGES OR ANY DAMAGES WHATSOEVER RESULTING FROM LOSS OF USE, DATA
 * OR PROFITS, WHETHER IN AN ACTION OF CONTRACT, NEGLIGENCE OR OTHER
 * TORTIOUS ACTION, ARISING OUT OF OR IN CONNECTION WITH THE USE OR
 * PERFORMANCE OF THIS SOFTWARE.
 */

#ifndef FILESTORAGEFILE_H
#define FILESTORAGEFILE_H

// No direct includes - all includes should be in tagsplice.h

namespace TagSplice {
namespace IO {
namespace File {

/**
 * @brief StorageFile backed by a local file opened for update
 *
 * The file is held through an RAIIFileHandle in "r+b" (or "w+b") mode.
 * Resizing uses ftruncate() on the underlying descriptor after flushing
 * the stdio buffer.
 */
class FileStorageFile : public StorageFile {
public:
    /**
     * @brief Open an existing file for reading and writing
     * @param path File path
     * @throws Core::InvalidMediaException if the file cannot be opened
     */
    static std::unique_ptr<FileStorageFile> open(const TagLib::String& path);

    /**
     * @brief Create a file, truncating it if it already exists
     * @param path File path
     * @throws Core::InvalidMediaException if the file cannot be created
     */
    static std::unique_ptr<FileStorageFile> create(const TagLib::String& path);

    ~FileStorageFile() override;

    // StorageFile interface
    size_t read(void* buffer, size_t length) override;
    size_t write(const void* data, size_t length) override;
    filesize_t seek(off_t offset, int whence) override;
    filesize_t tell() override;
    void setLength(filesize_t new_length) override;
    filesize_t length() override;
    void flush() override;

    const TagLib::String& path() const;

private:
    FileStorageFile(const TagLib::String& path, const char* mode);

    enum class LastOperation {
        None,
        Read,
        Write
    };

    TagLib::String m_file_path;
    RAIIFileHandle m_file_handle;
    LastOperation m_last_operation = LastOperation::None;
};

} // namespace File
} // namespace IO
} // namespace TagSplice

#endif // FILESTORAGEFILE_H

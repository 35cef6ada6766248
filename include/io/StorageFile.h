/*
 * StorageFile.h - Random-access backing store for region storage
 * This file is part of TagSplice.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
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

#ifndef STORAGEFILE_H
#define STORAGEFILE_H

// No direct includes - all includes should be in tagsplice.h

namespace TagSplice {
namespace IO {

class MemoryStorageFile;
class TagLibStorageFile;
namespace File {
class FileStorageFile;
}

/**
 * @brief Random-access file handle used as the backing store of a storage
 *
 * A StorageFile can read, write and seek like a stdio stream and can
 * additionally be resized in place. Growing fills the new tail with
 * zeroes; shrinking discards it, exactly like ftruncate(2).
 *
 * The set of implementations is closed: only MemoryStorageFile,
 * File::FileStorageFile and TagLibStorageFile can construct the base. New
 * behaviour is added by deriving from one of those.
 *
 * Every operation throws Core::IOException on failure. Nothing here is
 * thread-safe; a StorageFile belongs to exactly one PlainStorage.
 */
class StorageFile : public ReadStream {
public:
    ~StorageFile() override;

    StorageFile(const StorageFile&) = delete;
    StorageFile& operator=(const StorageFile&) = delete;

    /**
     * @brief Write all length bytes at the current position
     * @return length
     */
    virtual size_t write(const void* data, size_t length) = 0;

    /**
     * @brief Resize the file; the current position is not changed
     * @param new_length New total length in bytes
     */
    virtual void setLength(filesize_t new_length) = 0;

    /**
     * @brief Current total length in bytes
     */
    virtual filesize_t length() = 0;

    /**
     * @brief Hand buffered writes to the operating system
     */
    virtual void flush() = 0;

    /**
     * @brief Read exactly length bytes or fail
     * @throws Core::IOException with EIO if the file ends first
     */
    void readExact(void* buffer, size_t length);

    /**
     * @brief Write exactly length bytes or fail
     */
    void writeAll(const void* data, size_t length);

protected:
    /**
     * @brief Resolve a (offset, whence) pair to an absolute position
     * @param current Current absolute position
     * @param end Absolute end position that SEEK_END is relative to
     * @throws Core::InvalidSeekException if the result would be negative,
     *         would not fit in off_t, or whence is unknown
     */
    static filesize_t resolveSeek(filesize_t current, filesize_t end, off_t offset, int whence);

    /**
     * @brief Convert error code to a consistent error message
     * @param error_code The errno value to describe
     * @param context Additional context for the error
     */
    static std::string getErrorMessage(int error_code, const std::string& context = "");

private:
    StorageFile();

    friend class MemoryStorageFile;
    friend class TagLibStorageFile;
    friend class File::FileStorageFile;
};

} // namespace IO
} // namespace TagSplice

#endif // STORAGEFILE_H

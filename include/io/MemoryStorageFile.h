/*
 * MemoryStorageFile.h - Memory-based StorageFile implementation
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

#ifndef MEMORYSTORAGEFILE_H
#define MEMORYSTORAGEFILE_H

// No direct includes - all includes should be in tagsplice.h

namespace TagSplice {
namespace IO {

/**
 * @brief Memory-based StorageFile implementation
 *
 * Behaves like a file held entirely in a byte vector. Writing past the end
 * extends the vector, zero-filling any gap left by a seek past the end.
 */
class MemoryStorageFile : public StorageFile {
public:
    /**
     * @brief Construct empty file
     */
    MemoryStorageFile();

    /**
     * @brief Construct from existing data (copied)
     * @param data Pointer to data
     * @param size Size of data
     */
    MemoryStorageFile(const void* data, size_t size);

    explicit MemoryStorageFile(std::vector<uint8_t> data);

    ~MemoryStorageFile() override;

    // StorageFile interface
    size_t read(void* buffer, size_t length) override;
    size_t write(const void* data, size_t length) override;
    filesize_t seek(off_t offset, int whence) override;
    filesize_t tell() override;
    void setLength(filesize_t new_length) override;
    filesize_t length() override;
    void flush() override;

    /**
     * @brief Direct access to the current contents
     */
    const std::vector<uint8_t>& data() const;

private:
    std::vector<uint8_t> m_buffer;
    filesize_t m_pos = 0;
};

} // namespace IO
} // namespace TagSplice

#endif // MEMORYSTORAGEFILE_H

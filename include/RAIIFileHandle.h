/*
 * RAIIFileHandle.h - RAII wrapper for FILE* handles
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

#ifndef RAIIFILEHANDLE_H
#define RAIIFILEHANDLE_H

// No direct includes - all includes should be in tagsplice.h

namespace TagSplice {
namespace IO {

/**
 * @brief Owning handle for the stdio stream behind a FileStorageFile
 *
 * Closes the stream on destruction, including when the owner is unwound by
 * an exception. Move-only. Besides stdio access it exposes the two
 * descriptor-level operations that stdio lacks: resizing and querying the
 * size of the file. Like the C calls they wrap, these report failure
 * through the return value and errno rather than by throwing.
 */
class RAIIFileHandle {
public:
    RAIIFileHandle() noexcept;

    RAIIFileHandle(RAIIFileHandle&& other) noexcept;
    RAIIFileHandle& operator=(RAIIFileHandle&& other) noexcept;

    ~RAIIFileHandle() noexcept;

    RAIIFileHandle(const RAIIFileHandle&) = delete;
    RAIIFileHandle& operator=(const RAIIFileHandle&) = delete;

    /**
     * @brief Open a file, closing any stream already held
     * @param filename Path to the file to open
     * @param mode fopen() mode, "r+b" or "w+b" for storage files
     * @return true on success; on failure errno describes the error
     */
    bool open(const char* filename, const char* mode) noexcept;

    /**
     * @brief Close the stream if one is held
     * @return 0 on success, EOF on error (same as fclose)
     */
    int close() noexcept;

    FILE* get() const noexcept;
    bool is_valid() const noexcept;

    /**
     * @brief Flush the stdio buffer and resize the file to length bytes
     *
     * Growing zero-fills. The stream position is not changed.
     * @return 0 on success, -1 with errno set on failure (EBADF if no
     *         stream is held)
     */
    int truncate(off_t length) noexcept;

    /**
     * @brief Flush the stdio buffer and return the size of the file
     * @return Size in bytes, or -1 with errno set on failure
     */
    off_t size() noexcept;

private:
    FILE* m_file;
};

} // namespace IO
} // namespace TagSplice

#endif // RAIIFILEHANDLE_H

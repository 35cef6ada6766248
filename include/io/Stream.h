/*
 * Stream.h - Byte stream interfaces shared by storages and codecs
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

#ifndef STREAM_H
#define STREAM_H

// No direct includes - all includes should be in tagsplice.h

namespace TagSplice {
namespace IO {

// Absolute positions and lengths are unsigned 64-bit; relative seek
// offsets are off_t so they may be negative.
typedef uint64_t filesize_t;

/**
 * @brief Anything bytes can be pulled from.
 *
 * All implementations report failures by throwing Core::IOException.
 */
class ByteSource {
public:
    virtual ~ByteSource() = default;

    /**
     * @brief Read up to length bytes into buffer
     * @param buffer Destination, at least length bytes
     * @param length Maximum number of bytes to read
     * @return Number of bytes read; 0 means end of stream
     */
    virtual size_t read(void* buffer, size_t length) = 0;
};

/**
 * @brief Seekable read-only stream
 */
class ReadStream : public ByteSource {
public:
    /**
     * @brief Reposition the stream
     * @param offset Offset relative to whence
     * @param whence SEEK_SET, SEEK_CUR or SEEK_END
     * @return New position, in the stream's own coordinates
     */
    virtual filesize_t seek(off_t offset, int whence) = 0;

    /**
     * @brief Current position, in the stream's own coordinates
     */
    virtual filesize_t tell() = 0;
};

/**
 * @brief Seekable write-only stream with an explicit commit point
 */
class WriteStream {
public:
    virtual ~WriteStream() = default;

    /**
     * @brief Write length bytes at the current position
     * @return Number of bytes written (always length on success)
     */
    virtual size_t write(const void* data, size_t length) = 0;

    virtual filesize_t seek(off_t offset, int whence) = 0;
    virtual filesize_t tell() = 0;

    /**
     * @brief Push pending data to the backing store
     *
     * This is the only way to observe a failed commit.
     */
    virtual void flush() = 0;
};

} // namespace IO
} // namespace TagSplice

#endif // STREAM_H

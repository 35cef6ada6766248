/*
 * StorageFile.cpp - Random-access backing store for region storage
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

#include "tagsplice.h"

namespace TagSplice {
namespace IO {

StorageFile::StorageFile() = default;

StorageFile::~StorageFile() = default;

/**
 * @brief Reads exactly the requested number of bytes.
 *
 * Short reads from the implementation are retried until either the
 * request is satisfied or the implementation reports end of file, which
 * is an error here because the caller knows the bytes must exist.
 */
void StorageFile::readExact(void* buffer, size_t length) {
    uint8_t* dest = static_cast<uint8_t*>(buffer);
    size_t total = 0;
    while (total < length) {
        size_t n = read(dest + total, length - total);
        if (n == 0) {
            throw Core::IOException("StorageFile::readExact() - unexpected end of file after "
                                    + std::to_string(total) + " of " + std::to_string(length) + " bytes",
                                    EIO);
        }
        total += n;
    }
}

void StorageFile::writeAll(const void* data, size_t length) {
    const uint8_t* src = static_cast<const uint8_t*>(data);
    size_t total = 0;
    while (total < length) {
        size_t n = write(src + total, length - total);
        if (n == 0) {
            throw Core::IOException("StorageFile::writeAll() - write made no progress", EIO);
        }
        total += n;
    }
}

filesize_t StorageFile::resolveSeek(filesize_t current, filesize_t end, off_t offset, int whence) {
    filesize_t base;
    switch (whence) {
        case SEEK_SET:
            base = 0;
            break;
        case SEEK_CUR:
            base = current;
            break;
        case SEEK_END:
            base = end;
            break;
        default:
            throw Core::InvalidSeekException("invalid whence value " + std::to_string(whence));
    }

    const filesize_t max_pos = static_cast<filesize_t>(std::numeric_limits<off_t>::max());
    if (offset < 0) {
        // Negate offset + 1 so the most negative off_t does not overflow.
        filesize_t back = static_cast<filesize_t>(-(offset + 1)) + 1;
        if (back > base) {
            throw Core::InvalidSeekException("attempted to seek to negative position: " + std::to_string(base) +
                                             " - " + std::to_string(back));
        }
        return base - back;
    }
    if (base > max_pos || static_cast<filesize_t>(offset) > max_pos - base) {
        throw Core::InvalidSeekException("attempted to seek past the largest file position: " +
                                         std::to_string(base) + " + " + std::to_string(offset));
    }
    return base + static_cast<filesize_t>(offset);
}

std::string StorageFile::getErrorMessage(int error_code, const std::string& context) {
    std::string message;

    if (!context.empty()) {
        message = context + ": ";
    }

    const char* error_str = strerror(error_code);
    if (error_str) {
        message += error_str;
    } else {
        message += "Unknown error " + std::to_string(error_code);
    }

    return message;
}

} // namespace IO
} // namespace TagSplice

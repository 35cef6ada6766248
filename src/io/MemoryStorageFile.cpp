/*
 * MemoryStorageFile.cpp - Memory-based StorageFile implementation
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

MemoryStorageFile::MemoryStorageFile() = default;

MemoryStorageFile::MemoryStorageFile(const void* data, size_t size) {
    if (data && size > 0) {
        m_buffer.assign(static_cast<const uint8_t*>(data), static_cast<const uint8_t*>(data) + size);
    }
}

MemoryStorageFile::MemoryStorageFile(std::vector<uint8_t> data)
    : m_buffer(std::move(data)) {
}

MemoryStorageFile::~MemoryStorageFile() = default;

size_t MemoryStorageFile::read(void* buffer, size_t length) {
    if (length == 0 || m_pos >= m_buffer.size()) {
        return 0;
    }

    size_t available = m_buffer.size() - static_cast<size_t>(m_pos);
    size_t to_read = std::min(length, available);
    std::memcpy(buffer, m_buffer.data() + m_pos, to_read);
    m_pos += to_read;
    return to_read;
}

size_t MemoryStorageFile::write(const void* data, size_t length) {
    if (length == 0) {
        return 0;
    }

    filesize_t end = m_pos + length;
    if (end > std::numeric_limits<size_t>::max()) {
        throw Core::IOException("MemoryStorageFile::write() - " + getErrorMessage(EFBIG), EFBIG);
    }
    if (end > m_buffer.size()) {
        // Zero-fills any gap between the old end and m_pos.
        m_buffer.resize(static_cast<size_t>(end), 0);
    }

    std::memcpy(m_buffer.data() + m_pos, data, length);
    m_pos = end;
    return length;
}

filesize_t MemoryStorageFile::seek(off_t offset, int whence) {
    m_pos = resolveSeek(m_pos, m_buffer.size(), offset, whence);
    return m_pos;
}

filesize_t MemoryStorageFile::tell() {
    return m_pos;
}

void MemoryStorageFile::setLength(filesize_t new_length) {
    if (new_length > std::numeric_limits<size_t>::max()) {
        throw Core::IOException("MemoryStorageFile::setLength() - " + getErrorMessage(EFBIG), EFBIG);
    }
    m_buffer.resize(static_cast<size_t>(new_length), 0);
}

filesize_t MemoryStorageFile::length() {
    return m_buffer.size();
}

void MemoryStorageFile::flush() {
    // Nothing is buffered outside m_buffer.
}

const std::vector<uint8_t>& MemoryStorageFile::data() const {
    return m_buffer;
}

} // namespace IO
} // namespace TagSplice

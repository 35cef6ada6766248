/*
 * UnsynchReader.cpp - Streaming removal of ID3v2 unsynchronisation
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
namespace Tag {

UnsynchReader::UnsynchReader(IO::ByteSource& source, size_t buffer_size)
    : m_source(source) {
    if (buffer_size == 0) {
        throw std::invalid_argument("UnsynchReader: buffer size must be positive");
    }
    m_buffer.resize(buffer_size);
}

UnsynchReader::~UnsynchReader() = default;

// Asks the source every time; a source that ran dry may have more after a seek.
bool UnsynchReader::refill() {
    m_pos = 0;
    m_filled = m_source.read(m_buffer.data(), m_buffer.size());
    return m_filled > 0;
}

size_t UnsynchReader::read(void* buffer, size_t length) {
    uint8_t* out = static_cast<uint8_t*>(buffer);
    size_t produced = 0;

    while (produced < length) {
        if (m_pos >= m_filled) {
            // Hand back what we have before blocking on the source again.
            if (produced > 0 || !refill()) {
                break;
            }
        }

        uint8_t byte = m_buffer[m_pos++];
        if (m_after_marker && byte == TagConstants::UNSYNCH_STUFFING) {
            m_after_marker = false;
            continue;
        }
        out[produced++] = byte;
        m_after_marker = (byte == TagConstants::UNSYNCH_MARKER);
    }

    return produced;
}

} // namespace Tag
} // namespace TagSplice

/*
 * UnsynchReader.h - Streaming removal of ID3v2 unsynchronisation
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

#ifndef TAGSPLICE_TAG_UNSYNCHREADER_H
#define TAGSPLICE_TAG_UNSYNCHREADER_H

// No direct includes - all includes should be in tagsplice.h

namespace TagSplice {
namespace Tag {

/**
 * @brief Reads from another ByteSource and drops every stuffing 0x00
 *
 * A 0x00 that directly follows an emitted 0xFF is discarded. The pairing
 * carries across read() calls and across reads of the underlying source.
 *
 * The wrapped source is borrowed and must outlive the reader. Errors from
 * the source propagate unchanged.
 */
class UnsynchReader : public IO::ByteSource {
public:
    explicit UnsynchReader(IO::ByteSource& source,
                           size_t buffer_size = TagConstants::UNSYNCH_READ_BUFFER_SIZE);
    ~UnsynchReader() override;

    UnsynchReader(const UnsynchReader&) = delete;
    UnsynchReader& operator=(const UnsynchReader&) = delete;

    /**
     * @brief Read up to length decoded bytes
     * @return Bytes produced; 0 only when the underlying source returned 0.
     *         End of stream is not remembered: the next call asks the
     *         source again, so a source moved back by seek() reads again.
     */
    size_t read(void* buffer, size_t length) override;

private:
    bool refill();

    IO::ByteSource& m_source;
    std::vector<uint8_t> m_buffer;
    size_t m_pos = 0;
    size_t m_filled = 0;
    bool m_after_marker = false;
};

} // namespace Tag
} // namespace TagSplice

#endif // TAGSPLICE_TAG_UNSYNCHREADER_H

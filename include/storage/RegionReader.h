/*
 * RegionReader.h - Read-only view of a storage region
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

#ifndef TAGSPLICE_STORAGE_REGIONREADER_H
#define TAGSPLICE_STORAGE_REGIONREADER_H

// No direct includes - all includes should be in tagsplice.h

namespace TagSplice {
namespace Storage {

/**
 * @brief Reads the bytes of a PlainStorage region and nothing else
 *
 * Positions are relative to region.start. Reads stop at region.end even
 * when the file continues. Obtained from PlainStorage::reader().
 */
class RegionReader : public IO::ReadStream {
public:
    explicit RegionReader(StorageLease lease);
    ~RegionReader() override;

    /**
     * @brief Read up to length bytes, never past region.end
     * @return Bytes read; 0 once the position reaches region.end
     */
    size_t read(void* buffer, size_t length) override;

    /**
     * @brief SEEK_SET is relative to region.start, SEEK_END to region.end
     * @return New position relative to region.start
     * @throws Core::InvalidSeekException if the target lies before region.start
     */
    IO::filesize_t seek(off_t offset, int whence) override;

    IO::filesize_t tell() override;

private:
    IO::filesize_t absolutePosition();

    StorageLease m_lease;
};

} // namespace Storage
} // namespace TagSplice

#endif // TAGSPLICE_STORAGE_REGIONREADER_H

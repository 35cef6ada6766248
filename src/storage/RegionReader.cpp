/*
 * RegionReader.cpp - Read-only view of a storage region
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
namespace Storage {

RegionReader::RegionReader(StorageLease lease)
    : m_lease(std::move(lease)) {
}

RegionReader::~RegionReader() = default;

IO::filesize_t RegionReader::absolutePosition() {
    IO::filesize_t pos = m_lease.storage().m_file->tell();
    if (pos < m_lease.storage().m_region.start) {
        // Only possible if someone moved the file behind our back.
        throw std::logic_error("RegionReader: file position is before the start of the region");
    }
    return pos;
}

size_t RegionReader::read(void* buffer, size_t length) {
    const Region& region = m_lease.storage().m_region;
    IO::filesize_t pos = absolutePosition();
    if (length == 0 || pos >= region.end) {
        return 0;
    }

    IO::filesize_t remaining = region.end - pos;
    size_t to_read = remaining < length ? static_cast<size_t>(remaining) : length;
    return m_lease.storage().m_file->read(buffer, to_read);
}

IO::filesize_t RegionReader::seek(off_t offset, int whence) {
    const Region& region = m_lease.storage().m_region;

    IO::filesize_t base;
    switch (whence) {
        case SEEK_SET:
            base = region.start;
            break;
        case SEEK_CUR:
            base = absolutePosition();
            break;
        case SEEK_END:
            base = region.end;
            break;
        default:
            throw Core::InvalidSeekException("RegionReader::seek() - invalid whence " + std::to_string(whence));
    }

    IO::filesize_t target;
    if (offset < 0) {
        // Negate offset + 1 so the most negative off_t does not overflow.
        IO::filesize_t back = static_cast<IO::filesize_t>(-(offset + 1)) + 1;
        if (back > base - region.start) {
            throw Core::InvalidSeekException("attempted to seek to before the start of the region");
        }
        target = base - back;
    } else {
        const IO::filesize_t max_pos = static_cast<IO::filesize_t>(std::numeric_limits<off_t>::max());
        if (base > max_pos || static_cast<IO::filesize_t>(offset) > max_pos - base) {
            throw Core::InvalidSeekException("attempted to seek past the largest file position");
        }
        target = base + static_cast<IO::filesize_t>(offset);
    }

    m_lease.storage().m_file->seek(static_cast<off_t>(target), SEEK_SET);
    return target - region.start;
}

IO::filesize_t RegionReader::tell() {
    return absolutePosition() - m_lease.storage().m_region.start;
}

} // namespace Storage
} // namespace TagSplice

/*
 * RegionWriter.cpp - Buffered writer that splices a new tag into a region
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

RegionWriter::RegionWriter(StorageLease lease)
    : m_lease(std::move(lease)) {
}

RegionWriter::~RegionWriter() {
    try {
        flush();
    } catch (const std::exception& e) {
        Debug::log("storage", "RegionWriter::~RegionWriter() - commit failed: ", e.what());
    }
}

size_t RegionWriter::write(const void* data, size_t length) {
    if (length == 0) {
        return 0;
    }

    size_t end = m_cursor + length;
    if (end > m_buffer.size()) {
        // Anything between the old end and the cursor becomes zeroes.
        m_buffer.resize(end, 0);
    }
    std::memcpy(m_buffer.data() + m_cursor, data, length);
    m_cursor = end;
    m_dirty = true;
    return length;
}

IO::filesize_t RegionWriter::seek(off_t offset, int whence) {
    IO::filesize_t base;
    switch (whence) {
        case SEEK_SET:
            base = 0;
            break;
        case SEEK_CUR:
            base = m_cursor;
            break;
        case SEEK_END:
            base = m_buffer.size();
            break;
        default:
            throw Core::InvalidSeekException("RegionWriter::seek() - invalid whence " + std::to_string(whence));
    }

    IO::filesize_t target;
    if (offset < 0) {
        IO::filesize_t back = static_cast<IO::filesize_t>(-(offset + 1)) + 1;
        if (back > base) {
            throw Core::InvalidSeekException("attempted to seek to before the start of the region");
        }
        target = base - back;
    } else {
        const IO::filesize_t max_pos = static_cast<IO::filesize_t>(std::numeric_limits<off_t>::max());
        if (static_cast<IO::filesize_t>(offset) > max_pos - base) {
            throw Core::InvalidSeekException("attempted to seek past the largest file position");
        }
        target = base + static_cast<IO::filesize_t>(offset);
    }
    m_cursor = static_cast<size_t>(target);
    return m_cursor;
}

IO::filesize_t RegionWriter::tell() {
    return m_cursor;
}

void RegionWriter::flush() {
    if (!m_dirty) {
        return;
    }

    PlainStorage& storage = m_lease.storage();
    IO::StorageFile& file = *storage.m_file;
    Region& region = storage.m_region;

    IO::filesize_t old_length = region.length();
    IO::filesize_t new_length = m_buffer.size();

    DEBUG_LOG("storage", "committing ", new_length, " bytes into region ", region);

    IO::filesize_t file_end = file.length();
    if (region.end > file_end) {
        throw Core::IOException("RegionWriter: region extends past end of file", EINVAL);
    }

    if (new_length > old_length) {
        growRegion(file, file_end, new_length - old_length);
    } else if (new_length < old_length) {
        shrinkRegion(file, file_end, old_length - new_length);
    }

    file.seek(static_cast<off_t>(region.start), SEEK_SET);
    if (!m_buffer.empty()) {
        file.writeAll(m_buffer.data(), m_buffer.size());
    }
    file.flush();

    // Only a fully written and flushed commit moves the bounds.
    region.end = region.start + new_length;
    m_dirty = false;

    DEBUG_LOG("storage", "commit done, region is now ", region);
}

bool RegionWriter::isDirty() const {
    return m_dirty;
}

size_t RegionWriter::bufferedLength() const {
    return m_buffer.size();
}

/**
 * Moves everything after the region right by delta bytes. The file is
 * extended first, then the tail is copied from its last chunk backwards so
 * no byte is overwritten before it has been read.
 */
void RegionWriter::growRegion(IO::StorageFile& file, IO::filesize_t file_end, IO::filesize_t delta) {
    PlainStorage& storage = m_lease.storage();
    const Region& region = storage.m_region;
    IO::filesize_t tail = file_end - region.end;

    DEBUG_LOG("storage", "growing region by ", delta, ", moving ", tail, " trailing bytes");

    file.setLength(file_end + delta);
    if (tail == 0) {
        return;
    }

    std::vector<uint8_t> chunk(static_cast<size_t>(std::min<IO::filesize_t>(storage.m_copy_buffer_size, tail)));
    IO::filesize_t remaining = tail;
    while (remaining > 0) {
        size_t n = static_cast<size_t>(std::min<IO::filesize_t>(remaining, chunk.size()));
        IO::filesize_t from = region.end + remaining - n;
        file.seek(static_cast<off_t>(from), SEEK_SET);
        file.readExact(chunk.data(), n);
        file.seek(static_cast<off_t>(from + delta), SEEK_SET);
        file.writeAll(chunk.data(), n);
        remaining -= n;
    }
}

/**
 * Moves everything after the region left by delta bytes, front to back,
 * then cuts delta bytes off the end of the file.
 */
void RegionWriter::shrinkRegion(IO::StorageFile& file, IO::filesize_t file_end, IO::filesize_t delta) {
    PlainStorage& storage = m_lease.storage();
    const Region& region = storage.m_region;
    IO::filesize_t tail = file_end - region.end;

    DEBUG_LOG("storage", "shrinking region by ", delta, ", moving ", tail, " trailing bytes");

    if (tail > 0) {
        std::vector<uint8_t> chunk(static_cast<size_t>(std::min<IO::filesize_t>(storage.m_copy_buffer_size, tail)));
        IO::filesize_t moved = 0;
        while (moved < tail) {
            size_t n = static_cast<size_t>(std::min<IO::filesize_t>(tail - moved, chunk.size()));
            IO::filesize_t from = region.end + moved;
            file.seek(static_cast<off_t>(from), SEEK_SET);
            file.readExact(chunk.data(), n);
            file.seek(static_cast<off_t>(from - delta), SEEK_SET);
            file.writeAll(chunk.data(), n);
            moved += n;
        }
    }

    file.setLength(file_end - delta);
}

} // namespace Storage
} // namespace TagSplice

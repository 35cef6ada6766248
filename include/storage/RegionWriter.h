/*
 * RegionWriter.h - Buffered writer that splices a new tag into a region
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

#ifndef TAGSPLICE_STORAGE_REGIONWRITER_H
#define TAGSPLICE_STORAGE_REGIONWRITER_H

// No direct includes - all includes should be in tagsplice.h

namespace TagSplice {
namespace Storage {

/**
 * @brief Replaces the contents of a PlainStorage region
 *
 * Everything written goes to an in-memory buffer first. The buffer is the
 * complete new content of the region, not a patch. flush() commits it:
 * the bytes after the region are moved so that the region becomes exactly
 * as long as the buffer, then the buffer is written into it.
 *
 * A new writer starts with an empty, uncommitted buffer, so committing
 * without writing anything empties the region.
 *
 * The destructor commits too and swallows any error (it is logged on the
 * "storage" channel). Call flush() explicitly when the outcome matters.
 *
 * There is no rollback: if an I/O error interrupts a commit, the file can
 * be left partly shifted.
 */
class RegionWriter : public IO::WriteStream {
public:
    explicit RegionWriter(StorageLease lease);
    ~RegionWriter() override;

    /**
     * @brief Write into the pending buffer at the buffer cursor
     *
     * Overwrites or extends the buffer. The file is not touched.
     */
    size_t write(const void* data, size_t length) override;

    /**
     * @brief Move the buffer cursor; the file position is not touched
     * @throws Core::InvalidSeekException if the target is negative
     */
    IO::filesize_t seek(off_t offset, int whence) override;

    IO::filesize_t tell() override;

    /**
     * @brief Commit the pending buffer to the region
     *
     * Does nothing if nothing changed since the last commit. The region
     * bounds and the dirty flag change only after the buffer has been
     * written and the file flushed.
     * @throws Core::IOException on any I/O failure
     */
    void flush() override;

    bool isDirty() const;
    size_t bufferedLength() const;

private:
    void growRegion(IO::StorageFile& file, IO::filesize_t file_end, IO::filesize_t delta);
    void shrinkRegion(IO::StorageFile& file, IO::filesize_t file_end, IO::filesize_t delta);

    StorageLease m_lease;
    std::vector<uint8_t> m_buffer;
    size_t m_cursor = 0;
    bool m_dirty = true;
};

} // namespace Storage
} // namespace TagSplice

#endif // TAGSPLICE_STORAGE_REGIONWRITER_H

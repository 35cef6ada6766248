/*
 * PlainStorage.h - Tag storage bound to a byte region of a file
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

#ifndef TAGSPLICE_STORAGE_PLAINSTORAGE_H
#define TAGSPLICE_STORAGE_PLAINSTORAGE_H

// No direct includes - all includes should be in tagsplice.h

namespace TagSplice {
namespace Storage {

class PlainStorage;

/**
 * @brief Proof that its holder is the only reader or writer of a storage
 *
 * Issued by PlainStorage and returned to it when destroyed. Move-only.
 */
class StorageLease {
public:
    StorageLease(StorageLease&& other) noexcept;
    StorageLease& operator=(StorageLease&&) = delete;
    StorageLease(const StorageLease&) = delete;
    StorageLease& operator=(const StorageLease&) = delete;
    ~StorageLease();

    PlainStorage& storage() const;

private:
    friend class PlainStorage;
    explicit StorageLease(PlainStorage& storage);

    PlainStorage* m_storage;
};

/**
 * @brief Keeps track of the writable region of a file and keeps the rest
 *        of the file intact
 *
 * Any data following the region is moved left or right as needed when a
 * writer commits a tag of a different size. Padding is part of the region
 * and is returned by the reader.
 *
 * At most one reader or writer may be open at a time; asking for a second
 * one throws Core::StorageBusyException. This guard is not reentrant and
 * not thread-safe: a PlainStorage and everything it hands out belong to a
 * single thread. The storage must outlive its readers and writers.
 */
class PlainStorage : public TagStorage {
public:
    /**
     * @brief Creates a new storage.
     * @param file The backing file (must not be null)
     * @param region The writable area, including padding
     * @param copy_buffer_size Chunk size used when moving trailing data
     * @throws std::invalid_argument on a null file, region.start > region.end
     *         or a zero copy buffer size
     */
    PlainStorage(std::unique_ptr<IO::StorageFile> file, const Region& region,
                 size_t copy_buffer_size = StorageConstants::DEFAULT_COPY_BUFFER_SIZE);
    ~PlainStorage() override;

    PlainStorage(const PlainStorage&) = delete;
    PlainStorage& operator=(const PlainStorage&) = delete;

    // TagStorage interface
    std::unique_ptr<IO::ReadStream> reader() override;
    std::unique_ptr<IO::WriteStream> writer() override;

    /**
     * @brief Current region
     *
     * Only a commit that completes, through the final write and flush,
     * changes it. A failed commit leaves the old bounds even if trailing
     * data was already moved.
     */
    const Region& region() const;

    /**
     * @brief The backing file
     * @throws Core::StorageBusyException while a reader or writer is open
     */
    IO::StorageFile& file();

    size_t copyBufferSize() const;

    /**
     * @brief Whether a reader or writer is currently open
     */
    bool isBusy() const;

private:
    friend class StorageLease;
    friend class RegionReader;
    friend class RegionWriter;

    StorageLease acquireLease(const char* purpose);
    void releaseLease() noexcept;

    std::unique_ptr<IO::StorageFile> m_file;
    Region m_region;
    size_t m_copy_buffer_size;
    bool m_leased = false;
};

} // namespace Storage
} // namespace TagSplice

#endif // TAGSPLICE_STORAGE_PLAINSTORAGE_H

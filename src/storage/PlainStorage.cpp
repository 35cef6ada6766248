/*
 * PlainStorage.cpp - Tag storage bound to a byte region of a file
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

// ========== StorageLease ==========

StorageLease::StorageLease(PlainStorage& storage)
    : m_storage(&storage) {
}

StorageLease::StorageLease(StorageLease&& other) noexcept
    : m_storage(other.m_storage) {
    other.m_storage = nullptr;
}

StorageLease::~StorageLease() {
    if (m_storage) {
        m_storage->releaseLease();
    }
}

PlainStorage& StorageLease::storage() const {
    return *m_storage;
}

// ========== PlainStorage ==========

PlainStorage::PlainStorage(std::unique_ptr<IO::StorageFile> file, const Region& region,
                           size_t copy_buffer_size)
    : m_file(std::move(file)), m_region(region), m_copy_buffer_size(copy_buffer_size) {
    if (!m_file) {
        throw std::invalid_argument("PlainStorage: file must not be null");
    }
    if (region.start > region.end) {
        std::ostringstream oss;
        oss << "PlainStorage: region start is after region end " << region;
        throw std::invalid_argument(oss.str());
    }
    if (copy_buffer_size == 0) {
        throw std::invalid_argument("PlainStorage: copy buffer size must be positive");
    }

    DEBUG_LOG("storage", "PlainStorage created for region ", m_region,
              ", copy buffer ", m_copy_buffer_size, " bytes");
}

PlainStorage::~PlainStorage() {
    if (m_leased) {
        // Readers and writers must not outlive their storage.
        Debug::log("storage", "PlainStorage::~PlainStorage() - destroyed while a reader or writer is still open");
    }
}

std::unique_ptr<IO::ReadStream> PlainStorage::reader() {
    StorageLease lease = acquireLease("reader");
    m_file->seek(static_cast<off_t>(m_region.start), SEEK_SET);
    return std::make_unique<RegionReader>(std::move(lease));
}

std::unique_ptr<IO::WriteStream> PlainStorage::writer() {
    return std::make_unique<RegionWriter>(acquireLease("writer"));
}

const Region& PlainStorage::region() const {
    return m_region;
}

IO::StorageFile& PlainStorage::file() {
    if (m_leased) {
        throw Core::StorageBusyException("PlainStorage::file() - a reader or writer is open");
    }
    return *m_file;
}

size_t PlainStorage::copyBufferSize() const {
    return m_copy_buffer_size;
}

bool PlainStorage::isBusy() const {
    return m_leased;
}

StorageLease PlainStorage::acquireLease(const char* purpose) {
    if (m_leased) {
        throw Core::StorageBusyException(std::string("PlainStorage: cannot open ") + purpose +
                                         ", another reader or writer is open");
    }
    m_leased = true;
    DEBUG_LOG("storage", "opened ", purpose, " on region ", m_region);
    return StorageLease(*this);
}

void PlainStorage::releaseLease() noexcept {
    m_leased = false;
}

} // namespace Storage
} // namespace TagSplice

/*
 * RAIIFileHandle.cpp - RAII wrapper for FILE* handles
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

RAIIFileHandle::RAIIFileHandle() noexcept : m_file(nullptr) {
}

RAIIFileHandle::RAIIFileHandle(RAIIFileHandle&& other) noexcept : m_file(other.m_file) {
    other.m_file = nullptr;
}

RAIIFileHandle& RAIIFileHandle::operator=(RAIIFileHandle&& other) noexcept {
    if (this != &other) {
        close();
        m_file = other.m_file;
        other.m_file = nullptr;
    }
    return *this;
}

RAIIFileHandle::~RAIIFileHandle() noexcept {
    close();
}

bool RAIIFileHandle::open(const char* filename, const char* mode) noexcept {
    close();

    if (!filename || !mode) {
        Debug::log("raii", "RAIIFileHandle::open() - Invalid parameters");
        errno = EINVAL;
        return false;
    }

    m_file = fopen(filename, mode);
    if (!m_file) {
        int error = errno;
        Debug::log("raii", "RAIIFileHandle::open() - Failed to open ", filename, ": ", strerror(error));
        errno = error;
        return false;
    }
    return true;
}

int RAIIFileHandle::close() noexcept {
    if (!m_file) {
        return 0;
    }

    int result = fclose(m_file);
    if (result != 0) {
        Debug::log("raii", "RAIIFileHandle::close() - fclose failed: ", strerror(errno));
    }
    m_file = nullptr;
    return result;
}

FILE* RAIIFileHandle::get() const noexcept {
    return m_file;
}

bool RAIIFileHandle::is_valid() const noexcept {
    return m_file != nullptr;
}

int RAIIFileHandle::truncate(off_t length) noexcept {
    if (!m_file) {
        errno = EBADF;
        return -1;
    }
    if (length < 0) {
        errno = EINVAL;
        return -1;
    }
    if (fflush(m_file) != 0) {
        return -1;
    }
    return ftruncate(fileno(m_file), length);
}

off_t RAIIFileHandle::size() noexcept {
    if (!m_file) {
        errno = EBADF;
        return -1;
    }
    if (fflush(m_file) != 0) {
        return -1;
    }
    struct stat file_stat;
    if (fstat(fileno(m_file), &file_stat) != 0) {
        return -1;
    }
    return file_stat.st_size;
}

} // namespace IO
} // namespace TagSplice

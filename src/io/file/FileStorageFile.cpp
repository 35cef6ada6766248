/*
 * FileStorageFile.cpp - Implementation for the on-disk storage file.
 * This file is part of TagSplice.
 * Copyright © 2025-2026 Kirn Gill <segin2005@gmail.com>
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
namespace File {

std::unique_ptr<FileStorageFile> FileStorageFile::open(const TagLib::String& path) {
    return std::unique_ptr<FileStorageFile>(new FileStorageFile(path, "r+b"));
}

std::unique_ptr<FileStorageFile> FileStorageFile::create(const TagLib::String& path) {
    return std::unique_ptr<FileStorageFile>(new FileStorageFile(path, "w+b"));
}

/**
 * @brief Opens the file at path with the given stdio mode.
 *
 * The raw 8-bit path is handed to fopen() without UTF-8 conversion so the
 * original filesystem encoding is preserved.
 *
 * @throws InvalidMediaException if the file cannot be opened
 */
FileStorageFile::FileStorageFile(const TagLib::String& path, const char* mode)
    : m_file_path(path) {
    if (!m_file_handle.open(path.toCString(false), mode)) {
        int error = errno;
        std::string errorMsg = getErrorMessage(error, "Could not open file: " + path.to8Bit(true));
        Debug::log("io", "FileStorageFile::FileStorageFile() - ", errorMsg);
        throw Core::InvalidMediaException(errorMsg);
    }

    Debug::log("io", "FileStorageFile::FileStorageFile() - Opened ", path.to8Bit(true), " mode ", mode);
}

/**
 * @brief Destroys the FileStorageFile object.
 *
 * The handle is closed by RAIIFileHandle. Callers that need to see a
 * failed final write must call flush() first.
 */
FileStorageFile::~FileStorageFile() = default;

size_t FileStorageFile::read(void* buffer, size_t length) {
    if (length == 0) {
        return 0;
    }

    FILE* file = m_file_handle.get();
    // C stdio requires a flush or positioning call between output and input.
    if (m_last_operation == LastOperation::Write) {
        flush();
    }
    m_last_operation = LastOperation::Read;

    size_t bytes_read = fread(buffer, 1, length, file);
    if (bytes_read < length) {
        if (ferror(file)) {
            int error = errno;
            clearerr(file);
            throw Core::IOException(getErrorMessage(error, "FileStorageFile::read() - " + m_file_path.to8Bit(true)), error);
        }
        // Clear the EOF indicator so the next seek/read starts fresh.
        clearerr(file);
    }
    return bytes_read;
}

size_t FileStorageFile::write(const void* data, size_t length) {
    if (length == 0) {
        return 0;
    }

    FILE* file = m_file_handle.get();
    if (m_last_operation == LastOperation::Read && fseeko(file, 0, SEEK_CUR) != 0) {
        int error = errno;
        throw Core::IOException(getErrorMessage(error, "FileStorageFile::write() - " + m_file_path.to8Bit(true)), error);
    }
    m_last_operation = LastOperation::Write;

    size_t bytes_written = fwrite(data, 1, length, file);
    if (bytes_written < length) {
        int error = errno;
        clearerr(file);
        throw Core::IOException(getErrorMessage(error, "FileStorageFile::write() - " + m_file_path.to8Bit(true)), error);
    }
    return bytes_written;
}

filesize_t FileStorageFile::seek(off_t offset, int whence) {
    FILE* file = m_file_handle.get();

    // Resolve ourselves so that a negative target is reported consistently
    // with the other implementations instead of as a raw EINVAL from libc.
    filesize_t current = tell();
    filesize_t end = (whence == SEEK_END) ? length() : 0;
    filesize_t target = resolveSeek(current, end, offset, whence);

    if (target > static_cast<filesize_t>(std::numeric_limits<off_t>::max())) {
        throw Core::IOException("FileStorageFile::seek() - " + getErrorMessage(EOVERFLOW), EOVERFLOW);
    }

    if (fseeko(file, static_cast<off_t>(target), SEEK_SET) != 0) {
        int error = errno;
        throw Core::IOException(getErrorMessage(error, "FileStorageFile::seek() - " + m_file_path.to8Bit(true)), error);
    }
    m_last_operation = LastOperation::None;
    return target;
}

filesize_t FileStorageFile::tell() {
    off_t position = ftello(m_file_handle.get());
    if (position < 0) {
        int error = errno;
        throw Core::IOException(getErrorMessage(error, "FileStorageFile::tell() - " + m_file_path.to8Bit(true)), error);
    }
    return static_cast<filesize_t>(position);
}

void FileStorageFile::setLength(filesize_t new_length) {
    if (new_length > static_cast<filesize_t>(std::numeric_limits<off_t>::max())) {
        throw Core::IOException("FileStorageFile::setLength() - " + getErrorMessage(EFBIG), EFBIG);
    }

    // truncate() flushes pending stdio writes before resizing the descriptor.
    if (m_file_handle.truncate(static_cast<off_t>(new_length)) != 0) {
        int error = errno;
        throw Core::IOException(getErrorMessage(error, "FileStorageFile::setLength() - " + m_file_path.to8Bit(true)), error);
    }
    m_last_operation = LastOperation::None;

    Debug::log("io", "FileStorageFile::setLength() - ", m_file_path.to8Bit(true), " resized to ", new_length, " bytes");
}

filesize_t FileStorageFile::length() {
    off_t size = m_file_handle.size();
    if (size < 0) {
        int error = errno;
        throw Core::IOException(getErrorMessage(error, "FileStorageFile::length() - " + m_file_path.to8Bit(true)), error);
    }
    m_last_operation = LastOperation::None;
    return static_cast<filesize_t>(size);
}

void FileStorageFile::flush() {
    if (fflush(m_file_handle.get()) != 0) {
        int error = errno;
        throw Core::IOException(getErrorMessage(error, "FileStorageFile::flush() - " + m_file_path.to8Bit(true)), error);
    }
    m_last_operation = LastOperation::None;
}

const TagLib::String& FileStorageFile::path() const {
    return m_file_path;
}

} // namespace File
} // namespace IO
} // namespace TagSplice

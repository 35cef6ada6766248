/*
 * TagLibStorageFile.cpp - StorageFile on top of a TagLib::IOStream
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

TagLibStorageFile::TagLibStorageFile(std::unique_ptr<TagLib::IOStream> stream)
    : m_owned_stream(std::move(stream))
    , m_stream(m_owned_stream.get())
{
    if (!m_stream) {
        throw std::invalid_argument("TagLibStorageFile: stream cannot be null");
    }
}

TagLibStorageFile::TagLibStorageFile(TagLib::IOStream& stream)
    : m_stream(&stream)
{
}

TagLibStorageFile::~TagLibStorageFile() = default;

void TagLibStorageFile::checkOpen(const char* operation) const
{
    if (!m_stream->isOpen()) {
        throw Core::IOException(std::string("TagLibStorageFile::") + operation + "() - "
                                + getErrorMessage(EBADF, "stream is not open"), EBADF);
    }
}

size_t TagLibStorageFile::read(void* buffer, size_t length)
{
    checkOpen("read");
    if (length == 0) {
        return 0;
    }

    TagLib::ByteVector block = m_stream->readBlock(static_cast<TagLibReadLength>(length));
    size_t bytes_read = std::min(length, static_cast<size_t>(block.size()));
    if (bytes_read > 0) {
        std::memcpy(buffer, block.data(), bytes_read);
    }
    return bytes_read;
}

size_t TagLibStorageFile::write(const void* data, size_t length)
{
    checkOpen("write");
    if (m_stream->readOnly()) {
        throw Core::IOException("TagLibStorageFile::write() - " + getErrorMessage(EBADF, "stream is read-only"), EBADF);
    }
    if (length == 0) {
        return 0;
    }
    if (length > std::numeric_limits<unsigned int>::max()) {
        throw Core::IOException("TagLibStorageFile::write() - " + getErrorMessage(EFBIG), EFBIG);
    }

    m_stream->writeBlock(TagLib::ByteVector(static_cast<const char*>(data), static_cast<unsigned int>(length)));
    return length;
}

filesize_t TagLibStorageFile::seek(off_t offset, int whence)
{
    checkOpen("seek");
    filesize_t current = tell();
    filesize_t end = (whence == SEEK_END) ? length() : 0;
    filesize_t target = resolveSeek(current, end, offset, whence);

    if (target > static_cast<filesize_t>(std::numeric_limits<TagLibOffset>::max())) {
        throw Core::IOException("TagLibStorageFile::seek() - " + getErrorMessage(EOVERFLOW), EOVERFLOW);
    }

    m_stream->seek(static_cast<TagLibOffset>(target), TagLib::IOStream::Beginning);
    return target;
}

filesize_t TagLibStorageFile::tell()
{
    checkOpen("tell");
    TagLibOffset position = m_stream->tell();
    if (position < 0) {
        throw Core::IOException("TagLibStorageFile::tell() - " + getErrorMessage(EIO), EIO);
    }
    return static_cast<filesize_t>(position);
}

void TagLibStorageFile::setLength(filesize_t new_length)
{
    checkOpen("setLength");
    if (m_stream->readOnly()) {
        throw Core::IOException("TagLibStorageFile::setLength() - " + getErrorMessage(EBADF, "stream is read-only"), EBADF);
    }
    if (new_length > static_cast<filesize_t>(std::numeric_limits<TagLibOffset>::max())) {
        throw Core::IOException("TagLibStorageFile::setLength() - " + getErrorMessage(EFBIG), EFBIG);
    }

    // IOStream::truncate() may move the stream position; keep ours.
    TagLibOffset position = m_stream->tell();
    m_stream->truncate(static_cast<TagLibOffset>(new_length));
    m_stream->seek(position, TagLib::IOStream::Beginning);

    if (length() != new_length) {
        throw Core::IOException("TagLibStorageFile::setLength() - stream refused to resize to "
                                + std::to_string(new_length) + " bytes", EIO);
    }
}

filesize_t TagLibStorageFile::length()
{
    checkOpen("length");
    TagLibOffset stream_length = m_stream->length();
    if (stream_length < 0) {
        throw Core::IOException("TagLibStorageFile::length() - " + getErrorMessage(EIO), EIO);
    }
    return static_cast<filesize_t>(stream_length);
}

void TagLibStorageFile::flush()
{
    // TagLib streams write through; there is nothing to push.
}

TagLib::IOStream& TagLibStorageFile::stream()
{
    return *m_stream;
}

} // namespace IO
} // namespace TagSplice

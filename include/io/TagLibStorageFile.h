/*
 * TagLibStorageFile.h - StorageFile on top of a TagLib::IOStream
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

#ifndef TAGLIBSTORAGEFILE_H
#define TAGLIBSTORAGEFILE_H

// No direct includes - all includes should be in tagsplice.h

// Type compatibility for different TagLib versions
#ifdef TAGLIB_MAJOR_VERSION
  #if TAGLIB_MAJOR_VERSION >= 2
    // TagLib 2.x: readBlock(size_t), seek(offset_t), truncate(offset_t)
    using TagLibOffset = TagLib::offset_t;
    using TagLibReadLength = size_t;
  #else
    // TagLib 1.x: readBlock(unsigned long), seek(long), truncate(long)
    using TagLibOffset = long;
    using TagLibReadLength = unsigned long;
  #endif
#else
  // Fallback for older TagLib without version macros
  using TagLibOffset = long;
  using TagLibReadLength = unsigned long;
#endif

namespace TagSplice {
namespace IO {

/**
 * @brief Adapter that lets region storage run on a TagLib stream.
 *
 * Any TagLib::IOStream works: a TagLib::FileStream opened by TagLib for
 * the same file, or a TagLib::ByteVectorStream holding a file in memory.
 * TagLib streams do not report read errors, so a failed read surfaces as a
 * short read. Writes to a read-only stream raise Core::IOException (EBADF).
 */
class TagLibStorageFile : public StorageFile
{
public:
    /**
     * @brief Wraps a TagLib stream, taking ownership of it.
     * @param stream The stream to wrap (must not be null)
     */
    explicit TagLibStorageFile(std::unique_ptr<TagLib::IOStream> stream);

    /**
     * @brief Wraps a TagLib stream owned by someone else.
     * @param stream The stream to wrap; must outlive this object
     */
    explicit TagLibStorageFile(TagLib::IOStream& stream);

    ~TagLibStorageFile() override;

    // StorageFile interface
    size_t read(void* buffer, size_t length) override;
    size_t write(const void* data, size_t length) override;
    filesize_t seek(off_t offset, int whence) override;
    filesize_t tell() override;
    void setLength(filesize_t new_length) override;
    filesize_t length() override;
    void flush() override;

    TagLib::IOStream& stream();

private:
    std::unique_ptr<TagLib::IOStream> m_owned_stream;
    TagLib::IOStream* m_stream;

    void checkOpen(const char* operation) const;
};

} // namespace IO
} // namespace TagSplice

#endif // TAGLIBSTORAGEFILE_H

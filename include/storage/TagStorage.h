/*
 * TagStorage.h - Abstract tag storage interface
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

#ifndef TAGSPLICE_STORAGE_TAGSTORAGE_H
#define TAGSPLICE_STORAGE_TAGSTORAGE_H

// No direct includes - all includes should be in tagsplice.h

namespace TagSplice {
namespace Storage {

/**
 * @brief Where a tag lives inside some container file
 *
 * Audio formats keep their metadata in different places: MP3 puts ID3v2 in
 * a header and ID3v1 in a trailer, WAV keeps an ID3 tag inside a RIFF
 * chunk. A Storage hides that and exposes the tag bytes as a plain stream.
 */
class TagStorage {
public:
    virtual ~TagStorage() = default;

    /**
     * @brief Open the storage for reading
     * @return Stream positioned at the first tag byte
     * @throws Core::StorageBusyException if a reader or writer is open
     */
    virtual std::unique_ptr<IO::ReadStream> reader() = 0;

    /**
     * @brief Open the storage for writing
     *
     * Written data replaces the whole tag when flush() is called. Destroying
     * the writer also commits, but any error is dropped; call flush() to
     * find out whether the commit worked.
     *
     * @throws Core::StorageBusyException if a reader or writer is open
     */
    virtual std::unique_ptr<IO::WriteStream> writer() = 0;
};

} // namespace Storage
} // namespace TagSplice

#endif // TAGSPLICE_STORAGE_TAGSTORAGE_H

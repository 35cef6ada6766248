/*
 * exceptions.h - Various exception classes.
 * This file is part of TagSplice.
 * Copyright © 2011-2025 Kirn Gill <segin2005@gmail.com>
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

#ifndef EXCEPTIONS_H
#define EXCEPTIONS_H

namespace TagSplice {
namespace Core {

// When a file cannot be opened as tag storage at all.
class InvalidMediaException : public std::exception
{
    public:
        InvalidMediaException(TagLib::String why);
        ~InvalidMediaException() noexcept override = default;
        const char *what() const noexcept override;
    protected:
    private:
        TagLib::String m_why;
};

// Read, write, seek or resize failure on an open handle.
class IOException : public std::exception
{
    public:
        IOException(const std::string &why, int error_code = 0);
        ~IOException() noexcept override = default;
        const char *what() const noexcept override;
        int errorCode() const noexcept;
    protected:
    private:
        std::string m_why;
        int m_error_code;
};

// Seek to a position before the start of the addressable window.
class InvalidSeekException : public IOException
{
    public:
        explicit InvalidSeekException(const std::string &why);
        ~InvalidSeekException() noexcept override = default;
};

// A reader or writer is already open on the storage.
class StorageBusyException : public std::logic_error
{
    public:
        explicit StorageBusyException(const std::string &why);
        ~StorageBusyException() noexcept override = default;
};

} // namespace Core
} // namespace TagSplice

#endif // EXCEPTIONS_H

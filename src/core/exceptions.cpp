/*
 * exceptions.cpp - Various exception classes.
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

#include "tagsplice.h"

namespace TagSplice {
namespace Core {

/**
 * @brief Constructs an InvalidMediaException.
 *
 * This exception is thrown when a file cannot be opened or created as the
 * backing store of a region storage.
 * @param why A string describing the reason for the failure.
 */
InvalidMediaException::InvalidMediaException(TagLib::String why)
    : std::exception(), m_why(why) {
  // ctor
}

/**
 * @brief Returns the exception's explanatory string.
 * @return A C-style string detailing why the file could not be used.
 */
const char *InvalidMediaException::what() const noexcept {
  return m_why.toCString(true); // Return UTF-8 C-string representation
}

/**
 * @brief Constructs an IOException.
 *
 * Thrown for any failed read, write, seek, flush or resize on an open
 * handle. The error is reported as-is; nothing in the library retries.
 * @param why A string describing the I/O error.
 * @param error_code The errno value of the failing call, or 0 if unknown.
 */
IOException::IOException(const std::string &why, int error_code)
    : std::exception(), m_why(why), m_error_code(error_code) {
  // ctor
}

/**
 * @brief Returns the exception's explanatory string.
 * @return A C-style string detailing the I/O error.
 */
const char *IOException::what() const noexcept { return m_why.c_str(); }

/**
 * @brief Returns the errno value captured when the error was raised.
 */
int IOException::errorCode() const noexcept { return m_error_code; }

/**
 * @brief Constructs an InvalidSeekException.
 *
 * A seek resolved to a position before the start of the window the caller
 * may address. This is a caller error and is reported with EINVAL.
 * @param why A string describing the rejected seek.
 */
InvalidSeekException::InvalidSeekException(const std::string &why)
    : IOException(why, EINVAL) {
  // ctor
}

StorageBusyException::StorageBusyException(const std::string &why)
    : std::logic_error(why) {
  // ctor
}

} // namespace Core
} // namespace TagSplice

/*
 * Unsynch.h - ID3v2 synchsafe integers and unsynchronisation
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

#ifndef TAGSPLICE_TAG_UNSYNCH_H
#define TAGSPLICE_TAG_UNSYNCH_H

// No direct includes - all includes should be in tagsplice.h

namespace TagSplice {
namespace Tag {
namespace Unsynch {

// ============================================================================
// Synchsafe Integer Functions
// ============================================================================

/**
 * @brief Check if a value fits in a synchsafe integer (28 bits)
 */
bool canEncodeSynchsafe(uint32_t value);

/**
 * @brief Encode a 28-bit value as a 32-bit synchsafe integer
 *
 * Bit 7 of every byte of the result is clear.
 * @throws std::invalid_argument if value does not fit in 28 bits
 */
uint32_t encodeSynchsafe(uint32_t value);

/**
 * @brief Decode a 32-bit synchsafe integer; bit 7 of every byte is ignored
 */
uint32_t decodeSynchsafe(uint32_t synchsafe);

/**
 * @brief Decode a synchsafe integer from 4 big-endian bytes
 */
uint32_t decodeSynchsafeBytes(const uint8_t* data);

/**
 * @brief Encode a value as 4 big-endian synchsafe bytes
 * @throws std::invalid_argument if value does not fit in 28 bits
 */
void encodeSynchsafeBytes(uint32_t value, uint8_t* out);

// ============================================================================
// Unsynchronisation Functions
// ============================================================================

/**
 * @brief Apply unsynchronisation in place
 *
 * A 0x00 is inserted in front of every 0x00 that follows a 0xFF of the
 * original data, so that a stuffed stream never contains 0xFF 0x00 except
 * as a stuffing pair.
 */
void encodeBuffer(std::vector<uint8_t>& data);

/**
 * @brief Whether encodeBuffer() would change the data
 */
bool needsUnsynch(const uint8_t* data, size_t size);

/**
 * @brief Remove unsynchronisation from a complete buffer
 *
 * Produces the same bytes as reading the data through an UnsynchReader.
 */
std::vector<uint8_t> decodeBuffer(const uint8_t* data, size_t size);

} // namespace Unsynch
} // namespace Tag
} // namespace TagSplice

#endif // TAGSPLICE_TAG_UNSYNCH_H

/*
 * Unsynch.cpp - ID3v2 synchsafe integers and unsynchronisation
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
namespace Tag {
namespace Unsynch {

// ============================================================================
// Synchsafe Integer Functions
// ============================================================================

bool canEncodeSynchsafe(uint32_t value) {
    return value <= TagConstants::SYNCHSAFE_MAX;
}

uint32_t encodeSynchsafe(uint32_t value) {
    if (!canEncodeSynchsafe(value)) {
        throw std::invalid_argument("encodeSynchsafe: value " + std::to_string(value) +
                                    " does not fit in 28 bits");
    }
    uint32_t result = 0;
    result |= (value & 0x0000007F);        // Bits 0-6
    result |= (value & 0x00003F80) << 1;   // Bits 7-13 -> 8-14
    result |= (value & 0x001FC000) << 2;   // Bits 14-20 -> 16-22
    result |= (value & 0x0FE00000) << 3;   // Bits 21-27 -> 24-30
    return result;
}

uint32_t decodeSynchsafe(uint32_t synchsafe) {
    uint32_t result = 0;
    result |= (synchsafe & 0x0000007F);        // Bits 0-6
    result |= (synchsafe & 0x00007F00) >> 1;   // Bits 8-14 -> 7-13
    result |= (synchsafe & 0x007F0000) >> 2;   // Bits 16-22 -> 14-20
    result |= (synchsafe & 0x7F000000) >> 3;   // Bits 24-30 -> 21-27
    return result;
}

uint32_t decodeSynchsafeBytes(const uint8_t* data) {
    if (!data) {
        return 0;
    }
    return ((static_cast<uint32_t>(data[0] & 0x7F) << 21) |
            (static_cast<uint32_t>(data[1] & 0x7F) << 14) |
            (static_cast<uint32_t>(data[2] & 0x7F) << 7) |
            (static_cast<uint32_t>(data[3] & 0x7F)));
}

void encodeSynchsafeBytes(uint32_t value, uint8_t* out) {
    if (!out) {
        return;
    }
    if (!canEncodeSynchsafe(value)) {
        throw std::invalid_argument("encodeSynchsafeBytes: value " + std::to_string(value) +
                                    " does not fit in 28 bits");
    }
    out[0] = static_cast<uint8_t>((value >> 21) & 0x7F);
    out[1] = static_cast<uint8_t>((value >> 14) & 0x7F);
    out[2] = static_cast<uint8_t>((value >> 7) & 0x7F);
    out[3] = static_cast<uint8_t>(value & 0x7F);
}

// ============================================================================
// Unsynchronisation Functions
// ============================================================================

void encodeBuffer(std::vector<uint8_t>& data) {
    size_t inserted = 0;
    bool after_marker = false;
    size_t i = 0;
    while (i < data.size()) {
        if (after_marker && data[i] == TagConstants::UNSYNCH_STUFFING) {
            data.insert(data.begin() + static_cast<std::ptrdiff_t>(i), TagConstants::UNSYNCH_STUFFING);
            ++inserted;
            ++i; // back on the original 0x00
        }
        after_marker = (data[i] == TagConstants::UNSYNCH_MARKER);
        ++i;
    }

    if (inserted > 0) {
        DEBUG_LOG("unsynch", "inserted ", inserted, " stuffing bytes");
    }
}

bool needsUnsynch(const uint8_t* data, size_t size) {
    if (!data) {
        return false;
    }
    for (size_t i = 1; i < size; ++i) {
        if (data[i - 1] == TagConstants::UNSYNCH_MARKER && data[i] == TagConstants::UNSYNCH_STUFFING) {
            return true;
        }
    }
    return false;
}

std::vector<uint8_t> decodeBuffer(const uint8_t* data, size_t size) {
    if (!data || size == 0) {
        return {};
    }

    std::vector<uint8_t> result;
    result.reserve(size);

    bool after_marker = false;
    for (size_t i = 0; i < size; ++i) {
        if (after_marker && data[i] == TagConstants::UNSYNCH_STUFFING) {
            after_marker = false;
            continue;
        }
        result.push_back(data[i]);
        after_marker = (data[i] == TagConstants::UNSYNCH_MARKER);
    }

    return result;
}

} // namespace Unsynch
} // namespace Tag
} // namespace TagSplice

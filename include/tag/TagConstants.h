/*
 * TagConstants.h - Constants for Tag module
 * This file is part of TagSplice.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * TagSplice is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef TAGSPLICE_TAG_TAGCONSTANTS_H
#define TAGSPLICE_TAG_TAGCONSTANTS_H

namespace TagSplice {
namespace Tag {

namespace TagConstants {

// Synchsafe integers carry 28 bits of payload
constexpr uint32_t SYNCHSAFE_MAX = 0x0FFFFFFF;
constexpr size_t SYNCHSAFE_SIZE = 4;                       // bytes

// Unsynchronisation markers
constexpr uint8_t UNSYNCH_MARKER = 0xFF;
constexpr uint8_t UNSYNCH_STUFFING = 0x00;

constexpr size_t UNSYNCH_READ_BUFFER_SIZE = 8 * 1024;      // 8 KiB

} // namespace TagConstants

} // namespace Tag
} // namespace TagSplice

#endif // TAGSPLICE_TAG_TAGCONSTANTS_H

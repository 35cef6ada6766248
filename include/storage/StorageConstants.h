/*
 * StorageConstants.h - Constants for Storage module
 * This file is part of TagSplice.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * TagSplice is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef TAGSPLICE_STORAGE_STORAGECONSTANTS_H
#define TAGSPLICE_STORAGE_STORAGECONSTANTS_H

#include <cstdint>
#include <cstddef>

namespace TagSplice {
namespace Storage {

namespace StorageConstants {

// Size of the buffer used to move the bytes that follow a region when the
// region grows or shrinks. Bounds commit memory use regardless of file size.
constexpr size_t DEFAULT_COPY_BUFFER_SIZE = 64 * 1024;     // 64 KB

} // namespace StorageConstants

} // namespace Storage
} // namespace TagSplice

#endif // TAGSPLICE_STORAGE_STORAGECONSTANTS_H

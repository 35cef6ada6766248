/*
 * Region.h - Writable byte window inside a file
 * This file is part of TagSplice.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * TagSplice is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef TAGSPLICE_STORAGE_REGION_H
#define TAGSPLICE_STORAGE_REGION_H

// No direct includes - all includes should be in tagsplice.h

namespace TagSplice {
namespace Storage {

/**
 * @brief Half-open interval [start, end) of absolute file offsets
 *
 * Covers the tag area including any padding. start <= end.
 */
struct Region {
    IO::filesize_t start = 0;
    IO::filesize_t end = 0;

    Region() = default;
    Region(IO::filesize_t region_start, IO::filesize_t region_end)
        : start(region_start), end(region_end) {}

    IO::filesize_t length() const { return end - start; }
    bool isEmpty() const { return start == end; }

    bool operator==(const Region& other) const {
        return start == other.start && end == other.end;
    }
    bool operator!=(const Region& other) const { return !(*this == other); }
};

// Prints "[start, end)"
inline std::ostream& operator<<(std::ostream& os, const Region& region) {
    return os << "[" << region.start << ", " << region.end << ")";
}

} // namespace Storage
} // namespace TagSplice

#endif // TAGSPLICE_STORAGE_REGION_H

/*
 * tagsplice.h - main include for all other source files.
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

#ifndef __TAGSPLICE_H__
#define __TAGSPLICE_H__

#ifdef HAVE_CONFIG_H
#include "config.h"
#endif

// defines
#define TAGSPLICE_VERSION "2-CURRENT"
#define TAGSPLICE_MAINTAINER "Kirn Gill II <segin2005@gmail.com>"

//
// C++ Standard Library
#include <algorithm>
#include <exception>
#include <fstream>
#include <functional>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <sstream>
#include <unordered_set>
#include <utility>
#include <vector>
#include <chrono>
#include <limits>

// C Standard Library (wrapped)
#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>

// System-specific headers
#include <sys/stat.h>
#include <sys/types.h>
#ifndef _WIN32
#include <unistd.h>
#include <fcntl.h>
#else
#include <io.h>
#endif

// TagLib headers
#include <taglib/taglib.h>
#include <taglib/tstring.h>
#include <taglib/tbytevector.h>
#include <taglib/tiostream.h>

// Local project headers (in dependency order)
#include "debug.h"
#include "exceptions.h"
#include "RAIIFileHandle.h"

// I/O layer
#include "io/Stream.h"
#include "io/StorageFile.h"
#include "io/MemoryStorageFile.h"
#include "io/file/FileStorageFile.h"
#include "io/TagLibStorageFile.h"

// Region storage
#include "storage/StorageConstants.h"
#include "storage/Region.h"
#include "storage/TagStorage.h"
#include "storage/PlainStorage.h"
#include "storage/RegionReader.h"
#include "storage/RegionWriter.h"

// Tag codecs
#include "tag/TagConstants.h"
#include "tag/Unsynch.h"
#include "tag/UnsynchReader.h"

#endif // __TAGSPLICE_H__

/*
 * test_region_writer_properties.cpp - Property-based tests for region commits
 * This file is part of TagSplice.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * TagSplice is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#include "tagsplice.h"
#include "test_framework.h"
#include "MockStorageFile.h"

#ifdef HAVE_RAPIDCHECK
#include <rapidcheck.h>
#endif

using namespace TagSplice;
using namespace TagSplice::Storage;
using TagSplice::Testing::MockStorageFile;
using namespace TestFramework;

namespace {

struct SpliceOutcome {
    std::vector<uint8_t> file;
    Region region;
};

// Commits replacement into region of original and returns the resulting file.
SpliceOutcome commit(const std::vector<uint8_t>& original, const Region& region,
                     const std::vector<uint8_t>& replacement, size_t copy_buffer_size) {
    auto file = std::make_unique<MockStorageFile>(original);
    MockStorageFile* raw = file.get();
    PlainStorage storage(std::move(file), region, copy_buffer_size);
    {
        auto writer = storage.writer();
        if (!replacement.empty()) {
            writer->write(replacement.data(), replacement.size());
        }
        writer->flush();
    }
    return SpliceOutcome{ raw->data(), storage.region() };
}

std::vector<uint8_t> expectedSplice(const std::vector<uint8_t>& original, const Region& region,
                                    const std::vector<uint8_t>& replacement) {
    std::vector<uint8_t> expected(original.begin(), original.begin() + static_cast<std::ptrdiff_t>(region.start));
    expected.insert(expected.end(), replacement.begin(), replacement.end());
    expected.insert(expected.end(), original.begin() + static_cast<std::ptrdiff_t>(region.end), original.end());
    return expected;
}

} // namespace

#ifdef HAVE_RAPIDCHECK

bool runRapidCheckTests() {
    bool all_passed = true;

    std::cout << "Running RapidCheck property-based tests for region commits...\n\n";

    // Property: a commit replaces the region and keeps every other byte
    std::cout << "  RegionWriter_CommitIsSplice: ";
    auto result1 = rc::check("commit splices the buffer into the region", [](const std::vector<uint8_t>& original,
                                                                            const std::vector<uint8_t>& replacement) {
        const size_t start = *rc::gen::inRange<size_t>(0, original.size() + 1);
        const size_t end = *rc::gen::inRange<size_t>(start, original.size() + 1);
        const size_t chunk = *rc::gen::inRange<size_t>(1, 33);
        const Region region(start, end);

        SpliceOutcome outcome = commit(original, region, replacement, chunk);
        RC_ASSERT(outcome.file == expectedSplice(original, region, replacement));
        RC_ASSERT(outcome.region.start == region.start);
        RC_ASSERT(outcome.region.length() == replacement.size());
    });
    if (!result1) { all_passed = false; std::cout << "FAILED\n"; } else { std::cout << "PASSED\n"; }

    // Property: committing the old contents again restores the original file
    std::cout << "  RegionWriter_CommitIsReversible: ";
    auto result2 = rc::check("committing the old region contents restores the file", [](const std::vector<uint8_t>& original,
                                                                                       const std::vector<uint8_t>& replacement) {
        const size_t start = *rc::gen::inRange<size_t>(0, original.size() + 1);
        const size_t end = *rc::gen::inRange<size_t>(start, original.size() + 1);
        const size_t chunk = *rc::gen::inRange<size_t>(1, 9);
        const Region region(start, end);
        const std::vector<uint8_t> old_contents(original.begin() + static_cast<std::ptrdiff_t>(start),
                                                original.begin() + static_cast<std::ptrdiff_t>(end));

        SpliceOutcome first = commit(original, region, replacement, chunk);
        SpliceOutcome second = commit(first.file, first.region, old_contents, chunk);
        RC_ASSERT(second.file == original);
        RC_ASSERT(second.region == region);
    });
    if (!result2) { all_passed = false; std::cout << "FAILED\n"; } else { std::cout << "PASSED\n"; }

    // Property: reading the region back yields exactly what was committed
    std::cout << "  RegionWriter_ReaderSeesCommit: ";
    auto result3 = rc::check("reader returns the committed bytes", [](const std::vector<uint8_t>& original,
                                                                     const std::vector<uint8_t>& replacement) {
        const size_t start = *rc::gen::inRange<size_t>(0, original.size() + 1);
        const size_t end = *rc::gen::inRange<size_t>(start, original.size() + 1);

        PlainStorage storage(std::make_unique<MockStorageFile>(original), Region(start, end), 4);
        {
            auto writer = storage.writer();
            if (!replacement.empty()) {
                writer->write(replacement.data(), replacement.size());
            }
        }
        auto reader = storage.reader();
        std::vector<uint8_t> read_back(replacement.size() + 8);
        size_t total = 0;
        size_t n;
        while ((n = reader->read(read_back.data() + total, read_back.size() - total)) > 0) {
            total += n;
        }
        read_back.resize(total);
        RC_ASSERT(read_back == replacement);
    });
    if (!result3) { all_passed = false; std::cout << "FAILED\n"; } else { std::cout << "PASSED\n"; }

    std::cout << "\n";
    return all_passed;
}

int main(int argc, char* argv[]) {
    (void)argc;
    (void)argv;

    Debug::initFromEnvironment();

    std::cout << "========================================\n";
    std::cout << "Region Commit Property Tests (RapidCheck)\n";
    std::cout << "========================================\n\n";

    bool passed = runRapidCheckTests();

    std::cout << "\n========================================\n";
    if (passed) {
        std::cout << "All property tests PASSED\n";
    } else {
        std::cout << "Some property tests FAILED\n";
    }
    std::cout << "========================================\n";

    return passed ? 0 : 1;
}

#else // !HAVE_RAPIDCHECK

// ============================================================================
// Fallback Tests (when RapidCheck is not available)
// Exhaustive sweep over small files, regions, replacements and chunk sizes
// ============================================================================

class RegionWriter_Property_CommitIsSplice : public TestCase {
public:
    RegionWriter_Property_CommitIsSplice() : TestCase("RegionWriter_Property_CommitIsSplice") {}
protected:
    void runTest() override {
        for (size_t size = 0; size <= 9; ++size) {
            std::vector<uint8_t> original(size);
            for (size_t i = 0; i < size; ++i) {
                original[i] = static_cast<uint8_t>('a' + i);
            }
            for (size_t start = 0; start <= size; ++start) {
                for (size_t end = start; end <= size; ++end) {
                    for (size_t new_length = 0; new_length <= 12; new_length += 3) {
                        std::vector<uint8_t> replacement(new_length, static_cast<uint8_t>('#'));
                        for (size_t chunk : { 1u, 2u, 5u, 64u }) {
                            Region region(start, end);
                            SpliceOutcome outcome = commit(original, region, replacement, chunk);
                            std::ostringstream context;
                            context << "file " << size << ", region " << region << ", new length "
                                    << new_length << ", chunk " << chunk;
                            ASSERT_BYTES_EQUALS(expectedSplice(original, region, replacement), outcome.file,
                                                context.str());
                            ASSERT_EQUALS(Region(start, start + new_length), outcome.region, context.str());
                        }
                    }
                }
            }
        }
    }
};

class RegionWriter_Property_CommitIsReversible : public TestCase {
public:
    RegionWriter_Property_CommitIsReversible() : TestCase("RegionWriter_Property_CommitIsReversible") {}
protected:
    void runTest() override {
        const std::vector<uint8_t> original = { 'I', 'D', '3', 't', 'a', 'g', 0xFF, 0xFB, 0x90, 0x00, 0x11 };
        for (size_t start = 0; start <= original.size(); ++start) {
            for (size_t end = start; end <= original.size(); ++end) {
                const Region region(start, end);
                const std::vector<uint8_t> old_contents(original.begin() + static_cast<std::ptrdiff_t>(start),
                                                        original.begin() + static_cast<std::ptrdiff_t>(end));
                const std::vector<uint8_t> replacement(end - start + 4, 0x55);

                SpliceOutcome first = commit(original, region, replacement, 3);
                SpliceOutcome second = commit(first.file, first.region, old_contents, 3);
                ASSERT_BYTES_EQUALS(original, second.file, "restored file");
                ASSERT_EQUALS(region, second.region, "restored region");
            }
        }
    }
};

int main(int argc, char* argv[]) {
    (void)argc;
    (void)argv;

    Debug::initFromEnvironment();

    TestSuite suite("Region Commit Property Tests (Fallback)");

    suite.addTest(std::make_unique<RegionWriter_Property_CommitIsSplice>());
    suite.addTest(std::make_unique<RegionWriter_Property_CommitIsReversible>());

    auto results = suite.runAll();
    suite.printResults(results);

    return suite.getFailureCount(results) > 0 ? 1 : 0;
}

#endif // HAVE_RAPIDCHECK

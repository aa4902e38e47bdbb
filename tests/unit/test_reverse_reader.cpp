/**
 * Reverse reader tests: newest-first order, dedup, window-boundary
 * handling and torn-tail behavior.
 */

#include "engine/binary_codec.hpp"
#include "engine/reverse_reader.hpp"
#include "test_support.hpp"

#include <cstdio>
#include <fstream>

using namespace raptor;
using namespace raptor::engine;

static std::vector<StoredEntry> read_all(const std::filesystem::path& path,
                                         size_t chunk_size = ReverseReader::kDefaultChunkSize) {
    std::vector<StoredEntry> entries;
    ReverseReader reader(path, chunk_size);
    while (auto entry = reader.next()) {
        entries.push_back(std::move(*entry));
    }
    return entries;
}

static std::vector<float> ramp(size_t dim, float base) {
    std::vector<float> v(dim);
    for (size_t i = 0; i < dim; ++i) v[i] = base + static_cast<float>(i) * 0.001f;
    return v;
}

TEST(single_record) {
    TempFile file("reader-single");
    codec::write_header(file.path(), 3);
    codec::write_record(file.path(), "key1", {1.0f, 2.0f, 3.0f});

    auto entries = read_all(file.path());
    ASSERT(entries.size() == 1, "One entry expected");
    ASSERT(entries[0].key == "key1", "Key should match");
    ASSERT((vectors_near(entries[0].embedding, {1.0f, 2.0f, 3.0f})), "Embedding should match");
    ASSERT(entries[0].text.empty(), "Binary format keeps no text");
    ASSERT(entries[0].timestamp == 0, "Binary format keeps no timestamp");
}

TEST(reverse_order) {
    TempFile file("reader-order");
    codec::write_header(file.path(), 2);
    codec::write_record(file.path(), "k1", {1.0f, 2.0f});
    codec::write_record(file.path(), "k2", {3.0f, 4.0f});
    codec::write_record(file.path(), "k3", {5.0f, 6.0f});

    auto entries = read_all(file.path());
    ASSERT(entries.size() == 3, "Three entries expected");
    ASSERT(entries[0].key == "k3", "Newest first");
    ASSERT(entries[1].key == "k2", "Then k2");
    ASSERT(entries[2].key == "k1", "Oldest last");
}

TEST(dedup_keeps_last_write) {
    TempFile file("reader-dedup");
    codec::write_header(file.path(), 2);
    codec::write_record(file.path(), "a", {1.0f, 1.0f});
    codec::write_record(file.path(), "a", {2.0f, 2.0f});
    codec::write_record(file.path(), "a", {3.0f, 3.0f});

    auto entries = read_all(file.path());
    ASSERT(entries.size() == 1, "Exactly one entry for a");
    ASSERT((vectors_near(entries[0].embedding, {3.0f, 3.0f})), "Last write wins");
}

TEST(dedup_interleaved) {
    TempFile file("reader-dedup-interleaved");
    codec::write_header(file.path(), 1);
    codec::write_record(file.path(), "x", {1.0f});
    codec::write_record(file.path(), "x", {2.0f});
    codec::write_record(file.path(), "x", {3.0f});
    codec::write_record(file.path(), "y", {4.0f});
    codec::write_record(file.path(), "x", {5.0f});

    auto entries = read_all(file.path());
    ASSERT(entries.size() == 2, "Only x and y");
    ASSERT(entries[0].key == "x" && near(entries[0].embedding[0], 5.0f), "Latest x first");
    ASSERT(entries[1].key == "y" && near(entries[1].embedding[0], 4.0f), "Then y");
}

TEST(header_only_is_empty) {
    TempFile file("reader-header-only");
    codec::write_header(file.path(), 768);
    ASSERT(read_all(file.path()).empty(), "Header-only file yields nothing");
}

TEST(record_larger_than_chunk) {
    // dim 768 -> 3072 bytes of floats, far more than the 1024-byte window.
    TempFile file("reader-large-record");
    auto embedding = ramp(768, 0.5f);
    codec::write_header(file.path(), 768);
    codec::write_record(file.path(), "big", embedding);

    auto entries = read_all(file.path(), 1024);
    ASSERT(entries.size() == 1, "One entry expected");
    ASSERT(entries[0].key == "big", "Key should match");
    ASSERT(vectors_near(entries[0].embedding, embedding), "All 768 floats should match");
}

TEST(many_records_across_windows) {
    // Record size (2 + 6 + 40 + 4 = 52) does not divide the window, so records
    // and footers land on window edges repeatedly.
    TempFile file("reader-many");
    const size_t dim = 10;
    const size_t count = 500;
    codec::write_header(file.path(), dim);

    std::vector<RecordInput> records;
    for (size_t i = 0; i < count; ++i) {
        char key[16];
        std::snprintf(key, sizeof(key), "k%05zu", i);
        records.push_back({key, ramp(dim, static_cast<float>(i))});
    }
    codec::write_records(file.path(), records);

    for (size_t chunk_size : {size_t(4), size_t(7), size_t(53), size_t(100), size_t(1000), ReverseReader::kDefaultChunkSize}) {
        auto entries = read_all(file.path(), chunk_size);
        ASSERT(entries.size() == count, "All records with chunk size " + std::to_string(chunk_size));
        for (size_t i = 0; i < count; ++i) {
            const auto& expected = records[count - 1 - i];
            ASSERT(entries[i].key == expected.key, "Order with chunk size " + std::to_string(chunk_size));
            ASSERT(vectors_near(entries[i].embedding, expected.embedding), "Values with chunk size " + std::to_string(chunk_size));
        }
    }
}

TEST(chunk_size_too_small) {
    TempFile file("reader-tiny-chunk");
    codec::write_header(file.path(), 1);
    ASSERT_THROWS_CODE(ReverseReader(file.path(), 3), ErrorCode::InvalidArgument, "Window under 4 bytes rejected");
}

TEST(torn_tail_is_skipped) {
    TempFile file("reader-torn-tail");
    codec::write_header(file.path(), 2);
    codec::write_record(file.path(), "k1", {1.0f, 2.0f});
    codec::write_record(file.path(), "k2", {3.0f, 0.0f});

    // Drop the last 3 footer bytes, as a crash mid-append would. The trailing
    // 4 bytes now read as a huge length that cannot be satisfied.
    std::filesystem::resize_file(file.path(), std::filesystem::file_size(file.path()) - 3);

    std::vector<StoredEntry> entries;
    bool threw = false;
    try {
        entries = read_all(file.path());
    } catch (const std::exception&) {
        threw = true;
    }
    ASSERT(!threw, "Torn tail must not raise");
    ASSERT(entries.size() == 1 && entries[0].key == "k1", "Torn k2 is absent, k1 still visible");
}

TEST(sub_footer_remainder_stops) {
    TempFile file("reader-remainder");
    codec::write_header(file.path(), 1);
    std::ofstream out(file.path(), std::ios::binary | std::ios::app);
    out.write("\x01\x02\x03", 3);
    out.close();

    ASSERT(read_all(file.path()).empty(), "Fewer than 4 bytes after the header yields nothing");
}

TEST(torn_key_prefix_is_skipped) {
    TempFile file("reader-torn-prefix");
    const uint32_t dim = 768;

    std::vector<RecordInput> records;
    for (int i = 0; i < 200; ++i) {
        char key[8];
        std::snprintf(key, sizeof(key), "key-%03d", i);
        records.push_back({key, ramp(dim, static_cast<float>(i))});
    }
    codec::write_header(file.path(), dim);
    codec::write_records(file.path(), records);

    // Crash right after the next record's key-length prefix. The trailing
    // 4 bytes read as 0x00070000, a length the file can hold.
    {
        std::ofstream out(file.path(), std::ios::binary | std::ios::app);
        out.write("\x07\x00", 2);
    }

    for (size_t chunk_size : {size_t(64 * 1024), size_t(1024 * 1024)}) {
        std::vector<StoredEntry> entries;
        bool threw = false;
        try {
            entries = read_all(file.path(), chunk_size);
        } catch (const std::exception&) {
            threw = true;
        }
        ASSERT(!threw, "Torn prefix must not raise with chunk size " + std::to_string(chunk_size));
        ASSERT(entries.size() == 200, "Every intact record below the torn bytes is visible");
        ASSERT(entries.front().key == "key-199", "Newest intact record first");
    }
}

TEST(corrupt_key_length_raises) {
    TempFile file("reader-corrupt");
    codec::write_header(file.path(), 1);
    codec::write_record(file.path(), "abc", {1.0f});
    codec::write_record(file.path(), "xyz", {2.0f});

    // Claim a 1-byte key for "abc" while its footer still says 13 bytes.
    std::fstream io(file.path(), std::ios::binary | std::ios::in | std::ios::out);
    io.seekp(static_cast<std::streamoff>(codec::kHeaderSize));
    io.put(1);
    io.close();

    ASSERT_THROWS_CODE(read_all(file.path()), ErrorCode::CorruptRecord, "Bad record below a good one is corruption");
}

TEST(undecodable_last_record_is_skipped) {
    TempFile file("reader-corrupt-last");
    codec::write_header(file.path(), 1);
    codec::write_record(file.path(), "abc", {1.0f});
    codec::write_record(file.path(), "xyz", {2.0f});

    // Same damage on the newest record.
    std::fstream io(file.path(), std::ios::binary | std::ios::in | std::ios::out);
    io.seekp(static_cast<std::streamoff>(codec::kHeaderSize + codec::record_length(3, 1)));
    io.put(1);
    io.close();

    auto entries = read_all(file.path());
    ASSERT(entries.size() == 1 && entries[0].key == "abc", "Undecodable newest record treated as absent");
}

TEST(bad_header_raises) {
    TempFile file("reader-bad-header");
    std::ofstream out(file.path(), std::ios::binary);
    out << "this is not a store file";
    out.close();

    ASSERT_THROWS_CODE(ReverseReader reader(file.path()), ErrorCode::InvalidFormat, "Bad magic surfaces");
}

TEST(independent_readers) {
    TempFile file("reader-independent");
    codec::write_header(file.path(), 1);
    codec::write_record(file.path(), "a", {1.0f});
    codec::write_record(file.path(), "b", {2.0f});

    ReverseReader first(file.path());
    ReverseReader second(file.path());
    auto a1 = first.next();
    auto b1 = second.next();
    auto a2 = first.next();
    ASSERT(a1 && b1 && a2, "Both readers produce entries");
    ASSERT(a1->key == "b" && b1->key == "b", "Each reader starts at the newest record");
    ASSERT(a2->key == "a", "Readers keep separate cursors");
    ASSERT(!first.next().has_value(), "First reader is exhausted");
    ASSERT(!first.next().has_value(), "Exhausted reader stays exhausted");
}

int main() {
    std::cout << "=== Reverse reader ===" << std::endl;

    RUN_TEST(single_record);
    RUN_TEST(reverse_order);
    RUN_TEST(dedup_keeps_last_write);
    RUN_TEST(dedup_interleaved);
    RUN_TEST(header_only_is_empty);
    RUN_TEST(record_larger_than_chunk);
    RUN_TEST(many_records_across_windows);
    RUN_TEST(chunk_size_too_small);
    RUN_TEST(torn_tail_is_skipped);
    RUN_TEST(sub_footer_remainder_stops);
    RUN_TEST(torn_key_prefix_is_skipped);
    RUN_TEST(corrupt_key_length_raises);
    RUN_TEST(undecodable_last_record_is_skipped);
    RUN_TEST(bad_header_raises);
    RUN_TEST(independent_readers);

    return report_results();
}

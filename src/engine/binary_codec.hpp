#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "file_io.hpp"
#include "raptor/types.hpp"

namespace raptor::engine::codec {

    constexpr char kMagic[4] = {'E', 'M', 'B', 'D'};
    constexpr uint16_t kCurrentVersion = 1;
    constexpr size_t kHeaderSize = 16;
    constexpr size_t kKeyLengthSize = 2;
    constexpr size_t kFooterSize = 4;
    constexpr size_t kMaxKeyLength = 65535;

    /**
     * @brief Total on-disk size of a record: key length + key + floats + footer.
     */
    constexpr uint64_t record_length(size_t key_length, uint32_t dimension) {
        return kKeyLengthSize + key_length + static_cast<uint64_t>(dimension) * 4 + kFooterSize;
    }

    /**
     * @brief Creates (or truncates) `path` and writes a header for `dimension`.
     */
    void write_header(const std::filesystem::path& path, uint32_t dimension);

    /**
     * @brief Reads and validates the header of `path`.
     * @throws Error Truncated, InvalidFormat or UnsupportedVersion.
     */
    Header read_header(const std::filesystem::path& path);
    Header read_header(const File& file);

    Header decode_header(const uint8_t* data, size_t size);

    /**
     * @throws Error InvalidArgument for an empty key or one longer than kMaxKeyLength bytes.
     */
    void check_key(const std::string& key);

    /**
     * @brief Appends the encoding of one record to `out`.
     */
    void encode_record(std::vector<uint8_t>& out, const std::string& key, const std::vector<float>& embedding);

    /**
     * @brief Decodes a record occupying exactly `length` bytes at `data`.
     * @throws Error CorruptRecord when the key length or footer disagree with `length`.
     */
    StoredEntry decode_record(const uint8_t* data, size_t length, uint32_t dimension);

    void write_record(const std::filesystem::path& path, const std::string& key, const std::vector<float>& embedding);

    /**
     * @brief Encodes every record into one buffer and appends it with a single write.
     */
    void write_records(const std::filesystem::path& path, const std::vector<RecordInput>& records);

    /**
     * @brief Reads the record starting at `offset`.
     * @return std::nullopt when `offset` is at or past end of file.
     * @throws Error Truncated if the record runs past end of file, CorruptRecord on a bad footer.
     */
    std::optional<Record> read_record_forward(const std::filesystem::path& path, uint32_t dimension, uint64_t offset);
    std::optional<Record> read_record_forward(const File& file, uint32_t dimension, uint64_t offset);

    // Little-endian helpers shared with the reverse reader.
    uint16_t load_u16(const uint8_t* p);
    uint32_t load_u32(const uint8_t* p);

}

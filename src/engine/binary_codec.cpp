#include "binary_codec.hpp"
#include "raptor/error.hpp"
#include <cstring>

namespace raptor::engine::codec {

    namespace {
        void store_u16(uint8_t* p, uint16_t v) {
            p[0] = static_cast<uint8_t>(v);
            p[1] = static_cast<uint8_t>(v >> 8);
        }

        void store_u32(uint8_t* p, uint32_t v) {
            p[0] = static_cast<uint8_t>(v);
            p[1] = static_cast<uint8_t>(v >> 8);
            p[2] = static_cast<uint8_t>(v >> 16);
            p[3] = static_cast<uint8_t>(v >> 24);
        }
    }

    void check_key(const std::string& key) {
        if (key.empty()) {
            throw Error(ErrorCode::InvalidArgument, "Key must be provided.");
        }
        if (key.size() > kMaxKeyLength) {
            throw Error(ErrorCode::InvalidArgument,
                        "Key is " + std::to_string(key.size()) + " bytes, limit is " + std::to_string(kMaxKeyLength));
        }
    }

    uint16_t load_u16(const uint8_t* p) {
        return static_cast<uint16_t>(p[0] | (p[1] << 8));
    }

    uint32_t load_u32(const uint8_t* p) {
        return static_cast<uint32_t>(p[0]) | (static_cast<uint32_t>(p[1]) << 8) |
               (static_cast<uint32_t>(p[2]) << 16) | (static_cast<uint32_t>(p[3]) << 24);
    }

    void write_header(const std::filesystem::path& path, uint32_t dimension) {
        uint8_t buffer[kHeaderSize] = {};
        std::memcpy(buffer, kMagic, sizeof(kMagic));
        store_u16(buffer + 4, kCurrentVersion);
        store_u32(buffer + 6, dimension);
        // bytes 10..16 reserved, left zero

        File file(path, File::Mode::Create);
        file.write_all(buffer, kHeaderSize);
    }

    Header decode_header(const uint8_t* data, size_t size) {
        if (size < kHeaderSize) {
            throw Error(ErrorCode::Truncated,
                        "File too small: expected at least " + std::to_string(kHeaderSize) +
                        " bytes, got " + std::to_string(size));
        }
        if (std::memcmp(data, kMagic, sizeof(kMagic)) != 0) {
            throw Error(ErrorCode::InvalidFormat,
                        "Invalid file format: magic bytes expected \"EMBD\", got \"" +
                        std::string(reinterpret_cast<const char*>(data), 4) + "\"");
        }

        Header header;
        header.version = load_u16(data + 4);
        if (header.version > kCurrentVersion) {
            throw Error(ErrorCode::UnsupportedVersion,
                        "Unsupported version: " + std::to_string(header.version) +
                        ". Current version is " + std::to_string(kCurrentVersion));
        }
        header.dimension = load_u32(data + 6);
        return header;
    }

    Header read_header(const File& file) {
        uint8_t buffer[kHeaderSize];
        size_t n = file.read_at(buffer, kHeaderSize, 0);
        return decode_header(buffer, n);
    }

    Header read_header(const std::filesystem::path& path) {
        File file(path, File::Mode::Read);
        return read_header(file);
    }

    void encode_record(std::vector<uint8_t>& out, const std::string& key, const std::vector<float>& embedding) {
        check_key(key);
        uint64_t length = record_length(key.size(), static_cast<uint32_t>(embedding.size()));
        if (length > UINT32_MAX) {
            throw Error(ErrorCode::InvalidArgument, "Record of " + std::to_string(length) + " bytes overflows the length footer");
        }

        size_t pos = out.size();
        out.resize(pos + length);
        uint8_t* p = out.data() + pos;

        store_u16(p, static_cast<uint16_t>(key.size()));
        p += kKeyLengthSize;
        std::memcpy(p, key.data(), key.size());
        p += key.size();

        for (float value : embedding) {
            uint32_t bits;
            std::memcpy(&bits, &value, sizeof(bits));
            store_u32(p, bits);
            p += 4;
        }

        store_u32(p, static_cast<uint32_t>(length));
    }

    StoredEntry decode_record(const uint8_t* data, size_t length, uint32_t dimension) {
        if (length < record_length(0, dimension)) {
            throw Error(ErrorCode::CorruptRecord,
                        "Record of " + std::to_string(length) + " bytes is shorter than the minimum for dimension " +
                        std::to_string(dimension));
        }

        uint16_t key_length = load_u16(data);
        uint64_t expected = record_length(key_length, dimension);
        uint32_t footer = load_u32(data + length - kFooterSize);
        if (expected != length || footer != expected) {
            throw Error(ErrorCode::CorruptRecord,
                        "Record length mismatch: expected " + std::to_string(expected) +
                        ", got " + std::to_string(footer));
        }

        StoredEntry entry;
        const uint8_t* p = data + kKeyLengthSize;
        entry.key.assign(reinterpret_cast<const char*>(p), key_length);
        p += key_length;

        entry.embedding.resize(dimension);
        for (uint32_t i = 0; i < dimension; ++i) {
            uint32_t bits = load_u32(p);
            std::memcpy(&entry.embedding[i], &bits, sizeof(float));
            p += 4;
        }
        return entry;
    }

    void write_record(const std::filesystem::path& path, const std::string& key, const std::vector<float>& embedding) {
        std::vector<uint8_t> buffer;
        encode_record(buffer, key, embedding);

        File file(path, File::Mode::Append);
        file.write_all(buffer.data(), buffer.size());
    }

    void write_records(const std::filesystem::path& path, const std::vector<RecordInput>& records) {
        if (records.empty()) return;

        size_t total = 0;
        for (const auto& record : records) {
            total += record_length(record.key.size(), static_cast<uint32_t>(record.embedding.size()));
        }

        std::vector<uint8_t> buffer;
        buffer.reserve(total);
        for (const auto& record : records) {
            encode_record(buffer, record.key, record.embedding);
        }

        File file(path, File::Mode::Append);
        file.write_all(buffer.data(), buffer.size());
    }

    std::optional<Record> read_record_forward(const File& file, uint32_t dimension, uint64_t offset) {
        uint8_t prefix[kKeyLengthSize];
        size_t n = file.read_at(prefix, kKeyLengthSize, offset);
        if (n == 0) return std::nullopt;
        if (n < kKeyLengthSize) {
            throw Error(ErrorCode::Truncated, "Record at offset " + std::to_string(offset) + " is cut short");
        }

        uint64_t length = record_length(load_u16(prefix), dimension);
        std::vector<uint8_t> buffer(length);
        n = file.read_at(buffer.data(), buffer.size(), offset);
        if (n < length) {
            throw Error(ErrorCode::Truncated,
                        "Record at offset " + std::to_string(offset) + " declares " + std::to_string(length) +
                        " bytes, only " + std::to_string(n) + " available");
        }

        StoredEntry entry = decode_record(buffer.data(), buffer.size(), dimension);
        Record record;
        record.key = std::move(entry.key);
        record.embedding = std::move(entry.embedding);
        record.length = static_cast<uint32_t>(length);
        return record;
    }

    std::optional<Record> read_record_forward(const std::filesystem::path& path, uint32_t dimension, uint64_t offset) {
        File file(path, File::Mode::Read);
        return read_record_forward(file, dimension, offset);
    }

}

#pragma once
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace raptor::engine {

    /**
     * @brief Decoded 16-byte file preamble.
     */
    struct Header {
        uint16_t version = 0;
        uint32_t dimension = 0;
    };

    /**
     * @brief One logical entry materialized from the store.
     * The binary format keeps neither text nor timestamp, so both stay empty/zero.
     */
    struct StoredEntry {
        std::string key;
        std::vector<float> embedding;
        std::string text;
        int64_t timestamp = 0;
    };

    /**
     * @brief A record decoded by a forward read, with its on-disk size.
     */
    struct Record {
        std::string key;
        std::vector<float> embedding;
        uint32_t length = 0;
    };

    struct RecordInput {
        std::string key;
        std::vector<float> embedding;
    };

    struct StoreItem {
        std::string key;
        std::string text;
    };

    struct SearchResult {
        std::string key;
        float similarity;
    };

    struct StoreStats {
        std::filesystem::path path;
        uint16_t version = 0;
        uint32_t dimension = 0;
        std::uintmax_t file_size = 0;
        size_t record_count = 0;
        size_t unique_keys = 0;
    };

}

#include "storage_engine.hpp"
#include "binary_codec.hpp"
#include "candidate_set.hpp"
#include "raptor/error.hpp"
#include <cmath>
#include <iostream>
#include <unordered_set>

namespace raptor::engine {

    StorageEngine::StorageEngine(EngineOptions options, EmbedderFactory factory)
        : m_options(std::move(options)), m_factory(std::move(factory)) {
        if (!m_factory) {
            throw Error(ErrorCode::InvalidArgument, "An embedder factory must be provided.");
        }
    }

    std::shared_ptr<Embedder> StorageEngine::embedder() {
        std::lock_guard<std::mutex> lock(m_embedder_mutex);
        if (!m_embedder) {
            m_embedder = m_factory();
            if (!m_embedder) {
                throw Error(ErrorCode::ProviderError, "Embedder factory returned no embedder.");
            }
        }
        return m_embedder;
    }

    void StorageEngine::dispose() {
        std::lock_guard<std::mutex> lock(m_embedder_mutex);
        m_embedder.reset();
    }

    bool StorageEngine::has_embedder() const {
        std::lock_guard<std::mutex> lock(m_embedder_mutex);
        return m_embedder != nullptr;
    }

    std::vector<std::vector<float>> StorageEngine::embed_batch(const std::vector<std::string>& texts) {
        auto provider = embedder();
        auto embeddings = provider->embed(texts);
        for (const auto& embedding : embeddings) {
            if (embedding.empty()) {
                throw Error(ErrorCode::ProviderError, "Embedding provider returned an empty vector.");
            }
        }
        return embeddings;
    }

    std::vector<float> StorageEngine::generate_embedding(const std::string& text) {
        auto embeddings = embed_batch({text});
        if (embeddings.empty()) {
            throw Error(ErrorCode::ProviderError, "Embedding provider returned no vector.");
        }
        return std::move(embeddings.front());
    }

    void StorageEngine::prepare_file(uint32_t dimension) {
        const auto& path = m_options.store_path;
        if (!std::filesystem::exists(path)) {
            if (path.has_parent_path()) {
                std::filesystem::create_directories(path.parent_path());
            }
            codec::write_header(path, dimension);
            return;
        }

        Header header = codec::read_header(path);
        if (header.dimension != dimension) {
            throw Error(ErrorCode::DimensionMismatch,
                        "Store dimension is " + std::to_string(header.dimension) +
                        ", embedding has " + std::to_string(dimension));
        }
    }

    void StorageEngine::store(const std::string& key, const std::string& text) {
        codec::check_key(key);

        auto embedding = generate_embedding(text);
        prepare_file(static_cast<uint32_t>(embedding.size()));
        codec::write_record(m_options.store_path, key, embedding);
    }

    void StorageEngine::store_many(const std::vector<StoreItem>& items) {
        if (items.empty()) throw Error(ErrorCode::InvalidArgument, "Items array must not be empty.");

        std::vector<std::string> texts;
        texts.reserve(items.size());
        for (const auto& item : items) {
            codec::check_key(item.key);
            texts.push_back(item.text);
        }

        auto embeddings = embed_batch(texts);
        if (embeddings.size() != items.size()) {
            throw Error(ErrorCode::InvariantViolation,
                        "Number of embeddings (" + std::to_string(embeddings.size()) +
                        ") must match number of items (" + std::to_string(items.size()) + ").");
        }

        const size_t dimension = embeddings.front().size();
        for (const auto& embedding : embeddings) {
            if (embedding.size() != dimension) {
                throw Error(ErrorCode::DimensionMismatch, "Embedding provider returned vectors of mixed dimension.");
            }
        }
        prepare_file(static_cast<uint32_t>(dimension));

        std::vector<RecordInput> records;
        records.reserve(items.size());
        for (size_t i = 0; i < items.size(); ++i) {
            records.push_back({items[i].key, std::move(embeddings[i])});
        }
        codec::write_records(m_options.store_path, records);
    }

    std::optional<StoredEntry> StorageEngine::get(const std::string& key) const {
        if (key.empty()) throw Error(ErrorCode::InvalidArgument, "Key must be provided.");
        if (!std::filesystem::exists(m_options.store_path)) return std::nullopt;

        ReverseReader reader(m_options.store_path, m_options.chunk_size);
        while (auto entry = reader.next()) {
            if (entry->key == key) return entry;
        }
        return std::nullopt;
    }

    std::vector<SearchResult> StorageEngine::search(const std::string& query, int limit, double min_similarity) {
        if (query.empty()) throw Error(ErrorCode::InvalidArgument, "Query text must be provided.");
        if (limit <= 0) throw Error(ErrorCode::InvalidArgument, "Limit must be a positive integer.");
        if (!(min_similarity >= 0.0 && min_similarity <= 1.0)) {
            throw Error(ErrorCode::InvalidArgument, "minSimilarity must be between 0 and 1.");
        }

        if (!std::filesystem::exists(m_options.store_path)) return {};

        // Compared in float so a similarity equal to the threshold passes.
        const float threshold = static_cast<float>(min_similarity);
        auto query_embedding = generate_embedding(query);
        CandidateSet candidates(static_cast<size_t>(limit));

        ReverseReader reader(m_options.store_path, m_options.chunk_size);
        while (auto entry = reader.next()) {
            float similarity = cosine_similarity(query_embedding, entry->embedding);
            if (!(similarity >= threshold)) continue; // also drops NaN
            candidates.add(entry->key, similarity);
        }

        std::vector<SearchResult> results;
        for (auto& candidate : candidates.entries()) {
            results.push_back({std::move(candidate.key), candidate.value});
        }
        return results;
    }

    StoreStats StorageEngine::stats() const {
        const auto& path = m_options.store_path;
        if (!std::filesystem::exists(path)) {
            throw Error(ErrorCode::NotFound, "Store file does not exist: " + path.string());
        }

        File file(path, File::Mode::Read);
        Header header = codec::read_header(file);

        StoreStats stats;
        stats.path = path;
        stats.version = header.version;
        stats.dimension = header.dimension;
        stats.file_size = file.size();

        std::unordered_set<std::string> keys;
        uint64_t offset = codec::kHeaderSize;
        while (true) {
            std::optional<Record> record;
            try {
                record = codec::read_record_forward(file, header.dimension, offset);
            } catch (const Error& e) {
                // A record running past end of file is a torn tail; readers treat it as absent.
                if (e.code() != ErrorCode::Truncated) throw;
                std::cerr << "[StorageEngine] Not counting torn record at offset " << offset << "\n";
                break;
            }
            if (!record) break;
            offset += record->length;
            ++stats.record_count;
            keys.insert(std::move(record->key));
        }
        stats.unique_keys = keys.size();
        return stats;
    }

    float cosine_similarity(const std::vector<float>& a, const std::vector<float>& b) {
        if (a.size() != b.size()) {
            throw Error(ErrorCode::DimensionMismatch,
                        "Embeddings must have the same dimensions (" + std::to_string(a.size()) +
                        " vs " + std::to_string(b.size()) + ")");
        }

        double dot_product = 0.0;
        double magnitude_a = 0.0;
        double magnitude_b = 0.0;
        for (size_t i = 0; i < a.size(); ++i) {
            dot_product += (double)a[i] * b[i];
            magnitude_a += (double)a[i] * a[i];
            magnitude_b += (double)b[i] * b[i];
        }

        if (magnitude_a == 0.0 || magnitude_b == 0.0) return 0.0f;

        double similarity = dot_product / (std::sqrt(magnitude_a) * std::sqrt(magnitude_b));
        // Rounding can push |similarity| a hair past 1.
        if (similarity > 1.0) similarity = 1.0;
        if (similarity < -1.0) similarity = -1.0;
        return static_cast<float>(similarity);
    }

}

#pragma once

#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "embedder.hpp"
#include "reverse_reader.hpp"
#include "raptor/types.hpp"

namespace raptor::engine {

    struct EngineOptions {
        std::filesystem::path store_path;
        size_t chunk_size = ReverseReader::kDefaultChunkSize;
    };

    /**
     * @brief Append-only embedding store bound to one file.
     *
     * Every get/search re-scans the file; nothing is cached between calls
     * except the embedding provider, which is created on first use by the
     * factory and released by dispose(). A call that is already using the
     * provider keeps it alive until it returns. Reads may run concurrently;
     * writers must be serialized by the caller.
     */
    class StorageEngine {
    public:
        using EmbedderFactory = std::function<std::unique_ptr<Embedder>()>;

        StorageEngine(EngineOptions options, EmbedderFactory factory);

        /**
         * @brief Embeds `text` and appends it under `key`, creating the file on first use.
         */
        void store(const std::string& key, const std::string& text);

        /**
         * @brief Embeds all texts in one provider call and appends them in one write.
         */
        void store_many(const std::vector<StoreItem>& items);

        /**
         * @brief Latest entry for `key`, or std::nullopt if absent or the file does not exist.
         */
        std::optional<StoredEntry> get(const std::string& key) const;

        /**
         * @brief Top `limit` entries by cosine similarity to `query`, at least `min_similarity`.
         */
        std::vector<SearchResult> search(const std::string& query, int limit = 10, double min_similarity = 0.5);

        std::vector<float> generate_embedding(const std::string& text);

        /**
         * @brief Forward scan of the whole file.
         * @throws Error NotFound if the file does not exist.
         */
        StoreStats stats() const;

        /**
         * @brief Releases the provider. The next embedding call re-creates it.
         */
        void dispose();

        bool has_embedder() const;

        const std::filesystem::path& store_path() const { return m_options.store_path; }

    private:
        std::shared_ptr<Embedder> embedder();
        std::vector<std::vector<float>> embed_batch(const std::vector<std::string>& texts);
        void prepare_file(uint32_t dimension);

        EngineOptions m_options;
        EmbedderFactory m_factory;

        mutable std::mutex m_embedder_mutex;
        std::shared_ptr<Embedder> m_embedder;
    };

    /**
     * @brief dot(a, b) / (|a| * |b|), or 0 when either magnitude is 0.
     * @throws Error DimensionMismatch if the lengths differ.
     */
    float cosine_similarity(const std::vector<float>& a, const std::vector<float>& b);

}

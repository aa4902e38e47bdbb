#pragma once

#include <cstdlib>
#include <iostream>
#include <string>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>

namespace raptor::engine {

    struct Config {
        std::string store_path = ""; // empty: <data dir>/database.raptor
        std::string embedding_backend = "ollama"; // ollama, onnx, openai
        std::string embedding_model = "all-minilm"; // for ollama
        std::string embedding_endpoint = "http://localhost:11434/api/embed"; // for ollama
        std::string openai_key = "";
        std::string openai_model = "text-embedding-3-small";
        std::string onnx_model_path = "model.onnx";
        std::string onnx_vocab_path = "vocab.txt";
        size_t chunk_size = 64 * 1024; // reverse scan window in bytes
        int search_limit = 10;
        double min_similarity = 0.5;

        /**
         * @brief Loads `path` over the defaults. A missing file yields the
         * defaults; a malformed one is reported and also yields the defaults.
         */
        static Config load(const std::filesystem::path& path) {
            Config cfg;
            if (!std::filesystem::exists(path)) return cfg;

            try {
                std::ifstream f(path);
                nlohmann::json j = nlohmann::json::parse(f);

                cfg.store_path = j.value("store_path", cfg.store_path);
                cfg.embedding_backend = j.value("embedding_backend", cfg.embedding_backend);
                cfg.embedding_model = j.value("embedding_model", cfg.embedding_model);
                cfg.embedding_endpoint = j.value("embedding_endpoint", cfg.embedding_endpoint);
                cfg.openai_key = j.value("openai_key", cfg.openai_key);
                cfg.openai_model = j.value("openai_model", cfg.openai_model);
                cfg.onnx_model_path = j.value("onnx_model_path", cfg.onnx_model_path);
                cfg.onnx_vocab_path = j.value("onnx_vocab_path", cfg.onnx_vocab_path);
                cfg.chunk_size = j.value("chunk_size", cfg.chunk_size);
                cfg.search_limit = j.value("search_limit", cfg.search_limit);
                cfg.min_similarity = j.value("min_similarity", cfg.min_similarity);
            } catch (const nlohmann::json::exception& e) {
                std::cerr << "[Config] Ignoring " << path << ": " << e.what() << "\n";
                return Config{};
            }
            return cfg;
        }

        /**
         * @brief Applies OPENAI_API_KEY and RAPTOR_STORE_PATH when set.
         */
        void apply_env() {
            if (const char* key = std::getenv("OPENAI_API_KEY")) openai_key = key;
            if (const char* store = std::getenv("RAPTOR_STORE_PATH")) store_path = store;
        }

        void save(const std::filesystem::path& path) const {
            nlohmann::json j;
            j["store_path"] = store_path;
            j["embedding_backend"] = embedding_backend;
            j["embedding_model"] = embedding_model;
            j["embedding_endpoint"] = embedding_endpoint;
            j["openai_model"] = openai_model;
            j["onnx_model_path"] = onnx_model_path;
            j["onnx_vocab_path"] = onnx_vocab_path;
            j["chunk_size"] = chunk_size;
            j["search_limit"] = search_limit;
            j["min_similarity"] = min_similarity;
            if (!openai_key.empty()) j["openai_key"] = openai_key;

            std::ofstream f(path);
            f << j.dump(4);
        }
    };

}

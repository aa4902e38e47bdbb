#pragma once

#include <string>
#include <vector>
#include <memory>
#include "config.hpp"

namespace raptor::engine {

    /**
     * @brief Abstract base class for embedding generation.
     */
    class Embedder {
    public:
        virtual ~Embedder() = default;

        /**
         * @brief Generates one embedding per input text, in input order.
         * @throws Error ProviderError when the backend fails.
         */
        virtual std::vector<std::vector<float>> embed(const std::vector<std::string>& texts) = 0;

        /**
         * @brief Returns the dimension of the vectors produced by this embedder,
         * or 0 if it is not known until the first call.
         */
        virtual size_t dimension() const = 0;
    };

    std::unique_ptr<Embedder> create_ollama_embedder(const std::string& model, const std::string& endpoint);
    std::unique_ptr<Embedder> create_onnx_embedder(const std::string& model_path, const std::string& vocab_path);
    std::unique_ptr<Embedder> create_openai_embedder(const std::string& api_key, const std::string& model = "text-embedding-3-small");

    /**
     * @brief Builds the backend named by `config.embedding_backend`.
     * @throws Error InvalidArgument for an unknown backend name.
     */
    std::unique_ptr<Embedder> create_embedder(const Config& config);

}

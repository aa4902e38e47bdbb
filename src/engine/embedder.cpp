#include "embedder.hpp"
#include "raptor/error.hpp"
#include <iostream>

namespace raptor::engine {

    std::unique_ptr<Embedder> create_embedder(const Config& config) {
        if (config.embedding_backend == "openai") {
            if (config.openai_key.empty()) {
                throw Error(ErrorCode::InvalidArgument, "OpenAI backend selected but no API key configured.");
            }
            std::cerr << "[Raptor] Using OpenAI Embedder.\n";
            return create_openai_embedder(config.openai_key, config.openai_model);
        }
        if (config.embedding_backend == "onnx") {
            std::cerr << "[Raptor] Using Local ONNX Embedder.\n";
            return create_onnx_embedder(config.onnx_model_path, config.onnx_vocab_path);
        }
        if (config.embedding_backend == "ollama") {
            std::cerr << "[Raptor] Using Ollama Embedder.\n";
            return create_ollama_embedder(config.embedding_model, config.embedding_endpoint);
        }
        throw Error(ErrorCode::InvalidArgument, "Unknown embedding backend: " + config.embedding_backend);
    }

}

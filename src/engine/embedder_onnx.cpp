#include "embedder.hpp"
#include "raptor/error.hpp"
#include <atomic>
#include <iostream>
#include <vector>
#include <cmath>
#include <filesystem>

#ifdef RAPTOR_WITH_ONNX
#include <onnxruntime_cxx_api.h>
#include "tokenizer.hpp"
#endif

namespace raptor::engine {

#ifdef RAPTOR_WITH_ONNX

    class OnnxEmbedder : public Embedder {
    public:
        OnnxEmbedder(const std::string& model_path, const std::string& vocab_path) {
            if (!std::filesystem::exists(model_path) || !std::filesystem::exists(vocab_path)) {
                throw Error(ErrorCode::ProviderError,
                            "[OnnxEmbedder] Model or vocab file not found: " + model_path + ", " + vocab_path);
            }

            try {
                m_env = std::make_unique<Ort::Env>(ORT_LOGGING_LEVEL_WARNING, "raptor");

                Ort::SessionOptions session_options;
                session_options.SetIntraOpNumThreads(1);
                session_options.SetGraphOptimizationLevel(GraphOptimizationLevel::ORT_ENABLE_ALL);

                m_session = std::make_unique<Ort::Session>(*m_env, model_path.c_str(), session_options);
            } catch (const Ort::Exception& e) {
                throw Error(ErrorCode::ProviderError, std::string("[OnnxEmbedder] Initialization failed: ") + e.what());
            }
            m_tokenizer = std::make_unique<Tokenizer>(vocab_path);
            std::cerr << "[OnnxEmbedder] Loaded: " << model_path << "\n";
        }

        std::vector<std::vector<float>> embed(const std::vector<std::string>& texts) override {
            std::vector<std::vector<float>> embeddings;
            embeddings.reserve(texts.size());
            for (const auto& text : texts) {
                embeddings.push_back(embed_one(text));
            }
            return embeddings;
        }

        size_t dimension() const override { return m_dimension; }

    private:
        std::unique_ptr<Ort::Env> m_env;
        std::unique_ptr<Ort::Session> m_session;
        std::unique_ptr<Tokenizer> m_tokenizer;
        std::atomic<size_t> m_dimension{0};

        std::vector<float> embed_one(const std::string& text) {
            auto input_ids = m_tokenizer->encode(text);
            size_t seq_length = input_ids.size();

            std::vector<int64_t> token_type_ids(seq_length, 0);
            std::vector<int64_t> attention_mask(seq_length, 1);
            std::vector<int64_t> input_shape = { 1, (int64_t)seq_length };

            auto memory_info = Ort::MemoryInfo::CreateCpu(OrtArenaAllocator, OrtMemTypeDefault);

            std::vector<Ort::Value> input_tensors;
            input_tensors.push_back(Ort::Value::CreateTensor<int64_t>(memory_info, input_ids.data(), input_ids.size(), input_shape.data(), input_shape.size()));
            input_tensors.push_back(Ort::Value::CreateTensor<int64_t>(memory_info, attention_mask.data(), attention_mask.size(), input_shape.data(), input_shape.size()));
            input_tensors.push_back(Ort::Value::CreateTensor<int64_t>(memory_info, token_type_ids.data(), token_type_ids.size(), input_shape.data(), input_shape.size()));

            const char* input_names[] = { "input_ids", "attention_mask", "token_type_ids" };
            const char* output_names[] = { "last_hidden_state" };

            std::vector<float> embedding;
            try {
                auto output_tensors = m_session->Run(Ort::RunOptions{nullptr}, input_names, input_tensors.data(), 3, output_names, 1);

                // [batch, seq, hidden]
                const float* hidden = output_tensors[0].GetTensorData<float>();
                auto shape = output_tensors[0].GetTensorTypeAndShapeInfo().GetShape();
                size_t hidden_size = static_cast<size_t>(shape[2]);

                // Mean pooling over tokens; every token is unmasked for a single sequence.
                embedding.assign(hidden_size, 0.0f);
                for (size_t i = 0; i < seq_length; ++i) {
                    for (size_t j = 0; j < hidden_size; ++j) {
                        embedding[j] += hidden[i * hidden_size + j];
                    }
                }

                float norm = 0.0f;
                for (float& val : embedding) {
                    val /= (float)seq_length;
                    norm += val * val;
                }
                norm = std::sqrt(norm);
                for (float& val : embedding) val /= (norm + 1e-9f);
            } catch (const Ort::Exception& e) {
                throw Error(ErrorCode::ProviderError, std::string("[OnnxEmbedder] Inference failed: ") + e.what());
            }

            m_dimension = embedding.size();
            return embedding;
        }
    };

    std::unique_ptr<Embedder> create_onnx_embedder(const std::string& model_path, const std::string& vocab_path) {
        return std::make_unique<OnnxEmbedder>(model_path, vocab_path);
    }

#else

    std::unique_ptr<Embedder> create_onnx_embedder(const std::string&, const std::string&) {
        throw Error(ErrorCode::ProviderError, "[OnnxEmbedder] Compiled without ONNX Runtime support.");
    }

#endif

}

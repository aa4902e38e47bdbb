#include "embedder.hpp"
#include "raptor/error.hpp"
#include <atomic>
#include <nlohmann/json.hpp>
#include <curl/curl.h>

using json = nlohmann::json;

namespace raptor::engine {

    class OllamaEmbedder : public Embedder {
    public:
        OllamaEmbedder(const std::string& model, const std::string& endpoint)
            : m_model(model), m_endpoint(endpoint) {
            curl_global_init(CURL_GLOBAL_DEFAULT);
        }

        ~OllamaEmbedder() {
            curl_global_cleanup();
        }

        std::vector<std::vector<float>> embed(const std::vector<std::string>& texts) override {
            CURL* curl = curl_easy_init();
            if (!curl) throw Error(ErrorCode::ProviderError, "[OllamaEmbedder] curl_easy_init() failed");

            std::string json_str;
            try {
                json body = {
                    {"model", m_model},
                    {"input", texts}
                };
                json_str = body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
            } catch (const json::exception& e) {
                curl_easy_cleanup(curl);
                throw Error(ErrorCode::ProviderError, std::string("[OllamaEmbedder] JSON serialization error: ") + e.what());
            }

            struct curl_slist* headers = nullptr;
            headers = curl_slist_append(headers, "Content-Type: application/json");

            std::string response_string;
            curl_easy_setopt(curl, CURLOPT_URL, m_endpoint.c_str());
            curl_easy_setopt(curl, CURLOPT_POSTFIELDS, json_str.c_str());
            curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
            curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, WriteCallback);
            curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response_string);

            CURLcode res = curl_easy_perform(curl);
            curl_slist_free_all(headers);
            curl_easy_cleanup(curl);

            if (res != CURLE_OK) {
                throw Error(ErrorCode::ProviderError,
                            std::string("[OllamaEmbedder] curl_easy_perform() failed: ") + curl_easy_strerror(res));
            }

            std::vector<std::vector<float>> embeddings;
            try {
                auto resp_json = json::parse(response_string);
                if (resp_json.contains("error")) {
                    throw Error(ErrorCode::ProviderError, "[OllamaEmbedder] API Error: " + resp_json["error"].dump());
                }
                if (!resp_json.contains("embeddings")) {
                    throw Error(ErrorCode::ProviderError, "[OllamaEmbedder] Response has no embeddings");
                }
                embeddings = resp_json["embeddings"].get<std::vector<std::vector<float>>>();
            } catch (const json::exception& e) {
                throw Error(ErrorCode::ProviderError, std::string("[OllamaEmbedder] JSON parse error: ") + e.what());
            }

            if (!embeddings.empty()) m_dimension = embeddings.front().size();
            return embeddings;
        }

        size_t dimension() const override { return m_dimension; }

    private:
        std::string m_model;
        std::string m_endpoint;
        std::atomic<size_t> m_dimension{0};

        static size_t WriteCallback(void* contents, size_t size, size_t nmemb, void* userp) {
            ((std::string*)userp)->append((char*)contents, size * nmemb);
            return size * nmemb;
        }
    };

    std::unique_ptr<Embedder> create_ollama_embedder(const std::string& model, const std::string& endpoint) {
        return std::make_unique<OllamaEmbedder>(model, endpoint);
    }

}

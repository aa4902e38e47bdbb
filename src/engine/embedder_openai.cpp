#include "embedder.hpp"
#include "raptor/error.hpp"
#include <atomic>
#include <nlohmann/json.hpp>
#include <curl/curl.h>

using json = nlohmann::json;

namespace raptor::engine {

    class OpenAIEmbedder : public Embedder {
    public:
        OpenAIEmbedder(const std::string& api_key, const std::string& model = "text-embedding-3-small")
            : m_api_key(api_key), m_model(model) {
            curl_global_init(CURL_GLOBAL_DEFAULT);
        }

        ~OpenAIEmbedder() {
            curl_global_cleanup();
        }

        std::vector<std::vector<float>> embed(const std::vector<std::string>& texts) override {
            CURL* curl = curl_easy_init();
            if (!curl) throw Error(ErrorCode::ProviderError, "[OpenAIEmbedder] curl_easy_init() failed");

            json body = {
                {"model", m_model},
                {"input", texts}
            };
            std::string json_str = body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);

            struct curl_slist* headers = nullptr;
            headers = curl_slist_append(headers, "Content-Type: application/json");
            std::string auth_header = "Authorization: Bearer " + m_api_key;
            headers = curl_slist_append(headers, auth_header.c_str());

            std::string response_string;
            curl_easy_setopt(curl, CURLOPT_URL, "https://api.openai.com/v1/embeddings");
            curl_easy_setopt(curl, CURLOPT_POSTFIELDS, json_str.c_str());
            curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
            curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, WriteCallback);
            curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response_string);

            CURLcode res = curl_easy_perform(curl);
            curl_slist_free_all(headers);
            curl_easy_cleanup(curl);

            if (res != CURLE_OK) {
                throw Error(ErrorCode::ProviderError,
                            std::string("[OpenAIEmbedder] curl_easy_perform() failed: ") + curl_easy_strerror(res));
            }

            std::vector<std::vector<float>> embeddings;
            try {
                auto resp_json = json::parse(response_string);
                if (resp_json.contains("error")) {
                    throw Error(ErrorCode::ProviderError, "[OpenAIEmbedder] API Error: " + resp_json["error"].dump());
                }
                if (!resp_json.contains("data")) {
                    throw Error(ErrorCode::ProviderError, "[OpenAIEmbedder] Response has no data");
                }

                // Items carry their input position in "index"; do not rely on array order.
                const auto& data = resp_json["data"];
                embeddings.resize(data.size());
                for (const auto& item : data) {
                    size_t index = item.at("index").get<size_t>();
                    if (index >= embeddings.size()) {
                        throw Error(ErrorCode::ProviderError, "[OpenAIEmbedder] Response index out of range");
                    }
                    embeddings[index] = item.at("embedding").get<std::vector<float>>();
                }
            } catch (const json::exception& e) {
                throw Error(ErrorCode::ProviderError, std::string("[OpenAIEmbedder] JSON parse error: ") + e.what());
            }

            if (!embeddings.empty()) m_dimension = embeddings.front().size();
            return embeddings;
        }

        size_t dimension() const override { return m_dimension; }

    private:
        std::string m_api_key;
        std::string m_model;
        std::atomic<size_t> m_dimension{0};

        static size_t WriteCallback(void* contents, size_t size, size_t nmemb, void* userp) {
            ((std::string*)userp)->append((char*)contents, size * nmemb);
            return size * nmemb;
        }
    };

    std::unique_ptr<Embedder> create_openai_embedder(const std::string& api_key, const std::string& model) {
        return std::make_unique<OpenAIEmbedder>(api_key, model);
    }

}

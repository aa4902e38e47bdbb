#include "engine/config.hpp"
#include "test_support.hpp"

#include <cstdlib>

using namespace raptor::engine;

namespace {

    std::filesystem::path scratch(const std::string& name) {
        auto path = std::filesystem::temp_directory_path() / ("raptor-test-" + name + ".json");
        std::filesystem::remove(path);
        return path;
    }

}

TEST(missing_file_gives_defaults) {
    Config cfg = Config::load(scratch("config-missing"));
    ASSERT(cfg.embedding_backend == "ollama", "Default backend");
    ASSERT(cfg.chunk_size == 64 * 1024, "Default chunk size");
    ASSERT(cfg.search_limit == 10, "Default limit");
    ASSERT(near(static_cast<float>(cfg.min_similarity), 0.5f), "Default threshold");
}

TEST(partial_file_overrides_named_keys) {
    auto path = scratch("config-partial");
    {
        std::ofstream out(path);
        out << R"({"embedding_backend": "openai", "chunk_size": 4096, "store_path": "/tmp/x.raptor"})";
    }
    Config cfg = Config::load(path);
    std::filesystem::remove(path);

    ASSERT(cfg.embedding_backend == "openai", "Backend read");
    ASSERT(cfg.chunk_size == 4096, "Chunk size read");
    ASSERT(cfg.store_path == "/tmp/x.raptor", "Store path read");
    ASSERT(cfg.openai_model == "text-embedding-3-small", "Unnamed keys keep defaults");
}

TEST(malformed_file_gives_defaults) {
    auto path = scratch("config-malformed");
    {
        std::ofstream out(path);
        out << "{ not json";
    }
    Config cfg = Config::load(path);
    std::filesystem::remove(path);
    ASSERT(cfg.embedding_backend == "ollama", "Defaults after parse failure");

    {
        std::ofstream out(path);
        out << R"({"chunk_size": "big"})";
    }
    cfg = Config::load(path);
    std::filesystem::remove(path);
    ASSERT(cfg.chunk_size == 64 * 1024, "Defaults after type error");
}

TEST(save_then_load) {
    auto path = scratch("config-save");
    Config cfg;
    cfg.embedding_model = "nomic-embed-text";
    cfg.search_limit = 3;
    cfg.save(path);

    Config loaded = Config::load(path);
    std::filesystem::remove(path);
    ASSERT(loaded.embedding_model == "nomic-embed-text", "Model saved");
    ASSERT(loaded.search_limit == 3, "Limit saved");
}

TEST(environment_overrides) {
    setenv("RAPTOR_STORE_PATH", "/tmp/env.raptor", 1);
    setenv("OPENAI_API_KEY", "sk-test", 1);
    Config cfg;
    cfg.apply_env();
    unsetenv("RAPTOR_STORE_PATH");
    unsetenv("OPENAI_API_KEY");

    ASSERT(cfg.store_path == "/tmp/env.raptor", "Store path from environment");
    ASSERT(cfg.openai_key == "sk-test", "API key from environment");
}

int main() {
    std::cout << "=== Config ===" << std::endl;

    RUN_TEST(missing_file_gives_defaults);
    RUN_TEST(partial_file_overrides_named_keys);
    RUN_TEST(malformed_file_gives_defaults);
    RUN_TEST(save_then_load);
    RUN_TEST(environment_overrides);

    return report_results();
}

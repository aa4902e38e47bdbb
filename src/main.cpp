#include <iostream>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <ctime>
#include <string>
#include <vector>
#include <filesystem>
#include <nlohmann/json.hpp>

#include "platform.hpp"
#include "engine/config.hpp"
#include "engine/embedder.hpp"
#include "engine/storage_engine.hpp"
#include "raptor/error.hpp"

using json = nlohmann::json;

namespace {

    const char* USAGE =
        "Usage: raptor [--store PATH] [--config PATH] <command> [args...]\n"
        "Commands:\n"
        "  store <key> <text>           - Embed text and store it under key\n"
        "  get <key>                    - Print the latest entry for key\n"
        "  search <query> [--limit N] [--min-similarity X]\n"
        "                               - Print the most similar keys\n"
        "  import <file.jsonl>          - Store {\"key\",\"text\"} lines in one batch\n"
        "  stats                        - Print header and record counts\n";

    struct Args {
        std::string command;
        std::vector<std::string> positional;
        std::string store_path;
        std::filesystem::path config_path;
        int limit = -1;
        double min_similarity = -1.0;
    };

    bool parse_args(int argc, char* argv[], Args& a) {
        for (int i = 1; i < argc; ++i) {
            std::string f = argv[i];
            auto next = [&](std::string& dst) {
                if (i + 1 >= argc) {
                    std::cerr << "Missing value after " << f << "\n";
                    return false;
                }
                dst = argv[++i];
                return true;
            };

            std::string value;
            if (f == "--store" || f == "-s") {
                if (!next(a.store_path)) return false;
            } else if (f == "--config" || f == "-c") {
                if (!next(value)) return false;
                a.config_path = value;
            } else if (f == "--limit" || f == "-l") {
                if (!next(value)) return false;
                a.limit = std::stoi(value);
            } else if (f == "--min-similarity" || f == "-m") {
                if (!next(value)) return false;
                a.min_similarity = std::stod(value);
            } else if (a.command.empty()) {
                a.command = f;
            } else {
                a.positional.push_back(f);
            }
        }
        return !a.command.empty();
    }

    std::string iso_timestamp(int64_t millis) {
        std::time_t seconds = static_cast<std::time_t>(millis / 1000);
        std::tm tm{};
        gmtime_r(&seconds, &tm);
        std::ostringstream ss;
        ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << "." << std::setfill('0') << std::setw(3)
           << (millis % 1000) << "Z";
        return ss.str();
    }

    std::vector<raptor::engine::StoreItem> read_items(const std::filesystem::path& path) {
        std::ifstream file(path);
        if (!file.is_open()) {
            throw raptor::Error(raptor::ErrorCode::NotFound, "Cannot open " + path.string());
        }

        std::vector<raptor::engine::StoreItem> items;
        std::string line;
        while (std::getline(file, line)) {
            if (line.find_first_not_of(" \t\r") == std::string::npos) continue;
            auto j = json::parse(line);
            items.push_back({j.at("key").get<std::string>(), j.at("text").get<std::string>()});
        }
        return items;
    }

    int run(const Args& args, raptor::engine::StorageEngine& engine, const raptor::engine::Config& config) {
        const auto& p = args.positional;

        if (args.command == "store") {
            if (p.size() != 2) { std::cerr << USAGE; return 1; }
            engine.store(p[0], p[1]);
            std::cout << "Stored embedding for key: " << p[0] << "\n";
            return 0;
        }

        if (args.command == "get") {
            if (p.size() != 1) { std::cerr << USAGE; return 1; }
            auto entry = engine.get(p[0]);
            if (!entry) {
                std::cout << "Key \"" << p[0] << "\" not found\n";
                return 1;
            }
            json out = {
                {"key", entry->key},
                {"text", entry->text},
                {"embeddingDimensions", entry->embedding.size()},
                {"timestamp", iso_timestamp(entry->timestamp)}
            };
            std::cout << out.dump(2) << "\n";
            return 0;
        }

        if (args.command == "search") {
            if (p.size() != 1) { std::cerr << USAGE; return 1; }
            int limit = args.limit >= 0 ? args.limit : config.search_limit;
            double min_similarity = args.min_similarity >= 0.0 ? args.min_similarity : config.min_similarity;

            auto results = engine.search(p[0], limit, min_similarity);
            if (results.empty()) {
                std::cout << "No results found\n";
                return 0;
            }
            std::cout << "Found " << results.size() << " result(s):\n\n";
            for (const auto& result : results) {
                std::cout << "[" << std::fixed << std::setprecision(4) << result.similarity << "] "
                          << result.key << "\n";
            }
            return 0;
        }

        if (args.command == "import") {
            if (p.size() != 1) { std::cerr << USAGE; return 1; }
            auto items = read_items(p[0]);
            engine.store_many(items);
            std::cout << "Stored " << items.size() << " embedding(s)\n";
            return 0;
        }

        if (args.command == "stats") {
            auto stats = engine.stats();
            json out = {
                {"path", stats.path.string()},
                {"version", stats.version},
                {"dimension", stats.dimension},
                {"fileSize", stats.file_size},
                {"records", stats.record_count},
                {"uniqueKeys", stats.unique_keys}
            };
            std::cout << out.dump(2) << "\n";
            return 0;
        }

        std::cerr << "Unknown command: " << args.command << "\n" << USAGE;
        return 1;
    }

}

int main(int argc, char* argv[]) {
    Args args;
    try {
        if (!parse_args(argc, argv, args)) {
            std::cerr << USAGE;
            return 1;
        }
    } catch (const std::logic_error& e) {
        // std::stoi / std::stod on a malformed number
        std::cerr << "[Raptor] Invalid numeric flag: " << e.what() << "\n";
        return 1;
    }

    auto config_path = args.config_path;
    if (config_path.empty()) {
        auto config_dir = raptor::platform::system::get_config_dir();
        if (!config_dir.empty()) config_path = config_dir / "config.json";
    }

    auto config = raptor::engine::Config::load(config_path);
    config.apply_env();
    if (!args.store_path.empty()) config.store_path = args.store_path;
    if (config.store_path.empty()) {
        auto data_dir = raptor::platform::system::get_data_dir();
        config.store_path = data_dir.empty() ? "database.raptor" : (data_dir / "database.raptor").string();
    }

    raptor::engine::EngineOptions options;
    options.store_path = config.store_path;
    options.chunk_size = config.chunk_size;

    try {
        raptor::engine::StorageEngine engine(options, [&config]() {
            return raptor::engine::create_embedder(config);
        });
        int rc = run(args, engine, config);
        engine.dispose();
        return rc;
    } catch (const raptor::Error& e) {
        std::cerr << "[Raptor] Error (" << raptor::to_string(e.code()) << "): " << e.what() << "\n";
    } catch (const std::exception& e) {
        std::cerr << "[Raptor] Error: " << e.what() << "\n";
    }
    return 1;
}

// Reverse-scan cost versus reader window size. Windows smaller than one
// record force one exact-size pread per record.
#include "engine/binary_codec.hpp"
#include "engine/reverse_reader.hpp"

#include <chrono>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <random>
#include <string>
#include <vector>

struct OptionsScan {
    std::size_t num_records = 20000;
    std::size_t num_keys = 5000;
    std::size_t dim = 768;
    std::size_t repeats = 3;
    unsigned int seed = 123;
    std::string path = "bench_scan.raptor";
};

static void print_usage_scan(const char* prog) {
    std::cerr << "Usage: " << prog
              << " [--records N] [--keys K] [--dim D] [--repeats R] [--seed S] [--path FILE]" << std::endl;
}

static OptionsScan parse_args_scan(int argc, char** argv) {
    OptionsScan opt;
    for (int i = 1; i < argc; ++i) {
        const char* a = argv[i];
        auto next = [&](std::size_t& out) {
            if (i + 1 >= argc) {
                print_usage_scan(argv[0]);
                std::exit(1);
            }
            out = static_cast<std::size_t>(std::stoull(argv[++i]));
        };

        if (std::strcmp(a, "--records") == 0) {
            next(opt.num_records);
        } else if (std::strcmp(a, "--keys") == 0) {
            next(opt.num_keys);
        } else if (std::strcmp(a, "--dim") == 0) {
            next(opt.dim);
        } else if (std::strcmp(a, "--repeats") == 0) {
            next(opt.repeats);
        } else if (std::strcmp(a, "--seed") == 0) {
            std::size_t s = 0;
            next(s);
            opt.seed = static_cast<unsigned int>(s);
        } else if (std::strcmp(a, "--path") == 0 && i + 1 < argc) {
            opt.path = argv[++i];
        } else if (std::strcmp(a, "--help") == 0 || std::strcmp(a, "-h") == 0) {
            print_usage_scan(argv[0]);
            std::exit(0);
        } else {
            std::cerr << "Unknown argument: " << a << std::endl;
            print_usage_scan(argv[0]);
            std::exit(1);
        }
    }
    return opt;
}

int main(int argc, char** argv) {
    using namespace raptor::engine;
    OptionsScan opt = parse_args_scan(argc, argv);
    if (opt.num_keys == 0) opt.num_keys = 1;
    if (opt.repeats == 0) opt.repeats = 1;

    std::cout << "[benchmark_scan] records=" << opt.num_records << " keys=" << opt.num_keys
              << " dim=" << opt.dim << std::endl;

    std::mt19937 rng(opt.seed);
    std::uniform_real_distribution<float> dist(-1.0f, 1.0f);
    std::uniform_int_distribution<std::size_t> pick(0, opt.num_keys - 1);

    try {
        codec::write_header(opt.path, static_cast<uint32_t>(opt.dim));

        // Write in batches so the file is built with a bounded buffer.
        const std::size_t batch_size = 1000;
        std::vector<RecordInput> batch;
        for (std::size_t i = 0; i < opt.num_records; ++i) {
            RecordInput record;
            record.key = "doc-" + std::to_string(pick(rng));
            record.embedding.resize(opt.dim);
            for (auto& v : record.embedding) v = dist(rng);
            batch.push_back(std::move(record));
            if (batch.size() == batch_size) {
                codec::write_records(opt.path, batch);
                batch.clear();
            }
        }
        codec::write_records(opt.path, batch);

        const uint64_t record_bytes = codec::record_length(10, static_cast<uint32_t>(opt.dim));
        std::cout << "[benchmark_scan] file_size=" << std::filesystem::file_size(opt.path)
                  << " bytes, ~" << record_bytes << " bytes/record" << std::endl;

        const std::size_t chunk_sizes[] = {1024, 4096, 16 * 1024, 64 * 1024, 256 * 1024, 1024 * 1024};
        for (std::size_t chunk_size : chunk_sizes) {
            double total_ms = 0.0;
            std::size_t yielded = 0;
            for (std::size_t r = 0; r < opt.repeats; ++r) {
                auto start = std::chrono::steady_clock::now();
                ReverseReader reader(opt.path, chunk_size);
                yielded = 0;
                while (reader.next()) ++yielded;
                total_ms += std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();
            }
            std::cout << "chunk_size=" << chunk_size << " unique=" << yielded
                      << " avg_ms=" << total_ms / static_cast<double>(opt.repeats)
                      << (chunk_size < record_bytes ? " (window smaller than a record)" : "") << std::endl;
        }
    } catch (const std::exception& e) {
        std::cerr << "[benchmark_scan] " << e.what() << std::endl;
        std::filesystem::remove(opt.path);
        return 1;
    }

    std::filesystem::remove(opt.path);
    return 0;
}

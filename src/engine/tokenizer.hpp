#pragma once

#include <cctype>
#include <cstdint>
#include <fstream>
#include <string>
#include <unordered_map>
#include <vector>
#include "raptor/error.hpp"

namespace raptor::engine {

    /**
     * @brief Lower-casing WordPiece tokenizer for BERT-style sentence models.
     * Punctuation characters become tokens of their own, as in the BERT basic tokenizer.
     */
    class Tokenizer {
    public:
        explicit Tokenizer(const std::string& vocab_path) {
            load_vocab(vocab_path);
            m_cls = lookup("[CLS]");
            m_sep = lookup("[SEP]");
            m_unk = lookup("[UNK]");
        }

        /**
         * @brief Returns [CLS] pieces... [SEP], capped at `max_length` ids.
         */
        std::vector<int64_t> encode(const std::string& text, size_t max_length = 512) const {
            std::vector<int64_t> ids;
            ids.push_back(m_cls);

            for (const auto& word : split_words(text)) {
                if (ids.size() + 1 >= max_length) break; // keep room for [SEP]
                append_word_pieces(word, ids);
            }

            if (ids.size() > max_length - 1) ids.resize(max_length - 1);
            ids.push_back(m_sep);
            return ids;
        }

    private:
        static constexpr size_t kMaxWordLength = 100;

        std::unordered_map<std::string, int64_t> m_vocab;
        int64_t m_cls = 0;
        int64_t m_sep = 0;
        int64_t m_unk = 0;

        void load_vocab(const std::string& path) {
            std::ifstream file(path);
            if (!file.is_open()) {
                throw Error(ErrorCode::ProviderError, "[Tokenizer] Failed to load vocab: " + path);
            }
            std::string line;
            int64_t id = 0;
            while (std::getline(file, line)) {
                if (!line.empty() && line.back() == '\r') line.pop_back();
                m_vocab.emplace(line, id++);
            }
        }

        int64_t lookup(const std::string& token) const {
            auto it = m_vocab.find(token);
            if (it == m_vocab.end()) {
                throw Error(ErrorCode::ProviderError, "[Tokenizer] Vocab lacks special token " + token);
            }
            return it->second;
        }

        static std::vector<std::string> split_words(const std::string& text) {
            std::vector<std::string> words;
            std::string current;
            auto flush = [&]() {
                if (!current.empty()) words.push_back(std::move(current));
                current.clear();
            };

            for (unsigned char c : text) {
                if (std::isspace(c)) {
                    flush();
                } else if (c < 0x80 && std::ispunct(c)) {
                    flush();
                    words.emplace_back(1, static_cast<char>(c));
                } else {
                    current.push_back(static_cast<char>(c < 0x80 ? std::tolower(c) : c));
                }
            }
            flush();
            return words;
        }

        void append_word_pieces(const std::string& word, std::vector<int64_t>& ids) const {
            if (word.size() > kMaxWordLength) {
                ids.push_back(m_unk);
                return;
            }

            std::vector<int64_t> pieces;
            size_t start = 0;
            while (start < word.size()) {
                size_t end = word.size();
                int64_t found = -1;
                while (start < end) {
                    std::string piece = word.substr(start, end - start);
                    if (start > 0) piece = "##" + piece;
                    auto it = m_vocab.find(piece);
                    if (it != m_vocab.end()) {
                        found = it->second;
                        break;
                    }
                    --end;
                }
                if (found < 0) {
                    ids.push_back(m_unk);
                    return;
                }
                pieces.push_back(found);
                start = end;
            }
            ids.insert(ids.end(), pieces.begin(), pieces.end());
        }
    };

}

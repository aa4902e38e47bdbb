#include "reverse_reader.hpp"
#include "binary_codec.hpp"
#include "raptor/error.hpp"
#include <algorithm>
#include <iostream>

namespace raptor::engine {

    ReverseReader::ReverseReader(const std::filesystem::path& path, size_t chunk_size)
        : m_file(path, File::Mode::Read), m_chunk_size(chunk_size) {
        if (chunk_size < codec::kFooterSize) {
            throw Error(ErrorCode::InvalidArgument,
                        "Chunk size must be at least " + std::to_string(codec::kFooterSize) + " bytes.");
        }

        Header header = codec::read_header(m_file);
        m_dimension = header.dimension;
        m_min_record_length = codec::record_length(0, m_dimension);

        m_cursor = m_file.size();
        m_window_start = m_cursor;
        if (m_cursor <= codec::kHeaderSize) m_done = true;
    }

    std::optional<StoredEntry> ReverseReader::next() {
        while (!m_done) {
            auto entry = next_record();
            if (!entry) {
                m_done = true;
                break;
            }
            if (m_seen.insert(entry->key).second) {
                return entry;
            }
        }
        return std::nullopt;
    }

    void ReverseReader::load_window() {
        m_window_start = std::max<uint64_t>(codec::kHeaderSize,
                                            m_cursor > m_chunk_size ? m_cursor - m_chunk_size : 0);
        m_window.resize(static_cast<size_t>(m_cursor - m_window_start));
        size_t n = m_file.read_at(m_window.data(), m_window.size(), m_window_start);
        if (n < m_window.size()) {
            throw Error(ErrorCode::Truncated, "Store file shrank during scan: " + m_file.path().string());
        }
    }

    uint64_t ReverseReader::last_intact_offset() const {
        uint64_t offset = codec::kHeaderSize;
        while (offset < m_cursor) {
            try {
                auto record = codec::read_record_forward(m_file, m_dimension, offset);
                if (!record || offset + record->length > m_cursor) break;
                offset += record->length;
            } catch (const Error& e) {
                if (e.code() != ErrorCode::Truncated && e.code() != ErrorCode::CorruptRecord) throw;
                break;
            }
        }
        return offset;
    }

    bool ReverseReader::skip_torn_tail(const std::string& reason) {
        uint64_t end = last_intact_offset();
        if (end >= m_cursor) {
            std::cerr << "[ReverseReader] Stopping at offset " << m_cursor << ": " << reason << "\n";
            return false;
        }

        std::cerr << "[ReverseReader] Skipping torn tail, bytes " << end << ".." << m_cursor << ": " << reason << "\n";
        m_cursor = end;
        m_window_start = end;
        m_window.clear();
        m_decoded_any = true; // everything below `end` was just decoded
        return true;
    }

    std::optional<StoredEntry> ReverseReader::next_record() {
        uint64_t remaining = m_cursor - codec::kHeaderSize;
        if (remaining < codec::kFooterSize) return std::nullopt;

        if (m_cursor < m_window_start + codec::kFooterSize) {
            load_window();
        }

        uint64_t in_window = m_cursor - m_window_start;
        const uint8_t* end = m_window.data() + in_window;
        uint32_t length = codec::load_u32(end - codec::kFooterSize);

        if (length < m_min_record_length || length > remaining) {
            std::string reason = "record length " + std::to_string(length) + " cannot be satisfied";
            if (!m_decoded_any && skip_torn_tail(reason)) return next_record();
            if (m_decoded_any) {
                std::cerr << "[ReverseReader] Stopping at offset " << m_cursor << ": " << reason << "\n";
            }
            return std::nullopt;
        }

        StoredEntry entry;
        try {
            if (length <= in_window) {
                entry = codec::decode_record(end - length, length, m_dimension);
            } else {
                // Straddles the window edge: fetch exactly this record.
                std::vector<uint8_t> record(length);
                size_t n = m_file.read_at(record.data(), record.size(), m_cursor - length);
                if (n < length) {
                    throw Error(ErrorCode::Truncated, "Store file shrank during scan: " + m_file.path().string());
                }
                entry = codec::decode_record(record.data(), record.size(), m_dimension);
            }
        } catch (const Error& e) {
            // Only the newest record can be torn; a bad record below a good one is corruption.
            if (e.code() != ErrorCode::CorruptRecord || m_decoded_any) throw;
            if (skip_torn_tail(e.what())) return next_record();
            return std::nullopt;
        }

        m_decoded_any = true;
        m_cursor -= length;
        return entry;
    }

}

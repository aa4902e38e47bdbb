#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>
#include "file_io.hpp"
#include "raptor/types.hpp"

namespace raptor::engine {

    /**
     * @brief Pull-based newest-first scan over a store file.
     *
     * The file is read backward in windows of at most `chunk_size` bytes. Each
     * record is located through its trailing length footer; a record that does
     * not fit in the current window is fetched with one exact-size pread.
     * Keys already yielded are skipped, so each key appears once with its
     * latest value. Memory is bounded by the window plus the seen-key set.
     *
     * If the newest record cannot be read (torn tail after a crash
     * mid-append), a forward pass finds the end of the last intact record
     * and the scan resumes there. After one record has decoded, an
     * unsatisfiable length ends the scan silently and a record that fails
     * to decode raises CorruptRecord.
     */
    class ReverseReader {
    public:
        static constexpr size_t kDefaultChunkSize = 64 * 1024;

        explicit ReverseReader(const std::filesystem::path& path, size_t chunk_size = kDefaultChunkSize);

        /**
         * @brief Returns the next unseen entry, or std::nullopt once the header is reached.
         */
        std::optional<StoredEntry> next();

        uint32_t dimension() const { return m_dimension; }

    private:
        std::optional<StoredEntry> next_record();
        void load_window();
        uint64_t last_intact_offset() const;
        bool skip_torn_tail(const std::string& reason);

        File m_file;
        size_t m_chunk_size;
        uint32_t m_dimension = 0;
        uint64_t m_min_record_length = 0;

        uint64_t m_cursor = 0;       // absolute offset of the unscanned end
        uint64_t m_window_start = 0; // absolute offset of m_window[0]
        std::vector<uint8_t> m_window;
        bool m_done = false;
        bool m_decoded_any = false;

        std::unordered_set<std::string> m_seen;
    };

}

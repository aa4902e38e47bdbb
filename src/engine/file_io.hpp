#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>

namespace raptor::engine {

    /**
     * @brief Owning POSIX file descriptor.
     * All failures are raised as std::system_error carrying errno.
     */
    class File {
    public:
        enum class Mode {
            Read,   // O_RDONLY
            Append, // O_WRONLY | O_APPEND
            Create  // O_WRONLY | O_CREAT | O_TRUNC
        };

        File(const std::filesystem::path& path, Mode mode);
        ~File();

        File(const File&) = delete;
        File& operator=(const File&) = delete;
        File(File&& other) noexcept;
        File& operator=(File&& other) noexcept;

        /**
         * @brief Reads up to `size` bytes at `offset`. Returns the number read,
         * which is short only at end of file.
         */
        size_t read_at(void* buffer, size_t size, uint64_t offset) const;

        /**
         * @brief Writes the whole buffer with one write() call, retrying only
         * on a partial write or EINTR.
         */
        void write_all(const void* buffer, size_t size);

        uint64_t size() const;

        const std::filesystem::path& path() const { return m_path; }

    private:
        std::filesystem::path m_path;
        int m_fd = -1;
    };

}

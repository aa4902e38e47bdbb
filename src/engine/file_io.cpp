#include "file_io.hpp"
#include <cerrno>
#include <fcntl.h>
#include <sys/stat.h>
#include <string>
#include <system_error>
#include <unistd.h>
#include <utility>

namespace raptor::engine {

    namespace {
        int open_flags(File::Mode mode) {
            switch (mode) {
                case File::Mode::Read: return O_RDONLY | O_CLOEXEC;
                case File::Mode::Append: return O_WRONLY | O_APPEND | O_CLOEXEC;
                case File::Mode::Create: return O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC;
            }
            return O_RDONLY | O_CLOEXEC;
        }

        [[noreturn]] void throw_errno(const std::string& what, const std::filesystem::path& path) {
            throw std::system_error(errno, std::generic_category(), what + " " + path.string());
        }
    }

    File::File(const std::filesystem::path& path, Mode mode) : m_path(path) {
        do {
            m_fd = ::open(path.c_str(), open_flags(mode), 0644);
        } while (m_fd < 0 && errno == EINTR);
        if (m_fd < 0) throw_errno("open", path);
    }

    File::~File() {
        if (m_fd >= 0) ::close(m_fd);
    }

    File::File(File&& other) noexcept
        : m_path(std::move(other.m_path)), m_fd(std::exchange(other.m_fd, -1)) {}

    File& File::operator=(File&& other) noexcept {
        if (this != &other) {
            if (m_fd >= 0) ::close(m_fd);
            m_path = std::move(other.m_path);
            m_fd = std::exchange(other.m_fd, -1);
        }
        return *this;
    }

    size_t File::read_at(void* buffer, size_t size, uint64_t offset) const {
        auto* out = static_cast<char*>(buffer);
        size_t total = 0;
        while (total < size) {
            ssize_t n = ::pread(m_fd, out + total, size - total, static_cast<off_t>(offset + total));
            if (n < 0) {
                if (errno == EINTR) continue;
                throw_errno("pread", m_path);
            }
            if (n == 0) break; // EOF
            total += static_cast<size_t>(n);
        }
        return total;
    }

    void File::write_all(const void* buffer, size_t size) {
        const auto* in = static_cast<const char*>(buffer);
        size_t written = 0;
        while (written < size) {
            ssize_t n = ::write(m_fd, in + written, size - written);
            if (n < 0) {
                if (errno == EINTR) continue;
                throw_errno("write", m_path);
            }
            written += static_cast<size_t>(n);
        }
    }

    uint64_t File::size() const {
        struct stat st;
        if (::fstat(m_fd, &st) != 0) throw_errno("fstat", m_path);
        return static_cast<uint64_t>(st.st_size);
    }

}

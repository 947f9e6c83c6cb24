#include "transfer/target_file.hpp"

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include "transfer/transfer_error.hpp"

namespace fs = std::filesystem;

namespace {
std::string errno_message(const std::string& what, const std::string& path) {
    return what + " " + path + ": " + std::strerror(errno);
}
} // namespace

void ensure_parent_directory(const std::string& path) {
    fs::path parent = fs::path(path).parent_path();
    if (parent.empty()) {
        return;
    }
    std::error_code ec;
    fs::create_directories(parent, ec);
    if (ec) {
        throw transfer_error(error_kind::filesystem,
                             "failed to create directory " + parent.string() + ": " + ec.message());
    }
}

std::uint64_t existing_file_size(const std::string& path) {
    struct stat st;
    if (::stat(path.c_str(), &st) != 0) {
        if (errno == ENOENT) {
            return 0;
        }
        throw transfer_error(error_kind::filesystem, errno_message("failed to stat", path));
    }
    return static_cast<std::uint64_t>(st.st_size);
}

target_file target_file::open_for_chunks(const std::string& path) {
    ensure_parent_directory(path);
    int fd = ::open(path.c_str(), O_CREAT | O_RDWR | O_CLOEXEC, 0644);
    if (fd == -1) {
        throw transfer_error(error_kind::filesystem, errno_message("failed to open file", path));
    }
    return target_file(path, fd);
}

target_file::target_file(std::string path, int fd) : m_path(std::move(path)), m_fd(fd) {}

target_file::target_file(target_file&& other) noexcept
    : m_path(std::move(other.m_path)), m_fd(other.m_fd) {
    other.m_fd = -1;
}

target_file& target_file::operator=(target_file&& other) noexcept {
    if (this != &other) {
        if (m_fd != -1) {
            ::close(m_fd);
        }
        m_path = std::move(other.m_path);
        m_fd = other.m_fd;
        other.m_fd = -1;
    }
    return *this;
}

target_file::~target_file() {
    if (m_fd != -1) {
        ::close(m_fd);
    }
}

void target_file::write_at(std::uint64_t offset, const char* data, std::size_t size) {
    while (size > 0) {
        ssize_t written = ::pwrite(m_fd, data, size, static_cast<off_t>(offset));
        if (written < 0) {
            if (errno == EINTR) {
                continue;
            }
            throw transfer_error(error_kind::filesystem, errno_message("failed to write", m_path));
        }
        if (written == 0) {
            throw transfer_error(error_kind::filesystem, "short write to " + m_path);
        }
        data += written;
        size -= static_cast<std::size_t>(written);
        offset += static_cast<std::uint64_t>(written);
    }
}

std::uint64_t target_file::size() const {
    struct stat st;
    if (::fstat(m_fd, &st) != 0) {
        throw transfer_error(error_kind::filesystem, errno_message("failed to stat", m_path));
    }
    return static_cast<std::uint64_t>(st.st_size);
}

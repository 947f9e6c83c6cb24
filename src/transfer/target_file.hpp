#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

// The download destination opened read/write without truncation. Writers
// address it by offset, so concurrent chunk workers may share one instance as
// long as their extents are disjoint.
class target_file {
public:
    // Creates missing parent directories, then opens (creating if needed).
    // Throws transfer_error(filesystem) on failure.
    static target_file open_for_chunks(const std::string& path);

    target_file(target_file&& other) noexcept;
    target_file& operator=(target_file&& other) noexcept;
    target_file(const target_file&) = delete;
    target_file& operator=(const target_file&) = delete;
    ~target_file();

    // Writes all `size` bytes at `offset`. Throws transfer_error(filesystem).
    void write_at(std::uint64_t offset, const char* data, std::size_t size);

    // Current length of the file on disk.
    std::uint64_t size() const;

    const std::string& path() const {
        return m_path;
    }

private:
    target_file(std::string path, int fd);

    std::string m_path;
    int m_fd;
};

// Size of the file at `path`, 0 when it does not exist.
// Throws transfer_error(filesystem) for any other stat failure.
std::uint64_t existing_file_size(const std::string& path);

// Creates the parent directory chain of `path`. Throws transfer_error(filesystem).
void ensure_parent_directory(const std::string& path);

// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 tjdeveng

/**
 * @file VaultIO.cc
 * @brief Implementation of secure entry file I/O operations
 */

#include "VaultIO.h"
#include "../../utils/Log.h"

#include <cerrno>
#include <cstring>
#include <filesystem>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace Lockr {

namespace {

void sync_parent_directory(const std::string& path) {
    namespace fs = std::filesystem;
    std::string dir_path = fs::path(path).parent_path().string();
    if (dir_path.empty()) {
        dir_path = ".";
    }
    int dir_fd = open(dir_path.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
    if (dir_fd >= 0) {
        fsync(dir_fd);
        close(dir_fd);
    }
}

bool write_all(int fd, const std::vector<uint8_t>& data) {
    size_t written = 0;
    while (written < data.size()) {
        ssize_t n = ::write(fd, data.data() + written, data.size() - written);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            return false;
        }
        written += static_cast<size_t>(n);
    }
    return true;
}

}  // namespace

bool VaultIO::read_file(const std::string& path, std::vector<uint8_t>& data) {
    // Use file descriptor to prevent TOCTOU race condition
    // Open with O_NOFOLLOW to prevent symlink attacks
    int fd = open(path.c_str(), O_RDONLY | O_NOFOLLOW | O_CLOEXEC);
    if (fd < 0) {
        Log::error("VaultIO: Failed to open {} ({})", path, std::strerror(errno));
        return false;
    }

    struct stat st{};
    if (fstat(fd, &st) != 0) {
        Log::error("VaultIO: Failed to stat {}", path);
        close(fd);
        return false;
    }

    // Verify permissions on the opened file (owner-only read/write)
    if ((st.st_mode & (S_IRWXG | S_IRWXO)) != 0) {
        Log::error("VaultIO: {} has insecure permissions (must be owner-only)", path);
        close(fd);
        return false;
    }

    data.resize(static_cast<size_t>(st.st_size));
    size_t total = 0;
    while (total < data.size()) {
        ssize_t n = ::read(fd, data.data() + total, data.size() - total);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            Log::error("VaultIO: Error reading {} ({})", path, std::strerror(errno));
            close(fd);
            return false;
        }
        if (n == 0) {
            break;
        }
        total += static_cast<size_t>(n);
    }
    close(fd);

    if (total != data.size()) {
        Log::error("VaultIO: Short read on {} ({} of {} bytes)", path, total, data.size());
        return false;
    }
    return true;
}

bool VaultIO::write_file(const std::string& path, const std::vector<uint8_t>& data) {
    namespace fs = std::filesystem;
    const std::string temp_path = path + ".tmp";

    int fd = open(temp_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_NOFOLLOW | O_CLOEXEC,
                  S_IRUSR | S_IWUSR);
    if (fd < 0) {
        Log::error("VaultIO: Failed to create temporary file {} ({})", temp_path, std::strerror(errno));
        return false;
    }

    const bool ok = write_all(fd, data) && fsync(fd) == 0;
    close(fd);

    if (!ok) {
        Log::error("VaultIO: Failed to write {} ({})", temp_path, std::strerror(errno));
        std::error_code ec;
        fs::remove(temp_path, ec);
        return false;
    }

    // Atomic rename (POSIX guarantees atomicity)
    std::error_code ec;
    fs::rename(temp_path, path, ec);
    if (ec) {
        Log::error("VaultIO: Failed to rename {} over {}: {}", temp_path, path, ec.message());
        std::error_code cleanup_ec;
        fs::remove(temp_path, cleanup_ec);
        if (cleanup_ec) {
            Log::warning("VaultIO: Failed to remove temp file during error cleanup: {}",
                         cleanup_ec.message());
        }
        return false;
    }

    sync_parent_directory(path);
    return true;
}

bool VaultIO::remove_file(const std::string& path) {
    std::error_code ec;
    std::filesystem::remove(path, ec);
    if (ec) {
        Log::error("VaultIO: Failed to remove {}: {}", path, ec.message());
        return false;
    }
    sync_parent_directory(path);
    return true;
}

bool VaultIO::ensure_directory(const std::string& path) {
    namespace fs = std::filesystem;
    std::error_code ec;
    fs::create_directories(path, ec);
    if (ec) {
        Log::error("VaultIO: Failed to create directory {}: {}", path, ec.message());
        return false;
    }

    fs::permissions(path, fs::perms::owner_all, fs::perm_options::replace, ec);
    if (ec) {
        Log::warning("VaultIO: Could not restrict permissions on {}: {}", path, ec.message());
    }
    return fs::is_directory(path, ec);
}

} // namespace Lockr

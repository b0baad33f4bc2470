#include "../include/rotap_fs.hpp"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace rotap {
namespace fs {

static bool fail(std::string* error, const std::string& what, const std::string& path) {
    if (error) *error = what + " " + path + ": " + std::strerror(errno);
    return false;
}

static bool write_all(int fd, const char* data, size_t len) {
    while (len > 0) {
        ssize_t n = ::write(fd, data, len);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        data += n;
        len -= static_cast<size_t>(n);
    }
    return true;
}

bool atomic_write_file(const std::string& path, const std::string& content,
                       mode_t mode, std::string* error) {
    const std::string staging = path + ".tmp";

    int fd = ::open(staging.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, mode);
    if (fd < 0) return fail(error, "open", staging);

    // open() honours umask; the artifact mode must be exact
    if (::fchmod(fd, mode) != 0 ||
        !write_all(fd, content.data(), content.size()) ||
        ::fsync(fd) != 0) {
        int saved = errno;
        ::close(fd);
        ::unlink(staging.c_str());
        errno = saved;
        return fail(error, "write", staging);
    }
    if (::close(fd) != 0) {
        ::unlink(staging.c_str());
        return fail(error, "close", staging);
    }
    if (::rename(staging.c_str(), path.c_str()) != 0) {
        int saved = errno;
        ::unlink(staging.c_str());
        errno = saved;
        return fail(error, "rename", path);
    }
    return true;
}

bool append_record(const std::string& path, const std::string& record,
                   mode_t mode, std::string* error) {
    int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, mode);
    if (fd < 0) return fail(error, "open", path);

    ssize_t n;
    do {
        n = ::write(fd, record.data(), record.size());
    } while (n < 0 && errno == EINTR);

    if (n != static_cast<ssize_t>(record.size())) {
        int saved = errno;
        ::close(fd);
        errno = (n < 0) ? saved : EIO;
        return fail(error, "append", path);
    }
    if (::close(fd) != 0) return fail(error, "close", path);
    return true;
}

bool read_file(const std::string& path, std::string& out) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) return false;
    std::ostringstream ss;
    ss << file.rdbuf();
    if (file.bad()) return false;
    out = ss.str();
    return true;
}

bool file_exists(const std::string& path) {
    struct stat st{};
    return ::stat(path.c_str(), &st) == 0;
}

long long file_size(const std::string& path) {
    struct stat st{};
    if (::stat(path.c_str(), &st) != 0) return -1;
    return static_cast<long long>(st.st_size);
}

bool ensure_directory(const std::string& path, mode_t mode, std::string* error) {
    if (path.empty()) return false;
    std::string partial;
    size_t pos = 0;
    while (pos != std::string::npos) {
        pos = path.find('/', pos + 1);
        partial = path.substr(0, pos);
        if (partial.empty()) continue;
        if (::mkdir(partial.c_str(), mode) != 0 && errno != EEXIST) {
            return fail(error, "mkdir", partial);
        }
    }
    struct stat st{};
    if (::stat(path.c_str(), &st) != 0) return fail(error, "stat", path);
    if (!S_ISDIR(st.st_mode)) {
        errno = ENOTDIR;
        return fail(error, "mkdir", path);
    }
    return true;
}

std::string join(const std::string& dir, const std::string& name) {
    if (dir.empty()) return name;
    if (dir.back() == '/') return dir + name;
    return dir + "/" + name;
}

} // namespace fs
} // namespace rotap

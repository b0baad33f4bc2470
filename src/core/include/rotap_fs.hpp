#ifndef ROTAP_FS_HPP
#define ROTAP_FS_HPP

#include <string>
#include <sys/types.h>

namespace rotap {
namespace fs {

/**
 * @brief Replace path with content so readers see either old or new file.
 *
 * Writes <path>.tmp, fsyncs it, then rename()s over path. On failure the
 * previous file is left untouched and error (if given) describes the step.
 */
bool atomic_write_file(const std::string& path, const std::string& content,
                       mode_t mode, std::string* error = nullptr);

/// Append one record with a single write() on an O_APPEND descriptor.
bool append_record(const std::string& path, const std::string& record,
                   mode_t mode, std::string* error = nullptr);

bool read_file(const std::string& path, std::string& out);

bool file_exists(const std::string& path);

/// Size in bytes, or -1 if the file cannot be stat()ed.
long long file_size(const std::string& path);

/// mkdir -p; mode applies to directories that get created.
bool ensure_directory(const std::string& path, mode_t mode, std::string* error = nullptr);

std::string join(const std::string& dir, const std::string& name);

} // namespace fs
} // namespace rotap

#endif // ROTAP_FS_HPP

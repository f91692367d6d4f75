#include "core/paths.hpp"
#include <algorithm>
#include <cerrno>
#include <fstream>
#include <system_error>
#include <fcntl.h>
#include <limits.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace tabula::core::paths {

namespace {

[[noreturn]] void throw_errno(const std::string& what) {
    throw std::system_error(errno, std::generic_category(), what);
}

// fd is closed on every path out of write_file_atomic.
class FileDescriptor {
public:
    explicit FileDescriptor(int fd) : fd_(fd) {}
    ~FileDescriptor() {
        if (fd_ >= 0) ::close(fd_);
    }

    FileDescriptor(const FileDescriptor&) = delete;
    FileDescriptor& operator=(const FileDescriptor&) = delete;

    int get() const { return fd_; }

    int release_and_close() {
        int rc = ::close(fd_);
        fd_ = -1;
        return rc;
    }

private:
    int fd_;
};

void sync_parent_dir(const fs::path& path) {
    auto parent = path.parent_path();
    if (parent.empty()) parent = ".";

    int dfd = ::open(parent.c_str(), O_RDONLY | O_DIRECTORY);
    if (dfd < 0) {
        return;  // Best effort; the rename itself already happened
    }
    ::fsync(dfd);
    ::close(dfd);
}

} // namespace

fs::path executable_dir() {
    char buf[PATH_MAX];
    ssize_t len = readlink("/proc/self/exe", buf, sizeof(buf) - 1);
    if (len <= 0) {
        return {};
    }
    buf[len] = '\0';
    return fs::path(buf).parent_path();
}

std::vector<fs::path> project_search_paths() {
    std::vector<fs::path> roots;
    std::error_code ec;
    auto cwd = fs::current_path(ec);
    for (const auto& base : {ec ? fs::path() : cwd, executable_dir()}) {
        if (base.empty()) continue;
        roots.push_back(base);
        roots.push_back(base.parent_path());
        roots.push_back(base.parent_path().parent_path());
    }

    std::vector<fs::path> unique;
    for (const auto& p : roots) {
        if (p.empty()) continue;
        if (std::find(unique.begin(), unique.end(), p) == unique.end()) {
            unique.push_back(p);
        }
    }
    return unique;
}

fs::path temp_path_for(const fs::path& path) {
    fs::path tmp = path;
    tmp += ".tmp";
    return tmp;
}

std::vector<uint8_t> read_file(const fs::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw_errno("failed to open " + path.string());
    }

    file.seekg(0, std::ios::end);
    std::streamoff size = file.tellg();
    if (size < 0) {
        throw_errno("failed to size " + path.string());
    }
    file.seekg(0, std::ios::beg);

    std::vector<uint8_t> bytes(static_cast<size_t>(size));
    if (size > 0 && !file.read(reinterpret_cast<char*>(bytes.data()), size)) {
        throw std::system_error(std::make_error_code(std::errc::io_error),
                                "short read from " + path.string());
    }
    return bytes;
}

void write_file_atomic(const fs::path& path, const std::vector<uint8_t>& bytes) {
    fs::path tmp = temp_path_for(path);

    try {
        FileDescriptor fd(::open(tmp.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644));
        if (fd.get() < 0) {
            throw_errno("failed to create " + tmp.string());
        }

        size_t written = 0;
        while (written < bytes.size()) {
            ssize_t n = ::write(fd.get(), bytes.data() + written, bytes.size() - written);
            if (n < 0) {
                if (errno == EINTR) continue;
                throw_errno("failed to write " + tmp.string());
            }
            written += static_cast<size_t>(n);
        }

        if (::fsync(fd.get()) != 0) {
            throw_errno("failed to sync " + tmp.string());
        }
        if (fd.release_and_close() != 0) {
            throw_errno("failed to close " + tmp.string());
        }

        if (::rename(tmp.c_str(), path.c_str()) != 0) {
            throw_errno("failed to rename " + tmp.string() + " to " + path.string());
        }
    } catch (...) {
        std::error_code ignored;
        fs::remove(tmp, ignored);
        throw;
    }

    sync_parent_dir(path);
}

std::vector<fs::path> list_files(const fs::path& dir, const std::string& extension) {
    std::vector<fs::path> files;
    for (const auto& entry : fs::directory_iterator(dir)) {
        if (!entry.is_regular_file()) continue;
        if (entry.path().extension() == extension) {
            files.push_back(entry.path());
        }
    }
    std::sort(files.begin(), files.end());
    return files;
}

} // namespace tabula::core::paths

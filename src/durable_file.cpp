#include "durable_file.hpp"
#include "errors.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace {

constexpr mode_t kDirMode = 0750;
constexpr mode_t kFileMode = 0640;

std::string errno_text(const std::string& what, const fs::path& path) {
    return what + ": " + path.string() + ": " + std::strerror(errno);
}

// Closes on scope exit; errors on the success path go through close_checked().
class FdGuard {
public:
    explicit FdGuard(int fd) : fd_(fd) {}
    ~FdGuard() {
        if (fd_ >= 0) ::close(fd_);
    }
    FdGuard(const FdGuard&) = delete;
    FdGuard& operator=(const FdGuard&) = delete;

    int get() const { return fd_; }
    int close_checked() {
        int rc = ::close(fd_);
        fd_ = -1;
        return rc;
    }

private:
    int fd_;
};

void fsync_dir(const fs::path& dir) {
    const fs::path target = dir.empty() ? fs::path(".") : dir;
    FdGuard fd(::open(target.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC));
    if (fd.get() < 0) throw CrawlError(errno_text("failed to open directory", target));
    if (::fsync(fd.get()) != 0) throw CrawlError(errno_text("failed to sync directory", target));
}

} // namespace

void ensure_canonical(const fs::path& path) {
    const fs::path normal = path.lexically_normal();
    if (path.empty() || normal != path || path.filename().empty()) {
        throw CrawlError("invalid file path: " + path.string());
    }
}

void make_dirs(const fs::path& dir) {
    fs::path current;
    for (const auto& part : dir) {
        current /= part;
        if (part == current.root_path() || part.empty()) continue;
        if (::mkdir(current.c_str(), kDirMode) == 0) continue;
        if (errno == EEXIST) {
            std::error_code ec;
            if (fs::is_directory(current, ec)) continue;
            throw CrawlError("failed to create directory: " + current.string() + ": not a directory");
        }
        throw CrawlError(errno_text("failed to create directory", current));
    }
}

void write_and_fsync(const fs::path& path, const std::string& data) {
    ensure_canonical(path);

    FdGuard fd(::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, kFileMode));
    if (fd.get() < 0) throw CrawlError(errno_text("failed to create file", path));

    const char* p = data.data();
    size_t left = data.size();
    while (left > 0) {
        ssize_t n = ::write(fd.get(), p, left);
        if (n < 0) {
            if (errno == EINTR) continue;
            throw CrawlError(errno_text("failed to write file", path));
        }
        p += n;
        left -= static_cast<size_t>(n);
    }
    if (::fsync(fd.get()) != 0) throw CrawlError(errno_text("failed to sync file", path));
    if (fd.close_checked() != 0) throw CrawlError(errno_text("failed to close file", path));
}

void durable_rename(const fs::path& from, const fs::path& to) {
    ensure_canonical(from);
    ensure_canonical(to);
    if (::rename(from.c_str(), to.c_str()) != 0) {
        throw CrawlError("failed to rename " + from.string() + " -> " + to.string() + ": " + std::strerror(errno));
    }
    fsync_dir(to.parent_path());
}

#include "execd/capture.h"

#include <cerrno>
#include <cstring>
#include <utility>

#include <fcntl.h>
#include <unistd.h>

namespace execd {

CapturePaths capture_paths(const std::filesystem::path& dir, const std::string& session_id) {
    CapturePaths p;
    p.stdout_path = dir / (session_id + ".stdout");
    p.stderr_path = dir / (session_id + ".stderr");
    p.combined_path = dir / (session_id + ".output");
    return p;
}

CaptureFiles::~CaptureFiles() {
    close();
}

CaptureFiles::CaptureFiles(CaptureFiles&& other) noexcept
    : out_fd_(other.out_fd_), err_fd_(other.err_fd_), combined_(other.combined_) {
    other.out_fd_ = -1;
    other.err_fd_ = -1;
}

CaptureFiles& CaptureFiles::operator=(CaptureFiles&& other) noexcept {
    if (this != &other) {
        close();
        out_fd_ = std::exchange(other.out_fd_, -1);
        err_fd_ = std::exchange(other.err_fd_, -1);
        combined_ = other.combined_;
    }
    return *this;
}

void CaptureFiles::close() {
    if (out_fd_ >= 0) { ::close(out_fd_); out_fd_ = -1; }
    if (err_fd_ >= 0) { ::close(err_fd_); err_fd_ = -1; }
}

static int open_truncated(const std::filesystem::path& p) {
    // O_APPEND keeps interleaved stdout/stderr writes whole on the combined file.
    return ::open(p.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_APPEND | O_CLOEXEC, 0644);
}

std::string open_capture(const CapturePaths& paths, bool combined, CaptureFiles* out) {
    if (!out) return "open_capture: null output";
    out->close();

    std::error_code ec;
    auto parent = paths.stdout_path.parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
        if (ec) return std::string("create_directories: ") + ec.message();
    }

    if (combined) {
        int fd = open_truncated(paths.combined_path);
        if (fd < 0) {
            return std::string("open ") + paths.combined_path.string() + ": " + std::strerror(errno);
        }
        int fd2 = ::fcntl(fd, F_DUPFD_CLOEXEC, 0);
        if (fd2 < 0) {
            std::string err = std::string("dup: ") + std::strerror(errno);
            ::close(fd);
            return err;
        }
        out->out_fd_ = fd;
        out->err_fd_ = fd2;
        out->combined_ = true;
        return "";
    }

    int ofd = open_truncated(paths.stdout_path);
    if (ofd < 0) {
        return std::string("open ") + paths.stdout_path.string() + ": " + std::strerror(errno);
    }
    int efd = open_truncated(paths.stderr_path);
    if (efd < 0) {
        std::string err = std::string("open ") + paths.stderr_path.string() + ": " + std::strerror(errno);
        ::close(ofd);
        return err;
    }
    out->out_fd_ = ofd;
    out->err_fd_ = efd;
    out->combined_ = false;
    return "";
}

void remove_capture(const CapturePaths& paths) {
    std::error_code ec;
    std::filesystem::remove(paths.stdout_path, ec);
    std::filesystem::remove(paths.stderr_path, ec);
    std::filesystem::remove(paths.combined_path, ec);
}

} // namespace execd

#include "execd/status.h"

#include <cerrno>
#include <cstring>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace execd {

std::optional<CommandStatus> get_command_status(const SessionStore& store,
                                                const std::string& session_id,
                                                ExecError* err) {
    auto k = store.get(session_id);
    if (!k) {
        fail(err, ErrorCode::NOT_FOUND, "command not found: " + session_id);
        return std::nullopt;
    }
    return status_from_kernel(*k);
}

bool seek_background_output(const SessionStore& store,
                            const std::string& session_id,
                            int64_t cursor,
                            SeekResult* out,
                            ExecError* err) {
    if (!out) return fail(err, ErrorCode::RUNTIME_ERROR, "seek: null output");
    auto k = store.get(session_id);
    if (!k) return fail(err, ErrorCode::INVALID_REQUEST, "command not found: " + session_id);
    if (!k->is_background) {
        return fail(err, ErrorCode::INVALID_REQUEST, "command is not a background command: " + session_id);
    }
    if (cursor < 0) return fail(err, ErrorCode::INVALID_REQUEST, "cursor must be >= 0");

    const std::string& path = k->combined_path.empty() ? k->stdout_path : k->combined_path;

    out->output.clear();
    out->cursor = cursor;

    int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        return fail(err, ErrorCode::RUNTIME_ERROR, "open " + path + ": " + std::strerror(errno));
    }
    struct stat st{};
    if (::fstat(fd, &st) != 0) {
        std::string e = std::string("fstat: ") + std::strerror(errno);
        ::close(fd);
        return fail(err, ErrorCode::RUNTIME_ERROR, e);
    }
    if (st.st_size <= cursor) {
        ::close(fd);
        return true;
    }

    std::string buf;
    buf.resize(static_cast<size_t>(st.st_size - cursor));
    size_t got = 0;
    while (got < buf.size()) {
        ssize_t n = ::pread(fd, &buf[got], buf.size() - got, cursor + (off_t)got);
        if (n > 0) { got += (size_t)n; continue; }
        if (n == -1 && errno == EINTR) continue;
        if (n == 0) break;
        std::string e = std::string("read ") + path + ": " + std::strerror(errno);
        ::close(fd);
        return fail(err, ErrorCode::RUNTIME_ERROR, e);
    }
    ::close(fd);
    buf.resize(got);

    out->output = std::move(buf);
    out->cursor = cursor + (int64_t)got;
    return true;
}

} // namespace execd

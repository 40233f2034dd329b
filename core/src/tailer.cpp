#include "execd/tailer.h"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <thread>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace execd {

SplitResult split_records(const char* data, size_t n, bool at_eof, size_t max_record_bytes,
                          const RecordFn& on_record) {
    SplitResult r;
    size_t start = 0;
    size_t scan_end = n;

    for (size_t i = 0; i < n; i++) {
        char c = data[i];
        if (c != '\n' && c != '\r') continue;

        if (c == '\r' && i + 1 == n && !at_eof) {
            // may be the first half of "\r\n"; wait for more bytes
            scan_end = i;
            break;
        }
        if (i - start > max_record_bytes) {
            r.consumed = start;
            r.overflow = true;
            return r;
        }
        if (on_record) on_record(std::string(data + start, i - start));
        r.records++;
        if (c == '\r' && i + 1 < n && data[i + 1] == '\n') i++;
        start = i + 1;
    }

    size_t pending = scan_end > start ? scan_end - start : 0;
    if (pending > max_record_bytes) {
        r.consumed = start;
        r.overflow = true;
        return r;
    }
    if (at_eof && start < n) {
        if (on_record) on_record(std::string(data + start, n - start));
        r.records++;
        start = n;
    }
    r.consumed = start;
    return r;
}

Tailer::Tailer(std::filesystem::path path, TailOptions opts)
    : path_(std::move(path)), opts_(opts) {
    if (opts_.poll_interval_ms < 1) opts_.poll_interval_ms = 1;
    if (opts_.max_record_bytes == 0) opts_.max_record_bytes = TailOptions{}.max_record_bytes;
}

bool Tailer::poll(const RecordFn& on_record, bool final) {
    int fd = ::open(path_.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) return false;

    struct stat st{};
    if (::fstat(fd, &st) != 0) {
        ::close(fd);
        return false;
    }
    const int64_t end = st.st_size;
    if (end <= offset_) {
        ::close(fd);
        return true;
    }

    std::string buf;
    buf.resize(std::min(chunk_bytes(), static_cast<size_t>(end - offset_)));

    while (offset_ < end) {
        size_t want = std::min(buf.size(), static_cast<size_t>(end - offset_));
        size_t got = 0;
        while (got < want) {
            ssize_t n = ::pread(fd, &buf[got], want - got, offset_ + (off_t)got);
            if (n > 0) { got += (size_t)n; continue; }
            if (n == -1 && errno == EINTR) continue;
            if (n == 0) break;
            ::close(fd);
            return false;
        }
        if (got == 0) break; // truncated under us

        const bool last = offset_ + (int64_t)got >= end;
        SplitResult r = split_records(buf.data(), got, final && last, opts_.max_record_bytes, on_record);
        offset_ += (int64_t)r.consumed;
        if (r.overflow) {
            ::close(fd);
            return false;
        }
        // only a held-back tail is left in this chunk
        if (last || r.consumed == 0) break;
    }
    ::close(fd);
    return true;
}

void Tailer::run(const std::function<bool()>& still_growing, const RecordFn& on_record) {
    while (true) {
        bool done = !still_growing();
        // a failed poll is retried on the next tick, or dropped at the final drain
        (void)poll(on_record, done);
        if (done) return;
        std::this_thread::sleep_for(std::chrono::milliseconds(opts_.poll_interval_ms));
    }
}

} // namespace execd

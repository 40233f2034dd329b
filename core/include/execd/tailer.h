#pragma once

// Tailer: surfaces newly appended bytes of a growing file as text records.
//
// Records are split on '\n' or '\r'; "\r\n" is one delimiter. While the file
// may still grow, a trailing record without delimiter is held back (as is a
// trailing '\r', which may be the first half of "\r\n"). The final drain,
// taken once the writer is known to be done, emits it.
//
// Offset discipline: the file is read in chunks of max_record_bytes plus
// 64 KiB, and the records of each chunk are delivered before the next read,
// so memory stays bounded by one chunk whatever the backlog. The offset
// advances past the last delivered delimiter. A record longer than
// max_record_bytes stops the poll at its first byte: nothing from it on is
// delivered and the next poll retries from there, so an oversized record
// stalls the stream until it is terminated within the cap.

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>

namespace execd {

struct TailOptions {
    int poll_interval_ms{100};
    size_t max_record_bytes{5 * 1024 * 1024};
};

using RecordFn = std::function<void(const std::string&)>;

struct SplitResult {
    size_t records{0};    // records passed to on_record
    size_t consumed{0};   // bytes of input covered by records (incl. delimiters)
    bool overflow{false}; // stopped at a record longer than the cap
};

// Splits data[0..n) into records, handing each to on_record in order.
// at_eof marks the final drain. On overflow, consumed ends where the
// oversized record starts.
SplitResult split_records(const char* data, size_t n, bool at_eof, size_t max_record_bytes,
                          const RecordFn& on_record);

class Tailer {
public:
    explicit Tailer(std::filesystem::path path, TailOptions opts = {});

    // Reads from the current offset to end-of-file and delivers complete
    // records in file order. final=true also delivers a trailing partial
    // record. Returns false when the file cannot be read or a record
    // overflows; records before that point are delivered and consumed.
    bool poll(const RecordFn& on_record, bool final);

    // Polls every poll_interval_ms while still_growing() holds, then performs
    // one final drain. still_growing is sampled before each read, so bytes
    // written before it turned false are always part of the final drain.
    void run(const std::function<bool()>& still_growing, const RecordFn& on_record);

    int64_t offset() const { return offset_; }
    size_t chunk_bytes() const { return opts_.max_record_bytes + kChunkSlack; }
    const std::filesystem::path& path() const { return path_; }

private:
    static constexpr size_t kChunkSlack = 64 * 1024;

    std::filesystem::path path_;
    TailOptions opts_;
    int64_t offset_{0};
};

} // namespace execd

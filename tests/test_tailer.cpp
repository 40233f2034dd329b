#include "test_common.h"

#include "execd/tailer.h"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <thread>
#include <vector>

#include <sys/resource.h>

using namespace execd;

static void append(const std::filesystem::path& p, const std::string& s) {
    std::ofstream f(p, std::ios::binary | std::ios::app);
    f << s;
}

struct Split {
    SplitResult result;
    std::vector<std::string> records;
};

static Split split(const std::string& in, bool at_eof, size_t max) {
    Split s;
    s.result = split_records(in.data(), in.size(), at_eof, max,
                             [&s](const std::string& rec) { s.records.push_back(rec); });
    expect_eq_ll((long long)s.result.records, (long long)s.records.size(), "split: record count matches");
    return s;
}

static void test_split() {
    std::string in = "a\nb\rc\r\nd";
    auto r = split(in, false, 1024);
    expect_true(!r.result.overflow, "split: no overflow");
    expect_eq_ll((long long)r.records.size(), 3, "split: three complete records");
    expect_true(r.records[0] == "a" && r.records[1] == "b" && r.records[2] == "c", "split: record text");
    expect_eq_ll((long long)r.result.consumed, 7, "split: partial 'd' held back");

    r = split(in, true, 1024);
    expect_eq_ll((long long)r.records.size(), 4, "split eof: trailing record emitted");
    expect_eq_str(r.records[3], "d", "split eof: trailing text");
    expect_eq_ll((long long)r.result.consumed, (long long)in.size(), "split eof: all consumed");

    // "\r\n" and "\n" produce the same records
    expect_true(split("x\r\ny\r\n", false, 1024).records == split("x\ny\n", false, 1024).records,
                "split: CRLF equals LF");

    // a trailing CR may be half of CRLF
    r = split("line\r", false, 1024);
    expect_eq_ll((long long)r.records.size(), 0, "split: trailing CR held");
    expect_eq_ll((long long)r.result.consumed, 0, "split: trailing CR not consumed");
    r = split("line\r", true, 1024);
    expect_eq_ll((long long)r.records.size(), 1, "split eof: trailing CR terminates");
    expect_eq_str(r.records[0], "line", "split eof: CR stripped");

    r = split("\n\n", false, 1024);
    expect_eq_ll((long long)r.records.size(), 2, "split: empty records kept");
    expect_true(r.records[0].empty() && r.records[1].empty(), "split: empty text");

    r = split("abcdef\nok\n", false, 3);
    expect_true(r.result.overflow, "split: long record overflows");
    expect_true(r.records.empty() && r.result.consumed == 0, "split: overflow at start emits nothing");

    // records before the oversized one are delivered; consumption stops at it
    r = split("ab\ncd\nabcdef\nok\n", false, 3);
    expect_true(r.result.overflow, "split: later long record overflows");
    expect_eq_ll((long long)r.records.size(), 2, "split: records before overflow delivered");
    expect_eq_ll((long long)r.result.consumed, 6, "split: consumed stops at oversized record");

    r = split("ok\nabcdef", false, 3);
    expect_true(r.result.overflow, "split: long pending record overflows");
    expect_eq_ll((long long)r.result.consumed, 3, "split: pending overflow keeps earlier records");

    r = split("abc\n", false, 3);
    expect_true(!r.result.overflow && r.records.size() == 1, "split: record at cap is fine");
}

static void test_poll(const std::filesystem::path& dir) {
    auto p = dir / "poll.txt";
    Tailer t(p);
    std::vector<std::string> got;
    auto collect = [&](const std::string& s) { got.push_back(s); };

    expect_true(!t.poll(collect, false), "poll: missing file fails");
    expect_eq_ll(t.offset(), 0, "poll: offset unchanged on failure");

    append(p, "one\ntw");
    expect_true(t.poll(collect, false), "poll 1");
    expect_eq_ll((long long)got.size(), 1, "poll 1: one record");
    expect_eq_ll(t.offset(), 4, "poll 1: offset after delimiter");

    expect_true(t.poll(collect, false), "poll 2: nothing new");
    expect_eq_ll((long long)got.size(), 1, "poll 2: still one record");

    append(p, "o\nthree");
    expect_true(t.poll(collect, false), "poll 3");
    expect_eq_ll((long long)got.size(), 2, "poll 3: partial completed");
    expect_eq_str(got[1], "two", "poll 3: text spans writes");

    expect_true(t.poll(collect, true), "final drain");
    expect_eq_ll((long long)got.size(), 3, "final drain emits partial");
    expect_eq_str(got[2], "three", "final drain text");
    expect_eq_ll(t.offset(), (long long)std::filesystem::file_size(p), "final drain consumes file");
}

static void test_overflow_stall(const std::filesystem::path& dir) {
    auto p = dir / "overflow.txt";
    append(p, "ok\n");
    TailOptions opts;
    opts.max_record_bytes = 8;
    Tailer t(p, opts);
    std::vector<std::string> got;
    auto collect = [&](const std::string& s) { got.push_back(s); };

    expect_true(t.poll(collect, false), "overflow: first record fine");
    expect_eq_ll(t.offset(), 3, "overflow: offset after first");

    append(p, "0123456789abcdef\nnext\n");
    expect_true(!t.poll(collect, false), "overflow: poll fails");
    expect_eq_ll(t.offset(), 3, "overflow: offset not advanced");
    expect_true(!t.poll(collect, true), "overflow: still stalled at final drain");
    expect_eq_ll((long long)got.size(), 1, "overflow: nothing delivered");

    // within one poll, records ahead of the oversized one still come through
    auto q = dir / "overflow_mid.txt";
    append(q, "a\nb\n0123456789abcdef\nc\n");
    Tailer mid(q, opts);
    std::vector<std::string> seen;
    auto keep = [&](const std::string& s) { seen.push_back(s); };
    expect_true(!mid.poll(keep, false), "overflow mid: poll fails");
    expect_eq_ll((long long)seen.size(), 2, "overflow mid: leading records delivered");
    expect_eq_ll(mid.offset(), 4, "overflow mid: offset at oversized record");
    expect_true(!mid.poll(keep, false), "overflow mid: retry stalls");
    expect_eq_ll((long long)seen.size(), 2, "overflow mid: no duplicates on retry");
    expect_eq_ll(mid.offset(), 4, "overflow mid: offset unchanged on retry");
}

static long max_rss_kb() {
    struct rusage ru{};
    ::getrusage(RUSAGE_SELF, &ru);
    return ru.ru_maxrss;
}

static void test_large_backlog(const std::filesystem::path& dir) {
    // 20 MB of short records, written in 1 MB blocks
    auto p = dir / "backlog.txt";
    {
        std::string block;
        for (int i = 0; i < 512 * 1024; i++) block += "y\n";
        std::ofstream f(p, std::ios::binary);
        for (int i = 0; i < 20; i++) f << block;
    }
    const long long total = 20LL * 512 * 1024;

    TailOptions opts;
    opts.max_record_bytes = 64 * 1024;
    Tailer t(p, opts);
    expect_true(t.chunk_bytes() < 1024 * 1024, "backlog: chunk bounded by record cap");

    long before = max_rss_kb();
    long long count = 0;
    bool all_y = true;
    expect_true(t.poll([&](const std::string& s) { count++; if (s != "y") all_y = false; }, false),
                "backlog: poll");
    long grown_kb = max_rss_kb() - before;

    expect_eq_ll(count, total, "backlog: every record delivered once");
    expect_true(all_y, "backlog: record text");
    expect_eq_ll(t.offset(), 2 * total, "backlog: whole file consumed");
    expect_true(grown_kb < 16 * 1024, "backlog: peak memory stays bounded (grew " +
                                          std::to_string(grown_kb) + " KiB)");
    std::filesystem::remove(p);
}

static void test_chunk_boundaries(const std::filesystem::path& dir) {
    // CRLF records straddle every chunk boundary somewhere in the file
    auto p = dir / "crlf_chunks.txt";
    {
        std::string body;
        for (int i = 0; i < 100000; i++) body += "abc\r\n";
        append(p, body + "end");
    }
    TailOptions opts;
    opts.max_record_bytes = 16;
    Tailer t(p, opts);
    long long count = 0;
    bool ok = true;
    auto check = [&](const std::string& s) {
        if (count < 100000 && s != "abc") ok = false;
        count++;
    };
    expect_true(t.poll(check, false), "chunks: poll");
    expect_eq_ll(count, 100000, "chunks: partial tail held");
    expect_true(ok, "chunks: no record split across reads");
    expect_true(t.poll([&](const std::string& s) { expect_eq_str(s, "end", "chunks: tail text"); count++; }, true),
                "chunks: final drain");
    expect_eq_ll(count, 100001, "chunks: tail delivered");
}

static void test_run_growing(const std::filesystem::path& dir) {
    auto p = dir / "run.txt";
    append(p, "");
    TailOptions opts;
    opts.poll_interval_ms = 5;
    Tailer t(p, opts);

    std::atomic<bool> writing{true};
    std::thread writer([&] {
        for (int i = 0; i < 20; i++) {
            append(p, "line" + std::to_string(i) + "\n");
            std::this_thread::sleep_for(std::chrono::milliseconds(2));
        }
        append(p, "tail");
        writing.store(false);
    });

    std::vector<std::string> got;
    t.run([&] { return writing.load(); }, [&](const std::string& s) { got.push_back(s); });
    writer.join();

    expect_eq_ll((long long)got.size(), 21, "run: every record once");
    for (int i = 0; i < 20; i++) {
        expect_true(got[i] == "line" + std::to_string(i), "run: order preserved at " + std::to_string(i));
    }
    expect_eq_str(got[20], "tail", "run: final drain");
}

int main() {
    namespace fs = std::filesystem;
    fs::path dir = fs::temp_directory_path() / "execd_test_tailer";
    std::error_code ec;
    fs::remove_all(dir, ec);
    fs::create_directories(dir, ec);

    test_split();
    test_poll(dir);
    test_overflow_stall(dir);
    test_run_growing(dir);
    test_large_backlog(dir);
    test_chunk_boundaries(dir);

    fs::remove_all(dir, ec);
    std::cerr << "test_tailer: ALL PASSED" << std::endl;
    return 0;
}

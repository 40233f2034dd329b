#pragma once

// Output capture: per-session files receiving a command's stdout/stderr.
//
// Paths are derived from the session id, so two sessions never share a file:
//   <dir>/<id>.stdout, <dir>/<id>.stderr, <dir>/<id>.output (combined)
//
// The child writes straight into these files through its own descriptors;
// readers (Tailer, seek API) see every byte as soon as write(2) returns.

#include <filesystem>
#include <string>

namespace execd {

struct CapturePaths {
    std::filesystem::path stdout_path;
    std::filesystem::path stderr_path;
    std::filesystem::path combined_path;
};

CapturePaths capture_paths(const std::filesystem::path& dir, const std::string& session_id);

// Write-only descriptors handed to the child. Closed on destruction; the
// parent drops them right after the fork.
class CaptureFiles {
public:
    CaptureFiles() = default;
    ~CaptureFiles();

    CaptureFiles(const CaptureFiles&) = delete;
    CaptureFiles& operator=(const CaptureFiles&) = delete;
    CaptureFiles(CaptureFiles&& other) noexcept;
    CaptureFiles& operator=(CaptureFiles&& other) noexcept;

    int stdout_fd() const { return out_fd_; }
    int stderr_fd() const { return err_fd_; }
    bool combined() const { return combined_; }

    void close();

private:
    friend std::string open_capture(const CapturePaths&, bool, CaptureFiles*);

    int out_fd_{-1};
    int err_fd_{-1};
    bool combined_{false};
};

// Creates (or truncates) the capture files for one session. With combined
// set, stdout and stderr share combined_path; otherwise each stream gets its
// own file. Creates the parent directory if needed.
// Returns empty string on success; on failure no descriptor is left open.
std::string open_capture(const CapturePaths& paths, bool combined, CaptureFiles* out);

// Best-effort removal of every file named in paths.
void remove_capture(const CapturePaths& paths);

} // namespace execd

#include "execd/ids.h"

#include <cstdint>
#include <cstdio>
#include <iomanip>
#include <sstream>

#if defined(__linux__)
  #include <sys/random.h>
#endif

namespace execd {

static bool secure_rand32(uint32_t* out) {
    uint32_t v = 0;
#if defined(__linux__)
    if (::getrandom(&v, sizeof(v), 0) == (ssize_t)sizeof(v)) { *out = v; return true; }
#endif
    FILE* f = std::fopen("/dev/urandom", "rb");
    if (!f) return false;
    size_t got = std::fread(&v, sizeof(v), 1, f);
    std::fclose(f);
    if (got != 1) return false;
    *out = v;
    return true;
}

std::string new_session_id() {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (int i = 0; i < 4; i++) {
        uint32_t r = 0;
        // never fall back to a predictable id
        if (!secure_rand32(&r)) return "";
        oss << std::setw(8) << r;
    }
    return oss.str();
}

bool is_valid_session_id(const std::string& id) {
    if (id.empty() || id.size() > 128) return false;
    for (char c : id) {
        bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
                  (c >= '0' && c <= '9') || c == '_' || c == '-';
        if (!ok) return false;
    }
    return true;
}

} // namespace execd

#pragma once

// HTTP/1.1 plumbing for the execd daemon: request reading, response and
// server-sent-event framing. One request per connection (Connection: close).

#include "execd/errors.h"
#include "execd/json_util.h"

#include <cstdint>
#include <stdexcept>
#include <sstream>
#include <string>
#include <vector>

#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

namespace execd {

// Set socket recv/send timeouts for Slowloris defense
inline void set_socket_timeouts(int fd, int timeout_sec = 10) {
    struct timeval tv;
    tv.tv_sec = timeout_sec;
    tv.tv_usec = 0;
    ::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
    ::setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
}

// Parses the Content-Length header out of a request head. -1 when absent,
// -2 when duplicated or malformed (request smuggling guard).
inline long long content_length_of(const std::string& head) {
    long long cl = -1;
    std::istringstream iss(head);
    std::string line;
    while (std::getline(iss, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        std::string low = line;
        for (char& c : low) if (c >= 'A' && c <= 'Z') c = (char)(c - 'A' + 'a');
        if (low.rfind("content-length:", 0) != 0) continue;
        if (cl != -1) return -2;
        std::string v = line.substr(15);
        while (!v.empty() && (v[0] == ' ' || v[0] == '\t')) v.erase(0, 1);
        try { cl = std::stoll(v); } catch (const std::exception&) { return -2; }
        if (cl < 0) return -2;
    }
    return cl;
}

// max_body: maximum body size in bytes. Content-Length exceeding this is rejected
// immediately without reading the body.
inline bool read_http_request(int fd, std::string& head, std::string& body, size_t max_body = 2 * 1024 * 1024) {
    head.clear();
    body.clear();
    std::string buf;
    buf.resize(8192);
    std::string all;

    while (all.find("\r\n\r\n") == std::string::npos) {
        ssize_t n = ::recv(fd, buf.data(), buf.size(), 0);
        if (n <= 0) return false; // timeout or disconnect
        all.append(buf.data(), (size_t)n);
        if (all.size() > 64 * 1024) return false; // header cap
    }

    size_t p = all.find("\r\n\r\n");
    head = all.substr(0, p + 4);
    std::string rest = all.substr(p + 4);

    long long cl = content_length_of(head);
    if (cl == -2) return false;
    if (cl < 0) cl = 0;
    if ((size_t)cl > max_body) return false;

    body = rest;
    while (body.size() < (size_t)cl) {
        ssize_t n = ::recv(fd, buf.data(), buf.size(), 0);
        if (n <= 0) return false;
        body.append(buf.data(), (size_t)n);
    }
    if (body.size() > (size_t)cl) body.resize((size_t)cl);
    return true;
}

struct RequestLine {
    std::string method;
    std::string path;  // decoded, without query
    std::string query; // raw, without '?'
};

inline int hex_val(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

inline std::string url_decode(const std::string& s, bool plus_is_space) {
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); i++) {
        char c = s[i];
        if (c == '%' && i + 2 < s.size()) {
            int hi = hex_val(s[i + 1]);
            int lo = hex_val(s[i + 2]);
            if (hi >= 0 && lo >= 0) {
                out.push_back((char)(hi * 16 + lo));
                i += 2;
                continue;
            }
        }
        if (c == '+' && plus_is_space) { out.push_back(' '); continue; }
        out.push_back(c);
    }
    return out;
}

inline RequestLine parse_request_line(const std::string& head) {
    RequestLine rl;
    std::istringstream iss(head);
    std::string target, ver;
    iss >> rl.method >> target >> ver;
    auto q = target.find('?');
    if (q != std::string::npos) {
        rl.query = target.substr(q + 1);
        target.resize(q);
    }
    rl.path = url_decode(target, false);
    return rl;
}

// Value of key in an application/x-www-form-urlencoded query, "" if absent.
inline std::string query_param(const std::string& query, const std::string& key) {
    size_t start = 0;
    while (start <= query.size()) {
        size_t end = query.find('&', start);
        if (end == std::string::npos) end = query.size();
        std::string pair = query.substr(start, end - start);
        auto eq = pair.find('=');
        std::string k = url_decode(pair.substr(0, eq), true);
        if (k == key) {
            return eq == std::string::npos ? "" : url_decode(pair.substr(eq + 1), true);
        }
        start = end + 1;
    }
    return "";
}

// Non-numeric or missing cursor reads as defv.
inline int64_t parse_int64_or(const std::string& s, int64_t defv) {
    if (s.empty()) return defv;
    try {
        size_t pos = 0;
        long long v = std::stoll(s, &pos);
        if (pos != s.size()) return defv;
        return (int64_t)v;
    } catch (const std::exception&) {
        return defv;
    }
}

inline const char* status_text(int code) {
    switch (code) {
        case 200: return "OK";
        case 400: return "Bad Request";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 500: return "Internal Server Error";
        case 503: return "Service Unavailable";
    }
    return "ERR";
}

inline bool send_all(int fd, const std::string& s) {
    size_t sent = 0;
    while (sent < s.size()) {
        ssize_t n = ::send(fd, s.data() + sent, s.size() - sent, MSG_NOSIGNAL);
        if (n <= 0) return false;
        sent += (size_t)n;
    }
    return true;
}

inline bool send_response(int fd, int code, const std::string& content_type, const std::string& body,
                          const std::vector<std::pair<std::string, std::string>>& extra_headers = {}) {
    std::ostringstream oss;
    oss << "HTTP/1.1 " << code << " " << status_text(code) << "\r\n";
    oss << "Content-Type: " << content_type << "\r\n";
    for (const auto& h : extra_headers) oss << h.first << ": " << h.second << "\r\n";
    oss << "Content-Length: " << body.size() << "\r\n";
    oss << "Connection: close\r\n\r\n";
    oss << body;
    return send_all(fd, oss.str());
}

inline bool send_json(int fd, int code, const std::string& json) {
    return send_response(fd, code, "application/json", json);
}

// {"code":"INVALID_REQUEST","message":"..."}
inline std::string error_body(const std::string& code, const std::string& message) {
    return "{\"code\":\"" + json_util::json_escape(code) + "\",\"message\":\"" + json_util::json_escape(message) + "\"}";
}

inline int http_status_for(ErrorCode c) {
    switch (c) {
        case ErrorCode::INVALID_REQUEST: return 400;
        case ErrorCode::NOT_FOUND:       return 404;
        case ErrorCode::RUNTIME_ERROR:   return 500;
    }
    return 500;
}

inline bool send_sse_headers(int fd) {
    return send_all(fd,
        "HTTP/1.1 200 OK\r\n"
        "Content-Type: text/event-stream\r\n"
        "Cache-Control: no-cache\r\n"
        "Connection: close\r\n\r\n");
}

// One server-sent event carrying a single-line JSON payload.
inline std::string sse_frame(const std::string& json) {
    return "data: " + json + "\n\n";
}

} // namespace execd

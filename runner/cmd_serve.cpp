#include "cmd_serve.h"
#include "command_api.h"
#include "serve_http.h"

#include "execd/config.h"
#include "execd/engine.h"
#include "execd/log.h"
#include "execd/session_store.h"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <signal.h>
#include <sys/socket.h>
#include <unistd.h>

#include <atomic>
#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <list>
#include <memory>
#include <system_error>
#include <mutex>
#include <thread>

using namespace execd;

namespace {

volatile sig_atomic_t g_stop = 0;

void on_stop_signal(int) { g_stop = 1; }

void install_stop_handlers() {
    struct sigaction sa;
    std::memset(&sa, 0, sizeof(sa));
    sa.sa_handler = on_stop_signal;
    sigemptyset(&sa.sa_mask);
    ::sigaction(SIGINT, &sa, nullptr);
    ::sigaction(SIGTERM, &sa, nullptr);
    // Writing to disconnected clients must not kill the server.
    ::signal(SIGPIPE, SIG_IGN);
}

struct ConnThread {
    std::thread t;
    std::shared_ptr<std::atomic<bool>> done;
};

// Joins connection threads that have finished serving.
void reap_finished(std::list<ConnThread>& conns) {
    for (auto it = conns.begin(); it != conns.end();) {
        if (it->done->load()) {
            if (it->t.joinable()) it->t.join();
            it = conns.erase(it);
        } else {
            ++it;
        }
    }
}

int listen_on(const std::string& host, int port) {
    int sfd = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (sfd < 0) { std::cerr << "socket failed: " << std::strerror(errno) << "\n"; return -1; }
    {
        int one = 1;
        ::setsockopt(sfd, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));
    }

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons((uint16_t)port);
    if (::inet_pton(AF_INET, host.c_str(), &addr.sin_addr) <= 0) {
        std::cerr << "bad host: " << host << "\n";
        ::close(sfd);
        return -1;
    }
    if (::bind(sfd, (sockaddr*)&addr, sizeof(addr)) < 0) {
        std::cerr << "bind failed: " << std::strerror(errno) << "\n";
        ::close(sfd);
        return -1;
    }
    if (::listen(sfd, 64) < 0) {
        std::cerr << "listen failed: " << std::strerror(errno) << "\n";
        ::close(sfd);
        return -1;
    }
    return sfd;
}

} // namespace

int cmd_serve(int argc, char** argv) {
    install_stop_handlers();

    Profile profile = detect_profile();
    apply_profile_defaults(profile);
    Config cfg = load_config();

    std::string host = "127.0.0.1";
    int port = 44772;
    for (int i = 2; i < argc; i++) {
        std::string a = argv[i];
        if (a == "--host" && i + 1 < argc) { host = argv[++i]; continue; }
        if (a == "--port" && i + 1 < argc) { port = std::atoi(argv[++i]); continue; }
        if (a == "--output-dir" && i + 1 < argc) { cfg.output_dir = argv[++i]; continue; }
        std::cerr << "unknown option: " << a << "\n";
        return 2;
    }
    if (port <= 0 || port > 65535) {
        std::cerr << "bad port: " << port << "\n";
        return 2;
    }

    std::error_code ec;
    std::filesystem::create_directories(cfg.output_dir, ec);
    if (ec) {
        std::cerr << "cannot create output dir " << cfg.output_dir << ": " << ec.message() << "\n";
        return 2;
    }

    std::unique_ptr<JsonlLogger> events;
    if (!cfg.event_log.empty()) {
        events.reset(new JsonlLogger(cfg.event_log));
        if (!events->is_open()) {
            std::cerr << "[WARN] event log disabled, cannot open " << cfg.event_log << "\n";
            events.reset();
        }
    }

    int sfd = listen_on(host, port);
    if (sfd < 0) return 2;

    InMemorySessionStore store;
    Engine engine(store, engine_options_from_config(cfg), events.get());

    std::cerr << "[serve] http://" << host << ":" << port << " profile=" << profile_name(profile)
              << " output_dir=" << cfg.output_dir << "\n";

    std::atomic<int> active_conns{0};
    std::list<ConnThread> conns;
    auto last_prune = std::chrono::steady_clock::now();
    const auto ttl = std::chrono::seconds(cfg.session_ttl_sec);

    while (!g_stop) {
        pollfd pfd{sfd, POLLIN, 0};
        int pr = ::poll(&pfd, 1, 500);

        reap_finished(conns);
        if (cfg.session_ttl_sec > 0 && std::chrono::steady_clock::now() - last_prune >= std::chrono::seconds(30)) {
            size_t n = engine.prune_finished(ttl);
            if (n > 0) log_line("[serve]", "pruned " + std::to_string(n) + " finished sessions");
            last_prune = std::chrono::steady_clock::now();
        }

        if (pr <= 0 || !(pfd.revents & POLLIN)) continue;

        int cfd = ::accept4(sfd, nullptr, nullptr, SOCK_CLOEXEC);
        if (cfd < 0) continue;
        if (active_conns.load() >= cfg.max_conns) {
            send_json(cfd, 503, error_body("RUNTIME_ERROR", "too many connections"));
            ::close(cfd);
            continue;
        }
        active_conns.fetch_add(1);
        set_socket_timeouts(cfd, 10);

        auto done = std::make_shared<std::atomic<bool>>(false);
        try {
            std::thread t([&engine, &active_conns, cfd, done]() {
                handle_connection(cfd, engine);
                ::close(cfd);
                active_conns.fetch_sub(1);
                done->store(true);
            });
            conns.push_back(ConnThread{std::move(t), done});
        } catch (const std::system_error& e) {
            log_line("[serve]", std::string("cannot start connection thread: ") + e.what());
            send_json(cfd, 503, error_body("RUNTIME_ERROR", "server busy"));
            ::close(cfd);
            active_conns.fetch_sub(1);
        }
    }

    std::cerr << "[serve] shutting down\n";
    ::close(sfd);
    // Killing the sessions unblocks every streaming handler.
    engine.shutdown();
    for (auto& c : conns) {
        if (c.t.joinable()) c.t.join();
    }
    conns.clear();
    return 0;
}

#include "test_common.h"

#include "execd/session_store.h"

#include <atomic>
#include <thread>
#include <vector>

using namespace execd;

static CommandKernel kernel(const std::string& id) {
    CommandKernel k;
    k.session_id = id;
    k.running = true;
    k.started_at = Clock::now();
    return k;
}

int main() {
    InMemorySessionStore store;

    expect_true(store.insert(kernel("s1")), "insert s1");
    expect_true(!store.insert(kernel("s1")), "duplicate insert rejected");
    expect_eq_ll((long long)store.size(), 1, "size after insert");

    auto got = store.get("s1");
    expect_true(got.has_value() && got->running, "get returns snapshot");
    expect_true(!store.get("nope").has_value(), "unknown id");

    bool ok = store.update("s1", [](CommandKernel& k, std::unique_ptr<ProcessHandle>& proc) {
        expect_true(proc == nullptr, "no handle attached yet");
        k.running = false;
        k.exit_code = 3;
    });
    expect_true(ok, "update known id");
    got = store.get("s1");
    expect_true(!got->running && got->exit_code && *got->exit_code == 3, "update visible");
    expect_true(!store.update("nope", [](CommandKernel&, std::unique_ptr<ProcessHandle>&) {}), "update unknown");

    // snapshots are copies
    got->exit_code = 99;
    expect_true(*store.get("s1")->exit_code == 3, "snapshot isolated from store");

    expect_true(store.insert(kernel("s2")), "insert s2");
    auto ids = store.session_ids();
    expect_eq_ll((long long)ids.size(), 2, "session_ids lists all");

    expect_true(store.erase("s1"), "erase s1");
    expect_true(!store.erase("s1"), "erase twice");
    expect_true(!store.get("s1").has_value(), "erased id gone");

    // concurrent writers and readers
    InMemorySessionStore shared;
    expect_true(shared.insert(kernel("counter")), "insert counter");
    std::atomic<bool> torn{false};
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; t++) {
        threads.emplace_back([&shared, t] {
            for (int i = 0; i < 500; i++) {
                shared.insert(kernel("w" + std::to_string(t) + "_" + std::to_string(i)));
                shared.update("counter", [](CommandKernel& k, std::unique_ptr<ProcessHandle>&) {
                    int next = k.exit_code.value_or(0) + 1;
                    k.exit_code = next;
                    k.err_msg = std::to_string(next);
                });
            }
        });
    }
    for (int t = 0; t < 2; t++) {
        threads.emplace_back([&shared, &torn] {
            for (int i = 0; i < 1000; i++) {
                auto k = shared.get("counter");
                if (!k) { torn.store(true); continue; }
                int code = k->exit_code.value_or(0);
                std::string want = code == 0 ? "" : std::to_string(code);
                if (k->err_msg != want) torn.store(true);
            }
        });
    }
    for (auto& th : threads) th.join();
    expect_true(!torn.load(), "readers never see a half-written kernel");
    expect_eq_ll(*shared.get("counter")->exit_code, 2000, "all updates applied");
    expect_eq_ll((long long)shared.size(), 2001, "all inserts applied");

    std::cerr << "test_session_store: ALL PASSED" << std::endl;
    return 0;
}

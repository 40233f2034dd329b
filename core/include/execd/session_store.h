#pragma once

// Session store: the single source of truth for session state.
//
// Keys are session ids; each entry holds the session's CommandKernel plus the
// ProcessHandle capability while the child is alive. Lookups share a
// read lock; inserts and updates are serialized, so a status query never sees
// a half-written kernel.

#include "types.h"
#include "process.h"

#include <functional>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace execd {

class SessionStore {
public:
    using Mutator = std::function<void(CommandKernel&, std::unique_ptr<ProcessHandle>&)>;

    virtual ~SessionStore() = default;

    // Returns false if kernel.session_id is already registered.
    virtual bool insert(const CommandKernel& kernel) = 0;

    // Snapshot of the kernel, or nullopt when unknown.
    virtual std::optional<CommandKernel> get(const std::string& session_id) const = 0;

    // Runs fn on the kernel and its process slot under the write lock.
    // fn may attach, signal or release the handle. Returns false when unknown.
    virtual bool update(const std::string& session_id, const Mutator& fn) = 0;

    // Removes the entry. A still-attached handle is destroyed with it.
    virtual bool erase(const std::string& session_id) = 0;

    virtual std::vector<std::string> session_ids() const = 0;
    virtual size_t size() const = 0;
};

class InMemorySessionStore : public SessionStore {
public:
    InMemorySessionStore() = default;
    ~InMemorySessionStore() override = default;

    InMemorySessionStore(const InMemorySessionStore&) = delete;
    InMemorySessionStore& operator=(const InMemorySessionStore&) = delete;

    bool insert(const CommandKernel& kernel) override;
    std::optional<CommandKernel> get(const std::string& session_id) const override;
    bool update(const std::string& session_id, const Mutator& fn) override;
    bool erase(const std::string& session_id) override;
    std::vector<std::string> session_ids() const override;
    size_t size() const override;

private:
    struct Entry {
        CommandKernel kernel;
        std::unique_ptr<ProcessHandle> process;
    };

    mutable std::shared_mutex mu_;
    std::unordered_map<std::string, Entry> sessions_;
};

} // namespace execd

#include "execd/session_store.h"

#include <mutex>

namespace execd {

bool InMemorySessionStore::insert(const CommandKernel& kernel) {
    std::unique_lock<std::shared_mutex> lk(mu_);
    if (sessions_.find(kernel.session_id) != sessions_.end()) return false;
    sessions_.emplace(kernel.session_id, Entry{kernel, nullptr});
    return true;
}

std::optional<CommandKernel> InMemorySessionStore::get(const std::string& session_id) const {
    std::shared_lock<std::shared_mutex> lk(mu_);
    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) return std::nullopt;
    return it->second.kernel;
}

bool InMemorySessionStore::update(const std::string& session_id, const Mutator& fn) {
    std::unique_lock<std::shared_mutex> lk(mu_);
    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) return false;
    if (fn) fn(it->second.kernel, it->second.process);
    return true;
}

bool InMemorySessionStore::erase(const std::string& session_id) {
    std::unique_ptr<ProcessHandle> doomed;
    {
        std::unique_lock<std::shared_mutex> lk(mu_);
        auto it = sessions_.find(session_id);
        if (it == sessions_.end()) return false;
        doomed = std::move(it->second.process);
        sessions_.erase(it);
    }
    // handle destructor may block reaping a killed child; keep it off the lock
    return true;
}

std::vector<std::string> InMemorySessionStore::session_ids() const {
    std::shared_lock<std::shared_mutex> lk(mu_);
    std::vector<std::string> out;
    out.reserve(sessions_.size());
    for (const auto& kv : sessions_) out.push_back(kv.first);
    return out;
}

size_t InMemorySessionStore::size() const {
    std::shared_lock<std::shared_mutex> lk(mu_);
    return sessions_.size();
}

} // namespace execd

#include "zapwire/relay/PeerTable.hpp"

namespace zapwire::relay {

PeerTable::RegisterResult PeerTable::register_peer(const std::string& code_hash, Role role, SessionId session) {
    std::scoped_lock lock(mutex_);
    auto it = waiting_.find(code_hash);
    if (it == waiting_.end()) {
        waiting_.emplace(code_hash, Registration{role, session});
        return {Outcome::Waiting, std::nullopt};
    }
    if (it->second.role == role) {
        return {Outcome::DuplicateRole, std::nullopt};
    }
    const auto partner = it->second;
    waiting_.erase(it);
    return {Outcome::Matched, partner};
}

bool PeerTable::remove(const std::string& code_hash, SessionId session) {
    std::scoped_lock lock(mutex_);
    auto it = waiting_.find(code_hash);
    if (it == waiting_.end() || it->second.session != session) {
        return false;
    }
    waiting_.erase(it);
    return true;
}

std::optional<Registration> PeerTable::waiting(const std::string& code_hash) const {
    std::scoped_lock lock(mutex_);
    auto it = waiting_.find(code_hash);
    if (it == waiting_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::size_t PeerTable::size() const {
    std::scoped_lock lock(mutex_);
    return waiting_.size();
}

}  // namespace zapwire::relay

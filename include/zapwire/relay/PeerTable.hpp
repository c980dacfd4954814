#pragma once

#include "zapwire/Types.hpp"

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace zapwire::relay {

using SessionId = std::uint64_t;

struct Registration {
    Role role{Role::Sender};
    SessionId session{0};
};

// Waiting registrations keyed by code hash. At most one entry per hash; a match
// removes it, so each hash pairs exactly one sender with one receiver.
class PeerTable {
public:
    enum class Outcome {
        Waiting,
        Matched,
        DuplicateRole,
    };

    struct RegisterResult {
        Outcome outcome{Outcome::Waiting};
        // Set for Matched: the registration that was waiting.
        std::optional<Registration> partner;
    };

    RegisterResult register_peer(const std::string& code_hash, Role role, SessionId session);

    // Removes the waiting entry only if it still belongs to session.
    bool remove(const std::string& code_hash, SessionId session);

    std::optional<Registration> waiting(const std::string& code_hash) const;
    std::size_t size() const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, Registration> waiting_;
};

}  // namespace zapwire::relay

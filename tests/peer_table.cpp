#include "zapwire/relay/PeerTable.hpp"

#include <atomic>
#include <cassert>
#include <string>
#include <thread>
#include <vector>

using namespace zapwire;
using namespace zapwire::relay;

namespace {

const std::string kHashA(64, 'a');
const std::string kHashB(64, 'b');

}  // namespace

int main() {
    {
        PeerTable table;
        const auto first = table.register_peer(kHashA, Role::Sender, 1);
        assert(first.outcome == PeerTable::Outcome::Waiting);
        assert(!first.partner.has_value());
        assert(table.size() == 1);

        // Same role again: rejected, the original keeps waiting.
        const auto duplicate = table.register_peer(kHashA, Role::Sender, 2);
        assert(duplicate.outcome == PeerTable::Outcome::DuplicateRole);
        const auto still_waiting = table.waiting(kHashA);
        assert(still_waiting.has_value());
        assert(still_waiting->session == 1);

        const auto matched = table.register_peer(kHashA, Role::Receiver, 3);
        assert(matched.outcome == PeerTable::Outcome::Matched);
        assert(matched.partner.has_value());
        assert(matched.partner->session == 1);
        assert(matched.partner->role == Role::Sender);

        // One-shot: the entry is gone, a late registration starts over.
        assert(table.size() == 0);
        const auto late = table.register_peer(kHashA, Role::Receiver, 4);
        assert(late.outcome == PeerTable::Outcome::Waiting);
    }

    {
        PeerTable table;
        (void)table.register_peer(kHashA, Role::Receiver, 10);
        (void)table.register_peer(kHashB, Role::Receiver, 11);
        assert(table.size() == 2);

        // Only the owning session may withdraw its registration.
        assert(!table.remove(kHashA, 11));
        assert(table.waiting(kHashA).has_value());
        assert(table.remove(kHashA, 10));
        assert(!table.waiting(kHashA).has_value());
        assert(!table.remove(kHashA, 10));
        assert(table.size() == 1);
    }

    // Concurrent registrations: every hash ends in exactly one match.
    {
        PeerTable table;
        constexpr int kHashes = 200;
        std::atomic<int> matches{0};
        std::atomic<int> duplicates{0};
        auto worker = [&](Role role, SessionId base) {
            for (int index = 0; index < kHashes; ++index) {
                const auto hash = std::to_string(index);
                const auto result = table.register_peer(hash, role, base + static_cast<SessionId>(index));
                if (result.outcome == PeerTable::Outcome::Matched) {
                    ++matches;
                } else if (result.outcome == PeerTable::Outcome::DuplicateRole) {
                    ++duplicates;
                }
            }
        };
        std::thread senders(worker, Role::Sender, 1000);
        std::thread receivers(worker, Role::Receiver, 5000);
        senders.join();
        receivers.join();
        assert(matches.load() == kHashes);
        assert(duplicates.load() == 0);
        assert(table.size() == 0);
    }

    return 0;
}

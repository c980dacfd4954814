#pragma once

#include "zapwire/Config.hpp"
#include "zapwire/Types.hpp"
#include "zapwire/relay/EventLoop.hpp"
#include "zapwire/relay/PeerTable.hpp"
#include "zapwire/relay/RelayProtocol.hpp"

#include <chrono>
#include <memory>
#include <string>
#include <unordered_map>

namespace zapwire::relay {

struct RelayServerConfig {
    std::string listen_host{"0.0.0.0"};
    // 0 binds an ephemeral port, see RelayServer::port().
    std::uint16_t listen_port{kDefaultRelayPort};
    std::size_t max_frame_size{kMaxFrameSize};
    std::chrono::seconds registration_timeout{30};
};

// Pairs one sender with one receiver per code hash and forwards binary records
// between them unchanged. Runs entirely on the EventLoop thread; the PeerTable is
// the only state that may be shared.
class RelayServer {
public:
    RelayServer(EventLoop& loop, PeerTable& peers, RelayServerConfig config);
    ~RelayServer();

    RelayServer(const RelayServer&) = delete;
    RelayServer& operator=(const RelayServer&) = delete;

    bool start();
    void stop();

    std::uint16_t port() const noexcept { return bound_port_; }
    std::size_t session_count() const noexcept { return sessions_.size(); }

private:
    enum class SessionState {
        AwaitingRegister,
        Waiting,
        Matched
    };

    struct ClientSession {
        ClientSession(int fd, SessionId id);

        int fd{-1};
        SessionId id{0};
        SessionState state{SessionState::AwaitingRegister};
        Role role{Role::Sender};
        std::string code_hash;
        std::string endpoint;
        ByteBuffer read_buffer;
        ByteBuffer write_buffer;
        std::size_t write_offset{0};
        std::weak_ptr<ClientSession> partner;
        std::chrono::steady_clock::time_point connected_at;
        bool reading_paused{false};
        bool close_after_flush{false};
        bool closing{false};

        std::size_t pending_write() const noexcept { return write_buffer.size() - write_offset; }
    };

    using SessionPtr = std::shared_ptr<ClientSession>;

    void configure_socket(int fd);
    void accept_new_clients();
    void on_client_event(const SessionPtr& session, std::uint32_t events);
    bool handle_read(const SessionPtr& session);
    bool handle_write(const SessionPtr& session);
    void process_records(const SessionPtr& session);
    void handle_control(const SessionPtr& session, std::string_view line);
    void handle_register(const SessionPtr& session, const ControlMessage& message);
    void handle_binary(const SessionPtr& session, const std::uint8_t* record, std::size_t size);
    void sweep_idle_sessions();

    void queue_control(const SessionPtr& session, const ControlMessage& message);
    void queue_bytes(const SessionPtr& session, const std::uint8_t* data, std::size_t size);
    void reject(const SessionPtr& session, const std::string& reason);
    void close_after_flush(const SessionPtr& session);
    void update_interest(const SessionPtr& session);
    void close_session(const SessionPtr& session);
    SessionPtr find_session(SessionId id) const;

    EventLoop& loop_;
    PeerTable& peers_;
    RelayServerConfig config_{};
    int listen_fd_{-1};
    std::uint16_t bound_port_{0};

    std::unordered_map<SessionId, SessionPtr> sessions_;
};

}  // namespace zapwire::relay

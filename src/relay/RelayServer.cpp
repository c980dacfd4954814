#include "zapwire/relay/RelayServer.hpp"

#include "zapwire/core/StructuredLogger.hpp"
#include "zapwire/crypto/CodeHash.hpp"
#include "zapwire/network/Socket.hpp"

#include <array>
#include <atomic>
#include <cerrno>
#include <iostream>
#include <vector>

#include <fcntl.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

namespace zapwire::relay {

namespace {

using core::StructuredLogger;

constexpr std::size_t kReadChunk = 64 * 1024;
// Reading from a peer pauses while its partner has this much undelivered.
constexpr std::size_t kHighWatermark = 8 * 1024 * 1024;
constexpr std::size_t kLowWatermark = 1024 * 1024;

std::atomic<SessionId> g_next_session_id{1};

void log_event(StructuredLogger::Level level, std::string_view event, StructuredLogger::FieldList fields = {}) {
    StructuredLogger::instance().log(level, event, std::move(fields));
}

std::string hash_prefix(const std::string& code_hash) {
    return code_hash.substr(0, 8);
}

}  // namespace

RelayServer::ClientSession::ClientSession(int socket_fd, SessionId session_id)
    : fd(socket_fd),
      id(session_id),
      connected_at(std::chrono::steady_clock::now()) {}

RelayServer::RelayServer(EventLoop& loop, PeerTable& peers, RelayServerConfig config)
    : loop_(loop),
      peers_(peers),
      config_(std::move(config)) {}

RelayServer::~RelayServer() {
    stop();
}

bool RelayServer::start() {
    listen_fd_ = network::open_listener(config_.listen_host, config_.listen_port);
    if (listen_fd_ < 0) {
        std::cerr << "Unable to listen on " << config_.listen_host << ":" << config_.listen_port << "\n";
        return false;
    }
    configure_socket(listen_fd_);
    bound_port_ = network::local_port(listen_fd_);

    loop_.add(listen_fd_, EventLoop::kEventReadable, [this](int fd, std::uint32_t) {
        if (fd == listen_fd_) {
            accept_new_clients();
        }
    });
    loop_.set_tick(std::chrono::seconds(1), [this]() { sweep_idle_sessions(); });

    log_event(StructuredLogger::Level::Info, "relay.listening",
              {{"host", config_.listen_host}, {"port", std::to_string(bound_port_)}});
    return true;
}

void RelayServer::stop() {
    if (listen_fd_ >= 0) {
        loop_.remove(listen_fd_);
        ::close(listen_fd_);
        listen_fd_ = -1;
    }
    auto sessions = std::move(sessions_);
    sessions_.clear();
    for (auto& entry : sessions) {
        close_session(entry.second);
    }
}

void RelayServer::configure_socket(int fd) {
    int flags = ::fcntl(fd, F_GETFL, 0);
    if (flags >= 0) {
        ::fcntl(fd, F_SETFL, flags | O_NONBLOCK);
    }
    int opts = ::fcntl(fd, F_GETFD, 0);
    if (opts >= 0) {
        ::fcntl(fd, F_SETFD, opts | FD_CLOEXEC);
    }
}

void RelayServer::accept_new_clients() {
    while (true) {
        sockaddr_in remote{};
        socklen_t len = sizeof(remote);
        int client_fd = ::accept(listen_fd_, reinterpret_cast<sockaddr*>(&remote), &len);
        if (client_fd < 0) {
            if (errno == EINTR) {
                continue;
            }
            if (errno != EAGAIN && errno != EWOULDBLOCK) {
                log_event(StructuredLogger::Level::Warning, "relay.accept_failed", {{"errno", std::to_string(errno)}});
            }
            break;
        }
        configure_socket(client_fd);
#ifdef SO_NOSIGPIPE
        int enable = 1;
        ::setsockopt(client_fd, SOL_SOCKET, SO_NOSIGPIPE, &enable, sizeof(enable));
#endif
        auto session = std::make_shared<ClientSession>(client_fd, g_next_session_id.fetch_add(1));
        session->endpoint = network::endpoint_string(client_fd);
        sessions_.emplace(session->id, session);
        loop_.add(client_fd, EventLoop::kEventReadable,
                  [this, weak = std::weak_ptr<ClientSession>(session)](int fd, std::uint32_t events) {
                      auto locked = weak.lock();
                      if (!locked) {
                          loop_.remove(fd);
                          return;
                      }
                      on_client_event(locked, events);
                  });
        log_event(StructuredLogger::Level::Debug, "relay.session.accepted",
                  {{"session", std::to_string(session->id)}, {"remote", session->endpoint}});
    }
}

void RelayServer::on_client_event(const SessionPtr& session, std::uint32_t events) {
    // Drain readable data first so records that arrived with the hangup are not lost.
    if ((events & EventLoop::kEventReadable) && !handle_read(session)) {
        return;
    }
    if ((events & EventLoop::kEventWritable) && !handle_write(session)) {
        return;
    }
    if ((events & EventLoop::kEventError) && !session->closing) {
        close_session(session);
    }
}

bool RelayServer::handle_read(const SessionPtr& session) {
    std::array<std::uint8_t, kReadChunk> buffer{};
    while (!session->closing && !session->close_after_flush && !session->reading_paused) {
        const auto received = ::recv(session->fd, buffer.data(), buffer.size(), 0);
        if (received < 0) {
            if (errno == EINTR) {
                continue;
            }
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                break;
            }
            close_session(session);
            return false;
        }
        if (received == 0) {
            close_session(session);
            return false;
        }
        session->read_buffer.insert(session->read_buffer.end(), buffer.data(), buffer.data() + received);
        process_records(session);
    }
    return !session->closing;
}

bool RelayServer::handle_write(const SessionPtr& session) {
    while (session->pending_write() > 0) {
#ifdef MSG_NOSIGNAL
        constexpr int kFlags = MSG_NOSIGNAL;
#else
        constexpr int kFlags = 0;
#endif
        const auto sent = ::send(session->fd, session->write_buffer.data() + session->write_offset,
                                 session->pending_write(), kFlags);
        if (sent < 0) {
            if (errno == EINTR) {
                continue;
            }
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                break;
            }
            close_session(session);
            return false;
        }
        session->write_offset += static_cast<std::size_t>(sent);
    }
    if (session->pending_write() == 0) {
        session->write_buffer.clear();
        session->write_offset = 0;
        if (session->close_after_flush) {
            close_session(session);
            return false;
        }
    } else if (session->write_offset > session->write_buffer.size() / 2) {
        session->write_buffer.erase(session->write_buffer.begin(),
                                    session->write_buffer.begin() + static_cast<std::ptrdiff_t>(session->write_offset));
        session->write_offset = 0;
    }

    // Resume the partner that was paused on our backlog.
    if (session->pending_write() < kLowWatermark) {
        if (auto partner = session->partner.lock(); partner && partner->reading_paused && !partner->closing) {
            partner->reading_paused = false;
            update_interest(partner);
            log_event(StructuredLogger::Level::Debug, "relay.session.resumed",
                      {{"session", std::to_string(partner->id)}});
            if (!handle_read(partner)) {
                update_interest(session);
                return !session->closing;
            }
        }
    }
    update_interest(session);
    return true;
}

void RelayServer::process_records(const SessionPtr& session) {
    std::size_t consumed = 0;
    auto& buffer = session->read_buffer;
    while (!session->closing && !session->close_after_flush) {
        const auto available = buffer.size() - consumed;
        if (available < kRecordHeaderSize) {
            break;
        }
        const auto header = parse_record_header(
            std::span<const std::uint8_t>(buffer.data() + consumed, kRecordHeaderSize));
        if (!header.has_value()) {
            reject(session, "malformed record");
            break;
        }
        if (header->length > config_.max_frame_size) {
            reject(session, "frame too large");
            break;
        }
        const auto total = kRecordHeaderSize + static_cast<std::size_t>(header->length);
        if (available < total) {
            break;
        }
        const auto* record = buffer.data() + consumed;
        consumed += total;
        if (header->kind == RecordKind::Control) {
            handle_control(session, std::string_view(reinterpret_cast<const char*>(record + kRecordHeaderSize),
                                                     header->length));
        } else {
            handle_binary(session, record, total);
        }
    }
    if (session->closing) {
        return;
    }
    buffer.erase(buffer.begin(), buffer.begin() + static_cast<std::ptrdiff_t>(consumed));
}

void RelayServer::handle_control(const SessionPtr& session, std::string_view line) {
    const auto message = parse_control(line);
    if (!message.has_value()) {
        if (session->state == SessionState::AwaitingRegister) {
            const bool looks_like_register = line.substr(0, 8) == "REGISTER";
            reject(session, looks_like_register ? "malformed registration" : "expected register");
        }
        return;
    }

    switch (message->type) {
        case ControlType::Register:
            handle_register(session, *message);
            break;
        case ControlType::Ping:
            queue_control(session, ControlMessage::pong());
            break;
        case ControlType::Pong:
        case ControlType::Matched:
        case ControlType::Error:
            break;
    }
}

void RelayServer::handle_register(const SessionPtr& session, const ControlMessage& message) {
    if (session->state == SessionState::Waiting) {
        queue_control(session, ControlMessage::error("already registered"));
        return;
    }
    if (session->state == SessionState::Matched) {
        return;
    }
    if (!crypto::is_code_hash(message.code_hash)) {
        reject(session, "malformed registration");
        return;
    }

    auto result = peers_.register_peer(message.code_hash, message.role, session->id);
    SessionPtr partner;
    while (result.outcome == PeerTable::Outcome::Matched) {
        partner = find_session(result.partner->session);
        if (partner && !partner->closing) {
            break;
        }
        // Stale entry from a session this server no longer owns; retry against the table.
        partner.reset();
        result = peers_.register_peer(message.code_hash, message.role, session->id);
    }

    session->role = message.role;
    session->code_hash = message.code_hash;

    switch (result.outcome) {
        case PeerTable::Outcome::Waiting:
            session->state = SessionState::Waiting;
            log_event(StructuredLogger::Level::Info, "relay.session.waiting",
                      {{"session", std::to_string(session->id)},
                       {"role", std::string(role_to_string(message.role))},
                       {"code_hash", hash_prefix(message.code_hash)}});
            break;
        case PeerTable::Outcome::DuplicateRole:
            session->code_hash.clear();
            log_event(StructuredLogger::Level::Warning, "relay.session.duplicate_role",
                      {{"session", std::to_string(session->id)},
                       {"role", std::string(role_to_string(message.role))},
                       {"code_hash", hash_prefix(message.code_hash)}});
            reject(session, "duplicate role");
            break;
        case PeerTable::Outcome::Matched:
            session->state = SessionState::Matched;
            partner->state = SessionState::Matched;
            session->partner = partner;
            partner->partner = session;
            queue_control(partner, ControlMessage::matched());
            queue_control(session, ControlMessage::matched());
            log_event(StructuredLogger::Level::Info, "relay.session.matched",
                      {{"session", std::to_string(session->id)},
                       {"partner", std::to_string(partner->id)},
                       {"code_hash", hash_prefix(message.code_hash)}});
            break;
    }
}

void RelayServer::handle_binary(const SessionPtr& session, const std::uint8_t* record, std::size_t size) {
    if (session->state != SessionState::Matched) {
        reject(session, "not matched");
        return;
    }
    auto partner = session->partner.lock();
    if (!partner || partner->closing) {
        close_after_flush(session);
        return;
    }
    queue_bytes(partner, record, size);
    if (partner->pending_write() > kHighWatermark && !session->reading_paused) {
        session->reading_paused = true;
        update_interest(session);
        log_event(StructuredLogger::Level::Debug, "relay.session.paused",
                  {{"session", std::to_string(session->id)}, {"pending", std::to_string(partner->pending_write())}});
    }
}

void RelayServer::sweep_idle_sessions() {
    const auto now = std::chrono::steady_clock::now();
    std::vector<SessionPtr> expired;
    for (const auto& [id, session] : sessions_) {
        if (session->state == SessionState::AwaitingRegister && !session->close_after_flush &&
            now - session->connected_at > config_.registration_timeout) {
            expired.push_back(session);
        }
    }
    for (const auto& session : expired) {
        reject(session, "registration timeout");
    }
}

void RelayServer::queue_control(const SessionPtr& session, const ControlMessage& message) {
    const auto record = encode_control(message);
    queue_bytes(session, record.data(), record.size());
}

void RelayServer::queue_bytes(const SessionPtr& session, const std::uint8_t* data, std::size_t size) {
    if (session->closing) {
        return;
    }
    session->write_buffer.insert(session->write_buffer.end(), data, data + size);
    update_interest(session);
}

void RelayServer::reject(const SessionPtr& session, const std::string& reason) {
    log_event(StructuredLogger::Level::Info, "relay.session.rejected",
              {{"session", std::to_string(session->id)}, {"reason", reason}});
    queue_control(session, ControlMessage::error(reason));
    close_after_flush(session);
}

void RelayServer::close_after_flush(const SessionPtr& session) {
    if (session->closing) {
        return;
    }
    session->close_after_flush = true;
    if (session->pending_write() == 0) {
        close_session(session);
        return;
    }
    update_interest(session);
}

void RelayServer::update_interest(const SessionPtr& session) {
    if (session->closing) {
        return;
    }
    std::uint32_t mask = EventLoop::kEventNone;
    if (!session->close_after_flush && !session->reading_paused) {
        mask |= EventLoop::kEventReadable;
    }
    if (session->pending_write() > 0) {
        mask |= EventLoop::kEventWritable;
    }
    loop_.update(session->fd, mask);
}

void RelayServer::close_session(const SessionPtr& session) {
    if (session->closing) {
        return;
    }
    session->closing = true;
    if (session->state == SessionState::Waiting) {
        peers_.remove(session->code_hash, session->id);
    }
    loop_.remove(session->fd);
    ::close(session->fd);
    sessions_.erase(session->id);
    log_event(StructuredLogger::Level::Debug, "relay.session.closed", {{"session", std::to_string(session->id)}});

    // The partner still receives whatever was queued for it, then its connection ends.
    if (auto partner = session->partner.lock()) {
        session->partner.reset();
        partner->partner.reset();
        partner->reading_paused = false;
        close_after_flush(partner);
    }
}

RelayServer::SessionPtr RelayServer::find_session(SessionId id) const {
    auto it = sessions_.find(id);
    return it == sessions_.end() ? nullptr : it->second;
}

}  // namespace zapwire::relay

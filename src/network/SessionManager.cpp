#include "sharemesh/network/SessionManager.hpp"

#include "sharemesh/crypto/Aead.hpp"
#include "sharemesh/daemon/StructuredLogger.hpp"

#include <algorithm>
#include <exception>
#include <utility>

namespace sharemesh::network {

namespace {

constexpr std::chrono::milliseconds kReceivePoll{200};
constexpr std::chrono::milliseconds kAcceptPoll{200};

std::atomic<const SessionManager::TestHooks*> g_test_hooks{nullptr};

daemon::StructuredLogger& logger() {
    return daemon::StructuredLogger::instance();
}

std::string short_peer(const PeerId& peer_id) {
    return peer_id_to_string(peer_id).substr(0, 16);
}

std::uint64_t random_token() {
    std::array<std::uint8_t, 8> bytes{};
    crypto::random_bytes(bytes);
    std::uint64_t token = 0;
    for (const auto byte : bytes) {
        token = (token << 8) | byte;
    }
    return token;
}

}  // namespace

SessionManager::SessionManager(const Identity& identity, Config config)
    : identity_(identity),
      config_(sanitize(std::move(config))),
      nonces_(config_.handshake_freshness) {}

SessionManager::~SessionManager() {
    stop();
}

void SessionManager::start() {
    if (running_) {
        return;
    }
    listener_.open(config_.listen_host, config_.listen_port);
    running_ = true;
    accept_thread_ = std::thread(&SessionManager::accept_loop, this);
    logger().info("session.listening",
                  {{"port", std::to_string(listener_.port())}, {"peer", short_peer(identity_.peer_id())}});
}

void SessionManager::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    listener_.close();
    if (accept_thread_.joinable()) {
        accept_thread_.join();
    }

    std::vector<SessionHandle> tracked;
    {
        std::scoped_lock lock(tracked_mutex_);
        tracked.swap(tracked_);
    }
    for (const auto& session : tracked) {
        close(session, "local shutdown");
    }
    for (const auto& session : tracked) {
        session->join_reader();
    }

    std::unique_lock lock(slots_mutex_);
    slots_.clear();
}

std::uint16_t SessionManager::listening_port() const noexcept {
    return listener_.port();
}

void SessionManager::set_message_handler(MessageHandler handler) {
    std::scoped_lock lock(handler_mutex_);
    message_handler_ = std::move(handler);
}

void SessionManager::set_closed_handler(ClosedHandler handler) {
    std::scoped_lock lock(handler_mutex_);
    closed_handler_ = std::move(handler);
}

void SessionManager::set_auth_failure_handler(AuthFailureHandler handler) {
    std::scoped_lock lock(handler_mutex_);
    auth_failure_handler_ = std::move(handler);
}

HandshakeParameters SessionManager::handshake_parameters() const {
    HandshakeParameters parameters{};
    parameters.protocol_version = config_.protocol_version;
    parameters.user_id = config_.user_id;
    parameters.listen_port = listener_.port();
    parameters.freshness_window = config_.handshake_freshness;
    return parameters;
}

std::shared_ptr<SessionManager::PeerSlot> SessionManager::find_slot(const PeerId& peer_id) const {
    std::shared_lock lock(slots_mutex_);
    const auto it = slots_.find(peer_id_to_string(peer_id));
    return it == slots_.end() ? nullptr : it->second;
}

std::shared_ptr<SessionManager::PeerSlot> SessionManager::slot_for(const PeerId& peer_id) {
    if (auto existing = find_slot(peer_id)) {
        return existing;
    }
    std::unique_lock lock(slots_mutex_);
    auto& slot = slots_[peer_id_to_string(peer_id)];
    if (!slot) {
        slot = std::make_shared<PeerSlot>();
    }
    return slot;
}

SessionManager::SessionHandle SessionManager::reusable_session(PeerSlot& slot) const {
    std::scoped_lock lock(slot.mutex);
    for (const auto& session : slot.sessions) {
        if (session->is_authenticated()) {
            return session;
        }
    }
    return nullptr;
}

std::size_t SessionManager::live_count(PeerSlot& slot) const {
    return static_cast<std::size_t>(std::count_if(slot.sessions.begin(), slot.sessions.end(), [](const auto& session) {
        return !session->is_terminal();
    }));
}

bool SessionManager::attach_session(const PeerId& peer_id, const SessionHandle& session) {
    std::unique_lock lock(slots_mutex_);
    auto& slot = slots_[peer_id_to_string(peer_id)];
    if (!slot) {
        slot = std::make_shared<PeerSlot>();
    }
    std::scoped_lock slot_lock(slot->mutex);
    if (live_count(*slot) >= config_.max_sessions_per_peer) {
        return false;
    }
    slot->sessions.push_back(session);
    return true;
}

void SessionManager::drop_slot_if_empty(const PeerId& peer_id) {
    std::unique_lock lock(slots_mutex_);
    const auto it = slots_.find(peer_id_to_string(peer_id));
    if (it == slots_.end()) {
        return;
    }
    {
        std::scoped_lock slot_lock(it->second->mutex);
        if (!it->second->sessions.empty()) {
            return;
        }
    }
    slots_.erase(it);
}

SessionManager::SessionHandle SessionManager::open(const PeerEndpoint& endpoint) {
    if (!running_) {
        throw Error(ErrorKind::Network, "session manager is not running", endpoint.peer_id);
    }

    auto slot = slot_for(endpoint.peer_id);
    std::scoped_lock open_lock(slot->open_mutex);
    if (auto existing = reusable_session(*slot)) {
        return existing;
    }
    {
        std::scoped_lock lock(slot->mutex);
        if (live_count(*slot) >= config_.max_sessions_per_peer) {
            throw Error(ErrorKind::Network, "per-peer session limit reached", endpoint.peer_id);
        }
    }

    SessionHandle session;
    try {
        session = run_initiator(connect_with_backoff(endpoint), endpoint);
    } catch (const std::exception&) {
        drop_slot_if_empty(endpoint.peer_id);
        throw;
    }
    // An inbound session from the same peer may have taken the last place meanwhile.
    if (!attach_session(endpoint.peer_id, session)) {
        close(session, "per-peer session limit reached");
        throw Error(ErrorKind::Network, "per-peer session limit reached", endpoint.peer_id);
    }
    launch_reader(session, false);
    return session;
}

std::unique_ptr<Connection> SessionManager::connect_with_backoff(const PeerEndpoint& endpoint) {
    for (std::uint32_t attempt = 0; attempt < config_.connect_attempts; ++attempt) {
        if (auto connection = Connection::connect(endpoint.host, endpoint.port, config_.handshake_timeout)) {
            return connection;
        }
        logger().warning("session.connect_failed",
                         {{"peer", short_peer(endpoint.peer_id)},
                          {"endpoint", endpoint.host + ":" + std::to_string(endpoint.port)},
                          {"attempt", std::to_string(attempt + 1)}});
        if (attempt + 1 < config_.connect_attempts && running_) {
            std::this_thread::sleep_for(retry_backoff(config_, attempt));
        }
    }
    throw Error(ErrorKind::Network,
                "unable to reach " + endpoint.host + ":" + std::to_string(endpoint.port) + " after " +
                    std::to_string(config_.connect_attempts) + " attempts",
                endpoint.peer_id);
}

SessionManager::SessionHandle SessionManager::run_initiator(std::unique_ptr<Connection> connection,
                                                            const PeerEndpoint& endpoint) {
    auto session = std::make_shared<Session>(Session::Role::Initiator, std::move(connection));
    session->begin_key_exchange();

    const auto fail_with = [&](ErrorKind kind, std::string message) {
        const auto error = make_error(kind, std::move(message), endpoint.peer_id);
        report_failure(session, error);
        throw Error(error);
    };

    HandshakeInitiator initiator(identity_, handshake_parameters());
    auto hello = initiator.hello();
    if (const auto* hooks = g_test_hooks.load(std::memory_order_acquire); hooks && hooks->mutate_outgoing_hello) {
        hooks->mutate_outgoing_hello(hello);
    }
    if (!session->send_plain(protocol::make_message(hello))) {
        fail_with(ErrorKind::Network, "failed to send HELLO");
    }

    std::vector<std::uint8_t> body;
    const auto status = session->connection().receive(body, config_.handshake_timeout);
    if (status == Connection::ReceiveStatus::Timeout) {
        fail_with(ErrorKind::Network, "handshake timed out");
    }
    if (status == Connection::ReceiveStatus::Malformed) {
        fail_with(ErrorKind::Protocol, "malformed handshake frame");
    }
    if (status != Connection::ReceiveStatus::Frame) {
        fail_with(ErrorKind::Network, "connection lost during handshake");
    }

    const auto reply = protocol::decode_body(body);
    if (!reply.has_value()) {
        fail_with(ErrorKind::Protocol, "undecodable handshake reply");
    }
    if (const auto* rejection = std::get_if<protocol::ErrorPayload>(&reply->payload)) {
        fail_with(protocol::error_kind(rejection->code), "handshake rejected by peer: " + rejection->reason);
    }
    const auto* ack = std::get_if<protocol::HelloAckPayload>(&reply->payload);
    if (ack == nullptr) {
        fail_with(ErrorKind::Protocol,
                  "unexpected " + std::string(protocol::to_string(reply->type)) + " during handshake");
    }

    HandshakeKeys keys{};
    try {
        keys = initiator.complete(*ack, endpoint.peer_id);
    } catch (const Error& error) {
        report_failure(session, error.info());
        throw;
    }

    session->authenticate(std::move(keys));
    logger().info("session.opened",
                  {{"session", std::to_string(session->id())},
                   {"peer", short_peer(endpoint.peer_id)},
                   {"endpoint", session->connection().endpoint()}});
    return session;
}

void SessionManager::run_responder(const SessionHandle& session) {
    session->begin_key_exchange();

    std::vector<std::uint8_t> body;
    const auto status = session->connection().receive(body, config_.handshake_timeout);
    if (status != Connection::ReceiveStatus::Frame) {
        session->fail(make_error(status == Connection::ReceiveStatus::Timeout ? ErrorKind::Network : ErrorKind::Protocol,
                                 status == Connection::ReceiveStatus::Timeout ? "no HELLO within handshake timeout"
                                                                              : "connection lost before HELLO"));
        return;
    }

    const auto message = protocol::decode_body(body);
    const auto* hello = message.has_value() ? std::get_if<protocol::HelloPayload>(&message->payload) : nullptr;
    if (hello == nullptr) {
        reject_handshake(session, make_error(ErrorKind::Protocol, "expected HELLO"));
        return;
    }

    HandshakeResponder responder(identity_, handshake_parameters(), nonces_);
    std::optional<HandshakeResponder::Accepted> accepted;
    try {
        accepted = responder.accept(*hello);
    } catch (const Error& error) {
        reject_handshake(session, error.info());
        return;
    }

    if (const auto* hooks = g_test_hooks.load(std::memory_order_acquire); hooks && hooks->mutate_outgoing_ack) {
        hooks->mutate_outgoing_ack(accepted->ack);
    }
    if (!session->send_plain(protocol::make_message(accepted->ack))) {
        session->fail(make_error(ErrorKind::Network, "failed to send HELLO_ACK", accepted->keys.remote_peer));
        return;
    }

    const auto peer_id = accepted->keys.remote_peer;
    session->authenticate(std::move(accepted->keys));

    if (!attach_session(peer_id, session)) {
        logger().warning("session.rejected",
                         {{"peer", short_peer(peer_id)}, {"reason", "per-peer session limit reached"}});
        close(session, "per-peer session limit reached");
        return;
    }

    logger().info("session.accepted",
                  {{"session", std::to_string(session->id())},
                   {"peer", short_peer(peer_id)},
                   {"user", session->remote_user()},
                   {"endpoint", session->connection().endpoint()}});
    receive_loop(session);
}

void SessionManager::reject_handshake(const SessionHandle& session, const ErrorInfo& error) {
    protocol::ErrorPayload payload{};
    payload.code = protocol::error_code(error.kind);
    payload.reason = error.message;
    session->send_plain(protocol::make_message(std::move(payload)));
    report_failure(session, error);
}

void SessionManager::report_failure(const SessionHandle& session, const ErrorInfo& error) {
    session->fail(error);
    if (error.kind != ErrorKind::Auth || is_unset(error.peer)) {
        return;
    }
    AuthFailureHandler handler;
    {
        std::scoped_lock lock(handler_mutex_);
        handler = auth_failure_handler_;
    }
    if (handler) {
        handler(error.peer, error);
    }
}

void SessionManager::launch_reader(const SessionHandle& session, bool responder) {
    {
        std::scoped_lock lock(tracked_mutex_);
        tracked_.push_back(session);
    }
    std::thread worker([this, session, responder] {
        if (responder) {
            run_responder(session);
        } else {
            receive_loop(session);
        }
        finish_session(session);
        session->mark_reader_finished();
    });
    session->start_reader(std::move(worker));
}

void SessionManager::receive_loop(const SessionHandle& session) {
    std::vector<std::uint8_t> body;
    while (running_ && !session->is_terminal()) {
        const auto status = session->connection().receive(body, kReceivePoll);
        if (status == Connection::ReceiveStatus::Timeout) {
            continue;
        }
        if (status == Connection::ReceiveStatus::Closed) {
            session->close("connection closed");
            break;
        }
        if (status == Connection::ReceiveStatus::Malformed) {
            report_failure(session, make_error(ErrorKind::Protocol, "malformed frame"));
            break;
        }

        session->touch();
        const auto message = protocol::decode_body(body);
        if (!message.has_value() || message->version != config_.protocol_version) {
            report_failure(session, make_error(ErrorKind::Protocol, "undecodable frame"));
            break;
        }

        if (message->type == protocol::MessageType::Sealed) {
            const auto channel = session->channel();
            if (!channel) {
                break;
            }
            const auto inner = channel->open(std::get<protocol::SealedPayload>(message->payload));
            if (!inner.has_value()) {
                report_failure(session, make_error(ErrorKind::Protocol, "sealed frame rejected"));
                break;
            }
            dispatch(session, *inner);
        } else if (message->type == protocol::MessageType::ChunkData) {
            dispatch(session, *message);
        } else {
            report_failure(session,
                           make_error(ErrorKind::Protocol,
                                      "unsealed " + std::string(protocol::to_string(message->type)) +
                                          " after authentication"));
            break;
        }
    }
}

void SessionManager::dispatch(const SessionHandle& session, const protocol::Message& message) {
    switch (message.type) {
        case protocol::MessageType::Ping: {
            protocol::PongPayload pong{};
            pong.token = std::get<protocol::PingPayload>(message.payload).token;
            session->send(protocol::make_message(pong));
            return;
        }
        case protocol::MessageType::Pong:
            return;
        case protocol::MessageType::Goodbye:
            session->close("peer closed session: " + std::get<protocol::GoodbyePayload>(message.payload).reason);
            return;
        case protocol::MessageType::Discover:
        case protocol::MessageType::Announce:
        case protocol::MessageType::Hello:
        case protocol::MessageType::HelloAck:
        case protocol::MessageType::Sealed:
            report_failure(session,
                           make_error(ErrorKind::Protocol,
                                      "unexpected " + std::string(protocol::to_string(message.type)) +
                                          " on an established session"));
            return;
        default:
            break;
    }

    MessageHandler handler;
    {
        std::scoped_lock lock(handler_mutex_);
        handler = message_handler_;
    }
    if (!handler) {
        return;
    }
    try {
        handler(session, message);
    } catch (const std::exception& ex) {
        logger().error("session.handler_error",
                       {{"session", std::to_string(session->id())},
                        {"type", std::string(protocol::to_string(message.type))},
                        {"error", ex.what()}});
    }
}

void SessionManager::finish_session(const SessionHandle& session) {
    const auto peer_id = session->remote_peer();
    if (is_unset(peer_id)) {
        return;
    }
    if (auto slot = find_slot(peer_id)) {
        std::scoped_lock lock(slot->mutex);
        auto& sessions = slot->sessions;
        sessions.erase(std::remove(sessions.begin(), sessions.end(), session), sessions.end());
    }
    drop_slot_if_empty(peer_id);

    ClosedHandler handler;
    {
        std::scoped_lock lock(handler_mutex_);
        handler = closed_handler_;
    }
    if (handler) {
        handler(session);
    }
}

void SessionManager::accept_loop() {
    while (running_) {
        auto connection = listener_.accept(kAcceptPoll);
        if (!connection) {
            continue;
        }
        auto session = std::make_shared<Session>(Session::Role::Responder, std::move(connection));
        launch_reader(session, true);
    }
}

void SessionManager::close(const SessionHandle& session, const std::string& reason) {
    if (!session) {
        return;
    }
    if (session->is_authenticated()) {
        protocol::GoodbyePayload goodbye{};
        goodbye.reason = reason;
        session->send(protocol::make_message(std::move(goodbye)));
    }
    session->close(reason);
}

std::size_t SessionManager::sweep(Clock::time_point now) {
    std::size_t closed = 0;
    for (const auto& session : sessions()) {
        if (!session->is_authenticated()) {
            continue;
        }
        const auto idle = now - session->last_activity();
        const bool expired = now - session->established_at() >= config_.session_lifetime;
        if (session->job_count() == 0 && (idle >= config_.session_idle_timeout || expired)) {
            close(session, expired ? "session lifetime reached" : "idle timeout");
            ++closed;
            continue;
        }
        if (idle >= config_.keepalive_interval) {
            protocol::PingPayload ping{};
            ping.token = random_token();
            session->send(protocol::make_message(ping));
        }
    }
    reap();
    return closed;
}

void SessionManager::reap() {
    std::vector<SessionHandle> finished;
    {
        std::scoped_lock lock(tracked_mutex_);
        auto split = std::stable_partition(tracked_.begin(), tracked_.end(), [](const auto& session) {
            return !session->reader_finished();
        });
        finished.assign(std::make_move_iterator(split), std::make_move_iterator(tracked_.end()));
        tracked_.erase(split, tracked_.end());
    }
    for (const auto& session : finished) {
        session->join_reader();
    }
}

std::size_t SessionManager::active_session_count() const {
    std::vector<std::shared_ptr<PeerSlot>> slots;
    {
        std::shared_lock lock(slots_mutex_);
        for (const auto& [_, slot] : slots_) {
            slots.push_back(slot);
        }
    }
    std::size_t count = 0;
    for (const auto& slot : slots) {
        std::scoped_lock lock(slot->mutex);
        count += static_cast<std::size_t>(std::count_if(slot->sessions.begin(), slot->sessions.end(),
                                                        [](const auto& session) { return session->is_authenticated(); }));
    }
    return count;
}

std::size_t SessionManager::session_count(const PeerId& peer_id) const {
    const auto slot = find_slot(peer_id);
    if (!slot) {
        return 0;
    }
    std::scoped_lock lock(slot->mutex);
    return live_count(*slot);
}

std::vector<SessionManager::SessionHandle> SessionManager::sessions() const {
    std::scoped_lock lock(tracked_mutex_);
    return tracked_;
}

void SessionManager::set_test_hooks(const TestHooks* hooks) {
    g_test_hooks.store(hooks, std::memory_order_release);
}

}  // namespace sharemesh::network

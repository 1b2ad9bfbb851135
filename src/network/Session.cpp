#include "sharemesh/network/Session.hpp"

#include "sharemesh/crypto/Sha256.hpp"
#include "sharemesh/daemon/StructuredLogger.hpp"
#include "sharemesh/protocol/Wire.hpp"

#include <algorithm>
#include <type_traits>
#include <utility>

namespace sharemesh::network {

namespace {

std::atomic<std::uint64_t> g_session_ids{0};

crypto::Nonce truncate_to_nonce(const crypto::Sha256::Digest& digest) {
    crypto::Nonce nonce{};
    std::copy_n(digest.begin(), nonce.bytes.size(), nonce.bytes.begin());
    return nonce;
}

std::vector<std::uint8_t> frame_associated_data(const SessionId& session_id,
                                                std::uint8_t direction,
                                                std::uint64_t sequence) {
    std::vector<std::uint8_t> aad;
    protocol::ByteWriter writer(aad);
    writer.fixed(session_id);
    writer.u8(direction);
    writer.u64(sequence);
    return aad;
}

std::vector<std::uint8_t> chunk_associated_data(std::uint64_t transfer_id,
                                                const FileId& file_id,
                                                ChunkIndex index,
                                                std::uint32_t attempt) {
    std::vector<std::uint8_t> aad;
    protocol::ByteWriter writer(aad);
    writer.u64(transfer_id);
    writer.u32(index);
    writer.u32(attempt);
    writer.text(file_id);
    return aad;
}

}  // namespace

std::string_view to_string(SessionState state) noexcept {
    switch (state) {
        case SessionState::Init:
            return "INIT";
        case SessionState::KeyExchange:
            return "KEY_EXCHANGE";
        case SessionState::Authenticated:
            return "AUTHENTICATED";
        case SessionState::Closed:
            return "CLOSED";
        case SessionState::Failed:
            return "FAILED";
    }
    return "FAILED";
}

SecureChannel::SecureChannel(HandshakeKeys keys)
    : key_(keys.session_key),
      session_id_(keys.session_id),
      initiator_(keys.initiator) {
    keys.wipe();
}

SecureChannel::~SecureChannel() {
    wipe();
}

void SecureChannel::wipe() noexcept {
    std::scoped_lock lock(mutex_);
    crypto::secure_wipe(key_);
    wiped_ = true;
}

crypto::Nonce SecureChannel::frame_nonce(std::uint8_t direction, std::uint64_t sequence) const {
    crypto::Sha256 hasher;
    hasher.update(std::string_view("frame"));
    hasher.update(frame_associated_data(session_id_, direction, sequence));
    return truncate_to_nonce(hasher.finalize());
}

crypto::Nonce SecureChannel::chunk_nonce(std::uint8_t direction,
                                         std::uint64_t transfer_id,
                                         const FileId& file_id,
                                         ChunkIndex index,
                                         std::uint32_t attempt) const {
    crypto::Sha256 hasher;
    hasher.update(std::string_view("chunk"));
    hasher.update(session_id_);
    const std::array<std::uint8_t, 1> direction_byte{direction};
    hasher.update(direction_byte);
    hasher.update(chunk_associated_data(transfer_id, file_id, index, attempt));
    return truncate_to_nonce(hasher.finalize());
}

std::optional<protocol::Message> SecureChannel::seal(const protocol::Message& inner) {
    const auto plaintext = protocol::encode(inner);

    std::scoped_lock lock(mutex_);
    if (wiped_) {
        return std::nullopt;
    }
    const auto sequence = ++send_sequence_;
    const auto direction = outbound_direction();
    protocol::SealedPayload sealed{};
    sealed.sequence = sequence;
    sealed.ciphertext = crypto::Aead::seal(key_,
                                           frame_nonce(direction, sequence),
                                           plaintext,
                                           frame_associated_data(session_id_, direction, sequence));
    return protocol::make_message(std::move(sealed));
}

std::optional<protocol::Message> SecureChannel::open(const protocol::SealedPayload& sealed) {
    std::optional<std::vector<std::uint8_t>> plaintext;
    {
        std::scoped_lock lock(mutex_);
        if (wiped_ || sealed.sequence <= receive_sequence_) {
            return std::nullopt;
        }
        const auto direction = inbound_direction();
        plaintext = crypto::Aead::open(key_,
                                       frame_nonce(direction, sealed.sequence),
                                       sealed.ciphertext,
                                       frame_associated_data(session_id_, direction, sealed.sequence));
        if (!plaintext.has_value()) {
            return std::nullopt;
        }
        receive_sequence_ = sealed.sequence;
    }

    auto inner = protocol::decode(*plaintext);
    if (!inner.has_value() || inner->type == protocol::MessageType::Sealed) {
        return std::nullopt;
    }
    return inner;
}

std::optional<std::vector<std::uint8_t>> SecureChannel::seal_chunk(std::uint64_t transfer_id,
                                                                   const FileId& file_id,
                                                                   ChunkIndex index,
                                                                   std::uint32_t attempt,
                                                                   std::span<const std::uint8_t> plaintext) const {
    std::scoped_lock lock(mutex_);
    if (wiped_) {
        return std::nullopt;
    }
    return crypto::Aead::seal(key_,
                              chunk_nonce(outbound_direction(), transfer_id, file_id, index, attempt),
                              plaintext,
                              chunk_associated_data(transfer_id, file_id, index, attempt));
}

std::optional<ChunkData> SecureChannel::open_chunk(std::uint64_t transfer_id,
                                                   const FileId& file_id,
                                                   ChunkIndex index,
                                                   std::uint32_t attempt,
                                                   std::span<const std::uint8_t> sealed) const {
    std::scoped_lock lock(mutex_);
    if (wiped_) {
        return std::nullopt;
    }
    return crypto::Aead::open(key_,
                              chunk_nonce(inbound_direction(), transfer_id, file_id, index, attempt),
                              sealed,
                              chunk_associated_data(transfer_id, file_id, index, attempt));
}

Session::Session(Role role, std::unique_ptr<Connection> connection, Clock::time_point now)
    : role_(role),
      id_(g_session_ids.fetch_add(1, std::memory_order_relaxed) + 1),
      connection_(std::move(connection)),
      created_at_(now),
      last_activity_(now) {}

Session::~Session() {
    close("session destroyed");
    join_reader();
}

SessionState Session::state_of(const State& state) noexcept {
    return std::visit(
        [](const auto& current) {
            using S = std::decay_t<decltype(current)>;
            if constexpr (std::is_same_v<S, Init>) {
                return SessionState::Init;
            } else if constexpr (std::is_same_v<S, KeyExchanging>) {
                return SessionState::KeyExchange;
            } else if constexpr (std::is_same_v<S, Authenticated>) {
                return SessionState::Authenticated;
            } else if constexpr (std::is_same_v<S, Closed>) {
                return SessionState::Closed;
            } else {
                return SessionState::Failed;
            }
        },
        state);
}

template <typename Transition>
bool Session::transition(Transition&& next_state) {
    SessionState from{};
    SessionState to{};
    {
        std::scoped_lock lock(mutex_);
        std::optional<State> next = std::visit(next_state, state_);
        if (!next.has_value()) {
            return false;
        }
        if (const auto* authenticated = std::get_if<Authenticated>(&state_)) {
            if (authenticated->channel && !std::holds_alternative<Authenticated>(*next)) {
                authenticated->channel->wipe();
            }
        }
        from = state_of(state_);
        state_ = std::move(*next);
        to = state_of(state_);
    }

    daemon::StructuredLogger::instance().info(
        "session.state",
        {{"session", std::to_string(id_)},
         {"from", std::string(to_string(from))},
         {"to", std::string(to_string(to))},
         {"peer", peer_id_to_string(remote_peer())},
         {"endpoint", connection_ ? connection_->endpoint() : std::string("none")}});
    return true;
}

SessionState Session::state() const {
    std::scoped_lock lock(mutex_);
    return state_of(state_);
}

bool Session::is_terminal() const {
    const auto current = state();
    return current == SessionState::Closed || current == SessionState::Failed;
}

bool Session::begin_key_exchange(Clock::time_point now) {
    return transition([now](const auto& current) -> std::optional<State> {
        using S = std::decay_t<decltype(current)>;
        if constexpr (std::is_same_v<S, Init>) {
            return KeyExchanging{now};
        } else {
            return std::nullopt;
        }
    });
}

bool Session::authenticate(HandshakeKeys keys, Clock::time_point now) {
    {
        std::scoped_lock lock(mutex_);
        if (!std::holds_alternative<KeyExchanging>(state_)) {
            keys.wipe();
            return false;
        }
        remote_peer_ = keys.remote_peer;
        remote_user_ = keys.remote_user;
        remote_listen_port_ = keys.remote_listen_port;
        last_activity_ = now;
    }
    auto channel = std::make_shared<SecureChannel>(std::move(keys));
    return transition([&channel, now](const auto& current) -> std::optional<State> {
        using S = std::decay_t<decltype(current)>;
        if constexpr (std::is_same_v<S, KeyExchanging>) {
            return Authenticated{channel, now};
        } else {
            return std::nullopt;
        }
    });
}

bool Session::close(std::string reason) {
    const bool changed = transition([&reason](const auto& current) -> std::optional<State> {
        using S = std::decay_t<decltype(current)>;
        if constexpr (std::is_same_v<S, Closed> || std::is_same_v<S, Failed>) {
            return std::nullopt;
        } else {
            return Closed{reason};
        }
    });
    if (connection_) {
        connection_->shutdown();
    }
    return changed;
}

bool Session::fail(ErrorInfo error) {
    {
        std::scoped_lock lock(mutex_);
        if (is_unset(error.peer)) {
            error.peer = remote_peer_;
        }
    }
    const bool changed = transition([&error](const auto& current) -> std::optional<State> {
        using S = std::decay_t<decltype(current)>;
        if constexpr (std::is_same_v<S, Closed> || std::is_same_v<S, Failed>) {
            return std::nullopt;
        } else {
            return Failed{error};
        }
    });
    if (changed) {
        daemon::StructuredLogger::instance().warning(
            "session.failed",
            {{"session", std::to_string(id_)},
             {"kind", std::string(to_string(error.kind))},
             {"reason", error.message},
             {"peer", peer_id_to_string(error.peer)}});
    }
    if (connection_) {
        connection_->shutdown();
    }
    return changed;
}

std::optional<ErrorInfo> Session::failure() const {
    std::scoped_lock lock(mutex_);
    if (const auto* failed = std::get_if<Failed>(&state_)) {
        return failed->error;
    }
    return std::nullopt;
}

std::string Session::close_reason() const {
    std::scoped_lock lock(mutex_);
    if (const auto* closed = std::get_if<Closed>(&state_)) {
        return closed->reason;
    }
    if (const auto* failed = std::get_if<Failed>(&state_)) {
        return failed->error.message;
    }
    return {};
}

PeerId Session::remote_peer() const {
    std::scoped_lock lock(mutex_);
    return remote_peer_;
}

UserId Session::remote_user() const {
    std::scoped_lock lock(mutex_);
    return remote_user_;
}

std::uint16_t Session::remote_listen_port() const {
    std::scoped_lock lock(mutex_);
    return remote_listen_port_;
}

std::string Session::remote_host() const {
    return connection_ ? connection_->remote_host() : std::string();
}

std::shared_ptr<SecureChannel> Session::channel() const {
    std::scoped_lock lock(mutex_);
    if (const auto* authenticated = std::get_if<Authenticated>(&state_)) {
        return authenticated->channel;
    }
    return nullptr;
}

bool Session::send_plain(const protocol::Message& message) {
    if (!connection_) {
        return false;
    }
    const auto frame = protocol::encode(message);
    std::scoped_lock lock(send_mutex_);
    return connection_->send_frame(frame);
}

bool Session::send(const protocol::Message& inner) {
    const auto secure = channel();
    if (!secure || !connection_) {
        return false;
    }
    std::scoped_lock lock(send_mutex_);
    const auto sealed = secure->seal(inner);
    if (!sealed.has_value()) {
        return false;
    }
    return connection_->send_frame(protocol::encode(*sealed));
}

bool Session::send_chunk(std::uint64_t transfer_id,
                         const FileId& file_id,
                         ChunkIndex index,
                         std::uint32_t attempt,
                         std::span<const std::uint8_t> plaintext) {
    const auto secure = channel();
    if (!secure || !connection_) {
        return false;
    }
    auto ciphertext = secure->seal_chunk(transfer_id, file_id, index, attempt, plaintext);
    if (!ciphertext.has_value()) {
        return false;
    }
    protocol::ChunkDataPayload payload{};
    payload.transfer_id = transfer_id;
    payload.file_id = file_id;
    payload.index = index;
    payload.attempt = attempt;
    payload.ciphertext = std::move(*ciphertext);
    const auto frame = protocol::encode(protocol::make_message(std::move(payload)));

    std::scoped_lock lock(send_mutex_);
    return connection_->send_frame(frame);
}

void Session::touch(Clock::time_point now) {
    std::scoped_lock lock(mutex_);
    last_activity_ = std::max(last_activity_, now);
}

Session::Clock::time_point Session::last_activity() const {
    std::scoped_lock lock(mutex_);
    return last_activity_;
}

Session::Clock::time_point Session::established_at() const {
    std::scoped_lock lock(mutex_);
    if (const auto* authenticated = std::get_if<Authenticated>(&state_)) {
        return authenticated->established;
    }
    return created_at_;
}

void Session::attach_job() {
    jobs_.fetch_add(1);
}

void Session::detach_job() {
    auto current = jobs_.load();
    while (current > 0 && !jobs_.compare_exchange_weak(current, current - 1)) {
    }
}

void Session::start_reader(std::thread reader) {
    std::scoped_lock lock(reader_mutex_);
    reader_ = std::move(reader);
}

void Session::join_reader() {
    std::thread reader;
    {
        std::scoped_lock lock(reader_mutex_);
        reader = std::move(reader_);
    }
    if (!reader.joinable()) {
        return;
    }
    if (reader.get_id() == std::this_thread::get_id()) {
        reader.detach();
    } else {
        reader.join();
    }
}

}  // namespace sharemesh::network

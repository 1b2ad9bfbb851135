#pragma once

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>

namespace sharemesh {

struct Config {
    std::string listen_host{"0.0.0.0"};
    std::uint16_t listen_port{5001};
    std::optional<std::string> advertise_host{};
    bool discovery_enabled{true};
    std::uint16_t discovery_port{5000};
    std::string multicast_group{"224.3.29.71"};
    std::chrono::seconds peer_ttl{std::chrono::seconds(30)};
    std::chrono::seconds announce_interval{std::chrono::seconds(10)};
    std::chrono::seconds sweep_interval{std::chrono::seconds(15)};
    std::chrono::seconds auth_failure_cooldown{std::chrono::seconds(60)};
    std::chrono::milliseconds handshake_timeout{std::chrono::milliseconds(5000)};
    std::chrono::seconds handshake_freshness{std::chrono::seconds(30)};
    std::chrono::seconds session_idle_timeout{std::chrono::seconds(120)};
    std::chrono::seconds session_lifetime{std::chrono::hours(1)};
    std::chrono::seconds keepalive_interval{std::chrono::seconds(30)};
    std::size_t chunk_size{1024 * 1024};
    std::uint64_t max_file_size{1024ull * 1024ull * 1024ull};
    std::size_t max_concurrent_jobs{8};
    std::size_t max_sessions_per_peer{2};
    std::size_t per_job_concurrency{4};
    std::uint32_t max_chunk_retries{3};
    std::chrono::milliseconds chunk_request_timeout{std::chrono::milliseconds(10000)};
    std::uint32_t max_network_retries{5};
    std::chrono::milliseconds retry_initial_backoff{std::chrono::milliseconds(500)};
    std::chrono::milliseconds retry_max_backoff{std::chrono::milliseconds(8000)};
    std::uint32_t connect_attempts{3};
    std::uint8_t protocol_version{1};
    std::string user_id{"anonymous"};
    std::optional<std::array<std::uint8_t, 32>> identity_seed{};
    std::string identity_key_path{};
    // User id -> peer id (hex) allowed to act as that user for private files and admin rights.
    std::map<std::string, std::string> user_peers{};
    std::string download_directory{"downloads"};
    std::string download_log_path{};
    bool logging_enabled{true};
    // info, warning or error.
    std::string log_level{"info"};
};

inline constexpr std::size_t kMinChunkSize = 4 * 1024;
inline constexpr std::size_t kMaxChunkSize = 16 * 1024 * 1024;

// Clamps values that would stall timers or break framing.
Config sanitize(Config config);

// retry_initial_backoff doubled per attempt, capped at retry_max_backoff.
std::chrono::milliseconds retry_backoff(const Config& config, std::uint32_t attempt);

}  // namespace sharemesh

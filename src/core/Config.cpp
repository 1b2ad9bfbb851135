#include "sharemesh/Config.hpp"

#include <algorithm>

namespace sharemesh {

Config sanitize(Config config) {
    config.chunk_size = std::clamp(config.chunk_size, kMinChunkSize, kMaxChunkSize);
    config.peer_ttl = std::max(config.peer_ttl, std::chrono::seconds(1));
    config.announce_interval = std::max(config.announce_interval, std::chrono::seconds(1));
    config.sweep_interval = std::max(config.sweep_interval, std::chrono::seconds(1));
    config.handshake_timeout = std::max(config.handshake_timeout, std::chrono::milliseconds(100));
    config.handshake_freshness = std::max(config.handshake_freshness, std::chrono::seconds(1));
    config.session_idle_timeout = std::max(config.session_idle_timeout, std::chrono::seconds(1));
    config.session_lifetime = std::max(config.session_lifetime, config.session_idle_timeout);
    config.keepalive_interval = std::max(config.keepalive_interval, std::chrono::seconds(1));
    config.chunk_request_timeout = std::max(config.chunk_request_timeout, std::chrono::milliseconds(50));
    config.retry_initial_backoff = std::max(config.retry_initial_backoff, std::chrono::milliseconds(1));
    config.retry_max_backoff = std::max(config.retry_max_backoff, config.retry_initial_backoff);
    config.max_concurrent_jobs = std::max<std::size_t>(config.max_concurrent_jobs, 1);
    config.max_sessions_per_peer = std::max<std::size_t>(config.max_sessions_per_peer, 1);
    config.per_job_concurrency = std::max<std::size_t>(config.per_job_concurrency, 1);
    config.max_chunk_retries = std::max<std::uint32_t>(config.max_chunk_retries, 1);
    config.connect_attempts = std::max<std::uint32_t>(config.connect_attempts, 1);
    if (config.protocol_version == 0) {
        config.protocol_version = 1;
    }
    return config;
}

std::chrono::milliseconds retry_backoff(const Config& config, std::uint32_t attempt) {
    auto delay = config.retry_initial_backoff;
    for (std::uint32_t step = 0; step < attempt && delay < config.retry_max_backoff; ++step) {
        delay *= 2;
    }
    return std::min(delay, config.retry_max_backoff);
}

}  // namespace sharemesh

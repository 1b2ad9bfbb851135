#include "sharemesh/config/ConfigLoader.hpp"
#include "test_access.hpp"

#include <cassert>
#include <chrono>
#include <fstream>
#include <string>

using namespace std::chrono_literals;
using namespace sharemesh;
using namespace sharemesh::config;

namespace {

std::string failure_code(const std::string& text) {
    try {
        (void)apply_config(JsonParser(text).parse());
    } catch (const ConfigError& error) {
        return error.code;
    }
    return {};
}

void check_defaults() {
    const Config defaults{};
    assert(defaults.peer_ttl == 30s);
    assert(defaults.announce_interval == 10s);
    assert(defaults.chunk_size == 1024 * 1024);
    assert(defaults.max_chunk_retries == 3);
    assert(defaults.max_concurrent_jobs == 8);
    assert(defaults.handshake_freshness == 30s);

    const auto applied = apply_config(JsonParser("{}").parse());
    assert(applied.listen_port == defaults.listen_port);
    assert(applied.user_id == defaults.user_id);
}

void check_overlay() {
    const std::string text = R"({
        "network": {"listen_host": "127.0.0.1", "listen_port": 6000},
        "discovery": {"enabled": "no", "peer_ttl_seconds": 45, "multicast_group": "239.1.2.3"},
        "session": {"freshness_seconds": 10, "max_per_peer": 4},
        "transfer": {"chunk_size": 65536, "max_chunk_retries": 5, "retry_initial_backoff_ms": 100,
                     "retry_max_backoff_ms": 1000, "chunk_request_timeout_ms": 2500.0},
        "identity": {"user_id": "alice",
                     "seed": "0101010101010101010101010101010101010101010101010101010101010101"},
        "access": {"users": {"bob": "0202020202020202020202020202020202020202020202020202020202020202"}},
        "storage": {"download_directory": "/tmp/dl", "download_log": "/tmp/dl/log"},
        "logging": {"enabled": false, "level": "warning"}
    })";
    const auto config = apply_config(JsonParser(text).parse());
    assert(config.listen_host == "127.0.0.1");
    assert(config.listen_port == 6000);
    assert(!config.discovery_enabled);
    assert(config.peer_ttl == 45s);
    assert(config.multicast_group == "239.1.2.3");
    assert(config.handshake_freshness == 10s);
    assert(config.max_sessions_per_peer == 4);
    assert(config.chunk_size == 65536);
    assert(config.max_chunk_retries == 5);
    assert(config.chunk_request_timeout == 2500ms);
    assert(config.retry_initial_backoff == 100ms);
    assert(config.user_id == "alice");
    assert(config.identity_seed.has_value());
    assert((*config.identity_seed)[31] == 0x01);
    assert(config.user_peers.size() == 1);
    assert(config.user_peers.at("bob").starts_with("0202"));
    assert(config.download_directory == "/tmp/dl");
    assert(config.download_log_path == "/tmp/dl/log");
    assert(!config.logging_enabled);
    assert(config.log_level == "warning");
    // Untouched keys keep their defaults.
    assert(config.announce_interval == 10s);
}

void check_errors() {
    assert(failure_code("{") == "E_CONFIG_PARSE");
    assert(failure_code(R"({"network": {"listen_port": 1}} trailing)") == "E_CONFIG_PARSE");
    assert(failure_code("[]") == "E_CONFIG_TYPE");
    assert(failure_code(R"({"network": 5})") == "E_CONFIG_TYPE");
    assert(failure_code(R"({"network": {"listen_port": "high"}})") == "E_CONFIG_TYPE");
    assert(failure_code(R"({"network": {"listen_port": 70000}})") == "E_CONFIG_VALUE");
    assert(failure_code(R"({"transfer": {"chunk_size": 1024}})") == "E_CONFIG_VALUE");
    assert(failure_code(R"({"transfer": {"retry_initial_backoff_ms": 500, "retry_max_backoff_ms": 100}})") ==
           "E_CONFIG_VALUE");
    assert(failure_code(R"({"identity": {"user_id": ""}})") == "E_CONFIG_VALUE");
    assert(failure_code(R"({"identity": {"seed": "abcd"}})") == "E_CONFIG_VALUE");
    assert(failure_code(R"({"logging": {"level": "verbose"}})") == "E_CONFIG_VALUE");
    assert(failure_code(R"({"access": {"users": ["alice"]}})") == "E_CONFIG_TYPE");
    assert(failure_code(R"({"access": {"users": {"alice": 7}}})") == "E_CONFIG_TYPE");
    assert(failure_code(R"({"access": {"users": {"alice": "abcd"}}})") == "E_CONFIG_VALUE");

    bool threw = false;
    try {
        (void)load_config("/nonexistent/sharemesh/config.json");
    } catch (const ConfigError& error) {
        threw = error.code == "E_CONFIG_IO" && !error.hint.empty();
    }
    assert(threw);
}

void check_file_and_sanitize() {
    const auto dir = test::scratch_directory("config");
    const auto path = dir / "node.json";
    {
        std::ofstream out(path);
        out << R"({"identity": {"user_id": "carol"}, "transfer": {"per_job_concurrency": 2}})";
    }
    const auto config = load_config(path);
    assert(config.user_id == "carol");
    assert(config.per_job_concurrency == 2);
    std::filesystem::remove_all(dir);

    Config extreme{};
    extreme.chunk_size = 1;
    extreme.chunk_request_timeout = 0ms;
    extreme.retry_initial_backoff = 0ms;
    extreme.retry_max_backoff = 0ms;
    extreme.max_concurrent_jobs = 0;
    const auto clamped = sanitize(extreme);
    assert(clamped.chunk_size == kMinChunkSize);
    assert(clamped.chunk_request_timeout >= 50ms);
    assert(clamped.retry_initial_backoff >= 1ms);
    assert(clamped.retry_max_backoff >= clamped.retry_initial_backoff);
    assert(clamped.max_concurrent_jobs == 1);

    Config backoff{};
    backoff.retry_initial_backoff = 100ms;
    backoff.retry_max_backoff = 350ms;
    assert(retry_backoff(backoff, 0) == 100ms);
    assert(retry_backoff(backoff, 1) == 200ms);
    assert(retry_backoff(backoff, 2) == 350ms);
    assert(retry_backoff(backoff, 30) == 350ms);
}

}  // namespace

int main() {
    test::silence_logs();
    check_defaults();
    check_overlay();
    check_errors();
    check_file_and_sanitize();
    return 0;
}

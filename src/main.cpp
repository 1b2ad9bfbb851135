#include "sharemesh/Config.hpp"
#include "sharemesh/Error.hpp"
#include "sharemesh/Types.hpp"
#include "sharemesh/config/ConfigLoader.hpp"
#include "sharemesh/core/Node.hpp"

#include <atomic>
#include <charconv>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <exception>
#include <filesystem>
#include <iostream>
#include <iterator>
#include <optional>
#include <set>
#include <stdexcept>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>
#include <thread>
#include <utility>
#include <vector>

#include <signal.h>

namespace {

using namespace sharemesh;

constexpr std::string_view kSharemeshVersion = "0.1.0";
constexpr std::chrono::milliseconds kLoopInterval{200};
constexpr std::chrono::seconds kPeerListWait{3};

class CliException : public std::exception {
public:
    CliException(std::string code, std::string message, std::string hint = {})
        : code_(std::move(code)), message_(std::move(message)), hint_(std::move(hint)) {
        formatted_ = code_.empty() ? message_ : ("[" + code_ + "] " + message_);
    }

    const char* what() const noexcept override {
        return formatted_.c_str();
    }

    const std::string& code() const& {
        return code_;
    }

    const std::string& hint() const& {
        return hint_;
    }

private:
    std::string code_;
    std::string message_;
    std::string hint_;
    std::string formatted_;
};

[[noreturn]] void throw_cli_error(std::string code, std::string message, std::string hint = {}) {
    throw CliException(std::move(code), std::move(message), std::move(hint));
}

void print_cli_error(const CliException& ex) {
    std::cerr << ex.what() << std::endl;
    if (!ex.hint().empty()) {
        std::cerr << "Hint: " << ex.hint() << std::endl;
    }
}

struct ShareRequest {
    std::filesystem::path path;
    std::set<UserId> private_to;
};

struct Options {
    std::optional<std::string> config_path;
    std::vector<ShareRequest> shares;
    std::optional<FileId> fetch_file;
    std::optional<std::string> fetch_from;
    std::optional<std::string> fetch_at;
    std::optional<std::filesystem::path> fetch_out;
    std::optional<std::string> user_id;
    std::optional<std::uint16_t> port;
    bool list_peers{false};
    bool no_discovery{false};
};

std::atomic<bool> g_run_loop{false};

extern "C" void signal_handler(int signal_code) {
    switch (signal_code) {
    case SIGINT:
    case SIGTERM:
        g_run_loop.store(false, std::memory_order_release);
        break;
    default:
        break;
    }
}

void install_termination_handlers() {
    auto install = [](int sig) {
        struct sigaction action{};
        action.sa_handler = signal_handler;
        sigemptyset(&action.sa_mask);
        action.sa_flags = 0;
        sigaction(sig, &action, nullptr);
    };
    install(SIGINT);
    install(SIGTERM);
}

void uninstall_termination_handlers() {
    std::signal(SIGINT, SIG_DFL);
    std::signal(SIGTERM, SIG_DFL);
}

void print_usage() {
    std::cout << "sharemesh daemon" << std::endl;
    std::cout << "Usage: sharemeshd [options]\n\n";
    std::cout << "Options:\n"
              << "  --config <file>          Load configuration from a JSON file\n"
              << "  --user <id>              Local user id (overrides identity.user_id)\n"
              << "  --port <port>            Transport listening port (overrides network.listen_port)\n"
              << "  --share <path>           Share a file; may be repeated\n"
              << "  --private-to <u1,u2>     Make the preceding --share private to the listed users\n"
              << "  --fetch <fileId>         Download a file and exit\n"
              << "  --from <peerHex>         Peer to download from (64 hexadecimal characters)\n"
              << "  --at <host:port>         Skip discovery and connect to the peer at this address\n"
              << "  --out <path>             Destination for --fetch (default: storage.download_directory)\n"
              << "  --list-peers             Print the peers discovered on the local network and exit\n"
              << "  --no-discovery           Do not announce or listen for announcements\n"
              << "  --version                Print the version and exit\n"
              << "  --help                   Print this help message\n\n"
              << "Without --fetch or --list-peers the daemon serves shared files until SIGINT/SIGTERM.\n";
}

std::set<UserId> parse_user_list(const std::string& text) {
    std::set<UserId> users;
    std::stringstream stream(text);
    std::string item;
    while (std::getline(stream, item, ',')) {
        if (!item.empty()) {
            users.insert(item);
        }
    }
    if (users.empty()) {
        throw_cli_error("E_INVALID_USERS", "--private-to needs at least one user id",
                        "Separate user ids with commas, e.g. --private-to alice,bob");
    }
    return users;
}

std::uint16_t parse_port(const std::string& text, std::string_view option) {
    std::uint16_t value = 0;
    const auto* end = text.data() + text.size();
    const auto [ptr, ec] = std::from_chars(text.data(), end, value);
    if (ec == std::errc{} && ptr == end && !text.empty()) {
        return value;
    }
    throw_cli_error("E_INVALID_PORT", "Invalid port for " + std::string(option) + ": " + text,
                    "Use a number between 0 and 65535");
}

PeerId parse_peer(const std::string& text) {
    const auto peer = peer_id_from_string(text);
    if (!peer.has_value()) {
        throw_cli_error("E_INVALID_PEER", "Invalid peer id: " + text, "Peer ids are 64 hexadecimal characters");
    }
    return *peer;
}

Options parse_options(const std::vector<std::string_view>& args) {
    Options options{};
    std::size_t index = 0;

    auto require_value = [&](std::string_view option) -> std::string {
        if (index >= args.size()) {
            throw_cli_error("E_MISSING_VALUE",
                            std::string(option) + " requires a value",
                            "Provide an argument immediately after " + std::string(option));
        }
        return std::string(args[index++]);
    };
    auto reject_duplicate = [](bool present, std::string_view option) {
        if (present) {
            throw_cli_error("E_DUPLICATE_OPTION",
                            "Option " + std::string(option) + " specified multiple times",
                            "Provide " + std::string(option) + " only once");
        }
    };

    while (index < args.size()) {
        const auto opt = args[index++];
        if (opt == "--config") {
            reject_duplicate(options.config_path.has_value(), opt);
            options.config_path = require_value(opt);
        } else if (opt == "--user") {
            reject_duplicate(options.user_id.has_value(), opt);
            options.user_id = require_value(opt);
        } else if (opt == "--port") {
            reject_duplicate(options.port.has_value(), opt);
            options.port = parse_port(require_value(opt), opt);
        } else if (opt == "--share") {
            options.shares.push_back(ShareRequest{require_value(opt), {}});
        } else if (opt == "--private-to") {
            if (options.shares.empty()) {
                throw_cli_error("E_ORPHAN_OPTION", "--private-to must follow a --share",
                                "Example: --share report.pdf --private-to alice");
            }
            options.shares.back().private_to = parse_user_list(require_value(opt));
        } else if (opt == "--fetch") {
            reject_duplicate(options.fetch_file.has_value(), opt);
            options.fetch_file = require_value(opt);
        } else if (opt == "--from") {
            reject_duplicate(options.fetch_from.has_value(), opt);
            options.fetch_from = require_value(opt);
        } else if (opt == "--at") {
            reject_duplicate(options.fetch_at.has_value(), opt);
            options.fetch_at = require_value(opt);
        } else if (opt == "--out") {
            reject_duplicate(options.fetch_out.has_value(), opt);
            options.fetch_out = std::filesystem::path(require_value(opt));
        } else if (opt == "--list-peers") {
            options.list_peers = true;
        } else if (opt == "--no-discovery") {
            options.no_discovery = true;
        } else {
            throw_cli_error("E_UNKNOWN_OPTION", "Unknown option: " + std::string(opt),
                            "Run 'sharemeshd --help' to see the available options");
        }
    }

    if (options.fetch_file.has_value() != options.fetch_from.has_value()) {
        throw_cli_error("E_MISSING_VALUE", "--fetch and --from must be given together",
                        "Example: --fetch <fileId> --from <peerHex>");
    }
    if ((options.fetch_at || options.fetch_out) && !options.fetch_file) {
        throw_cli_error("E_ORPHAN_OPTION", "--at and --out only apply to --fetch");
    }
    return options;
}

Config build_config(const Options& options) {
    Config config{};
    if (options.config_path.has_value()) {
        config = config::load_config(*options.config_path);
    }
    if (options.user_id.has_value()) {
        config.user_id = *options.user_id;
    }
    if (options.port.has_value()) {
        config.listen_port = *options.port;
    }
    if (options.no_discovery) {
        config.discovery_enabled = false;
    }
    return config;
}

network::PeerEndpoint parse_endpoint(const PeerId& peer_id, const std::string& text) {
    const auto colon = text.rfind(':');
    if (colon == std::string::npos || colon == 0) {
        throw_cli_error("E_INVALID_ENDPOINT", "Invalid address: " + text, "Use host:port, e.g. 192.168.1.20:5001");
    }
    network::PeerEndpoint endpoint;
    endpoint.peer_id = peer_id;
    endpoint.host = text.substr(0, colon);
    endpoint.port = parse_port(text.substr(colon + 1), "--at");
    return endpoint;
}

std::string format_bytes(std::uint64_t bytes) {
    constexpr const char* kUnits[] = {"B", "KiB", "MiB", "GiB"};
    double value = static_cast<double>(bytes);
    std::size_t unit = 0;
    while (value >= 1024.0 && unit + 1 < std::size(kUnits)) {
        value /= 1024.0;
        ++unit;
    }
    std::ostringstream out;
    out.precision(unit == 0 ? 0 : 1);
    out << std::fixed << value << ' ' << kUnits[unit];
    return out.str();
}

void print_peers(Node& node) {
    const auto peers = node.peers();
    if (peers.empty()) {
        std::cout << "No peers discovered." << std::endl;
        return;
    }
    for (const auto& peer : peers) {
        std::cout << peer_id_to_string(peer.info.peer_id) << "  " << peer.info.user_id << "  " << peer.info.host
                  << ':' << peer.info.port << std::endl;
    }
}

// Waits for the peer to show up in the registry; discovery needs at least one announce round.
std::optional<network::PeerEndpoint> await_peer(Node& node, const PeerId& peer_id) {
    const auto deadline = std::chrono::steady_clock::now() + node.config().announce_interval * 2;
    while (g_run_loop.load(std::memory_order_acquire)) {
        if (auto endpoint = node.endpoint_for(peer_id)) {
            return endpoint;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            break;
        }
        std::this_thread::sleep_for(kLoopInterval);
    }
    return std::nullopt;
}

int run_fetch(Node& node, const Options& options) {
    const auto peer_id = parse_peer(*options.fetch_from);
    std::optional<network::PeerEndpoint> endpoint;
    if (options.fetch_at.has_value()) {
        endpoint = parse_endpoint(peer_id, *options.fetch_at);
    } else {
        endpoint = await_peer(node, peer_id);
    }
    if (!endpoint.has_value()) {
        throw_cli_error("E_PEER_UNKNOWN", "Peer " + *options.fetch_from + " was not discovered",
                        "Check that the peer is running on the same network, or pass --at host:port");
    }

    const auto job_id = node.fetch(*options.fetch_file, *endpoint, options.fetch_out);
    std::cout << "Fetching " << *options.fetch_file << " (job " << job_id << ")" << std::endl;

    std::optional<JobSnapshot> result;
    while (!result.has_value()) {
        if (!g_run_loop.load(std::memory_order_acquire)) {
            node.transfers().cancel(job_id, "interrupted");
        }
        result = node.transfers().wait(job_id, kLoopInterval);
    }

    switch (result->state) {
    case JobState::Complete:
        std::cout << "Downloaded " << result->name << " (" << format_bytes(result->file_size) << ")" << std::endl;
        return 0;
    case JobState::Cancelled:
        std::cout << "Download cancelled: " << result->cancel_reason << std::endl;
        return 1;
    default:
        break;
    }
    const std::string description = result->error ? result->error->describe() : std::string("unknown failure");
    throw_cli_error("E_FETCH_FAILED", "Download failed: " + description,
                    "Completed chunks are kept; run the same command again to resume");
}

int run(const Options& options) {
    Node node(build_config(options));

    g_run_loop.store(true, std::memory_order_release);
    install_termination_handlers();
    node.start();

    std::cout << "Peer " << peer_id_to_string(node.id()) << " (" << node.config().user_id << ") listening on port "
              << node.transport_port() << std::endl;

    for (const auto& share : options.shares) {
        const auto visibility = share.private_to.empty() ? Visibility::Public : Visibility::Private;
        try {
            const auto descriptor = node.share_file(share.path, visibility, share.private_to);
            std::cout << "Shared " << descriptor.name << " as " << descriptor.file_id << " ("
                      << format_bytes(descriptor.manifest.file_size) << ", " << to_string(visibility) << ")"
                      << std::endl;
            for (const auto& user : share.private_to) {
                if (!node.catalog().peer_for_user(user).has_value()) {
                    std::cerr << "Warning: user '" << user << "' has no access.users binding and cannot fetch "
                              << descriptor.name << std::endl;
                }
            }
        } catch (const std::invalid_argument& ex) {
            throw_cli_error("E_SHARE_FAILED", "Cannot share " + share.path.string() + ": " + ex.what(),
                            "Only regular files within transfer.max_file_size can be shared");
        }
    }

    int status = 0;
    if (options.fetch_file.has_value()) {
        status = run_fetch(node, options);
    } else if (options.list_peers) {
        const auto deadline = std::chrono::steady_clock::now() + kPeerListWait;
        while (g_run_loop.load(std::memory_order_acquire) && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(kLoopInterval);
        }
        print_peers(node);
    } else {
        while (g_run_loop.load(std::memory_order_acquire)) {
            std::this_thread::sleep_for(kLoopInterval);
        }
        std::cout << "Shutting down" << std::endl;
    }

    node.stop();
    uninstall_termination_handlers();
    return status;
}

}  // namespace

int main(int argc, char** argv) {
    try {
        std::vector<std::string_view> args;
        args.reserve(static_cast<std::size_t>(argc));
        for (int i = 1; i < argc; ++i) {
            const std::string_view arg(argv[i]);
            if (arg == "--help" || arg == "-h") {
                print_usage();
                return 0;
            }
            if (arg == "--version") {
                std::cout << "sharemesh " << kSharemeshVersion << std::endl;
                return 0;
            }
            args.push_back(arg);
        }
        return run(parse_options(args));
    } catch (const CliException& ex) {
        print_cli_error(ex);
        return 1;
    } catch (const config::ConfigError& ex) {
        std::cerr << "Config error [" << ex.code << "]: " << ex.message << std::endl;
        if (!ex.hint.empty()) {
            std::cerr << "Hint: " << ex.hint << std::endl;
        }
        return 1;
    } catch (const Error& ex) {
        std::cerr << "Error [" << to_string(ex.kind()) << "]: " << ex.info().describe() << std::endl;
        return 1;
    } catch (const std::exception& ex) {
        std::cerr << "Error [E_UNEXPECTED]: " << ex.what() << std::endl;
        return 1;
    }
}

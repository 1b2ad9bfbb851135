#pragma once

#include "sharemesh/Config.hpp"
#include "sharemesh/Error.hpp"
#include "sharemesh/Types.hpp"
#include "sharemesh/core/AccessControl.hpp"
#include "sharemesh/core/Mailbox.hpp"
#include "sharemesh/core/TransferJob.hpp"
#include "sharemesh/network/SessionManager.hpp"
#include "sharemesh/protocol/Message.hpp"
#include "sharemesh/storage/DownloadTracker.hpp"
#include "sharemesh/storage/FileAssembler.hpp"
#include "sharemesh/storage/FileStore.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <shared_mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <variant>
#include <vector>

namespace sharemesh {

namespace test {
class TransferEngineTestAccess;
}

struct DownloadRequest {
    FileId file_id;
    network::PeerEndpoint source;
    // Defaults to <download_directory>/<name announced in the manifest>.
    std::optional<std::filesystem::path> destination;
    // Chunks already present in the partial file. Defaults to the engine's resume ledger.
    std::optional<std::set<ChunkIndex>> completed;
};

// Drives downloads (one driver thread per job, fed through a mailbox) and serves uploads
// from the session reader threads. Every job holds one global slot while it runs.
class TransferEngine {
public:
    using SessionHandle = network::SessionManager::SessionHandle;
    using Observer = std::function<void(const JobSnapshot&)>;

    TransferEngine(Config config,
                   const PeerId& local_peer,
                   network::SessionManager& sessions,
                   const storage::FileStore& store,
                   storage::DownloadTracker& tracker);
    ~TransferEngine();

    TransferEngine(const TransferEngine&) = delete;
    TransferEngine& operator=(const TransferEngine&) = delete;

    JobId request_download(DownloadRequest request);
    // False when the job is unknown or already finished.
    bool cancel(JobId job_id, std::string reason = "cancelled by user");

    // Snapshot once the job is terminal; nullopt on timeout or unknown job.
    std::optional<JobSnapshot> wait(JobId job_id, std::chrono::milliseconds timeout);
    std::optional<JobSnapshot> snapshot(JobId job_id) const;
    std::vector<JobSnapshot> jobs() const;
    std::size_t active_job_count() const;

    // Throws Error when no session can be opened or the peer does not answer in time.
    std::vector<protocol::FileListEntry> list_remote_files(const network::PeerEndpoint& endpoint,
                                                           std::chrono::milliseconds timeout);

    void handle_message(const SessionHandle& session, const protocol::Message& message);
    void handle_session_closed(const SessionHandle& session);

    void set_observer(Observer observer);

    // Joins drivers whose jobs have finished.
    void reap();
    // Cancels every job and joins all drivers.
    void shutdown();

    struct TestHooks {
        // Receiving side, before the chunk is opened.
        std::function<void(JobId, ChunkIndex, std::vector<std::uint8_t>&)> tamper_received_chunk;
        // Serving side, before the chunk is sealed.
        std::function<void(const FileId&, ChunkIndex, ChunkData&)> tamper_outgoing_plaintext;
        std::function<void(protocol::FileManifest&)> tamper_outgoing_manifest;
        // Serving side; returning false leaves the request unanswered.
        std::function<bool(const FileId&, ChunkIndex, std::uint32_t)> on_chunk_request;
    };

    static void set_test_hooks(const TestHooks* hooks);

private:
    friend class test::TransferEngineTestAccess;

    struct ManifestArrived {
        protocol::FileManifestPayload payload;
    };
    struct ChunkArrived {
        protocol::ChunkDataPayload payload;
    };
    struct RemoteFailure {
        protocol::ErrorPayload payload;
    };
    struct SessionLost {
        std::string reason;
    };
    struct CancelRequested {
        std::string reason;
    };
    using DownloadEvent = std::variant<ManifestArrived, ChunkArrived, RemoteFailure, SessionLost, CancelRequested>;

    struct InFlight {
        std::uint32_t attempt{0};
        std::chrono::steady_clock::time_point deadline{};
    };

    struct Download {
        std::shared_ptr<TransferJob> job;
        DownloadRequest request;
        Mailbox<DownloadEvent> mailbox;
        std::optional<std::set<ChunkIndex>> resume;
        std::optional<Hash256> resume_hash;
        std::optional<std::filesystem::path> resume_destination;

        mutable std::mutex session_mutex;
        SessionHandle session;

        // Driver thread only.
        std::unique_ptr<storage::FileAssembler> assembler;
        protocol::FileManifest manifest;
        std::map<ChunkIndex, InFlight> in_flight;
        std::map<ChunkIndex, std::uint32_t> next_attempt;
        bool slot_held{false};
        bool discard_partial{false};

        std::atomic<bool> finished{false};
        std::thread driver;
    };

    struct Upload {
        std::shared_ptr<TransferJob> job;
        SessionHandle session;
        std::uint64_t transfer_id{0};
        storage::FileDescriptor descriptor;
        std::filesystem::path path;
    };

    struct LedgerEntry {
        std::optional<Hash256> content_hash;
        std::set<ChunkIndex> completed;
        std::filesystem::path destination;
    };

    struct PendingList {
        SessionHandle session;
        std::promise<std::vector<protocol::FileListEntry>> promise;
    };

    // Download driver.
    void run_download(const std::shared_ptr<Download>& download);
    void wait_for_slot(Download& download);
    SessionHandle connect(Download& download, std::uint32_t& network_failures);
    void bind_session(Download& download, const SessionHandle& session);
    SessionHandle current_session(const Download& download) const;
    protocol::FileManifestPayload request_manifest(Download& download);
    void prepare_transfer(Download& download, const protocol::FileManifestPayload& manifest);
    void transfer_chunks(Download& download);
    void handle_chunk(Download& download, const protocol::ChunkDataPayload& chunk, std::optional<ErrorInfo>& abandoned);
    void back_off(Download& download, std::uint32_t attempt);
    void conclude(Download& download, const std::function<bool(TransferJob&)>& finish);

    // Serving side, on session reader threads.
    void serve_file_request(const SessionHandle& session, const protocol::FileRequestPayload& request);
    void serve_chunk_request(const SessionHandle& session, const protocol::ChunkRequestPayload& request);
    void serve_chunk_ack(const SessionHandle& session, const protocol::ChunkAckPayload& ack);
    void serve_cancel(const SessionHandle& session, const protocol::TransferCancelPayload& cancel);
    void serve_complete(const SessionHandle& session, const protocol::TransferCompletePayload& complete);
    void serve_file_list(const SessionHandle& session, const protocol::FileListRequestPayload& request);
    void finish_upload(const std::shared_ptr<Upload>& upload, const std::function<bool(TransferJob&)>& finish);
    std::shared_ptr<Upload> find_upload(const SessionHandle& session, std::uint64_t transfer_id) const;
    std::shared_ptr<Upload> take_upload(const std::string& key);
    static std::string upload_key(const PeerId& peer_id, std::uint64_t transfer_id);

    // Receiving side routing.
    void route_to_download(const SessionHandle& session, std::uint64_t transfer_id, DownloadEvent event);
    void complete_file_list(const SessionHandle& session, const protocol::FileListPayload& list);

    void send_error(const SessionHandle& session,
                    protocol::ErrorCode code,
                    std::uint64_t transfer_id,
                    ChunkIndex chunk_index,
                    const std::string& reason);

    bool is_admin(const UserId& user_id) const;
    bool try_acquire_slot();
    void release_slot();

    std::optional<LedgerEntry> ledger_lookup(const std::string& key) const;
    void ledger_store(const std::string& key, LedgerEntry entry);
    void ledger_add(const std::string& key, ChunkIndex index);
    void ledger_erase(const std::string& key);
    static std::string ledger_key(const FileId& file_id, const PeerId& peer_id);

    std::filesystem::path destination_for(const Download& download, const std::string& announced_name) const;
    void register_job(const std::shared_ptr<TransferJob>& job);
    void notify(const TransferJob& job);

    Config config_;
    PeerId local_peer_;
    network::SessionManager& sessions_;
    const storage::FileStore& store_;
    storage::DownloadTracker& tracker_;
    AccessControlEngine access_;

    std::atomic<JobId> next_job_id_{1};
    std::atomic<std::uint64_t> next_request_id_{1};
    std::atomic<bool> stopping_{false};

    mutable std::mutex slots_mutex_;
    std::size_t active_jobs_{0};

    mutable std::shared_mutex jobs_mutex_;
    std::unordered_map<JobId, std::shared_ptr<TransferJob>> jobs_;

    mutable std::mutex downloads_mutex_;
    std::unordered_map<JobId, std::shared_ptr<Download>> downloads_;

    mutable std::mutex uploads_mutex_;
    std::unordered_map<std::string, std::shared_ptr<Upload>> uploads_;

    mutable std::mutex ledger_mutex_;
    std::unordered_map<std::string, LedgerEntry> ledger_;

    std::mutex lists_mutex_;
    std::unordered_map<std::uint64_t, PendingList> pending_lists_;

    std::mutex observer_mutex_;
    Observer observer_{};

    std::mutex wait_mutex_;
    std::condition_variable job_finished_;
};

}  // namespace sharemesh

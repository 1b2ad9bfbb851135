#include "sharemesh/core/TransferEngine.hpp"

#include "sharemesh/daemon/StructuredLogger.hpp"
#include "sharemesh/protocol/Manifest.hpp"

#include <algorithm>
#include <deque>
#include <stdexcept>
#include <type_traits>
#include <utility>

namespace sharemesh {

namespace {

constexpr std::chrono::milliseconds kDriverPoll{200};
constexpr std::chrono::milliseconds kMinimumWait{1};

std::atomic<const TransferEngine::TestHooks*> g_test_hooks{nullptr};

const TransferEngine::TestHooks* hooks() {
    return g_test_hooks.load(std::memory_order_acquire);
}

daemon::StructuredLogger& logger() {
    return daemon::StructuredLogger::instance();
}

// Unwinds a download driver when the job is cancelled at a suspension point.
struct JobCancelled : std::runtime_error {
    explicit JobCancelled(const std::string& reason) : std::runtime_error(reason) {}
};

Error job_error(ErrorKind kind,
                std::string message,
                const TransferJob& job,
                std::optional<ChunkIndex> chunk_index = std::nullopt) {
    return Error(make_error(kind, std::move(message), job.peer_id(), job.file_id(), chunk_index));
}

}  // namespace

TransferEngine::TransferEngine(Config config,
                               const PeerId& local_peer,
                               network::SessionManager& sessions,
                               const storage::FileStore& store,
                               storage::DownloadTracker& tracker)
    : config_(sanitize(std::move(config))),
      local_peer_(local_peer),
      sessions_(sessions),
      store_(store),
      tracker_(tracker) {}

TransferEngine::~TransferEngine() {
    shutdown();
}

void TransferEngine::set_test_hooks(const TestHooks* hooks) {
    g_test_hooks.store(hooks, std::memory_order_release);
}

void TransferEngine::set_observer(Observer observer) {
    std::scoped_lock lock(observer_mutex_);
    observer_ = std::move(observer);
}

void TransferEngine::notify(const TransferJob& job) {
    Observer observer;
    {
        std::scoped_lock lock(observer_mutex_);
        observer = observer_;
    }
    if (observer) {
        observer(job.snapshot());
    }
}

void TransferEngine::register_job(const std::shared_ptr<TransferJob>& job) {
    std::unique_lock lock(jobs_mutex_);
    jobs_.emplace(job->id(), job);
}

bool TransferEngine::try_acquire_slot() {
    std::scoped_lock lock(slots_mutex_);
    if (active_jobs_ >= config_.max_concurrent_jobs) {
        return false;
    }
    ++active_jobs_;
    return true;
}

void TransferEngine::release_slot() {
    std::scoped_lock lock(slots_mutex_);
    if (active_jobs_ > 0) {
        --active_jobs_;
    }
}

std::size_t TransferEngine::active_job_count() const {
    std::scoped_lock lock(slots_mutex_);
    return active_jobs_;
}

std::string TransferEngine::ledger_key(const FileId& file_id, const PeerId& peer_id) {
    return file_id + "@" + peer_id_to_string(peer_id);
}

std::optional<TransferEngine::LedgerEntry> TransferEngine::ledger_lookup(const std::string& key) const {
    std::scoped_lock lock(ledger_mutex_);
    const auto it = ledger_.find(key);
    if (it == ledger_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void TransferEngine::ledger_store(const std::string& key, LedgerEntry entry) {
    std::scoped_lock lock(ledger_mutex_);
    ledger_.insert_or_assign(key, std::move(entry));
}

void TransferEngine::ledger_add(const std::string& key, ChunkIndex index) {
    std::scoped_lock lock(ledger_mutex_);
    const auto it = ledger_.find(key);
    if (it != ledger_.end()) {
        it->second.completed.insert(index);
    }
}

void TransferEngine::ledger_erase(const std::string& key) {
    std::scoped_lock lock(ledger_mutex_);
    ledger_.erase(key);
}

JobId TransferEngine::request_download(DownloadRequest request) {
    if (stopping_) {
        throw Error(ErrorKind::Network, "transfer engine is shutting down", request.source.peer_id);
    }
    reap();

    auto download = std::make_shared<Download>();
    download->job = std::make_shared<TransferJob>(next_job_id_.fetch_add(1), request.file_id, request.source.peer_id,
                                                  TransferDirection::Download);
    if (request.completed.has_value()) {
        download->resume = request.completed;
    } else if (auto entry = ledger_lookup(ledger_key(request.file_id, request.source.peer_id))) {
        download->resume = entry->completed;
        download->resume_hash = entry->content_hash;
        download->resume_destination = entry->destination;
    }
    download->request = std::move(request);

    const auto job_id = download->job->id();
    register_job(download->job);
    {
        std::scoped_lock lock(downloads_mutex_);
        downloads_.emplace(job_id, download);
    }

    logger().info("transfer.job.requested",
                  {{"job", std::to_string(job_id)},
                   {"file", download->request.file_id},
                   {"peer", peer_id_to_string(download->request.source.peer_id)},
                   {"resume_chunks", std::to_string(download->resume ? download->resume->size() : 0)}});

    download->driver = std::thread(&TransferEngine::run_download, this, download);
    return job_id;
}

bool TransferEngine::cancel(JobId job_id, std::string reason) {
    std::shared_ptr<Download> download;
    {
        std::scoped_lock lock(downloads_mutex_);
        const auto it = downloads_.find(job_id);
        if (it != downloads_.end()) {
            download = it->second;
        }
    }
    if (!download || download->job->is_terminal()) {
        return false;
    }
    return download->mailbox.push(CancelRequested{std::move(reason)});
}

std::optional<JobSnapshot> TransferEngine::snapshot(JobId job_id) const {
    std::shared_lock lock(jobs_mutex_);
    const auto it = jobs_.find(job_id);
    if (it == jobs_.end()) {
        return std::nullopt;
    }
    return it->second->snapshot();
}

std::vector<JobSnapshot> TransferEngine::jobs() const {
    std::vector<JobSnapshot> snapshots;
    {
        std::shared_lock lock(jobs_mutex_);
        snapshots.reserve(jobs_.size());
        for (const auto& [_, job] : jobs_) {
            snapshots.push_back(job->snapshot());
        }
    }
    std::sort(snapshots.begin(), snapshots.end(), [](const JobSnapshot& lhs, const JobSnapshot& rhs) {
        return lhs.id < rhs.id;
    });
    return snapshots;
}

std::optional<JobSnapshot> TransferEngine::wait(JobId job_id, std::chrono::milliseconds timeout) {
    std::shared_ptr<TransferJob> job;
    {
        std::shared_lock lock(jobs_mutex_);
        const auto it = jobs_.find(job_id);
        if (it == jobs_.end()) {
            return std::nullopt;
        }
        job = it->second;
    }

    std::unique_lock lock(wait_mutex_);
    if (!job_finished_.wait_for(lock, timeout, [&job] { return job->is_terminal(); })) {
        return std::nullopt;
    }
    lock.unlock();
    return job->snapshot();
}

void TransferEngine::reap() {
    std::vector<std::shared_ptr<Download>> finished;
    {
        std::scoped_lock lock(downloads_mutex_);
        for (auto it = downloads_.begin(); it != downloads_.end();) {
            if (it->second->finished.load()) {
                finished.push_back(it->second);
                it = downloads_.erase(it);
            } else {
                ++it;
            }
        }
    }
    for (const auto& download : finished) {
        if (download->driver.joinable()) {
            download->driver.join();
        }
    }
}

void TransferEngine::shutdown() {
    if (stopping_.exchange(true)) {
        return;
    }

    std::vector<std::shared_ptr<Download>> downloads;
    {
        std::scoped_lock lock(downloads_mutex_);
        for (const auto& [_, download] : downloads_) {
            downloads.push_back(download);
        }
        downloads_.clear();
    }
    for (const auto& download : downloads) {
        download->mailbox.push(CancelRequested{"shutdown"});
    }
    for (const auto& download : downloads) {
        if (download->driver.joinable()) {
            download->driver.join();
        }
    }

    std::vector<std::shared_ptr<Upload>> uploads;
    {
        std::scoped_lock lock(uploads_mutex_);
        for (const auto& [_, upload] : uploads_) {
            uploads.push_back(upload);
        }
    }
    for (const auto& upload : uploads) {
        finish_upload(upload, [](TransferJob& job) { return job.cancel("shutdown"); });
    }

    std::scoped_lock lock(lists_mutex_);
    for (auto& [_, pending] : pending_lists_) {
        pending.promise.set_exception(std::make_exception_ptr(Error(ErrorKind::Network, "shutdown")));
    }
    pending_lists_.clear();
}

// ---------------------------------------------------------------------------
// Download driver

void TransferEngine::run_download(const std::shared_ptr<Download>& download) {
    auto& job = *download->job;
    try {
        wait_for_slot(*download);
        if (!job.begin_authorization()) {
            throw job_error(ErrorKind::Protocol, "job left PENDING unexpectedly", job);
        }
        notify(job);

        // The local catalog may already know the file; refuse early instead of asking the peer.
        if (const auto descriptor = store_.find_file(job.file_id())) {
            const auto decision = access_.authorize(config_.user_id, local_peer_, *descriptor,
                                                    store_.is_admin(config_.user_id));
            if (!decision.allowed()) {
                throw job_error(ErrorKind::Permission, decision.reason, job);
            }
        }

        const auto manifest = request_manifest(*download);
        prepare_transfer(*download, manifest);
        transfer_chunks(*download);

        if (!download->assembler->verify_content()) {
            download->discard_partial = true;
            throw job_error(ErrorKind::Integrity, "whole-file hash mismatch after reassembly", job);
        }
        download->assembler->finalize();

        storage::DownloadRecord record;
        record.file_id = job.file_id();
        record.peer_id = job.peer_id();
        record.completed_at = std::chrono::system_clock::now();
        record.bytes = download->manifest.file_size;
        record.direction = TransferDirection::Download;
        tracker_.record(std::move(record));

        logger().info("transfer.job.complete",
                      {{"job", std::to_string(job.id())},
                       {"file", job.file_id()},
                       {"peer", peer_id_to_string(job.peer_id())},
                       {"path", download->assembler->destination().string()}});
        conclude(*download, [](TransferJob& target) { return target.complete(); });
    } catch (const JobCancelled& cancelled) {
        const std::string reason = cancelled.what();
        conclude(*download, [&reason](TransferJob& target) { return target.cancel(reason); });
    } catch (const Error& error) {
        const auto info = error.info();
        conclude(*download, [&info](TransferJob& target) { return target.fail(info); });
    } catch (const std::exception& ex) {
        const auto info = make_error(ErrorKind::Network, std::string("local failure: ") + ex.what(), job.peer_id(),
                                     job.file_id());
        conclude(*download, [&info](TransferJob& target) { return target.fail(info); });
    }
}

void TransferEngine::wait_for_slot(Download& download) {
    bool announced = false;
    while (!try_acquire_slot()) {
        if (!announced) {
            logger().info("transfer.job.queued", {{"job", std::to_string(download.job->id())}});
            announced = true;
        }
        if (auto event = download.mailbox.pop(kDriverPoll)) {
            if (const auto* cancel = std::get_if<CancelRequested>(&*event)) {
                throw JobCancelled(cancel->reason);
            }
        }
    }
    download.slot_held = true;
}

void TransferEngine::back_off(Download& download, std::uint32_t attempt) {
    const auto deadline = std::chrono::steady_clock::now() + retry_backoff(config_, attempt);
    while (true) {
        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            return;
        }
        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        if (auto event = download.mailbox.pop(std::max(remaining, kMinimumWait))) {
            if (const auto* cancel = std::get_if<CancelRequested>(&*event)) {
                throw JobCancelled(cancel->reason);
            }
        }
    }
}

TransferEngine::SessionHandle TransferEngine::current_session(const Download& download) const {
    std::scoped_lock lock(download.session_mutex);
    return download.session;
}

void TransferEngine::bind_session(Download& download, const SessionHandle& session) {
    SessionHandle previous;
    {
        std::scoped_lock lock(download.session_mutex);
        if (download.session == session) {
            return;
        }
        previous = std::exchange(download.session, session);
    }
    if (previous) {
        previous->detach_job();
    }
    if (session) {
        session->attach_job();
    }
}

TransferEngine::SessionHandle TransferEngine::connect(Download& download, std::uint32_t& network_failures) {
    while (true) {
        try {
            auto session = sessions_.open(download.request.source);
            bind_session(download, session);
            return session;
        } catch (const Error& error) {
            if (error.kind() != ErrorKind::Network || network_failures >= config_.max_network_retries) {
                throw;
            }
            logger().warning("transfer.connect_retry",
                             {{"job", std::to_string(download.job->id())},
                              {"peer", peer_id_to_string(download.request.source.peer_id)},
                              {"attempt", std::to_string(network_failures + 1)},
                              {"reason", error.info().message}});
            back_off(download, network_failures++);
        }
    }
}

protocol::FileManifestPayload TransferEngine::request_manifest(Download& download) {
    auto& job = *download.job;
    std::uint32_t network_failures = 0;

    while (true) {
        auto session = connect(download, network_failures);

        protocol::FileRequestPayload request{};
        request.transfer_id = job.id();
        request.file_id = job.file_id();

        std::string failure = "failed to send FILE_REQUEST";
        if (session->send(protocol::make_message(request))) {
            failure = "no FILE_MANIFEST within the request timeout";
            const auto deadline = std::chrono::steady_clock::now() + config_.chunk_request_timeout;
            bool waiting = true;
            while (waiting) {
                const auto now = std::chrono::steady_clock::now();
                if (now >= deadline) {
                    break;
                }
                const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
                auto event = download.mailbox.pop(std::min(std::max(remaining, kMinimumWait), kDriverPoll));
                if (!event) {
                    continue;
                }
                if (auto* manifest = std::get_if<ManifestArrived>(&*event)) {
                    return std::move(manifest->payload);
                }
                if (const auto* cancel = std::get_if<CancelRequested>(&*event)) {
                    throw JobCancelled(cancel->reason);
                }
                if (const auto* remote = std::get_if<RemoteFailure>(&*event)) {
                    const auto kind = protocol::error_kind(remote->payload.code);
                    if (remote->payload.code != protocol::ErrorCode::Busy) {
                        throw job_error(kind, "peer refused FILE_REQUEST: " + remote->payload.reason, job);
                    }
                    failure = "peer busy: " + remote->payload.reason;
                    waiting = false;
                } else if (const auto* lost = std::get_if<SessionLost>(&*event)) {
                    failure = "session lost: " + lost->reason;
                    waiting = false;
                }
            }
        }

        if (network_failures >= config_.max_network_retries) {
            throw job_error(ErrorKind::Network, failure, job);
        }
        logger().warning("transfer.manifest_retry",
                         {{"job", std::to_string(job.id())},
                          {"attempt", std::to_string(network_failures + 1)},
                          {"reason", failure}});
        back_off(download, network_failures++);
    }
}

std::filesystem::path TransferEngine::destination_for(const Download& download,
                                                      const std::string& announced_name) const {
    if (download.request.destination.has_value()) {
        return *download.request.destination;
    }
    if (download.resume_destination.has_value()) {
        return *download.resume_destination;
    }
    auto name = std::filesystem::path(announced_name).filename();
    if (name.empty() || name == "." || name == "..") {
        name = download.job->file_id();
    }
    return std::filesystem::path(config_.download_directory) / name;
}

void TransferEngine::prepare_transfer(Download& download, const protocol::FileManifestPayload& payload) {
    auto& job = *download.job;
    const auto& manifest = payload.manifest;

    if (payload.file_id != job.file_id() || !manifest.consistent()) {
        throw job_error(ErrorKind::Protocol, "FILE_MANIFEST does not describe the requested file", job);
    }
    if (manifest.file_size > config_.max_file_size) {
        throw job_error(ErrorKind::Protocol,
                        "announced size " + std::to_string(manifest.file_size) + " exceeds the local limit", job);
    }
    if (const auto known = store_.find_file(job.file_id())) {
        if (known->manifest.content_hash != manifest.content_hash ||
            known->manifest.chunk_hashes != manifest.chunk_hashes) {
            throw job_error(ErrorKind::Integrity, "FILE_MANIFEST differs from the catalogued descriptor", job);
        }
    }

    download.manifest = manifest;
    job.describe_file(payload.name, manifest.chunk_count(), manifest.file_size);
    const auto destination = destination_for(download, payload.name);

    // Resume only into the same content and only when the partial file survived.
    std::set<ChunkIndex> restored;
    if (download.resume.has_value()) {
        const bool same_content = !download.resume_hash.has_value() || *download.resume_hash == manifest.content_hash;
        std::error_code ec;
        const bool partial_exists =
            std::filesystem::exists(storage::FileAssembler::partial_path_for(destination), ec);
        if (same_content && partial_exists) {
            for (const auto index : *download.resume) {
                if (index < manifest.chunk_count()) {
                    restored.insert(index);
                }
            }
        } else {
            logger().warning("transfer.resume_discarded",
                             {{"job", std::to_string(job.id())},
                              {"file", job.file_id()},
                              {"reason", same_content ? "partial file missing" : "content changed"}});
        }
    }
    job.forget_restored();
    std::uint64_t restored_bytes = 0;
    for (const auto index : restored) {
        restored_bytes += manifest.chunk_length(index);
    }
    job.restore(restored, restored_bytes);

    download.assembler = std::make_unique<storage::FileAssembler>(destination, manifest);
    download.assembler->open();

    LedgerEntry entry;
    entry.content_hash = manifest.content_hash;
    entry.completed = restored;
    entry.destination = destination;
    ledger_store(ledger_key(job.file_id(), job.peer_id()), std::move(entry));

    if (!job.activate()) {
        throw job_error(ErrorKind::Protocol, "job could not become ACTIVE", job);
    }
    notify(job);
}

void TransferEngine::transfer_chunks(Download& download) {
    auto& job = *download.job;
    const auto& manifest = download.manifest;

    std::deque<ChunkIndex> pending;
    for (ChunkIndex index = 0; index < manifest.chunk_count(); ++index) {
        if (!job.is_completed(index)) {
            pending.push_back(index);
        }
    }

    std::optional<ErrorInfo> abandoned;
    std::uint32_t network_failures = 0;

    while (!pending.empty() || !download.in_flight.empty()) {
        auto session = current_session(download);
        if (!session || session->is_terminal()) {
            throw job_error(ErrorKind::Network, "session to the serving peer is gone", job);
        }

        while (download.in_flight.size() < config_.per_job_concurrency && !pending.empty()) {
            const auto index = pending.front();
            pending.pop_front();
            const auto attempt = download.next_attempt[index]++;

            protocol::ChunkRequestPayload request{};
            request.transfer_id = job.id();
            request.file_id = job.file_id();
            request.index = index;
            request.attempt = attempt;
            if (!session->send(protocol::make_message(request))) {
                throw job_error(ErrorKind::Network, "failed to send CHUNK_REQUEST", job, index);
            }
            download.in_flight[index] = InFlight{attempt, std::chrono::steady_clock::now() + config_.chunk_request_timeout};
        }
        job.set_in_flight(download.in_flight.size());

        auto wait = kDriverPoll;
        const auto now = std::chrono::steady_clock::now();
        for (const auto& [_, slot] : download.in_flight) {
            const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(slot.deadline - now);
            wait = std::min(wait, std::max(remaining, kMinimumWait));
        }

        if (auto event = download.mailbox.pop(wait)) {
            if (const auto* cancel = std::get_if<CancelRequested>(&*event)) {
                throw JobCancelled(cancel->reason);
            }
            if (const auto* lost = std::get_if<SessionLost>(&*event)) {
                throw job_error(ErrorKind::Network, "session closed: " + lost->reason, job);
            }
            if (const auto* chunk = std::get_if<ChunkArrived>(&*event)) {
                const auto index = chunk->payload.index;
                const bool expected = download.in_flight.contains(index);
                handle_chunk(download, chunk->payload, abandoned);
                if (expected && !download.in_flight.contains(index) && !job.is_completed(index) &&
                    job.retries(index) < config_.max_chunk_retries) {
                    pending.push_front(index);
                }
            } else if (const auto* remote = std::get_if<RemoteFailure>(&*event)) {
                const auto& payload = remote->payload;
                const std::optional<ChunkIndex> chunk_index =
                    payload.chunk_index == protocol::kNoChunk ? std::nullopt : std::optional<ChunkIndex>(payload.chunk_index);
                if (payload.code != protocol::ErrorCode::Busy) {
                    throw job_error(protocol::error_kind(payload.code), "peer reported: " + payload.reason, job,
                                    chunk_index);
                }
                if (chunk_index.has_value() && download.in_flight.erase(*chunk_index) > 0) {
                    pending.push_front(*chunk_index);
                }
                if (network_failures >= config_.max_network_retries) {
                    throw job_error(ErrorKind::Network, "peer stayed busy", job, chunk_index);
                }
                back_off(download, network_failures++);
            }
        }

        const auto checked = std::chrono::steady_clock::now();
        for (auto it = download.in_flight.begin(); it != download.in_flight.end();) {
            if (it->second.deadline > checked) {
                ++it;
                continue;
            }
            const auto index = it->first;
            it = download.in_flight.erase(it);
            if (network_failures >= config_.max_network_retries) {
                throw job_error(ErrorKind::Network, "chunk request timed out", job, index);
            }
            ++network_failures;
            logger().warning("transfer.chunk.timeout",
                             {{"job", std::to_string(job.id())},
                              {"file", job.file_id()},
                              {"chunk", std::to_string(index)},
                              {"peer", peer_id_to_string(job.peer_id())}});
            pending.push_front(index);
        }
    }
    job.set_in_flight(0);

    if (abandoned.has_value()) {
        throw Error(*abandoned);
    }
}

void TransferEngine::handle_chunk(Download& download,
                                  const protocol::ChunkDataPayload& chunk,
                                  std::optional<ErrorInfo>& abandoned) {
    auto& job = *download.job;
    const auto it = download.in_flight.find(chunk.index);
    if (it == download.in_flight.end() || it->second.attempt != chunk.attempt || chunk.file_id != job.file_id()) {
        return;
    }
    download.in_flight.erase(it);

    const auto session = current_session(download);
    const auto channel = session ? session->channel() : nullptr;
    if (!channel) {
        throw job_error(ErrorKind::Network, "session lost its keys", job, chunk.index);
    }

    auto ciphertext = chunk.ciphertext;
    if (const auto* test_hooks = hooks(); test_hooks && test_hooks->tamper_received_chunk) {
        test_hooks->tamper_received_chunk(job.id(), chunk.index, ciphertext);
    }

    const auto plaintext = channel->open_chunk(job.id(), job.file_id(), chunk.index, chunk.attempt, ciphertext);
    std::string problem;
    if (!plaintext.has_value()) {
        problem = "authentication tag mismatch";
    } else if (!protocol::verify_chunk(download.manifest, chunk.index, *plaintext)) {
        problem = "chunk hash mismatch";
    }

    if (!problem.empty()) {
        const auto retries = job.note_retry(chunk.index);
        if (retries < config_.max_chunk_retries) {
            logger().warning("transfer.chunk.retry",
                             {{"job", std::to_string(job.id())},
                              {"file", job.file_id()},
                              {"chunk", std::to_string(chunk.index)},
                              {"retries", std::to_string(retries)},
                              {"reason", problem}});
        } else {
            logger().error("transfer.chunk.abandoned",
                           {{"job", std::to_string(job.id())},
                            {"file", job.file_id()},
                            {"chunk", std::to_string(chunk.index)},
                            {"retries", std::to_string(retries)},
                            {"reason", problem}});
            if (!abandoned.has_value()) {
                abandoned = make_error(ErrorKind::Integrity,
                                       problem + " persisted after " + std::to_string(retries) + " attempts",
                                       job.peer_id(), job.file_id(), chunk.index);
            }
        }
        return;
    }

    download.assembler->write_chunk(chunk.index, *plaintext);
    job.mark_completed(chunk.index, plaintext->size());
    ledger_add(ledger_key(job.file_id(), job.peer_id()), chunk.index);

    protocol::ChunkAckPayload ack{};
    ack.transfer_id = job.id();
    ack.file_id = job.file_id();
    ack.index = chunk.index;
    if (!session->send(protocol::make_message(ack))) {
        logger().warning("transfer.ack_failed", {{"job", std::to_string(job.id())}, {"chunk", std::to_string(chunk.index)}});
    }
    notify(job);
}

void TransferEngine::conclude(Download& download, const std::function<bool(TransferJob&)>& finish) {
    auto& job = *download.job;
    const auto session = current_session(download);
    const bool peer_involved = job.state() != JobState::Pending;
    bind_session(download, nullptr);

    download.in_flight.clear();
    job.set_in_flight(0);
    if (download.assembler) {
        download.assembler->close();
        if (download.discard_partial) {
            std::error_code ec;
            std::filesystem::remove(download.assembler->partial_path(), ec);
        }
    }
    if (download.slot_held) {
        release_slot();
        download.slot_held = false;
    }

    download.mailbox.close();
    finish(job);

    const auto state = job.state();
    // The serving job ends only on one of these two messages.
    if (session && session->is_authenticated() && peer_involved) {
        if (state == JobState::Complete) {
            protocol::TransferCompletePayload complete{};
            complete.transfer_id = job.id();
            complete.file_id = job.file_id();
            if (!session->send(protocol::make_message(std::move(complete)))) {
                logger().warning("transfer.complete_not_sent", {{"job", std::to_string(job.id())}});
            }
        } else {
            protocol::TransferCancelPayload cancel{};
            cancel.transfer_id = job.id();
            cancel.reason = state == JobState::Cancelled ? "download cancelled" : "download failed";
            if (!session->send(protocol::make_message(std::move(cancel)))) {
                logger().warning("transfer.cancel_not_sent", {{"job", std::to_string(job.id())}});
            }
        }
    }
    if (state == JobState::Complete || download.discard_partial) {
        ledger_erase(ledger_key(job.file_id(), job.peer_id()));
    }

    {
        std::scoped_lock lock(wait_mutex_);
        job_finished_.notify_all();
    }
    notify(job);
    download.finished = true;
}

// ---------------------------------------------------------------------------
// Serving side

std::string TransferEngine::upload_key(const PeerId& peer_id, std::uint64_t transfer_id) {
    return peer_id_to_string(peer_id) + "#" + std::to_string(transfer_id);
}

std::shared_ptr<TransferEngine::Upload> TransferEngine::find_upload(const SessionHandle& session,
                                                                     std::uint64_t transfer_id) const {
    std::scoped_lock lock(uploads_mutex_);
    const auto it = uploads_.find(upload_key(session->remote_peer(), transfer_id));
    if (it == uploads_.end() || it->second->session != session) {
        return nullptr;
    }
    return it->second;
}

std::shared_ptr<TransferEngine::Upload> TransferEngine::take_upload(const std::string& key) {
    std::scoped_lock lock(uploads_mutex_);
    const auto it = uploads_.find(key);
    if (it == uploads_.end()) {
        return nullptr;
    }
    auto upload = it->second;
    uploads_.erase(it);
    return upload;
}

void TransferEngine::finish_upload(const std::shared_ptr<Upload>& upload,
                                   const std::function<bool(TransferJob&)>& finish) {
    if (!take_upload(upload_key(upload->job->peer_id(), upload->transfer_id))) {
        return;
    }
    upload->session->detach_job();
    release_slot();
    finish(*upload->job);
    {
        std::scoped_lock lock(wait_mutex_);
        job_finished_.notify_all();
    }
    notify(*upload->job);
}

bool TransferEngine::is_admin(const UserId& user_id) const {
    return !user_id.empty() && store_.is_admin(user_id);
}

void TransferEngine::send_error(const SessionHandle& session,
                                protocol::ErrorCode code,
                                std::uint64_t transfer_id,
                                ChunkIndex chunk_index,
                                const std::string& reason) {
    protocol::ErrorPayload payload{};
    payload.code = code;
    payload.transfer_id = transfer_id;
    payload.chunk_index = chunk_index;
    payload.reason = reason;
    if (!session->send(protocol::make_message(std::move(payload)))) {
        logger().warning("transfer.error_not_sent",
                         {{"peer", peer_id_to_string(session->remote_peer())}, {"reason", reason}});
    }
}

void TransferEngine::serve_file_request(const SessionHandle& session, const protocol::FileRequestPayload& request) {
    const auto peer_id = session->remote_peer();
    const auto user_id = access_.resolve_user(session->remote_user(), peer_id, store_);

    if (const auto existing = find_upload(session, request.transfer_id)) {
        // Retried FILE_REQUEST after a lost manifest.
        protocol::FileManifestPayload manifest{};
        manifest.transfer_id = request.transfer_id;
        manifest.file_id = existing->descriptor.file_id;
        manifest.name = existing->descriptor.name;
        manifest.manifest = existing->descriptor.manifest;
        if (const auto* test_hooks = hooks(); test_hooks && test_hooks->tamper_outgoing_manifest) {
            test_hooks->tamper_outgoing_manifest(manifest.manifest);
        }
        session->send(protocol::make_message(std::move(manifest)));
        return;
    }

    const auto descriptor = store_.find_file(request.file_id);
    const auto path = store_.local_path(request.file_id);
    if (!descriptor.has_value() || !path.has_value()) {
        send_error(session, protocol::ErrorCode::NotFound, request.transfer_id, protocol::kNoChunk,
                   "file " + request.file_id + " is not shared here");
        return;
    }

    auto job = std::make_shared<TransferJob>(next_job_id_.fetch_add(1), request.file_id, peer_id,
                                             TransferDirection::Upload);
    job->describe_file(descriptor->name, descriptor->manifest.chunk_count(), descriptor->manifest.file_size);
    job->begin_authorization();

    const auto decision = access_.authorize(user_id, peer_id, *descriptor, is_admin(user_id));
    if (!decision.allowed()) {
        register_job(job);
        job->fail(make_error(ErrorKind::Permission, decision.reason, peer_id, request.file_id));
        logger().warning("transfer.upload.denied",
                         {{"file", request.file_id},
                          {"peer", peer_id_to_string(peer_id)},
                          {"claimed_user", session->remote_user()},
                          {"verified", user_id.empty() ? "false" : "true"}});
        send_error(session, protocol::ErrorCode::Permission, request.transfer_id, protocol::kNoChunk, decision.reason);
        notify(*job);
        return;
    }

    if (stopping_ || !try_acquire_slot()) {
        send_error(session, protocol::ErrorCode::Busy, request.transfer_id, protocol::kNoChunk,
                   "transfer limit reached");
        return;
    }

    auto upload = std::make_shared<Upload>();
    upload->job = job;
    upload->session = session;
    upload->transfer_id = request.transfer_id;
    upload->descriptor = *descriptor;
    upload->path = *path;
    {
        std::scoped_lock lock(uploads_mutex_);
        uploads_.insert_or_assign(upload_key(peer_id, request.transfer_id), upload);
    }
    register_job(job);
    session->attach_job();
    job->activate();
    notify(*job);

    protocol::FileManifestPayload manifest{};
    manifest.transfer_id = request.transfer_id;
    manifest.file_id = descriptor->file_id;
    manifest.name = descriptor->name;
    manifest.manifest = descriptor->manifest;
    if (const auto* test_hooks = hooks(); test_hooks && test_hooks->tamper_outgoing_manifest) {
        test_hooks->tamper_outgoing_manifest(manifest.manifest);
    }
    if (!session->send(protocol::make_message(std::move(manifest)))) {
        finish_upload(upload, [&](TransferJob& target) {
            return target.fail(make_error(ErrorKind::Network, "failed to send FILE_MANIFEST", peer_id, request.file_id));
        });
        return;
    }
}

void TransferEngine::serve_chunk_request(const SessionHandle& session, const protocol::ChunkRequestPayload& request) {
    const auto upload = find_upload(session, request.transfer_id);
    if (!upload || upload->descriptor.file_id != request.file_id) {
        send_error(session, protocol::ErrorCode::Protocol, request.transfer_id, request.index,
                   "no active transfer for this request");
        return;
    }
    const auto peer_id = session->remote_peer();
    const auto user_id = access_.resolve_user(session->remote_user(), peer_id, store_);

    // Permissions are checked again at every chunk boundary so revocation applies mid-transfer.
    const auto current = store_.find_file(request.file_id);
    if (!current.has_value()) {
        send_error(session, protocol::ErrorCode::NotFound, request.transfer_id, request.index, "file is no longer shared");
        finish_upload(upload, [&](TransferJob& job) {
            return job.fail(make_error(ErrorKind::Protocol, "file unshared during transfer", peer_id, request.file_id));
        });
        return;
    }
    const auto decision = access_.authorize(user_id, peer_id, *current, is_admin(user_id));
    if (!decision.allowed()) {
        send_error(session, protocol::ErrorCode::Permission, request.transfer_id, request.index, decision.reason);
        finish_upload(upload, [&](TransferJob& job) {
            return job.fail(make_error(ErrorKind::Permission, decision.reason, peer_id, request.file_id, request.index));
        });
        return;
    }

    const auto& manifest = upload->descriptor.manifest;
    if (request.index >= manifest.chunk_count()) {
        send_error(session, protocol::ErrorCode::Protocol, request.transfer_id, request.index, "chunk index out of range");
        return;
    }
    if (const auto* test_hooks = hooks();
        test_hooks && test_hooks->on_chunk_request &&
        !test_hooks->on_chunk_request(request.file_id, request.index, request.attempt)) {
        return;
    }

    ChunkData plaintext;
    try {
        plaintext = protocol::read_chunk(upload->path, manifest, request.index);
    } catch (const std::exception& ex) {
        logger().error("transfer.chunk.read_failed",
                       {{"file", request.file_id}, {"chunk", std::to_string(request.index)}, {"error", ex.what()}});
        send_error(session, protocol::ErrorCode::NotFound, request.transfer_id, request.index, "chunk unavailable");
        return;
    }
    if (const auto* test_hooks = hooks(); test_hooks && test_hooks->tamper_outgoing_plaintext) {
        test_hooks->tamper_outgoing_plaintext(request.file_id, request.index, plaintext);
    }
    if (!session->send_chunk(request.transfer_id, request.file_id, request.index, request.attempt, plaintext)) {
        logger().warning("transfer.chunk.send_failed",
                         {{"file", request.file_id}, {"chunk", std::to_string(request.index)}});
    }
}

void TransferEngine::serve_chunk_ack(const SessionHandle& session, const protocol::ChunkAckPayload& ack) {
    const auto upload = find_upload(session, ack.transfer_id);
    if (!upload) {
        return;
    }
    const auto& manifest = upload->descriptor.manifest;
    if (ack.index >= manifest.chunk_count()) {
        return;
    }
    upload->job->mark_completed(ack.index, manifest.chunk_length(ack.index));
    notify(*upload->job);
}

void TransferEngine::serve_complete(const SessionHandle& session, const protocol::TransferCompletePayload& complete) {
    const auto upload = find_upload(session, complete.transfer_id);
    if (!upload || upload->descriptor.file_id != complete.file_id) {
        return;
    }
    // A resumed download acknowledges only the chunks it was missing.
    tracker_.record({upload->descriptor.file_id, upload->job->peer_id(), std::chrono::system_clock::now(),
                     upload->descriptor.manifest.file_size, TransferDirection::Upload});
    finish_upload(upload, [](TransferJob& job) { return job.complete(); });
}

void TransferEngine::serve_cancel(const SessionHandle& session, const protocol::TransferCancelPayload& cancel) {
    if (const auto upload = find_upload(session, cancel.transfer_id)) {
        finish_upload(upload, [&cancel](TransferJob& job) { return job.cancel("peer cancelled: " + cancel.reason); });
    }
}

void TransferEngine::serve_file_list(const SessionHandle& session, const protocol::FileListRequestPayload& request) {
    protocol::FileListPayload list{};
    list.request_id = request.request_id;
    const auto user_id = access_.resolve_user(session->remote_user(), session->remote_peer(), store_);
    for (const auto& descriptor : access_.visible_files(user_id, session->remote_peer(), store_)) {
        protocol::FileListEntry entry{};
        entry.file_id = descriptor.file_id;
        entry.name = descriptor.name;
        entry.size = descriptor.manifest.file_size;
        entry.visibility = descriptor.visibility;
        entry.owner = descriptor.owner_id;
        list.entries.push_back(std::move(entry));
    }
    if (!session->send(protocol::make_message(std::move(list)))) {
        logger().warning("transfer.list_not_sent", {{"peer", peer_id_to_string(session->remote_peer())}});
    }
}

// ---------------------------------------------------------------------------
// Routing

void TransferEngine::route_to_download(const SessionHandle& session, std::uint64_t transfer_id, DownloadEvent event) {
    std::shared_ptr<Download> download;
    {
        std::scoped_lock lock(downloads_mutex_);
        const auto it = downloads_.find(transfer_id);
        if (it != downloads_.end()) {
            download = it->second;
        }
    }
    // Only the session the job runs on may feed it.
    if (!download || current_session(*download) != session) {
        return;
    }
    download->mailbox.push(std::move(event));
}

void TransferEngine::complete_file_list(const SessionHandle& session, const protocol::FileListPayload& list) {
    std::scoped_lock lock(lists_mutex_);
    const auto it = pending_lists_.find(list.request_id);
    if (it == pending_lists_.end() || it->second.session != session) {
        return;
    }
    it->second.promise.set_value(list.entries);
    pending_lists_.erase(it);
}

void TransferEngine::handle_message(const SessionHandle& session, const protocol::Message& message) {
    std::visit(
        [&](const auto& payload) {
            using P = std::decay_t<decltype(payload)>;
            if constexpr (std::is_same_v<P, protocol::FileRequestPayload>) {
                serve_file_request(session, payload);
            } else if constexpr (std::is_same_v<P, protocol::ChunkRequestPayload>) {
                serve_chunk_request(session, payload);
            } else if constexpr (std::is_same_v<P, protocol::ChunkAckPayload>) {
                serve_chunk_ack(session, payload);
            } else if constexpr (std::is_same_v<P, protocol::TransferCancelPayload>) {
                serve_cancel(session, payload);
            } else if constexpr (std::is_same_v<P, protocol::TransferCompletePayload>) {
                serve_complete(session, payload);
            } else if constexpr (std::is_same_v<P, protocol::FileListRequestPayload>) {
                serve_file_list(session, payload);
            } else if constexpr (std::is_same_v<P, protocol::FileManifestPayload>) {
                route_to_download(session, payload.transfer_id, ManifestArrived{payload});
            } else if constexpr (std::is_same_v<P, protocol::ChunkDataPayload>) {
                route_to_download(session, payload.transfer_id, ChunkArrived{payload});
            } else if constexpr (std::is_same_v<P, protocol::ErrorPayload>) {
                route_to_download(session, payload.transfer_id, RemoteFailure{payload});
            } else if constexpr (std::is_same_v<P, protocol::FileListPayload>) {
                complete_file_list(session, payload);
            } else {
                logger().warning("transfer.unexpected_message",
                                 {{"type", std::string(protocol::to_string(message.type))},
                                  {"peer", peer_id_to_string(session->remote_peer())}});
            }
        },
        message.payload);
}

void TransferEngine::handle_session_closed(const SessionHandle& session) {
    const auto reason = session->failure() ? session->failure()->message : session->close_reason();

    std::vector<std::shared_ptr<Download>> downloads;
    {
        std::scoped_lock lock(downloads_mutex_);
        for (const auto& [_, download] : downloads_) {
            downloads.push_back(download);
        }
    }
    for (const auto& download : downloads) {
        if (current_session(*download) == session) {
            download->mailbox.push(SessionLost{reason});
        }
    }

    std::vector<std::shared_ptr<Upload>> uploads;
    {
        std::scoped_lock lock(uploads_mutex_);
        for (const auto& [_, upload] : uploads_) {
            if (upload->session == session) {
                uploads.push_back(upload);
            }
        }
    }
    for (const auto& upload : uploads) {
        finish_upload(upload, [&reason](TransferJob& job) {
            return job.fail(make_error(ErrorKind::Network, "session closed: " + reason));
        });
    }

    std::scoped_lock lock(lists_mutex_);
    for (auto it = pending_lists_.begin(); it != pending_lists_.end();) {
        if (it->second.session == session) {
            it->second.promise.set_exception(
                std::make_exception_ptr(Error(ErrorKind::Network, "session closed: " + reason, session->remote_peer())));
            it = pending_lists_.erase(it);
        } else {
            ++it;
        }
    }
}

std::vector<protocol::FileListEntry> TransferEngine::list_remote_files(const network::PeerEndpoint& endpoint,
                                                                       std::chrono::milliseconds timeout) {
    auto session = sessions_.open(endpoint);
    const auto request_id = next_request_id_.fetch_add(1);

    std::future<std::vector<protocol::FileListEntry>> result;
    {
        std::scoped_lock lock(lists_mutex_);
        auto& pending = pending_lists_[request_id];
        pending.session = session;
        result = pending.promise.get_future();
    }

    protocol::FileListRequestPayload request{};
    request.request_id = request_id;
    const bool sent = session->send(protocol::make_message(request));
    if (!sent || result.wait_for(timeout) != std::future_status::ready) {
        std::scoped_lock lock(lists_mutex_);
        pending_lists_.erase(request_id);
        throw Error(ErrorKind::Network, sent ? "FILE_LIST timed out" : "failed to send FILE_LIST_REQUEST",
                    endpoint.peer_id);
    }
    return result.get();
}

}  // namespace sharemesh

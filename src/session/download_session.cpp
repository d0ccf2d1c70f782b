#include "meshload/session/download_session.h"
#include "meshload/base/logger.h"
#include "meshload/integrity/decryptor.h"
#include "meshload/integrity/integrity_verifier.h"
#include "meshload/scheduler/single_source.h"
#include "meshload/selection/source_selector.h"
#include "meshload/storage/part_file.h"
#include <algorithm>
#include <filesystem>
#include <map>
#include <set>

namespace meshload {

namespace {

std::string short_hash(const std::string& hash) {
    return hash.size() > 12 ? hash.substr(0, 12) : hash;
}

WallTime wall_now() {
    return std::chrono::system_clock::now();
}

} // anonymous namespace

struct DownloadSession::Impl {
    FileDescriptor descriptor;
    SessionOptions options;
    GlobalConfig config;
    ReputationEngine& reputation;
    EventBus& events;
    SnapshotStore* snapshots;
    TransferHook* hook;

    IntegrityVerifier verifier;
    PartFile part;
    ProgressAggregator progress;
    SourceSelector selector;

    SessionStatus status = SessionStatus::Queued;
    std::optional<SessionError> error;

    std::unique_ptr<ChunkPlanner> planner;
    bool single_source = false;
    std::vector<bool> restored;            // verified chunks known before the planner exists

    std::map<std::string, std::shared_ptr<Transport>> transports;  // connecting or active
    std::set<std::string> connecting;
    std::set<std::string> excluded;        // permanently removed from this session
    std::set<std::string> pinned;          // reputation records retained by this session
    std::vector<ConnectOrder> pending_connects;              // queued until the next Downloading tick
    std::map<std::string, SteadyTime> connect_started;      // launched, not yet answered

    std::shared_ptr<CancelToken> session_token = std::make_shared<CancelToken>();
    std::map<std::pair<uint32_t, uint64_t>, std::shared_ptr<CancelToken>> tokens;

    std::map<std::string, uint64_t> bytes_by_peer;
    SteadyTime download_started_at{};
    SteadyTime last_snapshot_at{};
    uint32_t completions_since_snapshot = 0;
    bool snapshot_dirty = false;
    bool finalize_pending = false;

    Impl(FileDescriptor desc, SessionOptions opts, const GlobalConfig& cfg, ReputationEngine& rep,
         EventBus& bus, SnapshotStore* store, TransferHook* transfer_hook)
        : descriptor(std::move(desc)),
          options(std::move(opts)),
          config(cfg),
          reputation(rep),
          events(bus),
          snapshots(store),
          hook(transfer_hook),
          verifier(descriptor),
          part(options.output_path, descriptor.size),
          progress(descriptor.file_hash, descriptor.size, descriptor.total_chunks, cfg.progress),
          selector(cfg.selection, rep),
          restored(descriptor.total_chunks, false) {}

    std::string tag() const { return "[" + short_hash(descriptor.file_hash) + "] "; }

    bool is_active_state() const {
        return status == SessionStatus::Downloading || status == SessionStatus::Paused;
    }

    void set_status(SessionStatus to) {
        if (status == to) return;
        SessionStatus from = status;
        status = to;
        Logger::instance().info(tag() + "Session " + to_string(from) + " -> " + to_string(to));
        events.publish(SessionStateChanged{descriptor.file_hash, from, to});
    }

    std::vector<bool> bitmap() const {
        return planner ? planner->table().completion_bitmap() : restored;
    }

    // Re-verifies chunks already present in the part file
    uint32_t adopt_part_file(const std::vector<bool>* candidates) {
        uint32_t adopted = 0;
        uint64_t bytes = 0;
        for (uint32_t i = 0; i < descriptor.total_chunks; ++i) {
            if (candidates && !(*candidates)[i]) continue;
            auto data = part.read_at(descriptor.chunk_offset(i), descriptor.chunk_length(i));
            if (data && verifier.verify_chunk(i, *data)) {
                restored[i] = true;
                ++adopted;
                bytes += data->size();
            } else if (candidates) {
                Logger::instance().warning(tag() + "Chunk " + std::to_string(i) +
                                           " no longer verifies, fetching it again");
            }
        }
        progress.add_restored(adopted, bytes);
        return adopted;
    }

    void pin(const std::string& peer_id) {
        if (pinned.insert(peer_id).second) {
            reputation.retain(peer_id);
        }
    }

    void unpin(const std::string& peer_id) {
        if (pinned.erase(peer_id) > 0) {
            reputation.release(peer_id);
        }
    }

    void unpin_all() {
        for (const auto& peer_id : pinned) {
            reputation.release(peer_id);
        }
        pinned.clear();
    }

    void cancel_token(uint32_t index, uint64_t attempt) {
        auto it = tokens.find({index, attempt});
        if (it != tokens.end()) {
            it->second->cancel();
            tokens.erase(it);
        }
    }

    void cancel_all_tokens() {
        for (auto& [key, token] : tokens) {
            token->cancel();
        }
        tokens.clear();
    }

    void disconnect_all() {
        for (auto& [peer_id, transport] : transports) {
            disconnect(*transport);
            progress.set_peer_active(peer_id, false);
        }
        transports.clear();
        connecting.clear();
        pending_connects.clear();
        connect_started.clear();
    }

    const CandidatePeer* find_candidate(const std::string& peer_id) const {
        for (const auto& c : descriptor.peers) {
            if (c.peer_id == peer_id) return &c;
        }
        return nullptr;
    }

    // Feeds one transfer outcome to the reputation engine and the external hook
    void report(const std::string& peer_id, TransferOutcome outcome, FetchError reason, uint64_t bytes,
                uint64_t duration_ms) {
        TransferEvent event{wall_now(), peer_id, bytes, duration_ms, outcome, reason};
        reputation.record_event(event);
        if (hook) hook->on_transfer(event);
    }

    void report_failure(const std::string& peer_id, FetchError reason) {
        report(peer_id, reason == FetchError::Corrupt ? TransferOutcome::Corrupt : TransferOutcome::Failure,
               reason, 0, 0);
    }

    bool request_connect(const CandidatePeer& peer) {
        reputation.touch(peer.peer_id, peer.protocol);
        auto transport = create_transport(peer, config.transport);
        if (!transport) {
            Logger::instance().warning(tag() + "Peer " + peer.peer_id + " speaks unsupported protocol " +
                                       to_string(peer.protocol));
            report_failure(peer.peer_id, FetchError::PeerRefused);
            excluded.insert(peer.peer_id);
            events.publish(PeerRemoved{descriptor.file_hash, peer.peer_id, "unsupported protocol"});
            return false;
        }

        auto shared = std::make_shared<Transport>(std::move(*transport));
        transports[peer.peer_id] = shared;
        connecting.insert(peer.peer_id);
        pin(peer.peer_id);
        pending_connects.push_back({peer.peer_id, shared});
        Logger::instance().debug(tag() + "Connecting to peer " + peer.peer_id + " (" +
                                 to_string(peer.protocol) + " " + peer.address + ")");
        return true;
    }

    // Selects peers and creates the planner; Downloading or Failed afterwards
    void begin_download(SteadyTime now) {
        SelectionResult selection = selector.select(descriptor.peers, excluded);
        if (!selection.ok()) {
            fail(selection.error, "no usable peer among " + std::to_string(descriptor.peers.size()) +
                                  " candidates", std::nullopt, std::nullopt);
            return;
        }

        if (!planner) {
            single_source = selection.single_source;
            if (single_source) {
                planner = std::make_unique<SingleSourcePlanner>(descriptor.total_chunks, config.scheduler);
            } else {
                planner = std::make_unique<ChunkScheduler>(descriptor.total_chunks, config.scheduler);
            }
            for (uint32_t i = 0; i < descriptor.total_chunks; ++i) {
                if (restored[i]) planner->restore_completed(i);
            }
        }

        std::vector<std::string> started;
        for (const auto& peer : selection.selected) {
            if (transports.count(peer.peer_id)) continue;
            if (request_connect(peer)) {
                started.push_back(peer.peer_id);
            }
        }

        if (selection.degraded) {
            Logger::instance().warning(tag() + "No peer meets the trust threshold, using best untrusted peer");
        }
        Logger::instance().info(tag() + "Downloading " + descriptor.file_name + " (" +
                                std::to_string(descriptor.size) + " bytes, " +
                                std::to_string(descriptor.total_chunks) + " chunks) from " +
                                std::to_string(started.size()) + " peer(s)" +
                                (single_source ? ", single-source" : ""));

        download_started_at = now;
        last_snapshot_at = now;
        set_status(SessionStatus::Downloading);
        events.publish(DownloadStarted{descriptor.file_hash, started, single_source});
    }

    bool check_key() {
        if (descriptor.encrypted && options.decryption_key.size() != kAesKeySize) {
            fail(ErrorCode::DecryptionFailed, "encrypted file needs a 256-bit key", std::nullopt, std::nullopt);
            return false;
        }
        return true;
    }

    bool backfill() {
        if (status != SessionStatus::Downloading) return false;
        std::set<std::string> active;
        for (const auto& [peer_id, transport] : transports) {
            active.insert(peer_id);
        }
        auto candidate = selector.backfill(descriptor.peers, active, excluded);
        while (candidate) {
            Logger::instance().info(tag() + "Backfilling with peer " + candidate->peer_id);
            if (request_connect(*candidate)) {
                return true;
            }
            candidate = selector.backfill(descriptor.peers, active, excluded);
        }
        return false;
    }

    // Permanent removal; the peer's in-flight chunks return to Pending uncharged
    void remove_peer(const std::string& peer_id, const std::string& reason) {
        std::vector<uint32_t> released;
        if (planner && planner->has_peer(peer_id)) {
            for (const auto& r : planner->in_flight()) {
                if (r.peer_id == peer_id) cancel_token(r.index, r.attempt);
            }
            released = planner->remove_peer(peer_id);
        }

        auto it = transports.find(peer_id);
        if (it != transports.end()) {
            disconnect(*it->second);
            transports.erase(it);
        }
        connecting.erase(peer_id);
        connect_started.erase(peer_id);
        pending_connects.erase(std::remove_if(pending_connects.begin(), pending_connects.end(),
                                              [&](const ConnectOrder& o) { return o.peer_id == peer_id; }),
                               pending_connects.end());
        excluded.insert(peer_id);
        progress.set_peer_active(peer_id, false);
        unpin(peer_id);

        Logger::instance().warning(tag() + "Removed peer " + peer_id + " (" + reason + "), " +
                                   std::to_string(released.size()) + " chunk(s) back to Pending");
        events.publish(PeerRemoved{descriptor.file_hash, peer_id, reason});
        backfill();
    }

    void handle_failure(const ChunkRequest& request, FetchError reason) {
        cancel_token(request.index, request.attempt);
        ChunkOutcome outcome = planner->on_failure(request);
        if (outcome == ChunkOutcome::Stale) {
            return;
        }

        const ChunkState& state = planner->table().at(request.index);
        Logger::instance().warning(tag() + "Chunk " + std::to_string(request.index) + " failed on peer " +
                                   request.peer_id + ": " + to_string(reason) + " (retry " +
                                   std::to_string(state.retry_count) + "/" +
                                   std::to_string(config.scheduler.max_retries) + ")");
        events.publish(ChunkFailed{descriptor.file_hash, request.index, request.peer_id, reason,
                                   state.retry_count, outcome == ChunkOutcome::Exhausted});

        // The peer stays; its backoff keeps new work away until it may be retried
        report_failure(request.peer_id, reason);

        if (!reputation.is_healthy(request.peer_id)) {
            remove_peer(request.peer_id, "unhealthy");
        } else if (auto* scheduler = single_source ? nullptr : static_cast<ChunkScheduler*>(planner.get())) {
            scheduler->set_weight(request.peer_id, reputation.get_score(request.peer_id));
        }
    }

    void handle_success(const ChunkRequest& request, std::vector<uint8_t> data, uint64_t duration_ms,
                        SteadyTime now) {
        cancel_token(request.index, request.attempt);
        if (!part.write_at(descriptor.chunk_offset(request.index), data)) {
            fail(ErrorCode::StorageError, "cannot write chunk to " + part.path(), request.index,
                 request.peer_id);
            return;
        }
        if (planner->on_success(request) != ChunkOutcome::Accepted) {
            return;
        }

        uint64_t bytes = data.size();
        progress.on_completed(request.peer_id, bytes, now);
        bytes_by_peer[request.peer_id] += bytes;
        report(request.peer_id, TransferOutcome::Success, FetchError::Timeout, bytes, duration_ms);
        if (!single_source) {
            static_cast<ChunkScheduler*>(planner.get())->set_weight(request.peer_id,
                                                                     reputation.get_score(request.peer_id));
        }

        Logger::instance().debug(tag() + "Chunk " + std::to_string(request.index) + " completed by " +
                                 request.peer_id + " in " + std::to_string(duration_ms) + "ms");
        events.publish(ChunkCompleted{descriptor.file_hash, request.index, request.peer_id});
        ++completions_since_snapshot;
        snapshot_dirty = true;

        if (planner->table().all_completed()) {
            finish();
        }
    }

    // Every chunk is in; the whole-file check runs as a FinalizeOrder off the loop
    void finish() {
        cancel_all_tokens();
        disconnect_all();
        set_status(SessionStatus::Verifying);
        finalize_pending = true;
    }

    void complete(SteadyTime now) {
        auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(now - download_started_at);
        uint64_t duration_ms = static_cast<uint64_t>(std::max<int64_t>(0, duration.count()));
        uint64_t fetched = 0;
        for (const auto& [peer_id, bytes] : bytes_by_peer) {
            fetched += bytes;
        }
        double average = duration_ms > 0 ? static_cast<double>(fetched) * 1000.0 / duration_ms : 0.0;

        set_status(SessionStatus::Completed);
        events.publish(progress.current(now));
        events.publish(DownloadCompleted{descriptor.file_hash, options.output_path, duration_ms, average});
        Logger::instance().info("{}Completed {} in {}ms, average {:.0f} B/s", tag(), options.output_path,
                                duration_ms, average);

        for (const auto& [peer_id, bytes] : bytes_by_peer) {
            if (bytes == 0) continue;
            PaymentDue payment{descriptor.file_hash, bytes, peer_id};
            events.publish(payment);
            if (hook) hook->on_payment_due(payment);
        }

        if (snapshots) snapshots->remove(descriptor.file_hash);
        unpin_all();
    }

    void fail(ErrorCode code, const std::string& message, std::optional<uint32_t> chunk_index,
              std::optional<std::string> peer_id) {
        if (is_terminal(status)) return;

        SessionError err{code, message, chunk_index, peer_id};
        error = err;
        cancel_all_tokens();
        if (planner) planner->release_all();
        disconnect_all();
        Logger::instance().error(tag() + "Download failed: " + err.describe());

        // Kept for retry_failed or a later run unless the partial data is gone
        if (snapshots && code != ErrorCode::FileCorruption) {
            snapshots->save(make_snapshot());
        }
        set_status(SessionStatus::Failed);
        events.publish(DownloadFailed{descriptor.file_hash, err});
        unpin_all();
    }

    // Launched connects that never answered count as refused
    void expire_connects(SteadyTime now) {
        auto timeout = std::chrono::milliseconds(config.transport.connect_timeout_ms);
        std::vector<std::string> expired;
        for (const auto& [peer_id, started] : connect_started) {
            if (now - started >= timeout) {
                expired.push_back(peer_id);
            }
        }
        for (const auto& peer_id : expired) {
            if (status != SessionStatus::Downloading) return;
            Logger::instance().warning(tag() + "Connect to peer " + peer_id + " timed out after " +
                                       std::to_string(config.transport.connect_timeout_ms) + "ms");
            connecting.erase(peer_id);
            connect_started.erase(peer_id);
            report_failure(peer_id, FetchError::Timeout);
            reputation.record_uptime(peer_id, false);
            remove_peer(peer_id, "connect timed out");
        }
    }

    // Nothing in flight and no current peer can serve what is left
    void check_stall() {
        if (!connecting.empty() || !planner->in_flight().empty() || planner->can_serve_remaining()) {
            return;
        }

        if (planner->table().count(ChunkStatus::Pending) > 0) {
            if (backfill()) return;
            std::optional<uint32_t> index;
            for (const auto& c : planner->table().chunks()) {
                if (c.status == ChunkStatus::Pending) {
                    index = c.index;
                    break;
                }
            }
            fail(ErrorCode::NoPeersAvailable, "no remaining peer can serve pending chunks", index,
                 std::nullopt);
            return;
        }

        for (const auto& c : planner->table().chunks()) {
            if (c.exhausted) {
                std::optional<std::string> last_peer;
                if (!c.failed_peers.empty()) last_peer = c.failed_peers.back();
                fail(ErrorCode::RetriesExhausted,
                     std::to_string(planner->table().exhausted_count()) + " chunk(s) failed on every peer tried",
                     c.index, last_peer);
                return;
            }
        }
    }

    SessionSnapshot make_snapshot() const {
        SessionSnapshot snapshot;
        snapshot.descriptor = descriptor;
        snapshot.completed = bitmap();
        if (planner) snapshot.last_peers = planner->peer_ids();
        snapshot.output_path = options.output_path;
        snapshot.saved_at = wall_now();
        return snapshot;
    }

    bool save_snapshot(SteadyTime now) {
        if (!snapshots) return false;
        bool ok = snapshots->save(make_snapshot());
        if (ok) {
            completions_since_snapshot = 0;
            snapshot_dirty = false;
            last_snapshot_at = now;
        }
        return ok;
    }
};

DownloadSession::DownloadSession(FileDescriptor descriptor, SessionOptions options, const GlobalConfig& config,
                                 ReputationEngine& reputation, EventBus& events,
                                 SnapshotStore* snapshots, TransferHook* hook)
    : impl_(std::make_unique<Impl>(std::move(descriptor), std::move(options), config, reputation, events,
                                   snapshots, hook)) {}

DownloadSession::~DownloadSession() {
    impl_->cancel_all_tokens();
    impl_->unpin_all();
}

const std::string& DownloadSession::file_hash() const { return impl_->descriptor.file_hash; }
const FileDescriptor& DownloadSession::descriptor() const { return impl_->descriptor; }
const SessionOptions& DownloadSession::options() const { return impl_->options; }
SessionStatus DownloadSession::status() const { return impl_->status; }
const std::optional<SessionError>& DownloadSession::error() const { return impl_->error; }

void DownloadSession::start(SteadyTime now) {
    if (impl_->status != SessionStatus::Queued) {
        return;
    }
    impl_->set_status(SessionStatus::Initializing);

    if (!impl_->check_key()) {
        return;
    }

    bool had_part = impl_->part.exists();
    if (!impl_->part.open()) {
        impl_->fail(ErrorCode::StorageError, "cannot create " + impl_->part.path(), std::nullopt,
                    std::nullopt);
        return;
    }
    if (had_part) {
        uint32_t adopted = impl_->adopt_part_file(nullptr);
        Logger::instance().info(impl_->tag() + "Adopted " + std::to_string(adopted) +
                                " verified chunk(s) from " + impl_->part.path());
    }

    impl_->begin_download(now);
}

bool DownloadSession::restore(const SessionSnapshot& snapshot, SteadyTime now) {
    if (impl_->status != SessionStatus::Queued || snapshot.file_hash() != impl_->descriptor.file_hash ||
        snapshot.completed.size() != impl_->descriptor.total_chunks) {
        return false;
    }

    uint32_t adopted = 0;
    if (impl_->part.exists()) {
        adopted = impl_->adopt_part_file(&snapshot.completed);
    }
    if (!impl_->part.open()) {
        impl_->fail(ErrorCode::StorageError, "cannot open " + impl_->part.path(), std::nullopt, std::nullopt);
        return false;
    }

    impl_->last_snapshot_at = now;
    impl_->snapshot_dirty = adopted != snapshot.completed_count();
    Logger::instance().info(impl_->tag() + "Restored snapshot: " + std::to_string(adopted) + "/" +
                            std::to_string(impl_->descriptor.total_chunks) + " chunks verified, " +
                            std::to_string(snapshot.last_peers.size()) + " previous peer(s)");
    impl_->set_status(SessionStatus::Paused);
    return true;
}

SessionWork DownloadSession::tick(SteadyTime now) {
    SessionWork work;
    auto& d = *impl_;

    if (d.status == SessionStatus::Downloading) {
        d.expire_connects(now);
    }

    if (d.status == SessionStatus::Downloading && d.planner) {
        for (const auto& r : d.planner->collect_timeouts(now)) {
            d.handle_failure(r, FetchError::Timeout);
        }
    }

    if (d.status == SessionStatus::Downloading && d.planner) {
        if (d.planner->table().all_completed()) {
            d.finish();
        } else {
            WallTime wall = wall_now();
            PeerFilter accept = [&d, wall](const std::string& peer_id) {
                return !d.reputation.is_backing_off(peer_id, wall);
            };
            for (const auto& r : d.planner->next_requests(now, accept)) {
                auto it = d.transports.find(r.peer_id);
                if (it == d.transports.end()) {
                    d.planner->release(r);
                    continue;
                }
                auto token = std::make_shared<CancelToken>(d.session_token);
                d.tokens[{r.index, r.attempt}] = token;
                d.progress.on_assigned(r.peer_id);
                ChunkRange range{d.descriptor.file_hash, r.index, d.descriptor.chunk_offset(r.index),
                                 d.descriptor.chunk_length(r.index)};
                work.fetches.push_back({r, range, it->second, token});
            }
            if (work.fetches.empty()) {
                d.check_stall();
            }
        }
    }

    if (d.status == SessionStatus::Downloading || d.status == SessionStatus::Paused) {
        if (auto update = d.progress.poll(now)) {
            d.events.publish(*update);
        }
    }

    if (d.status == SessionStatus::Downloading && d.snapshots && d.snapshot_dirty &&
        (d.completions_since_snapshot >= d.config.persistence.snapshot_every_chunks ||
         now - d.last_snapshot_at >= std::chrono::seconds(d.config.persistence.snapshot_interval_sec))) {
        d.save_snapshot(now);
    }

    // Connects queued while paused go out with the first tick after resume
    if (d.status == SessionStatus::Downloading) {
        for (auto& order : d.pending_connects) {
            d.connect_started[order.peer_id] = now;
            work.connects.push_back(std::move(order));
        }
        d.pending_connects.clear();
    }

    if (d.status == SessionStatus::Verifying && d.finalize_pending) {
        d.finalize_pending = false;
        work.finalize = FinalizeOrder{d.descriptor, d.options.output_path, d.options.decryption_key};
    }
    return work;
}

void DownloadSession::on_connect_result(const std::string& peer_id, bool ok, SteadyTime now) {
    auto& d = *impl_;
    if (!d.connecting.erase(peer_id) || is_terminal(d.status)) {
        return;
    }
    std::optional<SteadyTime> started;
    auto it = d.connect_started.find(peer_id);
    if (it != d.connect_started.end()) {
        started = it->second;
        d.connect_started.erase(it);
    }

    d.reputation.record_uptime(peer_id, ok);
    if (!ok) {
        d.report_failure(peer_id, FetchError::PeerRefused);
        d.remove_peer(peer_id, "connect failed");
        return;
    }
    if (started && now > *started) {
        d.reputation.record_latency(peer_id, std::chrono::duration<double, std::milli>(now - *started).count());
    }

    const CandidatePeer* candidate = d.find_candidate(peer_id);
    if (!candidate || !d.planner) {
        return;
    }
    double score = d.reputation.get_score(peer_id);
    d.planner->add_peer(*candidate, score);
    d.progress.set_peer_active(peer_id, true);
    Logger::instance().info(d.tag() + "Peer " + peer_id + " connected (score " +
                            std::to_string(static_cast<int>(score)) + ", " +
                            to_string(d.reputation.get_trust_level(peer_id)) + ")");
}

void DownloadSession::on_fetch_result(const ChunkRequest& request, FetchResult result, uint64_t duration_ms,
                                      SteadyTime now) {
    auto& d = *impl_;
    d.tokens.erase({request.index, request.attempt});
    if (d.status != SessionStatus::Downloading || !d.planner || request.index >= d.descriptor.total_chunks) {
        return;
    }

    const ChunkState& state = d.planner->table().at(request.index);
    if (state.status != ChunkStatus::InFlight || state.attempt != request.attempt ||
        state.assigned_peer != request.peer_id) {
        Logger::instance().debug(d.tag() + "Dropping stale result for chunk " + std::to_string(request.index) +
                                 " attempt " + std::to_string(request.attempt) + " from " + request.peer_id);
        return;
    }

    if (!result.ok()) {
        d.handle_failure(request, *result.error);
        return;
    }
    if (!d.verifier.verify_chunk(request.index, result.data)) {
        d.handle_failure(request, FetchError::Corrupt);
        return;
    }
    d.handle_success(request, std::move(result.data), duration_ms, now);
}

void DownloadSession::on_finalize_result(const FinalizeResult& result, SteadyTime now) {
    auto& d = *impl_;
    if (d.status != SessionStatus::Verifying) {
        return;
    }
    if (result.code == ErrorCode::FileCorruption) {
        if (d.snapshots) d.snapshots->remove(d.descriptor.file_hash);
    }
    if (result.code != ErrorCode::Success) {
        d.fail(result.code, result.message, std::nullopt, std::nullopt);
        return;
    }
    d.complete(now);
}

FinalizeResult FinalizeOrder::run() const {
    PartFile part(output_path, descriptor.size);
    IntegrityVerifier verifier(descriptor);

    ErrorCode verified = verifier.verify_file(part.path());
    if (verified == ErrorCode::FileCorruption) {
        part.discard();
        return {ErrorCode::FileCorruption, "assembled file does not match " +
                (descriptor.manifest.scheme == IntegrityScheme::MerkleRoot ? std::string("merkle root")
                                                                           : std::string("file hash"))};
    }
    if (verified != ErrorCode::Success) {
        return {verified, "cannot read " + part.path()};
    }

    if (descriptor.encrypted) {
        std::string decrypted = output_path + ".dec";
        ErrorCode ec = decrypt_file(part.path(), decrypted, decryption_key);
        if (ec != ErrorCode::Success) {
            std::error_code rm;
            std::filesystem::remove(decrypted, rm);
            return {ec, "cannot decrypt " + part.path()};
        }
        std::error_code mv;
        std::filesystem::rename(decrypted, output_path, mv);
        if (mv) {
            return {ErrorCode::StorageError, "cannot move decrypted file: " + mv.message()};
        }
        part.discard();
    } else if (!part.promote()) {
        return {ErrorCode::StorageError, "cannot promote " + part.path()};
    }
    return {};
}

bool DownloadSession::pause(SteadyTime now) {
    auto& d = *impl_;
    if (d.status != SessionStatus::Downloading) {
        return false;
    }
    d.cancel_all_tokens();
    if (d.planner) {
        auto released = d.planner->release_all();
        Logger::instance().info(d.tag() + "Paused, " + std::to_string(released.size()) +
                                " in-flight chunk(s) released");
    }
    d.set_status(SessionStatus::Paused);
    d.save_snapshot(now);
    return true;
}

bool DownloadSession::resume(SteadyTime now) {
    auto& d = *impl_;
    if (d.status != SessionStatus::Paused) {
        return false;
    }
    if (!d.planner) {
        if (!d.check_key()) {
            return false;
        }
        d.begin_download(now);
        return d.status == SessionStatus::Downloading;
    }
    d.set_status(SessionStatus::Downloading);
    // Connects launched before the pause get a fresh deadline
    for (auto& [peer_id, started] : d.connect_started) {
        started = now;
    }
    if (d.transports.empty()) {
        d.backfill();
    }
    return true;
}

void DownloadSession::cancel() {
    auto& d = *impl_;
    if (is_terminal(d.status)) {
        return;
    }
    if (d.status == SessionStatus::Verifying) {
        // The part file belongs to the finalize step now
        Logger::instance().warning(d.tag() + "Cannot cancel while verifying");
        return;
    }
    d.session_token->cancel();
    d.cancel_all_tokens();
    if (d.planner) d.planner->release_all();
    d.disconnect_all();
    if (!d.config.persistence.keep_verified_on_cancel) {
        d.part.discard();
    }
    if (d.snapshots) d.snapshots->remove(d.descriptor.file_hash);
    d.set_status(SessionStatus::Canceled);
    d.unpin_all();
}

size_t DownloadSession::retry_failed(SteadyTime now) {
    auto& d = *impl_;
    if (!d.planner) {
        return 0;
    }
    if (d.status == SessionStatus::Failed) {
        ErrorCode code = d.error ? d.error->code : ErrorCode::Success;
        if (code != ErrorCode::RetriesExhausted && code != ErrorCode::NoPeersAvailable &&
            code != ErrorCode::InsufficientReputationPeers) {
            Logger::instance().warning(d.tag() + "Cannot retry a session that failed with " + to_string(code));
            return 0;
        }
    } else if (!d.is_active_state()) {
        return 0;
    }

    size_t reset = d.planner->reset_exhausted();
    d.excluded.clear();
    Logger::instance().info(d.tag() + "Retrying " + std::to_string(reset) + " failed chunk(s)");

    if (d.status == SessionStatus::Failed) {
        d.error.reset();
        d.set_status(SessionStatus::Initializing);
        d.begin_download(now);
    } else if (d.status == SessionStatus::Downloading) {
        d.backfill();
    }
    return reset;
}

bool DownloadSession::disconnect_peer(const std::string& peer_id, SteadyTime /*now*/) {
    auto& d = *impl_;
    if (!d.transports.count(peer_id)) {
        return false;
    }
    d.remove_peer(peer_id, "disconnected");
    return true;
}

ChunkScheduler* DownloadSession::scheduler() {
    if (!impl_->planner || impl_->single_source) {
        return nullptr;
    }
    return static_cast<ChunkScheduler*>(impl_->planner.get());
}

const ChunkPlanner* DownloadSession::planner() const {
    return impl_->planner.get();
}

bool DownloadSession::is_single_source() const {
    return impl_->planner && impl_->single_source;
}

std::vector<std::string> DownloadSession::active_peers() const {
    return impl_->planner ? impl_->planner->peer_ids() : std::vector<std::string>{};
}

std::vector<bool> DownloadSession::completion_bitmap() const {
    return impl_->bitmap();
}

ProgressUpdate DownloadSession::progress(SteadyTime now) {
    return impl_->progress.current(now);
}

std::vector<PeerProgress> DownloadSession::peer_progress(SteadyTime now) {
    return impl_->progress.peers(now);
}

SessionSnapshot DownloadSession::make_snapshot() const {
    return impl_->make_snapshot();
}

bool DownloadSession::save_snapshot() {
    return impl_->save_snapshot(std::chrono::steady_clock::now());
}

} // namespace meshload

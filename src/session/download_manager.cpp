#include "meshload/session/download_manager.h"
#include "meshload/base/logger.h"
#include "meshload/session/download_session.h"
#include "meshload/transport/transport.h"
#include <elio/time/timer.hpp>
#include <atomic>
#include <condition_variable>
#include <deque>
#include <filesystem>
#include <functional>
#include <map>
#include <mutex>
#include <set>
#include <thread>

namespace meshload {

namespace {

// Work for the loop thread, posted from callers and from finished coroutines
class Mailbox {
public:
    void post(std::function<void()> fn) {
        std::lock_guard<std::mutex> lock(mutex_);
        queue_.push_back(std::move(fn));
    }

    std::deque<std::function<void()>> drain() {
        std::lock_guard<std::mutex> lock(mutex_);
        std::deque<std::function<void()>> out;
        out.swap(queue_);
        return out;
    }

private:
    std::mutex mutex_;
    std::deque<std::function<void()>> queue_;
};

// One thread for blocking file work (whole-file hashing, decryption, promotion)
class BlockingWorker {
public:
    ~BlockingWorker() {
        stop();
    }

    void start() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stopping_ = false;
        }
        thread_ = std::thread([this]() { run(); });
    }

    // Jobs already queued still run before the thread exits
    void stop() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stopping_ = true;
        }
        cv_.notify_all();
        if (thread_.joinable()) {
            thread_.join();
        }
    }

    void post(std::function<void()> job) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            jobs_.push_back(std::move(job));
        }
        cv_.notify_one();
    }

private:
    void run() {
        while (true) {
            std::function<void()> job;
            {
                std::unique_lock<std::mutex> lock(mutex_);
                cv_.wait(lock, [this]() { return stopping_ || !jobs_.empty(); });
                if (jobs_.empty()) {
                    return;
                }
                job = std::move(jobs_.front());
                jobs_.pop_front();
            }
            try {
                job();
            } catch (const std::exception& e) {
                Logger::instance().error("Blocking job failed: " + std::string(e.what()));
            }
        }
    }

    std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<std::function<void()>> jobs_;
    bool stopping_ = false;
    std::thread thread_;
};

bool is_settled(SessionStatus status) {
    return is_terminal(status) || status == SessionStatus::Paused;
}

uint64_t elapsed_ms(SteadyTime since) {
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - since).count());
}

// The coroutines below hold only shared state; results are applied on the loop thread.

elio::coro::task<void> resolve_task(std::shared_ptr<DescriptorResolver> resolver,
                                    std::shared_ptr<Mailbox> mailbox, std::string file_hash,
                                    std::chrono::milliseconds timeout,
                                    std::function<void(ResolveResult)> done) {
    ResolveResult result;
    try {
        result = co_await resolver->resolve(file_hash, timeout);
    } catch (const std::exception& e) {
        result.error = ErrorCode::InternalError;
        result.message = e.what();
    }
    mailbox->post([done = std::move(done), result = std::move(result)]() mutable {
        done(std::move(result));
    });
}

elio::coro::task<void> connect_task(std::shared_ptr<Transport> transport, std::shared_ptr<Mailbox> mailbox,
                                    std::function<void(bool)> done) {
    bool ok = false;
    try {
        ok = co_await meshload::connect(*transport);
    } catch (const std::exception& e) {
        Logger::instance().warning("Connect to " + peer_id_of(*transport) + " threw: " + e.what());
    }
    mailbox->post([done = std::move(done), ok]() { done(ok); });
}

elio::coro::task<void> fetch_task(FetchOrder order, std::shared_ptr<Mailbox> mailbox,
                                  std::function<void(FetchResult, uint64_t)> done) {
    auto started = std::chrono::steady_clock::now();
    FetchResult result;
    try {
        result = co_await fetch_chunk(*order.transport, order.range, order.cancel);
    } catch (const std::exception& e) {
        Logger::instance().warning("Fetch of chunk " + std::to_string(order.range.index) + " threw: " + e.what());
        result = FetchResult::failure(FetchError::ConnectionLost);
    }
    uint64_t duration = elapsed_ms(started);
    mailbox->post([done = std::move(done), result = std::move(result), duration]() mutable {
        done(std::move(result), duration);
    });
}

} // anonymous namespace

struct DownloadManager::Impl {
    struct Entry {
        std::string file_hash;
        DownloadRequest request;
        uint64_t sequence = 0;
        std::unique_ptr<DownloadSession> session;
        bool resolving = false;
        SessionStatus status = SessionStatus::Queued;   // until a session exists
        std::optional<SessionError> error;
    };

    GlobalConfig config;
    ReputationEngine& reputation;
    std::shared_ptr<DescriptorResolver> resolver;
    EventBus bus;
    SnapshotStore snapshots;
    TransferHook* hook = nullptr;

    std::shared_ptr<Mailbox> mailbox = std::make_shared<Mailbox>();
    BlockingWorker worker;
    std::map<std::string, Entry> entries;   // loop thread only
    uint64_t next_sequence = 0;

    mutable std::mutex cache_mutex;
    mutable std::condition_variable cache_cv;
    std::map<std::string, SessionInfo> cache;
    std::set<std::string> pending;          // posted to the loop but not yet materialized

    std::atomic<bool> running{false};
    std::atomic<bool> loop_exited{true};
    std::thread loop_thread;

    Impl(const GlobalConfig& cfg, ReputationEngine& rep, std::shared_ptr<DescriptorResolver> res)
        : config(cfg), reputation(rep), resolver(std::move(res)), snapshots(cfg.persistence) {}

    std::string output_path_for(const FileDescriptor& descriptor, const DownloadRequest& request) const {
        if (!request.output_path.empty()) {
            return request.output_path;
        }
        std::string name = descriptor.file_name.empty() ? descriptor.file_hash : descriptor.file_name;
        // Never let a manifest place the file outside the output directory
        name = std::filesystem::path(name).filename().string();
        if (name.empty() || name == "." || name == "..") {
            name = descriptor.file_hash;
        }
        return (std::filesystem::path(config.download.output_dir) / name).string();
    }

    Entry* find(const std::string& file_hash) {
        auto it = entries.find(file_hash);
        return it == entries.end() ? nullptr : &it->second;
    }

    std::unique_ptr<DownloadSession> make_session(const FileDescriptor& descriptor, const DownloadRequest& request) {
        SessionOptions options{output_path_for(descriptor, request), request.decryption_key};
        return std::make_unique<DownloadSession>(descriptor, std::move(options), config, reputation, bus,
                                                 &snapshots, hook);
    }

    void on_resolved(const std::string& file_hash, ResolveResult result) {
        Entry* entry = find(file_hash);
        if (!entry || !entry->resolving) {
            return;
        }
        entry->resolving = false;
        if (entry->status == SessionStatus::Canceled) {
            return;
        }

        if (!result.ok()) {
            SessionError err{result.error, result.message, std::nullopt, std::nullopt};
            entry->status = SessionStatus::Failed;
            entry->error = err;
            Logger::instance().error("Cannot resolve " + file_hash + ": " + err.describe());
            bus.publish(DownloadFailed{file_hash, err});
            return;
        }

        entry->session = make_session(*result.descriptor, entry->request);
        entry->session->start(std::chrono::steady_clock::now());
    }

    size_t active_count() const {
        size_t active = 0;
        for (const auto& [hash, entry] : entries) {
            if (entry.resolving) {
                ++active;
            } else if (entry.session) {
                auto s = entry.session->status();
                if (s == SessionStatus::Initializing || s == SessionStatus::Downloading ||
                    s == SessionStatus::Verifying) {
                    ++active;
                }
            }
        }
        return active;
    }

    void activate_queued() {
        while (active_count() < config.download.max_concurrent_downloads) {
            Entry* next = nullptr;
            for (auto& [hash, entry] : entries) {
                if (!entry.session && !entry.resolving && entry.status == SessionStatus::Queued &&
                    (!next || entry.sequence < next->sequence)) {
                    next = &entry;
                }
            }
            if (!next) {
                return;
            }

            next->resolving = true;
            std::string file_hash = next->file_hash;
            Logger::instance().info("Resolving descriptor for " + file_hash);
            (void)resolve_task(resolver, mailbox, file_hash,
                               std::chrono::milliseconds(config.download.resolve_timeout_ms),
                               [this, file_hash](ResolveResult result) {
                                   on_resolved(file_hash, std::move(result));
                               }).spawn();
        }
    }

    void launch(const std::string& file_hash, SessionWork work) {
        for (auto& order : work.connects) {
            std::string peer_id = order.peer_id;
            (void)connect_task(order.transport, mailbox, [this, file_hash, peer_id](bool ok) {
                Entry* entry = find(file_hash);
                if (entry && entry->session) {
                    entry->session->on_connect_result(peer_id, ok, std::chrono::steady_clock::now());
                }
            }).spawn();
        }

        for (auto& order : work.fetches) {
            ChunkRequest request = order.request;
            (void)fetch_task(std::move(order), mailbox,
                             [this, file_hash, request](FetchResult result, uint64_t duration_ms) {
                                 Entry* entry = find(file_hash);
                                 if (entry && entry->session) {
                                     entry->session->on_fetch_result(request, std::move(result), duration_ms,
                                                                     std::chrono::steady_clock::now());
                                 }
                             }).spawn();
        }

        if (work.finalize) {
            Logger::instance().info("Verifying " + file_hash);
            worker.post([this, file_hash, order = std::move(*work.finalize), box = mailbox]() {
                FinalizeResult result = order.run();
                box->post([this, file_hash, result]() {
                    Entry* entry = find(file_hash);
                    if (entry && entry->session) {
                        entry->session->on_finalize_result(result, std::chrono::steady_clock::now());
                    }
                });
            });
        }
    }

    void refresh_cache(SteadyTime now) {
        std::map<std::string, SessionInfo> fresh;
        for (auto& [hash, entry] : entries) {
            SessionInfo info;
            info.file_hash = hash;
            if (entry.session) {
                info.file_name = entry.session->descriptor().file_name;
                info.status = entry.session->status();
                info.progress = entry.session->progress(now);
                info.peer_progress = entry.session->peer_progress(now);
                info.peers = entry.session->active_peers();
                info.error = entry.session->error();
                info.output_path = entry.session->options().output_path;
            } else {
                info.status = entry.status;
                info.error = entry.error;
                info.output_path = entry.request.output_path;
                info.progress.file_hash = hash;
            }
            fresh.emplace(hash, std::move(info));
        }

        {
            std::lock_guard<std::mutex> lock(cache_mutex);
            // Entries posted by callers but not yet seen by the loop stay visible
            for (auto& [hash, info] : cache) {
                if (!fresh.count(hash) && pending.count(hash)) {
                    fresh.emplace(hash, info);
                }
            }
            cache.swap(fresh);
        }
        cache_cv.notify_all();
    }

    void materialized(const std::string& file_hash) {
        std::lock_guard<std::mutex> lock(cache_mutex);
        pending.erase(file_hash);
    }

    void process_mailbox() {
        auto jobs = mailbox->drain();
        for (auto& job : jobs) {
            try {
                job();
            } catch (const std::exception& e) {
                Logger::instance().error("Download manager job failed: " + std::string(e.what()));
            }
        }
    }

    elio::coro::task<void> run_loop() {
        Logger::instance().info("Download manager loop started");
        while (running) {
            process_mailbox();
            activate_queued();

            auto now = std::chrono::steady_clock::now();
            for (auto& [hash, entry] : entries) {
                if (entry.session) {
                    launch(hash, entry.session->tick(now));
                }
            }
            refresh_cache(now);

            co_await elio::time::sleep_for(std::chrono::milliseconds(config.download.loop_interval_ms));
        }

        // Leave resumable state behind for sessions still downloading
        process_mailbox();
        auto now = std::chrono::steady_clock::now();
        for (auto& [hash, entry] : entries) {
            if (entry.session && entry.session->status() == SessionStatus::Downloading) {
                entry.session->pause(now);
            }
        }
        refresh_cache(now);
        Logger::instance().info("Download manager loop stopped");
        co_return;
    }
};

DownloadManager::DownloadManager(const GlobalConfig& config, ReputationEngine& reputation,
                                 std::shared_ptr<DescriptorResolver> resolver)
    : impl_(std::make_shared<Impl>(config, reputation, std::move(resolver))) {}

DownloadManager::~DownloadManager() {
    stop();
}

bool DownloadManager::start() {
    if (impl_->running) {
        Logger::instance().warning("Download manager already running");
        return false;
    }
    if (!impl_->resolver) {
        Logger::instance().error("Download manager needs a descriptor resolver");
        return false;
    }

    impl_->running = true;
    impl_->loop_exited = false;
    impl_->worker.start();
    // The loop keeps its own reference so a detached loop never outlives Impl
    impl_->loop_thread = std::thread([self = impl_]() {
        elio::run(self->run_loop());
        self->loop_exited = true;
    });

    Logger::instance().info("Download manager started (max " +
                            std::to_string(impl_->config.download.max_concurrent_downloads) +
                            " concurrent downloads)");
    return true;
}

void DownloadManager::stop() {
    if (!impl_->running) {
        return;
    }
    Logger::instance().info("Stopping download manager");
    impl_->running = false;

    if (impl_->loop_thread.joinable()) {
        constexpr auto timeout = std::chrono::seconds(5);
        auto start = std::chrono::steady_clock::now();
        while (!impl_->loop_exited) {
            if (std::chrono::steady_clock::now() - start >= timeout) {
                break;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        if (impl_->loop_exited) {
            impl_->loop_thread.join();
        } else {
            Logger::instance().warning("Download manager thread join timeout, detaching");
            impl_->loop_thread.detach();
        }
    }
    impl_->worker.stop();
    Logger::instance().info("Download manager stopped");
}

bool DownloadManager::is_running() const {
    return impl_->running.load();
}

bool DownloadManager::enqueue(const std::string& file_hash, DownloadRequest request) {
    if (file_hash.empty()) {
        return false;
    }
    {
        std::lock_guard<std::mutex> lock(impl_->cache_mutex);
        if (impl_->cache.count(file_hash)) {
            Logger::instance().warning("Download already managed: " + file_hash);
            return false;
        }
        SessionInfo info;
        info.file_hash = file_hash;
        info.progress.file_hash = file_hash;
        info.output_path = request.output_path;
        impl_->cache.emplace(file_hash, std::move(info));
        impl_->pending.insert(file_hash);
    }

    Impl* d = impl_.get();
    impl_->mailbox->post([d, file_hash, request = std::move(request)]() mutable {
        d->materialized(file_hash);
        if (d->entries.count(file_hash)) {
            return;
        }
        Impl::Entry entry;
        entry.file_hash = file_hash;
        entry.request = std::move(request);
        entry.sequence = d->next_sequence++;
        d->entries.emplace(file_hash, std::move(entry));
    });
    Logger::instance().info("Queued download " + file_hash);
    return true;
}

namespace {

template <typename Fn>
bool post_command(std::mutex& cache_mutex, const std::map<std::string, SessionInfo>& cache,
                  const std::shared_ptr<Mailbox>& mailbox, const std::string& file_hash, Fn fn) {
    {
        std::lock_guard<std::mutex> lock(cache_mutex);
        if (!cache.count(file_hash)) {
            return false;
        }
    }
    mailbox->post(std::move(fn));
    return true;
}

} // anonymous namespace

bool DownloadManager::pause(const std::string& file_hash) {
    Impl* d = impl_.get();
    return post_command(d->cache_mutex, d->cache, d->mailbox, file_hash, [d, file_hash]() {
        auto* entry = d->find(file_hash);
        if (entry && entry->session) {
            entry->session->pause(std::chrono::steady_clock::now());
        }
    });
}

bool DownloadManager::resume(const std::string& file_hash) {
    Impl* d = impl_.get();
    {
        // Not settled until the loop has applied the command
        std::lock_guard<std::mutex> lock(d->cache_mutex);
        auto it = d->cache.find(file_hash);
        if (it == d->cache.end()) {
            return false;
        }
        if (it->second.status == SessionStatus::Paused) {
            it->second.status = SessionStatus::Initializing;
        }
    }
    d->mailbox->post([d, file_hash]() {
        auto* entry = d->find(file_hash);
        if (entry && entry->session) {
            entry->session->resume(std::chrono::steady_clock::now());
        }
    });
    return true;
}

bool DownloadManager::cancel(const std::string& file_hash) {
    Impl* d = impl_.get();
    return post_command(d->cache_mutex, d->cache, d->mailbox, file_hash, [d, file_hash]() {
        auto* entry = d->find(file_hash);
        if (!entry) {
            return;
        }
        if (entry->session) {
            entry->session->cancel();
        } else if (!is_terminal(entry->status)) {
            entry->status = SessionStatus::Canceled;
            Logger::instance().info("Canceled queued download " + file_hash);
        }
    });
}

bool DownloadManager::retry_failed(const std::string& file_hash) {
    Impl* d = impl_.get();
    return post_command(d->cache_mutex, d->cache, d->mailbox, file_hash, [d, file_hash]() {
        auto* entry = d->find(file_hash);
        if (!entry) {
            return;
        }
        if (entry->session) {
            entry->session->retry_failed(std::chrono::steady_clock::now());
        } else if (entry->status == SessionStatus::Failed) {
            // Resolution failed; try again from the queue
            entry->status = SessionStatus::Queued;
            entry->error.reset();
        }
    });
}

bool DownloadManager::remove(const std::string& file_hash) {
    Impl* d = impl_.get();
    return post_command(d->cache_mutex, d->cache, d->mailbox, file_hash, [d, file_hash]() {
        auto* entry = d->find(file_hash);
        if (entry && entry->session && !is_terminal(entry->session->status())) {
            entry->session->cancel();
        }
        d->snapshots.remove(file_hash);
        d->entries.erase(file_hash);
        {
            std::lock_guard<std::mutex> lock(d->cache_mutex);
            d->cache.erase(file_hash);
            d->pending.erase(file_hash);
        }
        d->cache_cv.notify_all();
        Logger::instance().info("Removed download " + file_hash);
    });
}

size_t DownloadManager::restore_snapshots(const std::vector<uint8_t>& decryption_key) {
    auto restored = impl_->snapshots.load_all(std::chrono::system_clock::now());
    size_t count = 0;

    for (auto& snapshot : restored) {
        std::string file_hash = snapshot.file_hash();
        {
            std::lock_guard<std::mutex> lock(impl_->cache_mutex);
            if (impl_->cache.count(file_hash)) {
                continue;
            }
            SessionInfo info;
            info.file_hash = file_hash;
            info.file_name = snapshot.descriptor.file_name;
            info.status = SessionStatus::Paused;
            info.progress.file_hash = file_hash;
            info.output_path = snapshot.output_path;
            impl_->cache.emplace(file_hash, std::move(info));
            impl_->pending.insert(file_hash);
        }

        Impl* d = impl_.get();
        impl_->mailbox->post([d, snapshot = std::move(snapshot), decryption_key]() {
            std::string file_hash = snapshot.file_hash();
            d->materialized(file_hash);
            if (d->entries.count(file_hash)) {
                return;
            }
            DownloadRequest request;
            request.output_path = snapshot.output_path;
            if (snapshot.descriptor.encrypted) {
                request.decryption_key = decryption_key;
            }
            auto session = d->make_session(snapshot.descriptor, request);
            if (!session->restore(snapshot, std::chrono::steady_clock::now())) {
                Logger::instance().warning("Could not restore session " + file_hash);
                {
                    std::lock_guard<std::mutex> lock(d->cache_mutex);
                    d->cache.erase(file_hash);
                }
                d->cache_cv.notify_all();
                return;
            }
            Impl::Entry entry;
            entry.file_hash = file_hash;
            entry.request = request;
            entry.sequence = d->next_sequence++;
            entry.session = std::move(session);
            d->entries.emplace(file_hash, std::move(entry));
        });
        ++count;
    }

    Logger::instance().info("Restoring " + std::to_string(count) + " paused download(s) from snapshots");
    return count;
}

std::optional<SessionInfo> DownloadManager::status(const std::string& file_hash) const {
    std::lock_guard<std::mutex> lock(impl_->cache_mutex);
    auto it = impl_->cache.find(file_hash);
    if (it == impl_->cache.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<SessionInfo> DownloadManager::list() const {
    std::lock_guard<std::mutex> lock(impl_->cache_mutex);
    std::vector<SessionInfo> out;
    out.reserve(impl_->cache.size());
    for (const auto& [hash, info] : impl_->cache) {
        out.push_back(info);
    }
    return out;
}

bool DownloadManager::wait_idle(std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(impl_->cache_mutex);
    return impl_->cache_cv.wait_for(lock, timeout, [this]() {
        for (const auto& [hash, info] : impl_->cache) {
            if (!is_settled(info.status)) {
                return false;
            }
        }
        return true;
    });
}

EventBus& DownloadManager::events() {
    return impl_->bus;
}

void DownloadManager::set_transfer_hook(TransferHook* hook) {
    impl_->hook = hook;
}

} // namespace meshload

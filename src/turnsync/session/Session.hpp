#pragma once

#include "core/Error.hpp"
#include "core/Value.hpp"
#include "delta/Delta.hpp"
#include "replay/SnapshotManager.hpp"
#include "storage/SessionArchive.hpp"
#include "turn/TurnSequencer.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace TS {

struct SessionOptions {
    // Sessions without activity for this long may be evicted; 0 disables eviction.
    std::chrono::milliseconds idleEviction{0};
};

// Notified on the session's worker thread after each turn outcome.
class SessionObserver {
public:
    virtual ~SessionObserver() = default;

    virtual void onTurnCommitted(std::string const& sessionId, CommitResult const& result) = 0;
    virtual void onTurnRolledBack(std::string const& sessionId, std::uint64_t turn, Error const& error) = 0;
};

/**
 * One game session. All mutation runs on a single worker thread that drains a job
 * queue, so deltas from many connections are applied one at a time and in arrival
 * order. Writers get a std::future for the outcome; readers use the immutable
 * History published after each commit and never wait on the worker.
 *
 * When SequencerOptions::turnTimeout is set, a turn that has been open that long
 * with deltas pending or buffered is force-closed by the worker.
 */
class Session {
public:
    Session(SessionMetadata metadata, std::unique_ptr<TurnSequencer> sequencer, SessionObserver* observer = nullptr);
    ~Session();

    Session(Session const&)            = delete;
    Session& operator=(Session const&) = delete;

    [[nodiscard]] static auto create(SessionMetadata metadata,
                                     Value initialState,
                                     SequencerOptions options,
                                     SnapshotPolicy policy,
                                     SessionObserver* observer = nullptr) -> std::unique_ptr<Session>;
    [[nodiscard]] static auto restore(SessionArchive archive,
                                      SequencerOptions options,
                                      SnapshotPolicy policy,
                                      SessionObserver* observer = nullptr) -> Expected<std::unique_ptr<Session>>;

    [[nodiscard]] auto id() const -> std::string const& { return id_; }

    [[nodiscard]] auto submit(Delta delta) -> std::future<Expected<TurnSequencer::Submitted>>;
    [[nodiscard]] auto closeTurn() -> std::future<Expected<CommitResult>>;
    [[nodiscard]] auto commitBatch(TurnDeltas batch) -> std::future<Expected<CommitResult>>;
    [[nodiscard]] auto forceClose() -> std::future<Expected<CommitResult>>;

    // Stops accepting work, drains queued jobs and joins the worker. Idempotent.
    void shutdown();
    [[nodiscard]] auto isClosed() const -> bool { return stopping_.load(); }

    [[nodiscard]] auto history() const -> std::shared_ptr<const History>;
    [[nodiscard]] auto currentTurn() const -> std::uint64_t;
    [[nodiscard]] auto state() const -> Value;
    [[nodiscard]] auto stateAt(std::uint64_t turn) const -> Expected<Value>;
    [[nodiscard]] auto metadata() const -> SessionMetadata;
    [[nodiscard]] auto archive() const -> SessionArchive;

    [[nodiscard]] auto idleFor(std::chrono::steady_clock::time_point now) const -> std::chrono::milliseconds;

private:
    template <typename T>
    auto post(std::function<Expected<T>(TurnSequencer&)> job) -> std::future<Expected<T>>;

    void run();
    // Timeout path of the worker loop.
    void expireTurn();
    void touch();
    auto finishTurn(Expected<CommitResult> result, std::uint64_t turn) -> Expected<CommitResult>;

    std::string                      id_;
    std::unique_ptr<TurnSequencer>   sequencer_;
    SessionObserver*                 observer_;

    mutable std::mutex               metadataMutex_;
    SessionMetadata                  metadata_;

    std::mutex                       queueMutex_;
    std::condition_variable          queueCv_;
    std::deque<std::function<void()>> jobs_;
    std::atomic<bool>                stopping_{false};
    std::atomic<std::int64_t>        lastActivityMs_{0};
    // Worker-thread only.
    std::chrono::steady_clock::time_point turnOpenedAt_;
    std::jthread                     worker_;
};

} // namespace TS

#include "session/Session.hpp"

#include "core/Identifiers.hpp"
#include "log/TaggedLogger.hpp"

namespace TS {

namespace {

auto steadyMillis(std::chrono::steady_clock::time_point tp) -> std::int64_t {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

auto closedError(std::string const& id) -> Error {
    return Error{Error::Code::SessionClosed, "session " + id + " is closed"};
}

} // namespace

Session::Session(SessionMetadata metadata, std::unique_ptr<TurnSequencer> sequencer, SessionObserver* observer)
    : id_(metadata.id),
      sequencer_(std::move(sequencer)),
      observer_(observer),
      metadata_(std::move(metadata)),
      turnOpenedAt_(std::chrono::steady_clock::now()) {
    metadata_.currentTurn = sequencer_->lastCommittedTurn();
    touch();
    worker_ = std::jthread([this] { run(); });
}

Session::~Session() {
    shutdown();
}

auto Session::create(SessionMetadata metadata,
                     Value initialState,
                     SequencerOptions options,
                     SnapshotPolicy policy,
                     SessionObserver* observer) -> std::unique_ptr<Session> {
    auto sequencer = std::make_unique<TurnSequencer>(std::move(initialState), options, policy);
    metadata.stats.totalSnapshots = 1;
    return std::make_unique<Session>(std::move(metadata), std::move(sequencer), observer);
}

auto Session::restore(SessionArchive archive,
                      SequencerOptions options,
                      SnapshotPolicy policy,
                      SessionObserver* observer) -> Expected<std::unique_ptr<Session>> {
    auto snapshots = SnapshotManager::restore(std::move(archive.snapshots), std::move(archive.log), policy);
    if (!snapshots) {
        return std::unexpected(snapshots.error());
    }
    auto sequencer = std::make_unique<TurnSequencer>(std::move(*snapshots), options);
    ts_log("Restored session " + archive.metadata.id + " at turn " + std::to_string(sequencer->lastCommittedTurn()),
           "Session");
    return std::make_unique<Session>(std::move(archive.metadata), std::move(sequencer), observer);
}

template <typename T>
auto Session::post(std::function<Expected<T>(TurnSequencer&)> job) -> std::future<Expected<T>> {
    auto promise = std::make_shared<std::promise<Expected<T>>>();
    auto future  = promise->get_future();
    touch();
    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        if (!stopping_) {
            jobs_.push_back([this, promise, job = std::move(job)] {
                try {
                    promise->set_value(job(*sequencer_));
                } catch (...) {
                    ts_log("Exception in session " + id_ + " job", "Session", "Error");
                    promise->set_exception(std::current_exception());
                }
            });
            queueCv_.notify_one();
            return future;
        }
    }
    promise->set_value(std::unexpected(closedError(id_)));
    return future;
}

auto Session::submit(Delta delta) -> std::future<Expected<TurnSequencer::Submitted>> {
    return post<TurnSequencer::Submitted>(
            [delta = std::move(delta)](TurnSequencer& sequencer) mutable { return sequencer.submit(std::move(delta)); });
}

auto Session::closeTurn() -> std::future<Expected<CommitResult>> {
    return post<CommitResult>([this](TurnSequencer& sequencer) {
        auto const turn = sequencer.openTurn();
        return finishTurn(sequencer.closeTurn(), turn);
    });
}

auto Session::commitBatch(TurnDeltas batch) -> std::future<Expected<CommitResult>> {
    return post<CommitResult>([this, batch = std::move(batch)](TurnSequencer& sequencer) mutable {
        auto const turn = sequencer.openTurn();
        return finishTurn(sequencer.commitBatch(std::move(batch)), turn);
    });
}

auto Session::forceClose() -> std::future<Expected<CommitResult>> {
    return post<CommitResult>([this](TurnSequencer& sequencer) {
        auto const turn = sequencer.openTurn();
        return finishTurn(sequencer.forceClose(), turn);
    });
}

auto Session::finishTurn(Expected<CommitResult> result, std::uint64_t turn) -> Expected<CommitResult> {
    if (!result) {
        if (result.error().code == Error::Code::IntegrityError && observer_) {
            observer_->onTurnRolledBack(id_, turn, result.error());
        }
        return result;
    }
    {
        std::lock_guard<std::mutex> lock(metadataMutex_);
        metadata_.currentTurn      = result->batch.turn;
        metadata_.updatedAt        = nowTimestamp();
        metadata_.stats.totalTurns = result->batch.turn;
        metadata_.stats.totalDeltas += result->batch.deltas.size();
        metadata_.stats.rejectedDeltas += result->rejected.size();
        if (result->snapshotTaken) {
            metadata_.stats.totalSnapshots += 1;
        }
    }
    turnOpenedAt_ = std::chrono::steady_clock::now();
    if (observer_) {
        observer_->onTurnCommitted(id_, *result);
    }
    return result;
}

void Session::run() {
    auto const timeout = sequencer_->options().turnTimeout;
    std::unique_lock<std::mutex> lock(queueMutex_);
    while (true) {
        auto ready = [this] { return !jobs_.empty() || stopping_; };
        if (timeout.count() > 0) {
            // A busy queue must not hold the turn open past its deadline.
            auto const deadline = turnOpenedAt_ + timeout;
            if (std::chrono::steady_clock::now() >= deadline || !queueCv_.wait_until(lock, deadline, ready)) {
                lock.unlock();
                expireTurn();
                lock.lock();
                if (jobs_.empty() && !stopping_) {
                    continue;
                }
            }
        } else {
            queueCv_.wait(lock, ready);
        }
        if (jobs_.empty()) {
            if (stopping_) {
                break; // stopping with nothing left to drain
            }
            continue;
        }
        auto job = std::move(jobs_.front());
        jobs_.pop_front();
        lock.unlock();
        job();
        lock.lock();
    }
}

void Session::expireTurn() {
    if (sequencer_->pendingCount() == 0 && sequencer_->bufferedCount() == 0) {
        turnOpenedAt_ = std::chrono::steady_clock::now();
        return;
    }
    ts_log("Turn " + std::to_string(sequencer_->openTurn()) + " timed out", "Session");
    auto const turn   = sequencer_->openTurn();
    auto       result = finishTurn(sequencer_->forceClose(), turn);
    if (!result) {
        ts_log("Forced close failed: " + describeError(result.error()), "Session");
        turnOpenedAt_ = std::chrono::steady_clock::now();
    }
}

void Session::shutdown() {
    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        if (stopping_ && !worker_.joinable()) {
            return;
        }
        stopping_ = true;
        queueCv_.notify_all();
    }
    if (worker_.joinable() && worker_.get_id() != std::this_thread::get_id()) {
        worker_.join();
        sequencer_->close();
        ts_log("Session " + id_ + " shut down", "Session");
    }
}

auto Session::history() const -> std::shared_ptr<const History> {
    return sequencer_->snapshots().history();
}

auto Session::currentTurn() const -> std::uint64_t {
    return history()->headTurn;
}

auto Session::state() const -> Value {
    return history()->headState;
}

auto Session::stateAt(std::uint64_t turn) const -> Expected<Value> {
    return history()->stateAt(turn);
}

auto Session::metadata() const -> SessionMetadata {
    std::lock_guard<std::mutex> lock(metadataMutex_);
    return metadata_;
}

auto Session::archive() const -> SessionArchive {
    auto view = history();
    return archiveFromHistory(metadata(), *view);
}

void Session::touch() {
    lastActivityMs_.store(steadyMillis(std::chrono::steady_clock::now()));
}

auto Session::idleFor(std::chrono::steady_clock::time_point now) const -> std::chrono::milliseconds {
    auto const idle = steadyMillis(now) - lastActivityMs_.load();
    return std::chrono::milliseconds{idle > 0 ? idle : 0};
}

} // namespace TS

#include "turn/TurnSequencer.hpp"

#include "delta/DeltaApplicator.hpp"
#include "log/TaggedLogger.hpp"
#include "turn/Checksum.hpp"

#include <algorithm>
#include <utility>

namespace TS {

namespace {

auto turnText(std::uint64_t turn) -> std::string {
    return std::to_string(turn);
}

} // namespace

auto phaseToString(TurnSequencer::Phase phase) -> std::string_view {
    switch (phase) {
    case TurnSequencer::Phase::Open:
        return "open";
    case TurnSequencer::Phase::Committing:
        return "committing";
    case TurnSequencer::Phase::Closed:
        return "closed";
    }
    return "closed";
}

TurnSequencer::TurnSequencer(Value initialState, SequencerOptions options, SnapshotPolicy policy)
    : options_(options),
      snapshots_(std::make_unique<SnapshotManager>(Snapshot{0, initialState}, policy)),
      state_(std::move(initialState)) {}

TurnSequencer::TurnSequencer(std::unique_ptr<SnapshotManager> snapshots, SequencerOptions options)
    : options_(options), snapshots_(std::move(snapshots)) {
    auto history   = snapshots_->history();
    state_         = history->headState;
    lastCommitted_ = history->headTurn;
    for (auto const& batch : history->log) {
        for (auto const& delta : batch.deltas) {
            committed_.insert_or_assign(delta.id, delta);
        }
    }
}

auto TurnSequencer::bufferedCount() const -> std::size_t {
    std::size_t count = 0;
    for (auto const& [turn, deltas] : buffered_) {
        count += deltas.size();
    }
    return count;
}

auto TurnSequencer::recorded(std::string const& id) const -> std::optional<Delta> {
    if (auto it = committed_.find(id); it != committed_.end()) {
        return it->second;
    }
    return std::nullopt;
}

auto TurnSequencer::submit(Delta delta) -> Expected<Submitted> {
    if (phase_ == Phase::Closed) {
        return std::unexpected(Error{Error::Code::SessionClosed, "session no longer accepts deltas"});
    }
    if (auto it = committed_.find(delta.id); it != committed_.end()) {
        return Submitted{Submitted::Status::Duplicate, it->second};
    }
    if (waitingIds_.contains(delta.id)) {
        return Submitted{Submitted::Status::AlreadyPending, std::nullopt};
    }
    auto const open = openTurn();
    if (delta.turn < open) {
        return std::unexpected(Error{Error::Code::StaleTurn,
                                     "delta " + delta.id + " targets turn " + turnText(delta.turn)
                                         + " but turn " + turnText(open) + " is open"});
    }
    if (delta.turn - open > options_.lookaheadTurns) {
        return std::unexpected(Error{Error::Code::TurnGap,
                                     "delta " + delta.id + " targets turn " + turnText(delta.turn)
                                         + ", beyond the lookahead window of turn " + turnText(open)});
    }
    waitingIds_.insert(delta.id);
    if (delta.turn > open) {
        ts_log("Buffered delta " + delta.id + " for turn " + turnText(delta.turn), "Sequencer");
        buffered_[delta.turn].push_back(std::move(delta));
        return Submitted{Submitted::Status::Buffered, std::nullopt};
    }
    pending_.push_back(Pending{nextTick_++, std::move(delta)});
    return Submitted{Submitted::Status::Queued, std::nullopt};
}

auto TurnSequencer::closeTurn() -> Expected<CommitResult> {
    return runTurn({}, std::nullopt);
}

auto TurnSequencer::commitBatch(TurnDeltas batch) -> Expected<CommitResult> {
    if (phase_ == Phase::Closed) {
        return std::unexpected(Error{Error::Code::SessionClosed, "session no longer accepts batches"});
    }
    auto const open = openTurn();
    if (batch.turn < open) {
        return std::unexpected(Error{Error::Code::StaleTurn,
                                     "batch for turn " + turnText(batch.turn) + " but turn " + turnText(open) + " is open"});
    }
    if (batch.turn > open) {
        return std::unexpected(Error{Error::Code::TurnGap,
                                     "batch for turn " + turnText(batch.turn) + " but turn " + turnText(open) + " is open"});
    }
    std::vector<Pending> extra;
    extra.reserve(batch.deltas.size());
    for (auto& delta : batch.deltas) {
        if (delta.turn != batch.turn) {
            return std::unexpected(Error{Error::Code::MalformedInput,
                                         "delta " + delta.id + " does not belong to turn " + turnText(batch.turn)});
        }
        if (committed_.contains(delta.id) || waitingIds_.contains(delta.id)) {
            continue;
        }
        extra.push_back(Pending{nextTick_++, std::move(delta)});
    }
    return runTurn(std::move(extra), batch.checksum);
}

auto TurnSequencer::forceClose() -> Expected<CommitResult> {
    if (phase_ == Phase::Closed) {
        return std::unexpected(Error{Error::Code::SessionClosed, "session is closed"});
    }
    std::vector<Rejection> dropped;
    for (auto& [turn, deltas] : buffered_) {
        for (auto& delta : deltas) {
            waitingIds_.erase(delta.id);
            auto message = "turn " + turnText(openTurn()) + " timed out before turn " + turnText(turn) + " was reached";
            dropped.push_back(Rejection{std::move(delta), Error{Error::Code::TurnGap, std::move(message)}});
        }
    }
    buffered_.clear();

    auto result = closeTurn();
    if (!result) {
        return result;
    }
    counters_.rejectedDeltas += dropped.size();
    for (auto& rejection : dropped) {
        result->rejected.push_back(std::move(rejection));
    }
    ts_log("Force-closed turn " + turnText(result->batch.turn) + ", dropped " + std::to_string(dropped.size())
               + " buffered deltas",
           "Sequencer");
    return result;
}

void TurnSequencer::close() {
    phase_ = Phase::Closed;
    pending_.clear();
    buffered_.clear();
    waitingIds_.clear();
}

auto TurnSequencer::runTurn(std::vector<Pending> extra, std::optional<std::string> const& expectedChecksum)
        -> Expected<CommitResult> {
    if (phase_ == Phase::Closed) {
        return std::unexpected(Error{Error::Code::SessionClosed, "session is closed"});
    }
    phase_ = Phase::Committing;
    auto const turn = openTurn();

    std::vector<Pending const*> ordered;
    ordered.reserve(pending_.size() + extra.size());
    for (auto const& entry : pending_) {
        ordered.push_back(&entry);
    }
    for (auto const& entry : extra) {
        ordered.push_back(&entry);
    }
    std::stable_sort(ordered.begin(), ordered.end(), [](Pending const* a, Pending const* b) {
        if (a->tick != b->tick) {
            return a->tick < b->tick;
        }
        return a->delta.id < b->delta.id;
    });

    CommitResult result;
    result.batch.turn = turn;
    Value working     = state_;
    for (auto const* entry : ordered) {
        auto applied = DeltaApplicator::apply(working, entry->delta);
        if (!applied) {
            result.rejected.push_back(Rejection{entry->delta, applied.error()});
            continue;
        }
        working = std::move(applied->state);
        result.batch.deltas.push_back(std::move(applied->effective));
    }

    auto checksum = Checksum::compute(working);
    if (!checksum) {
        phase_ = Phase::Open;
        return std::unexpected(checksum.error());
    }
    if (expectedChecksum && *expectedChecksum != *checksum) {
        // Working copy is discarded; state, counter and pending deltas stay as they were.
        phase_ = Phase::Open;
        counters_.rolledBackTurns += 1;
        ts_log("Rolled back turn " + turnText(turn) + ": checksum mismatch", "Sequencer");
        return std::unexpected(Error{Error::Code::IntegrityError,
                                     "turn " + turnText(turn) + " checksum " + *expectedChecksum
                                         + " does not match recomputed " + *checksum});
    }

    result.batch.checksum = std::move(*checksum);
    for (auto const& delta : result.batch.deltas) {
        committed_.insert_or_assign(delta.id, delta);
    }
    for (auto const* entry : ordered) {
        waitingIds_.erase(entry->delta.id);
    }
    counters_.committedDeltas += result.batch.deltas.size();
    counters_.rejectedDeltas += result.rejected.size();

    state_         = working;
    lastCommitted_ = turn;
    pending_.clear();
    result.state         = std::move(working);
    result.snapshotTaken = snapshots_->record(result.batch, state_);

    ts_log("Committed turn " + turnText(turn) + " with " + std::to_string(result.batch.deltas.size()) + " deltas, "
               + std::to_string(result.rejected.size()) + " rejected",
           "Sequencer");

    phase_ = Phase::Open;
    promoteBuffered();
    return result;
}

void TurnSequencer::promoteBuffered() {
    auto it = buffered_.find(openTurn());
    if (it == buffered_.end()) {
        return;
    }
    // Everything promoted together shares one arrival tick; ids decide the order.
    auto const tick = nextTick_++;
    for (auto& delta : it->second) {
        pending_.push_back(Pending{tick, std::move(delta)});
    }
    buffered_.erase(it);
}

} // namespace TS

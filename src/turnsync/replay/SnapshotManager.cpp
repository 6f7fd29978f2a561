#include "replay/SnapshotManager.hpp"

#include "delta/DeltaApplicator.hpp"
#include "log/TaggedLogger.hpp"
#include "turn/Checksum.hpp"

#include <algorithm>
#include <string>

namespace TS {

namespace {

auto replayBatch(Value const& state, TurnDeltas const& batch) -> Expected<Value> {
    Value working = state;
    for (auto const& delta : batch.deltas) {
        auto applied = DeltaApplicator::apply(working, delta);
        if (!applied) {
            return std::unexpected(Error{Error::Code::IntegrityError,
                                         "turn " + std::to_string(batch.turn) + " delta " + delta.id
                                             + " no longer applies: " + describeError(applied.error())});
        }
        working = std::move(applied->state);
    }
    if (batch.checksum) {
        auto same = Checksum::matches(working, *batch.checksum);
        if (!same) {
            return std::unexpected(same.error());
        }
        if (!*same) {
            return std::unexpected(Error{Error::Code::IntegrityError,
                                         "replayed turn " + std::to_string(batch.turn) + " diverges from its checksum"});
        }
    }
    return working;
}

} // namespace

auto validatePolicy(SnapshotPolicy const& policy) -> Expected<void> {
    if (policy.everyTurns == 0) {
        return std::unexpected(Error{Error::Code::MalformedInput, "snapshots.everyTurns must be greater than zero"});
    }
    if (policy.retainSnapshots == 0) {
        return std::unexpected(Error{Error::Code::MalformedInput, "snapshots.retainSnapshots must be at least one"});
    }
    return {};
}

auto History::stateAt(std::uint64_t turn) const -> Expected<Value> {
    if (snapshots.empty() || turn < oldestTurn() || turn > headTurn) {
        return std::unexpected(Error{Error::Code::NotFound, "turn " + std::to_string(turn) + " is outside the retained history"});
    }
    if (turn == headTurn) {
        return headState;
    }
    auto base = std::find_if(snapshots.rbegin(), snapshots.rend(), [turn](Snapshot const& s) { return s.turn <= turn; });
    Value state = base->state;
    for (auto const& batch : log) {
        if (batch.turn <= base->turn) {
            continue;
        }
        if (batch.turn > turn) {
            break;
        }
        auto next = replayBatch(state, batch);
        if (!next) {
            return std::unexpected(next.error());
        }
        state = std::move(*next);
    }
    return state;
}

auto History::snapshotAt(std::uint64_t turn) const -> Expected<Snapshot> {
    auto state = stateAt(turn);
    if (!state) {
        return std::unexpected(state.error());
    }
    return Snapshot{turn, std::move(*state)};
}

SnapshotManager::SnapshotManager(Snapshot initial, SnapshotPolicy policy)
    : policy_(policy) {
    auto history       = std::make_shared<History>();
    history->headTurn  = initial.turn;
    history->headState = initial.state;
    history->snapshots.push_back(std::move(initial));
    current_ = std::move(history);
}

SnapshotManager::SnapshotManager(std::shared_ptr<const History> history, SnapshotPolicy policy)
    : policy_(policy), current_(std::move(history)) {}

auto SnapshotManager::restore(std::vector<Snapshot> snapshots,
                              std::vector<TurnDeltas> log,
                              SnapshotPolicy policy) -> Expected<std::unique_ptr<SnapshotManager>> {
    if (auto valid = validatePolicy(policy); !valid) {
        return std::unexpected(valid.error());
    }
    if (snapshots.empty()) {
        return std::unexpected(Error{Error::Code::MalformedInput, "archive holds no snapshot"});
    }
    std::sort(snapshots.begin(), snapshots.end(), [](Snapshot const& a, Snapshot const& b) { return a.turn < b.turn; });
    std::sort(log.begin(), log.end(), [](TurnDeltas const& a, TurnDeltas const& b) { return a.turn < b.turn; });

    auto history = std::make_shared<History>();
    auto const oldest = snapshots.front().turn;
    for (auto& snapshot : snapshots) {
        history->snapshots.push_back(std::move(snapshot));
    }
    std::uint64_t expected = oldest + 1;
    for (auto& batch : log) {
        if (batch.turn <= oldest) {
            continue;
        }
        if (batch.turn != expected) {
            return std::unexpected(Error{Error::Code::IntegrityError,
                                         "archived log is missing turn " + std::to_string(expected)});
        }
        ++expected;
        history->log.push_back(std::move(batch));
    }

    auto const latest = history->latestSnapshot().turn;
    Value      state  = history->latestSnapshot().state;
    for (auto const& batch : history->log) {
        if (batch.turn <= latest) {
            continue;
        }
        auto next = replayBatch(state, batch);
        if (!next) {
            return std::unexpected(next.error());
        }
        state = std::move(*next);
    }
    history->headTurn  = std::max(latest, expected - 1);
    history->headState = std::move(state);

    auto manager = std::unique_ptr<SnapshotManager>(new SnapshotManager(std::move(history), policy));
    auto view    = manager->history();
    manager->turnsSinceSnapshot = static_cast<std::size_t>(view->headTurn - latest);
    for (auto const& batch : view->log) {
        if (batch.turn > latest) {
            manager->deltasSinceSnapshot += batch.deltas.size();
        }
    }
    manager->stats_.snapshotsTaken = view->snapshots.size();
    return manager;
}

auto SnapshotManager::record(TurnDeltas batch, Value const& state) -> bool {
    auto const previous = history();
    auto next           = std::make_shared<History>(*previous);

    turnsSinceSnapshot += 1;
    deltasSinceSnapshot += batch.deltas.size();
    next->headTurn  = batch.turn;
    next->headState = state;
    next->log.push_back(std::move(batch));

    bool const due = turnsSinceSnapshot >= policy_.everyTurns
                     || (policy_.everyDeltas > 0 && deltasSinceSnapshot >= policy_.everyDeltas);
    std::size_t trimmedSnapshots = 0;
    std::size_t trimmedBatches   = 0;
    if (due) {
        next->snapshots.push_back(Snapshot{next->headTurn, state});
        turnsSinceSnapshot  = 0;
        deltasSinceSnapshot = 0;
        while (next->snapshots.size() > policy_.retainSnapshots) {
            next->snapshots.pop_front();
            ++trimmedSnapshots;
        }
        while (!next->log.empty() && next->log.front().turn <= next->oldestTurn()) {
            next->log.pop_front();
            ++trimmedBatches;
        }
        ts_log("Snapshot at turn " + std::to_string(next->headTurn) + ", retained "
                   + std::to_string(next->snapshots.size()),
               "Snapshot");
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (due) {
            stats_.snapshotsTaken += 1;
        }
        stats_.trimmedSnapshots += trimmedSnapshots;
        stats_.trimmedBatches += trimmedBatches;
    }
    publish(std::move(next));
    return due;
}

void SnapshotManager::publish(std::shared_ptr<const History> next) {
    std::lock_guard<std::mutex> lock(mutex_);
    current_ = std::move(next);
}

auto SnapshotManager::history() const -> std::shared_ptr<const History> {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_;
}

auto SnapshotManager::stateAt(std::uint64_t turn) const -> Expected<Value> {
    return history()->stateAt(turn);
}

auto SnapshotManager::snapshotAt(std::uint64_t turn) const -> Expected<Snapshot> {
    return history()->snapshotAt(turn);
}

auto SnapshotManager::stats() const -> Stats {
    std::lock_guard<std::mutex> lock(mutex_);
    return stats_;
}

} // namespace TS

#pragma once

#include "core/Error.hpp"
#include "core/Value.hpp"
#include "delta/Delta.hpp"

#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <vector>

namespace TS {

struct Snapshot {
    std::uint64_t turn = 0;
    Value         state;
};

struct SnapshotPolicy {
    std::size_t everyTurns      = 10; // must be > 0; bounds replay depth
    std::size_t everyDeltas     = 0;  // 0 == off
    std::size_t retainSnapshots = 4;  // must be >= 1
};

[[nodiscard]] auto validatePolicy(SnapshotPolicy const& policy) -> Expected<void>;

/**
 * Immutable view of a session's replayable history: retained snapshots in ascending
 * turn order and every committed batch after the oldest of them. Readers keep the
 * shared_ptr they were handed and replay without further locking.
 */
struct History {
    std::deque<Snapshot>   snapshots;
    std::deque<TurnDeltas> log;
    std::uint64_t          headTurn = 0;
    Value                  headState;

    [[nodiscard]] auto oldestTurn() const -> std::uint64_t { return snapshots.front().turn; }
    [[nodiscard]] auto latestSnapshot() const -> Snapshot const& { return snapshots.back(); }

    // Rebuilds the state at `turn` from the nearest snapshot at or before it,
    // verifying every replayed batch against its checksum.
    [[nodiscard]] auto stateAt(std::uint64_t turn) const -> Expected<Value>;
    [[nodiscard]] auto snapshotAt(std::uint64_t turn) const -> Expected<Snapshot>;
};

class SnapshotManager {
public:
    struct Stats {
        std::size_t snapshotsTaken = 0;
        std::size_t trimmedSnapshots = 0;
        std::size_t trimmedBatches = 0;
    };

    explicit SnapshotManager(Snapshot initial, SnapshotPolicy policy = {});

    // Rebuilds a manager from archived snapshots and log; fails when the log does not
    // replay onto the snapshots.
    [[nodiscard]] static auto restore(std::vector<Snapshot> snapshots,
                                      std::vector<TurnDeltas> log,
                                      SnapshotPolicy policy) -> Expected<std::unique_ptr<SnapshotManager>>;

    SnapshotManager(SnapshotManager const&)            = delete;
    SnapshotManager& operator=(SnapshotManager const&) = delete;

    // Appends a committed batch together with the state it produced and applies the
    // snapshot and retention policy. Returns true when a snapshot was taken.
    auto record(TurnDeltas batch, Value const& state) -> bool;

    [[nodiscard]] auto history() const -> std::shared_ptr<const History>;
    [[nodiscard]] auto stateAt(std::uint64_t turn) const -> Expected<Value>;
    [[nodiscard]] auto snapshotAt(std::uint64_t turn) const -> Expected<Snapshot>;

    [[nodiscard]] auto policy() const -> SnapshotPolicy const& { return policy_; }
    [[nodiscard]] auto stats() const -> Stats;

private:
    SnapshotManager(std::shared_ptr<const History> history, SnapshotPolicy policy);

    void publish(std::shared_ptr<const History> next);

    SnapshotPolicy                 policy_;
    std::size_t                    turnsSinceSnapshot  = 0;
    std::size_t                    deltasSinceSnapshot = 0;
    Stats                          stats_;
    mutable std::mutex             mutex_;
    std::shared_ptr<const History> current_;
};

} // namespace TS

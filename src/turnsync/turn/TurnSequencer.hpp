#pragma once

#include "core/Error.hpp"
#include "core/Value.hpp"
#include "delta/Delta.hpp"
#include "replay/SnapshotManager.hpp"

#include <parallel_hashmap/phmap.h>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace TS {

struct SequencerOptions {
    // Future turns beyond open + lookaheadTurns are refused with TurnGap.
    std::size_t               lookaheadTurns = 4;
    // An open turn that waits this long is force-closed; 0 disables the timeout.
    std::chrono::milliseconds turnTimeout{0};
};

struct Rejection {
    Delta delta;
    Error error;
};

struct CommitResult {
    // Effective deltas in commit order plus the checksum of the resulting state.
    TurnDeltas             batch;
    Value                  state;
    std::vector<Rejection> rejected;
    bool                   snapshotTaken = false;
};

/**
 * Turn state machine of one session: Open(T) -> Committing(T) -> Open(T+1), and
 * Closed once the session shuts down. T is always lastCommittedTurn() + 1.
 *
 * Not thread-safe; the owning Session actor is its only caller. Readers use the
 * History published through snapshots().
 */
class TurnSequencer {
public:
    enum class Phase {
        Open,
        Committing,
        Closed,
    };

    struct Submitted {
        enum class Status {
            Queued,         // joins the open turn
            Buffered,       // held for a future turn within the lookahead window
            AlreadyPending, // same id is already waiting; nothing changed
            Duplicate,      // id was committed earlier; `recorded` is its effective delta
        };
        Status               status = Status::Queued;
        std::optional<Delta> recorded;
    };

    struct Counters {
        std::uint64_t committedDeltas = 0;
        std::uint64_t rejectedDeltas  = 0;
        std::uint64_t rolledBackTurns = 0;
    };

    TurnSequencer(Value initialState, SequencerOptions options = {}, SnapshotPolicy policy = {});
    // Resumes from a restored history; the committed-id index covers the retained log.
    TurnSequencer(std::unique_ptr<SnapshotManager> snapshots, SequencerOptions options);

    TurnSequencer(TurnSequencer const&)            = delete;
    TurnSequencer& operator=(TurnSequencer const&) = delete;

    [[nodiscard]] auto submit(Delta delta) -> Expected<Submitted>;
    [[nodiscard]] auto closeTurn() -> Expected<CommitResult>;
    // Closes the open turn with `batch` appended to the pending deltas. A checksum on
    // the batch must equal the recomputed one or nothing is committed.
    [[nodiscard]] auto commitBatch(TurnDeltas batch) -> Expected<CommitResult>;
    // Timeout path: every buffered future delta is dropped as TurnGap and the open
    // turn closes with whatever is pending.
    [[nodiscard]] auto forceClose() -> Expected<CommitResult>;
    void close();

    [[nodiscard]] auto phase() const -> Phase { return phase_; }
    [[nodiscard]] auto openTurn() const -> std::uint64_t { return lastCommitted_ + 1; }
    [[nodiscard]] auto lastCommittedTurn() const -> std::uint64_t { return lastCommitted_; }
    [[nodiscard]] auto state() const -> Value const& { return state_; }
    [[nodiscard]] auto pendingCount() const -> std::size_t { return pending_.size(); }
    [[nodiscard]] auto bufferedCount() const -> std::size_t;
    [[nodiscard]] auto recorded(std::string const& id) const -> std::optional<Delta>;
    [[nodiscard]] auto counters() const -> Counters const& { return counters_; }
    [[nodiscard]] auto options() const -> SequencerOptions const& { return options_; }

    [[nodiscard]] auto snapshots() const -> SnapshotManager const& { return *snapshots_; }

private:
    struct Pending {
        std::uint64_t tick = 0;
        Delta         delta;
    };

    auto runTurn(std::vector<Pending> extra, std::optional<std::string> const& expectedChecksum)
            -> Expected<CommitResult>;
    void promoteBuffered();

    SequencerOptions                             options_;
    std::unique_ptr<SnapshotManager>             snapshots_;
    Value                                        state_;
    std::uint64_t                                lastCommitted_ = 0;
    Phase                                        phase_         = Phase::Open;
    std::uint64_t                                nextTick_      = 0;
    std::vector<Pending>                         pending_;
    std::map<std::uint64_t, std::vector<Delta>>  buffered_;
    phmap::flat_hash_set<std::string>            waitingIds_;
    phmap::flat_hash_map<std::string, Delta>     committed_;
    Counters                                     counters_;
};

[[nodiscard]] auto phaseToString(TurnSequencer::Phase phase) -> std::string_view;

} // namespace TS

#pragma once

#include "core/Error.hpp"
#include "storage/SessionArchive.hpp"

#include <cstdint>
#include <filesystem>
#include <mutex>
#include <string>
#include <vector>

namespace TS {

class SessionStore {
public:
    virtual ~SessionStore() = default;

    virtual auto save(SessionArchive const& archive) -> Expected<void>          = 0;
    virtual auto load(std::string const& sessionId) -> Expected<SessionArchive> = 0;
    virtual auto list() -> Expected<std::vector<SessionSummary>>                = 0;
};

/**
 * Directory-backed store using the layout
 *
 *   <root>/sessions/active/<id>/session.meta.json
 *   <root>/sessions/active/<id>/snapshots/snapshot-turn-NNNN.json
 *   <root>/sessions/active/<id>/deltas/deltas-SSSS-EEEE.jsonl
 *
 * Delta chunks hold 100 turns each, one TurnDeltas document per line. Every file is
 * replaced atomically; a save removes snapshot and chunk files the archive no
 * longer references.
 */
class FileSessionStore final : public SessionStore {
public:
    static constexpr std::uint64_t kTurnsPerChunk = 100;

    explicit FileSessionStore(std::filesystem::path root, bool fsyncWrites = false);

    auto save(SessionArchive const& archive) -> Expected<void> override;
    auto load(std::string const& sessionId) -> Expected<SessionArchive> override;
    auto list() -> Expected<std::vector<SessionSummary>> override;

    [[nodiscard]] auto sessionDirectory(std::string const& sessionId) const -> std::filesystem::path;
    [[nodiscard]] static auto snapshotFileName(std::uint64_t turn) -> std::string;
    [[nodiscard]] static auto deltaChunkFileName(std::uint64_t turn) -> std::string;

private:
    std::filesystem::path root;
    bool                  fsyncWrites;
    std::mutex            mutex;
};

} // namespace TS

#include "storage/SessionStore.hpp"

#include "core/Identifiers.hpp"
#include "core/JsonFields.hpp"
#include "delta/DeltaCodec.hpp"
#include "log/TaggedLogger.hpp"
#include "storage/FileIo.hpp"

#include <algorithm>
#include <cstdio>
#include <map>
#include <set>
#include <sstream>
#include <system_error>

namespace TS {

namespace {

namespace fs = std::filesystem;

constexpr std::string_view kMetaFile     = "session.meta.json";
constexpr std::string_view kSnapshotsDir = "snapshots";
constexpr std::string_view kDeltasDir    = "deltas";

auto padded(std::uint64_t value) -> std::string {
    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%04llu", static_cast<unsigned long long>(value));
    return buffer;
}

auto chunkStart(std::uint64_t turn) -> std::uint64_t {
    auto const index = turn == 0 ? 0 : (turn - 1) / FileSessionStore::kTurnsPerChunk;
    return index * FileSessionStore::kTurnsPerChunk + 1;
}

// Deletes regular files in `dir` that are not in `keep`.
auto removeStale(fs::path const& dir, std::set<std::string> const& keep) -> Expected<void> {
    std::error_code ec;
    if (!fs::exists(dir, ec)) {
        return {};
    }
    for (auto const& entry : fs::directory_iterator(dir, ec)) {
        if (!entry.is_regular_file() || keep.contains(entry.path().filename().string())) {
            continue;
        }
        fs::remove(entry.path(), ec);
        if (ec) {
            return std::unexpected(Error{Error::Code::IoError, "failed to remove " + entry.path().string()});
        }
    }
    if (ec) {
        return std::unexpected(Error{Error::Code::IoError, "failed to scan " + dir.string()});
    }
    return {};
}

auto readJsonFile(fs::path const& path) -> Expected<JsonFields::Json> {
    auto text = FileIo::readTextFile(path);
    if (!text) {
        return std::unexpected(text.error());
    }
    return JsonFields::parseDocument(*text, path.filename().string());
}

} // namespace

FileSessionStore::FileSessionStore(fs::path root, bool fsyncWrites)
    : root(std::move(root)), fsyncWrites(fsyncWrites) {}

auto FileSessionStore::sessionDirectory(std::string const& sessionId) const -> fs::path {
    return root / "sessions" / "active" / sessionId;
}

auto FileSessionStore::snapshotFileName(std::uint64_t turn) -> std::string {
    return "snapshot-turn-" + padded(turn) + ".json";
}

auto FileSessionStore::deltaChunkFileName(std::uint64_t turn) -> std::string {
    auto const start = chunkStart(turn);
    return "deltas-" + padded(start) + "-" + padded(start + kTurnsPerChunk - 1) + ".jsonl";
}

auto FileSessionStore::save(SessionArchive const& archive) -> Expected<void> {
    if (!isUuid(archive.metadata.id)) {
        return std::unexpected(Error{Error::Code::MalformedInput, "session id must be a UUID"});
    }
    std::lock_guard<std::mutex> lock(mutex);
    auto const dir = sessionDirectory(archive.metadata.id);

    std::set<std::string> snapshotFiles;
    for (auto const& snapshot : archive.snapshots) {
        auto name = snapshotFileName(snapshot.turn);
        if (auto written = FileIo::writeTextFileAtomic(dir / kSnapshotsDir / name,
                                                       JsonFields::writeDocument(snapshotToJson(snapshot)),
                                                       fsyncWrites);
            !written) {
            return written;
        }
        snapshotFiles.insert(std::move(name));
    }

    std::map<std::string, std::string> chunks;
    for (auto const& batch : archive.log) {
        auto& lines = chunks[deltaChunkFileName(batch.turn)];
        lines.append(serializeTurnDeltas(batch));
        lines.push_back('\n');
    }
    std::set<std::string> chunkFiles;
    for (auto const& [name, lines] : chunks) {
        if (auto written = FileIo::writeTextFileAtomic(dir / kDeltasDir / name, lines, fsyncWrites); !written) {
            return written;
        }
        chunkFiles.insert(name);
    }

    if (auto cleaned = removeStale(dir / kSnapshotsDir, snapshotFiles); !cleaned) {
        return cleaned;
    }
    if (auto cleaned = removeStale(dir / kDeltasDir, chunkFiles); !cleaned) {
        return cleaned;
    }
    // Metadata last: a session is listed only once its history is on disk.
    if (auto written = FileIo::writeTextFileAtomic(dir / kMetaFile, JsonFields::writeDocument(metadataToJson(archive.metadata), 2), fsyncWrites);
        !written) {
        return written;
    }
    ts_log("Saved session " + archive.metadata.id + " at turn " + std::to_string(archive.metadata.currentTurn), "Store");
    return {};
}

auto FileSessionStore::load(std::string const& sessionId) -> Expected<SessionArchive> {
    if (!isUuid(sessionId)) {
        return std::unexpected(Error{Error::Code::SessionNotFound, "no archived session " + sessionId});
    }
    std::lock_guard<std::mutex> lock(mutex);
    auto const dir = sessionDirectory(sessionId);

    auto meta = readJsonFile(dir / kMetaFile);
    if (!meta) {
        if (meta.error().code == Error::Code::NotFound) {
            return std::unexpected(Error{Error::Code::SessionNotFound, "no archived session " + sessionId});
        }
        return std::unexpected(meta.error());
    }
    SessionArchive archive;
    auto metadata = metadataFromJson(*meta);
    if (!metadata) {
        return std::unexpected(metadata.error());
    }
    archive.metadata = std::move(*metadata);

    std::error_code ec;
    if (fs::exists(dir / kSnapshotsDir, ec)) {
        for (auto const& entry : fs::directory_iterator(dir / kSnapshotsDir, ec)) {
            if (!entry.is_regular_file() || entry.path().extension() != ".json") {
                continue;
            }
            auto json = readJsonFile(entry.path());
            if (!json) {
                return std::unexpected(json.error());
            }
            auto snapshot = snapshotFromJson(*json);
            if (!snapshot) {
                return std::unexpected(snapshot.error());
            }
            archive.snapshots.push_back(std::move(*snapshot));
        }
    }
    if (fs::exists(dir / kDeltasDir, ec)) {
        for (auto const& entry : fs::directory_iterator(dir / kDeltasDir, ec)) {
            if (!entry.is_regular_file() || entry.path().extension() != ".jsonl") {
                continue;
            }
            auto text = FileIo::readTextFile(entry.path());
            if (!text) {
                return std::unexpected(text.error());
            }
            std::istringstream lines(*text);
            std::string        line;
            while (std::getline(lines, line)) {
                if (line.find_first_not_of(" \t\r") == std::string::npos) {
                    continue;
                }
                auto batch = deserializeTurnDeltas(line);
                if (!batch) {
                    return std::unexpected(batch.error());
                }
                archive.log.push_back(std::move(*batch));
            }
        }
    }
    if (ec) {
        return std::unexpected(Error{Error::Code::IoError, "failed to scan " + dir.string()});
    }
    std::sort(archive.snapshots.begin(), archive.snapshots.end(),
              [](Snapshot const& a, Snapshot const& b) { return a.turn < b.turn; });
    std::sort(archive.log.begin(), archive.log.end(),
              [](TurnDeltas const& a, TurnDeltas const& b) { return a.turn < b.turn; });
    return archive;
}

auto FileSessionStore::list() -> Expected<std::vector<SessionSummary>> {
    std::lock_guard<std::mutex> lock(mutex);
    std::vector<SessionSummary> sessions;
    auto const                  active = root / "sessions" / "active";
    std::error_code             ec;
    if (!fs::exists(active, ec)) {
        return sessions;
    }
    for (auto const& entry : fs::directory_iterator(active, ec)) {
        if (!entry.is_directory()) {
            continue;
        }
        auto meta = readJsonFile(entry.path() / kMetaFile);
        if (!meta) {
            // Directories without metadata are incomplete saves.
            continue;
        }
        auto metadata = metadataFromJson(*meta);
        if (!metadata) {
            ts_log("Skipping unreadable session " + entry.path().string() + ": " + describeError(metadata.error()), "Store");
            continue;
        }
        sessions.push_back(summarize(*metadata));
    }
    if (ec) {
        return std::unexpected(Error{Error::Code::IoError, "failed to scan " + active.string()});
    }
    std::sort(sessions.begin(), sessions.end(),
              [](SessionSummary const& a, SessionSummary const& b) { return a.lastPlayed > b.lastPlayed; });
    return sessions;
}

} // namespace TS

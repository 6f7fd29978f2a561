#include "core/ValueJson.hpp"
#include "replay/SnapshotManager.hpp"
#include "storage/SessionStore.hpp"
#include "turn/Checksum.hpp"
#include "util/CommandLine.hpp"

#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>

using namespace TS;

namespace {

struct InspectOptions {
    bool                                 showHelp = false;
    std::optional<std::filesystem::path> storeRoot;
    std::optional<std::string>           sessionId;
    std::optional<std::uint64_t>         turn;
};

void printUsage() {
    std::cout << "Usage: turnsync_inspect --store <dir> [--session <id>] [--turn <n>]\n"
                 "       turnsync_inspect --help\n"
                 "Without --session the archived sessions under <dir> are listed.\n";
}

auto parseCommandLine(int argc, char** argv) -> std::optional<InspectOptions> {
    InspectOptions options;

    CommandLine cli;
    cli.setProgramName("turnsync_inspect");
    cli.addFlag("--help", [&] { options.showHelp = true; });
    cli.addAlias("-h", "--help");
    cli.addValue("--store", [&](std::string_view value) -> CommandLine::ParseError {
        if (value.empty()) {
            return std::string{"--store requires a directory"};
        }
        options.storeRoot = std::filesystem::path(std::string(value));
        return std::nullopt;
    });
    cli.addValue("--session", [&](std::string_view value) -> CommandLine::ParseError {
        options.sessionId = std::string(value);
        return std::nullopt;
    });
    cli.addUnsigned("--turn", [&](std::uint64_t value) { options.turn = value; });

    if (!cli.parse(argc, argv)) {
        return std::nullopt;
    }
    if (!cli.positional().empty()) {
        std::cerr << "turnsync_inspect: unexpected argument '" << cli.positional().front() << "'\n";
        return std::nullopt;
    }
    return options;
}

auto listSessions(FileSessionStore& store) -> int {
    auto sessions = store.list();
    if (!sessions) {
        std::cerr << "Failed to list sessions: " << describeError(sessions.error()) << "\n";
        return EXIT_FAILURE;
    }
    if (sessions->empty()) {
        std::cout << "No archived sessions" << std::endl;
        return EXIT_SUCCESS;
    }
    for (auto const& summary : *sessions) {
        std::cout << summary.id << "  turn " << summary.turn << "  " << summary.name << "  (" << summary.theme
                  << ", last played " << summary.lastPlayed << ")" << std::endl;
    }
    return EXIT_SUCCESS;
}

auto inspectSession(FileSessionStore& store, std::string const& sessionId, std::optional<std::uint64_t> turn)
        -> int {
    auto archive = store.load(sessionId);
    if (!archive) {
        std::cerr << "Failed to load session " << sessionId << ": " << describeError(archive.error()) << "\n";
        return EXIT_FAILURE;
    }
    auto const metadata = archive->metadata;
    auto       manager  = SnapshotManager::restore(std::move(archive->snapshots), std::move(archive->log), {});
    if (!manager) {
        std::cerr << "Session " << sessionId << " does not replay: " << describeError(manager.error()) << "\n";
        return EXIT_FAILURE;
    }

    auto const view   = (*manager)->history();
    auto const target = turn.value_or(view->headTurn);
    auto       state  = (*manager)->stateAt(target);
    if (!state) {
        std::cerr << "Turn " << target << " is not available (retained " << view->oldestTurn() << ".."
                  << view->headTurn << "): " << describeError(state.error()) << "\n";
        return EXIT_FAILURE;
    }
    auto checksum = Checksum::compute(*state);
    if (!checksum) {
        std::cerr << "Failed to compute checksum: " << describeError(checksum.error()) << "\n";
        return EXIT_FAILURE;
    }

    std::cout << "session: " << metadata.id << " (" << metadata.name << ")" << std::endl;
    std::cout << "turn: " << target << " of " << view->headTurn << std::endl;
    std::cout << "checksum: " << *checksum << std::endl;
    std::cout << canonicalJson(*state) << std::endl;
    return EXIT_SUCCESS;
}

} // namespace

int main(int argc, char** argv) {
    auto cli = parseCommandLine(argc, argv);
    if (!cli) {
        return EXIT_FAILURE;
    }
    if (cli->showHelp) {
        printUsage();
        return EXIT_SUCCESS;
    }
    if (!cli->storeRoot) {
        std::cerr << "turnsync_inspect: missing --store" << std::endl;
        printUsage();
        return EXIT_FAILURE;
    }

    FileSessionStore store(*cli->storeRoot);
    if (!cli->sessionId) {
        if (cli->turn) {
            std::cerr << "turnsync_inspect: --turn requires --session" << std::endl;
            return EXIT_FAILURE;
        }
        return listSessions(store);
    }
    return inspectSession(store, *cli->sessionId, cli->turn);
}

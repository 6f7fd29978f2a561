#pragma once

#include "core/Error.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace TS {

struct PathStep {
    enum class Kind {
        Key,    // .name
        Index,  // [n]
        Append, // [*]
    };

    [[nodiscard]] static auto key(std::string name) -> PathStep { return PathStep{Kind::Key, std::move(name), 0}; }
    [[nodiscard]] static auto index(std::size_t position) -> PathStep { return PathStep{Kind::Index, {}, position}; }
    [[nodiscard]] static auto append() -> PathStep { return PathStep{Kind::Append, {}, 0}; }

    Kind        kind     = Kind::Key;
    std::string name;
    std::size_t position = 0;

    friend auto operator==(PathStep const&, PathStep const&) -> bool = default;
};

/**
 * Address of a location inside a state tree.
 *
 *   path       = segment , { ("." , identifier) | ("[" , (integer | "*") , "]") } ;
 *   segment    = identifier ;
 *   identifier = letter , { letter | digit | "_" } ;
 *
 * Target sub-roots are prefixed programmatically and may hold keys that are not
 * identifiers (NPC ids for instance); only text paths go through the grammar.
 */
class DeltaPath {
public:
    DeltaPath() = default;
    explicit DeltaPath(std::vector<PathStep> steps) : steps_(std::move(steps)) {}

    [[nodiscard]] auto steps() const noexcept -> std::vector<PathStep> const& { return steps_; }
    [[nodiscard]] auto empty() const noexcept -> bool { return steps_.empty(); }
    [[nodiscard]] auto size() const noexcept -> std::size_t { return steps_.size(); }

    [[nodiscard]] auto terminal() const -> PathStep const& { return steps_.back(); }
    [[nodiscard]] auto endsWithAppend() const noexcept -> bool {
        return !steps_.empty() && steps_.back().kind == PathStep::Kind::Append;
    }
    // True when a wildcard appears anywhere but the last step.
    [[nodiscard]] auto hasInnerAppend() const noexcept -> bool;

    [[nodiscard]] auto parent() const -> DeltaPath;
    [[nodiscard]] auto joined(DeltaPath const& suffix) const -> DeltaPath;

    [[nodiscard]] auto toString() const -> std::string;

    friend auto operator==(DeltaPath const&, DeltaPath const&) -> bool = default;

private:
    std::vector<PathStep> steps_;
};

[[nodiscard]] auto parseDeltaPath(std::string_view text) -> Expected<DeltaPath>;

} // namespace TS

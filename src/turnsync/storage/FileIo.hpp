#pragma once

#include "core/Error.hpp"

#include <filesystem>
#include <string>

namespace TS::FileIo {

[[nodiscard]] auto fsyncFileDescriptor(int fd) -> Expected<void>;
[[nodiscard]] auto fsyncDirectory(std::filesystem::path const& dir) -> Expected<void>;

// Writes `<path>.tmp` and renames it over `path`; readers see the old or the new
// contents, never a partial file.
[[nodiscard]] auto writeTextFileAtomic(std::filesystem::path const& path,
                                       std::string const& text,
                                       bool fsyncData) -> Expected<void>;
[[nodiscard]] auto readTextFile(std::filesystem::path const& path) -> Expected<std::string>;

} // namespace TS::FileIo

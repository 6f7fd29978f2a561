#include "storage/FileIo.hpp"

#include <fstream>
#include <sstream>
#include <system_error>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace TS::FileIo {

namespace {

auto ioError(std::string what, std::filesystem::path const& path) -> Error {
    return Error{Error::Code::IoError, std::move(what) + ": " + path.string()};
}

} // namespace

auto fsyncFileDescriptor(int fd) -> Expected<void> {
    if (::fsync(fd) != 0) {
        return std::unexpected(Error{Error::Code::IoError, "fsync failed"});
    }
    return {};
}

auto fsyncDirectory(std::filesystem::path const& dir) -> Expected<void> {
    int fd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY);
    if (fd < 0) {
        return std::unexpected(ioError("open directory failed", dir));
    }
    auto result = fsyncFileDescriptor(fd);
    ::close(fd);
    return result;
}

auto writeTextFileAtomic(std::filesystem::path const& path, std::string const& text, bool fsyncData)
        -> Expected<void> {
    std::error_code ec;
    auto            parent = path.parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            return std::unexpected(ioError("failed to create directories", parent));
        }
    }

    auto tmpPath = path;
    tmpPath += ".tmp";

    int fd = ::open(tmpPath.c_str(), O_CREAT | O_TRUNC | O_WRONLY, 0644);
    if (fd < 0) {
        return std::unexpected(ioError("failed to open temp file", tmpPath));
    }

    std::size_t totalWritten = 0;
    while (totalWritten < text.size()) {
        auto written = ::write(fd, text.data() + totalWritten, text.size() - totalWritten);
        if (written <= 0) {
            ::close(fd);
            return std::unexpected(ioError("failed to write temp file", tmpPath));
        }
        totalWritten += static_cast<std::size_t>(written);
    }

    if (fsyncData) {
        if (auto sync = fsyncFileDescriptor(fd); !sync) {
            ::close(fd);
            return sync;
        }
    }
    if (::close(fd) != 0) {
        return std::unexpected(ioError("failed to close temp file", tmpPath));
    }

    std::filesystem::rename(tmpPath, path, ec);
    if (ec) {
        return std::unexpected(ioError("failed to rename temp file", path));
    }
    if (fsyncData && !parent.empty()) {
        return fsyncDirectory(parent);
    }
    return {};
}

auto readTextFile(std::filesystem::path const& path) -> Expected<std::string> {
    std::ifstream stream(path);
    if (!stream) {
        return std::unexpected(Error{Error::Code::NotFound, "file not found: " + path.string()});
    }
    std::ostringstream oss;
    oss << stream.rdbuf();
    if (!stream.good() && !stream.eof()) {
        return std::unexpected(ioError("failed to read file", path));
    }
    return oss.str();
}

} // namespace TS::FileIo

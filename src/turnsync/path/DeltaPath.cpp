#include "path/DeltaPath.hpp"

#include <cctype>
#include <limits>

namespace TS {

namespace {

auto isLetter(char ch) -> bool {
    return std::isalpha(static_cast<unsigned char>(ch)) != 0;
}

auto isDigit(char ch) -> bool {
    return std::isdigit(static_cast<unsigned char>(ch)) != 0;
}

auto pathError(std::string_view text, std::size_t offset, std::string_view reason) -> Error {
    std::string message{reason};
    message.append(" at offset ");
    message.append(std::to_string(offset));
    message.append(" in '");
    message.append(text);
    message.push_back('\'');
    return Error{Error::Code::InvalidPath, std::move(message)};
}

auto readIdentifier(std::string_view text, std::size_t& pos) -> Expected<std::string> {
    auto const start = pos;
    if (pos >= text.size() || !isLetter(text[pos])) {
        return std::unexpected(pathError(text, pos, "expected identifier"));
    }
    ++pos;
    while (pos < text.size() && (isLetter(text[pos]) || isDigit(text[pos]) || text[pos] == '_')) {
        ++pos;
    }
    return std::string{text.substr(start, pos - start)};
}

auto readBracket(std::string_view text, std::size_t& pos) -> Expected<PathStep> {
    // pos is on '['
    ++pos;
    if (pos >= text.size()) {
        return std::unexpected(pathError(text, pos, "unclosed bracket"));
    }
    PathStep step;
    if (text[pos] == '*') {
        step = PathStep::append();
        ++pos;
    } else {
        if (!isDigit(text[pos])) {
            return std::unexpected(pathError(text, pos, "expected index or '*'"));
        }
        std::size_t value = 0;
        while (pos < text.size() && isDigit(text[pos])) {
            auto digit = static_cast<std::size_t>(text[pos] - '0');
            if (value > (std::numeric_limits<std::size_t>::max() - digit) / 10) {
                return std::unexpected(pathError(text, pos, "index overflow"));
            }
            value = value * 10 + digit;
            ++pos;
        }
        step = PathStep::index(value);
    }
    if (pos >= text.size() || text[pos] != ']') {
        return std::unexpected(pathError(text, pos, "unclosed bracket"));
    }
    ++pos;
    return step;
}

} // namespace

auto DeltaPath::hasInnerAppend() const noexcept -> bool {
    for (std::size_t i = 0; i + 1 < steps_.size(); ++i) {
        if (steps_[i].kind == PathStep::Kind::Append) {
            return true;
        }
    }
    return false;
}

auto DeltaPath::parent() const -> DeltaPath {
    if (steps_.empty()) {
        return {};
    }
    return DeltaPath{std::vector<PathStep>(steps_.begin(), steps_.end() - 1)};
}

auto DeltaPath::joined(DeltaPath const& suffix) const -> DeltaPath {
    auto steps = steps_;
    steps.insert(steps.end(), suffix.steps_.begin(), suffix.steps_.end());
    return DeltaPath{std::move(steps)};
}

auto DeltaPath::toString() const -> std::string {
    std::string out;
    for (auto const& step : steps_) {
        switch (step.kind) {
        case PathStep::Kind::Key:
            if (!out.empty()) {
                out.push_back('.');
            }
            out.append(step.name);
            break;
        case PathStep::Kind::Index:
            out.push_back('[');
            out.append(std::to_string(step.position));
            out.push_back(']');
            break;
        case PathStep::Kind::Append:
            out.append("[*]");
            break;
        }
    }
    return out;
}

auto parseDeltaPath(std::string_view text) -> Expected<DeltaPath> {
    if (text.empty()) {
        return std::unexpected(Error{Error::Code::InvalidPath, "empty path"});
    }
    std::vector<PathStep> steps;
    std::size_t           pos = 0;

    auto head = readIdentifier(text, pos);
    if (!head) {
        return std::unexpected(head.error());
    }
    steps.push_back(PathStep::key(std::move(*head)));

    while (pos < text.size()) {
        if (text[pos] == '.') {
            ++pos;
            auto name = readIdentifier(text, pos);
            if (!name) {
                return std::unexpected(name.error());
            }
            steps.push_back(PathStep::key(std::move(*name)));
        } else if (text[pos] == '[') {
            auto step = readBracket(text, pos);
            if (!step) {
                return std::unexpected(step.error());
            }
            steps.push_back(std::move(*step));
        } else {
            return std::unexpected(pathError(text, pos, "unexpected character"));
        }
    }
    return DeltaPath{std::move(steps)};
}

} // namespace TS

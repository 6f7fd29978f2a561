#pragma once
#include <expected>
#include <optional>
#include <string>
#include <string_view>

namespace TS {

struct Error {
    enum class Code {
        UnknownError = 0,
        // Path resolution
        MissingKey,
        MissingParent,
        IndexOutOfRange,
        InvalidWildcardUsage,
        InvalidPath,
        // Delta validation
        NotFound,
        ElementNotFound,
        TypeMismatch,
        // Turn sequencing
        StaleTurn,
        TurnGap,
        IntegrityError,
        // Sessions
        SessionNotFound,
        SessionClosed,
        // Protocol / environment
        MalformedInput,
        Timeout,
        NoHandler,
        IoError
    };

    enum class Category {
        Path,
        Validation,
        Sequencing,
        Integrity,
        Session,
        Protocol,
        Internal
    };

    Error(Code c, std::string m)
        : code(c), message(std::move(m)) {}

    Code                       code;
    std::optional<std::string> message;
};

template <typename T>
using Expected = std::expected<T, Error>;

[[nodiscard]] inline auto errorCodeToString(Error::Code code) -> std::string_view {
    switch (code) {
    case Error::Code::UnknownError:
        return "unknown_error";
    case Error::Code::MissingKey:
        return "missing_key";
    case Error::Code::MissingParent:
        return "missing_parent";
    case Error::Code::IndexOutOfRange:
        return "index_out_of_range";
    case Error::Code::InvalidWildcardUsage:
        return "invalid_wildcard_usage";
    case Error::Code::InvalidPath:
        return "invalid_path";
    case Error::Code::NotFound:
        return "not_found";
    case Error::Code::ElementNotFound:
        return "element_not_found";
    case Error::Code::TypeMismatch:
        return "type_mismatch";
    case Error::Code::StaleTurn:
        return "stale_turn";
    case Error::Code::TurnGap:
        return "turn_gap";
    case Error::Code::IntegrityError:
        return "integrity_error";
    case Error::Code::SessionNotFound:
        return "session_not_found";
    case Error::Code::SessionClosed:
        return "session_closed";
    case Error::Code::MalformedInput:
        return "malformed_input";
    case Error::Code::Timeout:
        return "timeout";
    case Error::Code::NoHandler:
        return "no_handler";
    case Error::Code::IoError:
        return "io_error";
    }
    return "unknown_error";
}

[[nodiscard]] inline auto errorCategory(Error::Code code) -> Error::Category {
    switch (code) {
    case Error::Code::MissingKey:
    case Error::Code::MissingParent:
    case Error::Code::IndexOutOfRange:
    case Error::Code::InvalidWildcardUsage:
    case Error::Code::InvalidPath:
        return Error::Category::Path;
    case Error::Code::NotFound:
    case Error::Code::ElementNotFound:
    case Error::Code::TypeMismatch:
        return Error::Category::Validation;
    case Error::Code::StaleTurn:
    case Error::Code::TurnGap:
        return Error::Category::Sequencing;
    case Error::Code::IntegrityError:
        return Error::Category::Integrity;
    case Error::Code::SessionNotFound:
    case Error::Code::SessionClosed:
        return Error::Category::Session;
    case Error::Code::MalformedInput:
    case Error::Code::NoHandler:
        return Error::Category::Protocol;
    case Error::Code::UnknownError:
    case Error::Code::Timeout:
    case Error::Code::IoError:
        return Error::Category::Internal;
    }
    return Error::Category::Internal;
}

// Path and validation errors reject one delta; the turn carries on without it.
[[nodiscard]] inline auto isDeltaLocal(Error::Code code) -> bool {
    auto const category = errorCategory(code);
    return category == Error::Category::Path || category == Error::Category::Validation;
}

[[nodiscard]] inline auto describeError(Error const& error) -> std::string {
    auto const label = errorCodeToString(error.code);
    if (error.message && !error.message->empty()) {
        std::string description;
        description.reserve(label.size() + 1 + error.message->size());
        description.append(label.data(), label.size());
        description.push_back(':');
        description.append(error.message->data(), error.message->size());
        return description;
    }
    return std::string{label};
}

} // namespace TS

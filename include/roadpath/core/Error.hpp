#pragma once
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

namespace RP {

struct Error {
    enum class Code {
        InvalidError = 0,
        UnknownError,
        NoSuchPath,
        InvalidPath,
        InvalidName,
        InvalidSuffix,
        EmptyName,
        NotRelative,
        MixedAbsoluteRelative,
        NoCommonPath,
        InvalidPermissions,
        NotFound,
        IoError
    };

    Error(Code c, std::string m)
        : code(c), message(std::move(m)) {}
    Error(Code c, std::string m, std::error_code ec)
        : code(c), message(std::move(m)), cause(ec) {}

    Code                       code;
    std::optional<std::string> message;
    // Platform error the failure originated from, empty for lexical failures.
    std::error_code            cause;
};

template <typename T>
using Expected = std::expected<T, Error>;

[[nodiscard]] inline auto errorCodeToString(Error::Code code) -> std::string_view {
    switch (code) {
    case Error::Code::InvalidError:
        return "invalid_error";
    case Error::Code::UnknownError:
        return "unknown_error";
    case Error::Code::NoSuchPath:
        return "no_such_path";
    case Error::Code::InvalidPath:
        return "invalid_path";
    case Error::Code::InvalidName:
        return "invalid_name";
    case Error::Code::InvalidSuffix:
        return "invalid_suffix";
    case Error::Code::EmptyName:
        return "empty_name";
    case Error::Code::NotRelative:
        return "not_relative";
    case Error::Code::MixedAbsoluteRelative:
        return "mixed_absolute_relative";
    case Error::Code::NoCommonPath:
        return "no_common_path";
    case Error::Code::InvalidPermissions:
        return "invalid_permissions";
    case Error::Code::NotFound:
        return "not_found";
    case Error::Code::IoError:
        return "io_error";
    }
    return "unknown_error";
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

/**
 * Maps a platform error onto an Error while keeping the original code in
 * Error::cause. The context string usually names the offending path.
 */
[[nodiscard]] inline auto fromErrorCode(std::error_code ec, std::string context) -> Error {
    auto code = Error::Code::IoError;
    if (ec == std::errc::no_such_file_or_directory) {
        code = Error::Code::NoSuchPath;
    } else if (ec == std::errc::permission_denied || ec == std::errc::operation_not_permitted) {
        code = Error::Code::InvalidPermissions;
    }
    if (!context.empty()) {
        context.append(": ");
    }
    context.append(ec.message());
    return Error{code, std::move(context), ec};
}

} // namespace RP

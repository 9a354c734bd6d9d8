#pragma once
#include <expected>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace WS {

struct Error {
    enum class Code {
        InvalidError = 0,
        UnknownError,
        InvalidHandle,
        StaleHandle,
        SlotOccupied,
        SlotVacant,
        NotFound,
        MalformedInput,
        InvalidType,
        TypeMismatch,
        CyclicReference,
        NotSupported
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
    case Error::Code::InvalidError:
        return "invalid_error";
    case Error::Code::UnknownError:
        return "unknown_error";
    case Error::Code::InvalidHandle:
        return "invalid_handle";
    case Error::Code::StaleHandle:
        return "stale_handle";
    case Error::Code::SlotOccupied:
        return "slot_occupied";
    case Error::Code::SlotVacant:
        return "slot_vacant";
    case Error::Code::NotFound:
        return "not_found";
    case Error::Code::MalformedInput:
        return "malformed_input";
    case Error::Code::InvalidType:
        return "invalid_type";
    case Error::Code::TypeMismatch:
        return "type_mismatch";
    case Error::Code::CyclicReference:
        return "cyclic_reference";
    case Error::Code::NotSupported:
        return "not_supported";
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

/*
 * Thrown when a caller breaks a precondition of the node arena or the interface
 * (stale handle, reinsertion into an occupied slot, removing the root). These are
 * programming errors; the tree is left untouched by the failing call.
 */
class ContractViolation : public std::logic_error {
public:
    ContractViolation(Error::Code c, std::string const& m)
        : std::logic_error(describeError(Error{c, m})), code(c) {}

    Error::Code code;
};

} // namespace WS

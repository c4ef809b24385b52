/// @file error.hpp
/// @brief Error types for the jsonverse-cpp library.

#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace jsonverse_cpp {

/// Categories of errors that can occur in the library.
enum class ErrorKind : std::uint8_t {
    document_not_found,          ///< No document with the given id exists.
    version_not_found,           ///< The version does not exist or belongs to another document.
    invalid_content,             ///< Input could not be turned into a well-formed Tree.
    patch_conflict,              ///< A patch does not fit the tree it is applied to.
    concurrent_save_superseded,  ///< A queued autosave was collapsed into another one (see SaveOutcome::error_kind).
    storage_error,               ///< The backend failed or returned an unreadable record.
};

/// Convert an ErrorKind to its string representation.
constexpr auto to_string_view(ErrorKind kind) noexcept -> std::string_view {
    switch (kind) {
        case ErrorKind::document_not_found:         return "document_not_found";
        case ErrorKind::version_not_found:          return "version_not_found";
        case ErrorKind::invalid_content:            return "invalid_content";
        case ErrorKind::patch_conflict:             return "patch_conflict";
        case ErrorKind::concurrent_save_superseded: return "concurrent_save_superseded";
        case ErrorKind::storage_error:              return "storage_error";
    }
    return "unknown";
}

/// A structured error with a category and a human-readable message.
struct Error {
    ErrorKind kind;      ///< The category of this error.
    std::string message; ///< A human-readable description.

    /// Construct an Error with the given kind and message.
    Error(ErrorKind k, std::string msg)
        : kind{k}, message{std::move(msg)} {}

    auto operator==(const Error& other) const -> bool = default;
};

/// Exception thrown by core operations. Carries the structured Error.
///
/// @code
/// try {
///     repo.versions().get_version(doc_id, version_id);
/// } catch (const jsonverse_cpp::Exception& e) {
///     if (e.kind() == ErrorKind::version_not_found) { ... }
/// }
/// @endcode
class Exception : public std::runtime_error {
public:
    explicit Exception(Error error)
        : std::runtime_error{std::string{to_string_view(error.kind)} + ": " + error.message},
          error_{std::move(error)} {}

    Exception(ErrorKind kind, std::string message)
        : Exception{Error{kind, std::move(message)}} {}

    auto error() const noexcept -> const Error& { return error_; }
    auto kind() const noexcept -> ErrorKind { return error_.kind; }

private:
    Error error_;
};

}  // namespace jsonverse_cpp

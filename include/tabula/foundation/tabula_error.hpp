#pragma once

/// @file tabula_error.hpp
/// @brief TabulaError: what went wrong while building a model registry.

#include <any>
#include <filesystem>
#include <string>
#include <string_view>
#include <utility>

#include "tabula/foundation/error_code.hpp"

namespace tabula::foundation {

/// Error value returned through TabulaResult.
///
/// The message is meant for logs and names the type, artifact or key
/// involved. Errors about a file on disk (a missing secondary artifact,
/// an unreadable archive or preference store) also carry that file as a
/// std::filesystem::path context:
///
/// @code
///   auto located = ArtifactLocator(context).locate();
///   if (located.hasError()) {
///       if (const auto* path = located.error().path()) {
///           // *path is the secondary unit that was expected on disk
///       }
///   }
/// @endcode
class TabulaError {
public:
    TabulaError() = default;

    explicit TabulaError(ErrorCode code)
        : code_(code) {}

    TabulaError(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    TabulaError(ErrorCode code, std::string message, std::any context)
        : code_(code), message_(std::move(message)), context_(std::move(context)) {}

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }
    [[nodiscard]] std::string_view message() const noexcept { return message_; }

    /// "Config", "Artifact", "Type", ... derived from the code range.
    [[nodiscard]] std::string_view subsystem() const noexcept {
        return errorSubsystem(code_);
    }

    /// Context of type @p T, or nullptr when absent or of another type.
    template <typename T>
    [[nodiscard]] const T* context() const noexcept {
        return std::any_cast<T>(&context_);
    }

    /// The file this error is about, if any.
    [[nodiscard]] const std::filesystem::path* path() const noexcept {
        return context<std::filesystem::path>();
    }

    [[nodiscard]] bool hasContext() const noexcept { return context_.has_value(); }

    [[nodiscard]] bool isSuccess() const noexcept {
        return code_ == ErrorCode::Success;
    }

private:
    ErrorCode code_ = ErrorCode::Unknown;
    std::string message_;
    std::any context_;
};

} // namespace tabula::foundation

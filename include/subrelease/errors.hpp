#pragma once

/// @file errors.hpp
/// @brief Error types and exception classes for the subrelease library

#include <exception>
#include <string>
#include <utility>

namespace subrelease {

/// @brief Error codes for categorizing errors
enum class ErrorCode {
    None = 0,
    InvalidConfig,
    InvalidLanguageTable
};

/// @brief Base exception class for all subrelease errors
class SubreleaseError : public std::exception {
public:
    explicit SubreleaseError(std::string message, ErrorCode code = ErrorCode::None)
        : message_(std::move(message)), code_(code) {}

    [[nodiscard]] const char* what() const noexcept override { return message_.c_str(); }
    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

protected:
    std::string message_;
    ErrorCode code_;
};

/// @brief Configuration error
class ConfigError : public SubreleaseError {
public:
    ConfigError(std::string field, std::string details)
        : SubreleaseError(format_message(field, details), ErrorCode::InvalidConfig),
          field_(std::move(field)),
          details_(std::move(details)) {}

    [[nodiscard]] const std::string& field() const noexcept { return field_; }
    [[nodiscard]] const std::string& details() const noexcept { return details_; }

private:
    static std::string format_message(const std::string& field, const std::string& details) {
        if (!field.empty()) {
            return "invalid configuration for '" + field + "': " + details;
        }
        return "invalid configuration: " + details;
    }

    std::string field_;
    std::string details_;
};

/// @brief Language table construction error
///
/// Raised while building a table from JSON data. The key is empty when the
/// problem concerns the document as a whole (unreadable file, wrong root type).
class LanguageTableError : public SubreleaseError {
public:
    LanguageTableError(std::string key, std::string details)
        : SubreleaseError(format_message(key, details), ErrorCode::InvalidLanguageTable),
          key_(std::move(key)),
          details_(std::move(details)) {}

    [[nodiscard]] const std::string& key() const noexcept { return key_; }
    [[nodiscard]] const std::string& details() const noexcept { return details_; }

private:
    static std::string format_message(const std::string& key, const std::string& details) {
        if (!key.empty()) {
            return "invalid language entry '" + key + "': " + details;
        }
        return "invalid language table: " + details;
    }

    std::string key_;
    std::string details_;
};

}  // namespace subrelease

/**
 * @file errors.hpp
 * @brief Typed error hierarchy shared by the parser, storage and ingestion layers
 */

#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <utility>

namespace Lexicore {

/**
 * @brief Root of every error the engine throws.
 */
class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Bad or unwritable data directory, invalid option values.
class ConfigurationError : public Error {
public:
    using Error::Error;
};

/**
 * @brief Malformed XML or an LMF schema violation.
 *
 * Line and column are 1-based; zero means the position is unknown
 * (e.g. a dangling reference detected when the lexicon closes).
 */
class ParseError : public Error {
public:
    ParseError(const std::string& message, std::string element = {},
               std::size_t line = 0, std::size_t column = 0)
        : Error(format(message, element, line, column)),
          element_(std::move(element)), line_(line), column_(column) {}

    const std::string& element() const { return element_; }
    std::size_t line() const { return line_; }
    std::size_t column() const { return column_; }

private:
    static std::string format(const std::string& message, const std::string& element,
                              std::size_t line, std::size_t column) {
        std::string out = "LMF parse error";
        if (line > 0) out += " at " + std::to_string(line) + ":" + std::to_string(column);
        if (!element.empty()) out += " <" + element + ">";
        return out + ": " + message;
    }

    std::string element_;
    std::size_t line_;
    std::size_t column_;
};

/**
 * @brief Transport failure while fetching a project.
 *
 * retryable() is true for transient failures (connection reset, 5xx, timeout).
 */
class NetworkError : public Error {
public:
    enum class Kind { Transport, Timeout, Cancelled, Http };

    NetworkError(const std::string& message, Kind kind, long http_status = 0)
        : Error(message), kind_(kind), http_status_(http_status) {}

    Kind kind() const { return kind_; }
    long http_status() const { return http_status_; }
    bool timed_out() const { return kind_ == Kind::Timeout; }
    bool cancelled() const { return kind_ == Kind::Cancelled; }

    bool retryable() const {
        switch (kind_) {
            case Kind::Transport:
            case Kind::Timeout:   return true;
            case Kind::Cancelled: return false;
            case Kind::Http:      return http_status_ >= 500 || http_status_ == 429;
        }
        return false;
    }

private:
    Kind kind_;
    long http_status_;
};

/// Unknown project or version in the project index. Never retryable.
class ProjectError : public Error {
public:
    using Error::Error;
};

/// Corrupt archive, unsafe entry path, or no LMF payload found.
class ArchiveError : public Error {
public:
    using Error::Error;
};

/// Adding a lexicon whose id is already installed without force.
class ConflictError : public Error {
public:
    using Error::Error;
};

/// Mutating operation on an id that is not installed.
class NotFoundError : public Error {
public:
    using Error::Error;
};

class StorageError : public Error {
public:
    using Error::Error;
};

/// Write lock held by another connection or process.
class LockedError : public StorageError {
public:
    using StorageError::StorageError;
};

/// Store file is damaged or has an unexpected schema. Never repaired automatically.
class CorruptStoreError : public StorageError {
public:
    using StorageError::StorageError;
};

} // namespace Lexicore

#pragma once

#include <string>
#include <optional>
#include <vector>
#include <functional>
#include <cstdint>

// Failure categories carried by Result so callers can branch without
// parsing messages.
enum class ErrorCode {
    NONE,
    ALREADY_RAW,
    TERMINAL,
    RESTORE_FAILED,     // raw mode left but the old attributes did not come back
    HOP_FAILED,
    UNSUPPORTED_PATH_FORM,
    NO_CONFIG_FOUND,
    PARSE_ERROR,
    VALIDATION_ERROR,
    CONNECTION,
    AUTH,
    PROTOCOL,
    IO,
    TRANSFER,
    CANCELLED,
    NOT_FOUND,
};

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;
    ErrorCode code = ErrorCode::NONE;

    static Result<T> Ok(T val) {
        return {true, std::move(val), "", ErrorCode::NONE};
    }

    static Result<T> Err(const std::string& err, ErrorCode code = ErrorCode::IO) {
        return {false, T{}, err, code};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    std::string error;
    ErrorCode code = ErrorCode::NONE;

    static Result<void> Ok() {
        return {true, "", ErrorCode::NONE};
    }

    static Result<void> Err(const std::string& err, ErrorCode code = ErrorCode::IO) {
        return {false, err, code};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Host entry from the YAML file. Entries with children are groups and are
// never connected to; leaves carry host and user.
struct HostConfig {
    std::string name;
    std::string host;
    std::string user;
    int port = 22;
    std::optional<std::string> password;
    std::optional<std::string> key_path;
    std::vector<HostConfig> jump;              // hops, in dial order
    std::vector<HostConfig> children;          // group members
    std::vector<std::string> callback_shells;

    bool is_group() const { return !children.empty(); }
    std::string address() const { return host + ":" + std::to_string(port); }
};

// Status callback for operations
using StatusCallback = std::function<void(const std::string&)>;

#pragma once
#include <chrono>
#include <optional>
#include <stdexcept>
#include <string>

// Raised at the collaborator boundary. The kind tells how the call failed,
// status/retry_after carry what the upstream told us.
class UpstreamError : public std::runtime_error {
public:
    enum class Kind {
        Http,            // upstream answered with a non-2xx status
        Network,         // connection refused, DNS, TLS, reset
        Timeout,         // no answer in time
        InvalidResponse  // answered 2xx with a body we could not use
    };

    UpstreamError(Kind kind, const std::string& message,
                  std::optional<int> status = std::nullopt,
                  std::optional<std::chrono::seconds> retry_after = std::nullopt);

    static UpstreamError http(int status, const std::string& message,
                              std::optional<std::chrono::seconds> retry_after = std::nullopt);

    Kind kind() const { return kind_; }
    std::optional<int> status() const { return status_; }
    std::optional<std::chrono::seconds> retry_after() const { return retry_after_; }

private:
    Kind kind_;
    std::optional<int> status_;
    std::optional<std::chrono::seconds> retry_after_;
};

class CancelledError : public std::runtime_error {
public:
    explicit CancelledError(const std::string& message = "Operation cancelled")
        : std::runtime_error(message) {}
};

const char* to_string(UpstreamError::Kind kind);

// Parses an HTTP Retry-After header given in delta-seconds.
std::optional<std::chrono::seconds> parse_retry_after(const std::string& header_value);

#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace shardrent {

// Base of every error raised by the library. The code is stable and meant for
// callers that branch on the failure kind.
class Error : public std::runtime_error {
public:
    Error(std::string code, const std::string& message, std::string hint = {})
        : std::runtime_error(message),
          code_(std::move(code)),
          hint_(std::move(hint)) {}

    const std::string& code() const noexcept { return code_; }
    const std::string& hint() const noexcept { return hint_; }

private:
    std::string code_;
    std::string hint_;
};

// Reading the source stream failed.
class IoError : public Error {
public:
    explicit IoError(const std::string& message) : Error("E_IO", message) {}
};

// A chunk had the wrong size or the erasure coder could not process it.
class EncodingError : public Error {
public:
    explicit EncodingError(const std::string& message) : Error("E_ENCODING", message) {}
};

// Network failure while talking to a single host.
class TransportError : public Error {
public:
    explicit TransportError(const std::string& message) : Error("E_TRANSPORT", message) {}
};

// A host answered, but refused or mangled the exchange.
class ProtocolError : public Error {
public:
    explicit ProtocolError(const std::string& message) : Error("E_PROTOCOL", message) {}
};

class InsufficientHostsError : public Error {
public:
    explicit InsufficientHostsError(const std::string& message)
        : Error("E_INSUFFICIENT_HOSTS", message, "Wait for more hosts to announce or lower the redundancy") {}
};

class InsufficientFundsError : public Error {
public:
    explicit InsufficientFundsError(const std::string& message)
        : Error("E_INSUFFICIENT_FUNDS", message, "Fund the wallet or shorten the contract duration") {}
};

class ValidationError : public Error {
public:
    explicit ValidationError(const std::string& message) : Error("E_VALIDATION", message) {}
};

class UploadFailedError : public Error {
public:
    explicit UploadFailedError(const std::string& message) : Error("E_UPLOAD_FAILED", message) {}
};

class ConfigError : public Error {
public:
    ConfigError(std::string code, const std::string& message, std::string hint = {})
        : Error(std::move(code), message, std::move(hint)) {}
};

}  // namespace shardrent

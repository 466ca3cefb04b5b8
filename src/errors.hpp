#pragma once

#include <stdexcept>
#include <string>
#include <utility>

// Every failure aborts the whole transfer session. kind() names the
// failure class in the terminal message; entry() is the manifest path
// being processed when the failure happened, if any.
class TransferError : public std::runtime_error {
public:
  TransferError(const char* kind, const std::string& message, std::string entry = {})
    : std::runtime_error(message), kind_(kind), entry_(std::move(entry)) {}

  const char* kind() const noexcept { return kind_; }
  const std::string& entry() const noexcept { return entry_; }
  void set_entry(std::string entry) { entry_ = std::move(entry); }

private:
  const char* kind_;
  std::string entry_;
};

// Bad settings or command line.
class ConfigError : public TransferError {
public:
  explicit ConfigError(const std::string& message, std::string entry = {})
    : TransferError("ConfigError", message, std::move(entry)) {}
};

class ConnectionError : public TransferError {
public:
  explicit ConnectionError(const std::string& message, std::string entry = {})
    : TransferError("ConnectionError", message, std::move(entry)) {}
};

// Malformed or unexpected message from the peer.
class ProtocolError : public TransferError {
public:
  explicit ProtocolError(const std::string& message, std::string entry = {})
    : TransferError("ProtocolError", message, std::move(entry)) {}
};

class RemoteRejectedError : public TransferError {
public:
  explicit RemoteRejectedError(const std::string& message, std::string entry = {})
    : TransferError("RemoteRejectedError", message, std::move(entry)) {}
};

// An entry path would land outside the destination root.
class PathTraversalError : public TransferError {
public:
  explicit PathTraversalError(const std::string& message, std::string entry = {})
    : TransferError("PathTraversalError", message, std::move(entry)) {}
};

// The destination already holds something at the entry path.
class ConflictError : public TransferError {
public:
  explicit ConflictError(const std::string& message, std::string entry = {})
    : TransferError("ConflictError", message, std::move(entry)) {}
};

class StreamCorruptError : public TransferError {
public:
  explicit StreamCorruptError(const std::string& message, std::string entry = {})
    : TransferError("StreamCorruptError", message, std::move(entry)) {}
};

// Size or digest differs from the manifest.
class IntegrityError : public TransferError {
public:
  explicit IntegrityError(const std::string& message, std::string entry = {})
    : TransferError("IntegrityError", message, std::move(entry)) {}
};

// Local read, write, staging or commit failure.
class FileSystemError : public TransferError {
public:
  explicit FileSystemError(const std::string& message, std::string entry = {})
    : TransferError("FileSystemError", message, std::move(entry)) {}
};

#pragma once

#include <stdexcept>
#include <string>

#include "core/types.hpp"

namespace convo {

// Error taxonomy shared by every component
enum class ErrorKind {
  Config,
  Network,
  Protocol,
  PolicyViolation,
  ToolExecution,
  SessionIO,
  CapabilityUnsupported,
  DuplicateTool,
  UnknownTool,
  Cancelled
};

std::string to_string(ErrorKind kind);

// Recoverable errors become tool-result content, everything else ends the run
bool is_recoverable(ErrorKind kind);

class Error : public std::runtime_error {
 public:
  Error(ErrorKind kind, const std::string &message) : std::runtime_error(message), kind_(kind) {}

  ErrorKind kind() const {
    return kind_;
  }

  // "<Kind>: <message>", the form recorded in tool results and logs
  std::string describe() const;

 private:
  ErrorKind kind_;
};

class ConfigError : public Error {
 public:
  explicit ConfigError(const std::string &message) : Error(ErrorKind::Config, message) {}
};

class NetworkError : public Error {
 public:
  explicit NetworkError(const std::string &message, int status_code = 0)
      : Error(ErrorKind::Network, message), status_code_(status_code) {}

  // 0 when the failure happened below HTTP
  int status_code() const {
    return status_code_;
  }

 private:
  int status_code_;
};

class ProtocolError : public Error {
 public:
  explicit ProtocolError(const std::string &message) : Error(ErrorKind::Protocol, message) {}
};

class PolicyViolation : public Error {
 public:
  PolicyViolation(const std::string &tool, Mode mode, const std::string &reason)
      : Error(ErrorKind::PolicyViolation, reason), tool_(tool), mode_(mode) {}

  const std::string &tool() const {
    return tool_;
  }

  Mode mode() const {
    return mode_;
  }

 private:
  std::string tool_;
  Mode mode_;
};

class ToolExecutionError : public Error {
 public:
  explicit ToolExecutionError(const std::string &message) : Error(ErrorKind::ToolExecution, message) {}
};

class SessionIOError : public Error {
 public:
  explicit SessionIOError(const std::string &message) : Error(ErrorKind::SessionIO, message) {}
};

class CapabilityUnsupported : public Error {
 public:
  explicit CapabilityUnsupported(const std::string &message) : Error(ErrorKind::CapabilityUnsupported, message) {}
};

class DuplicateTool : public Error {
 public:
  explicit DuplicateTool(const std::string &name)
      : Error(ErrorKind::DuplicateTool, "tool '" + name + "' is already registered") {}
};

class UnknownTool : public Error {
 public:
  explicit UnknownTool(const std::string &name) : Error(ErrorKind::UnknownTool, "unknown tool '" + name + "'") {}
};

class Cancelled : public Error {
 public:
  explicit Cancelled(const std::string &message = "operation cancelled") : Error(ErrorKind::Cancelled, message) {}
};

}  // namespace convo

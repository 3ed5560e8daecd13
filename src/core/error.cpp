#include "core/error.hpp"

namespace convo {

std::string to_string(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::Config:
      return "ConfigError";
    case ErrorKind::Network:
      return "NetworkError";
    case ErrorKind::Protocol:
      return "ProtocolError";
    case ErrorKind::PolicyViolation:
      return "PolicyViolation";
    case ErrorKind::ToolExecution:
      return "ToolExecutionError";
    case ErrorKind::SessionIO:
      return "SessionIOError";
    case ErrorKind::CapabilityUnsupported:
      return "CapabilityUnsupported";
    case ErrorKind::DuplicateTool:
      return "DuplicateTool";
    case ErrorKind::UnknownTool:
      return "UnknownTool";
    case ErrorKind::Cancelled:
      return "Cancelled";
  }
  return "Error";
}

bool is_recoverable(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::PolicyViolation:
    case ErrorKind::ToolExecution:
    case ErrorKind::UnknownTool:
      return true;
    default:
      return false;
  }
}

std::string Error::describe() const {
  return to_string(kind_) + ": " + what();
}

}  // namespace convo

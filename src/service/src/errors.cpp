#include "../include/errors.hpp"

std::string errorKindToString(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::Conflict:
      return "conflict";
    case ErrorKind::GuardViolation:
      return "guard_violation";
    case ErrorKind::Filesystem:
      return "filesystem";
    case ErrorKind::ResourceExhaustion:
      return "resource_exhaustion";
    case ErrorKind::NotFound:
      return "not_found";
    case ErrorKind::InvalidArgument:
      return "invalid_argument";
    case ErrorKind::Supervisor:
      return "supervisor";
    case ErrorKind::ReconcileBusy:
      return "reconcile_busy";
    case ErrorKind::Timeout:
      return "timeout";
  }
  return "unknown";
}

ConflictError::ConflictError(ValidationResult result)
    : StewardError(ErrorKind::Conflict,
                   "Configuration conflicts: " + result.summary()),
      result_(std::move(result)) {}

GuardViolation::GuardViolation(const std::string &node,
                               const std::string &state,
                               const std::string &operation)
    : StewardError(ErrorKind::GuardViolation,
                   "Cannot " + operation + " node \"" + node +
                       "\" while it is " + state + ". Stop the node first."),
      node_(node),
      state_(state) {}

FilesystemError::FilesystemError(const std::string &message,
                                 const std::string &path, std::error_code code)
    : StewardError(ErrorKind::Filesystem,
                   message + ": " + path +
                       (code ? " (" + code.message() + ")" : std::string())),
      path_(path),
      code_(code) {}

#ifndef SYNC_ERRORS_H
#define SYNC_ERRORS_H

#include <exception>
#include <stdexcept>
#include <string>

enum class ErrorKind { Connection, Schema, Provision, Data, System };

std::string errorKindToString(ErrorKind kind);

// Base for every failure the sync pipeline raises. unit() and operation()
// carry enough context for an operator to act without reading logs.
class SyncError : public std::runtime_error {
  ErrorKind kind_;
  std::string unit_;
  std::string operation_;

public:
  SyncError(ErrorKind kind, const std::string &message,
            const std::string &unit = "", const std::string &operation = "")
      : std::runtime_error(message), kind_(kind), unit_(unit),
        operation_(operation) {}

  ErrorKind kind() const { return kind_; }
  const std::string &unit() const { return unit_; }
  const std::string &operation() const { return operation_; }

  // "[Kind] unit/operation: message"
  std::string describe() const;
};

class ConnectionError : public SyncError {
public:
  explicit ConnectionError(const std::string &message,
                           const std::string &unit = "",
                           const std::string &operation = "")
      : SyncError(ErrorKind::Connection, message, unit, operation) {}
};

class SchemaError : public SyncError {
public:
  explicit SchemaError(const std::string &message, const std::string &unit = "",
                       const std::string &operation = "")
      : SyncError(ErrorKind::Schema, message, unit, operation) {}
};

class ProvisionError : public SyncError {
public:
  explicit ProvisionError(const std::string &message,
                          const std::string &unit = "",
                          const std::string &operation = "")
      : SyncError(ErrorKind::Provision, message, unit, operation) {}
};

class DataError : public SyncError {
public:
  explicit DataError(const std::string &message, const std::string &unit = "",
                     const std::string &operation = "")
      : SyncError(ErrorKind::Data, message, unit, operation) {}
};

class SystemError : public SyncError {
public:
  explicit SystemError(const std::string &message, const std::string &unit = "",
                       const std::string &operation = "")
      : SyncError(ErrorKind::System, message, unit, operation) {}
};

enum class RecordFailureKind {
  ConstraintViolation,
  TypeMismatch,
  SizeLimit,
  Rejected,
  Unknown
};

std::string recordFailureKindToString(RecordFailureKind kind);

// Converts whatever escaped a pipeline step into a SyncError. SyncErrors keep
// their kind, std::bad_alloc and filesystem-full conditions become
// SystemError, anything else is reported as SystemError with the original
// message since its effect on the destination is unknown.
SyncError classifyException(std::exception_ptr error, const std::string &unit,
                            const std::string &operation);

#endif

#include "core/sync_errors.h"
#include <cerrno>
#include <filesystem>
#include <new>
#include <system_error>

std::string errorKindToString(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::Connection:
    return "ConnectionError";
  case ErrorKind::Schema:
    return "SchemaError";
  case ErrorKind::Provision:
    return "ProvisionError";
  case ErrorKind::Data:
    return "DataError";
  case ErrorKind::System:
    return "SystemError";
  }
  return "SystemError";
}

std::string recordFailureKindToString(RecordFailureKind kind) {
  switch (kind) {
  case RecordFailureKind::ConstraintViolation:
    return "constraint_violation";
  case RecordFailureKind::TypeMismatch:
    return "type_mismatch";
  case RecordFailureKind::SizeLimit:
    return "size_limit";
  case RecordFailureKind::Rejected:
    return "rejected";
  case RecordFailureKind::Unknown:
    return "unknown";
  }
  return "unknown";
}

std::string SyncError::describe() const {
  std::string text = "[" + errorKindToString(kind_) + "]";
  if (!unit_.empty() || !operation_.empty()) {
    text += " " + unit_;
    if (!operation_.empty())
      text += (unit_.empty() ? "" : "/") + operation_;
    text += ":";
  }
  return text + " " + what();
}

SyncError classifyException(std::exception_ptr error, const std::string &unit,
                            const std::string &operation) {
  try {
    std::rethrow_exception(error);
  } catch (const SyncError &e) {
    return SyncError(e.kind(), e.what(), e.unit().empty() ? unit : e.unit(),
                     e.operation().empty() ? operation : e.operation());
  } catch (const std::bad_alloc &) {
    return SystemError("memory allocation failed", unit, operation);
  } catch (const std::system_error &e) {
    if (e.code() == std::errc::no_space_on_device)
      return SystemError(std::string("disk full: ") + e.what(), unit,
                         operation);
    return SystemError(e.what(), unit, operation);
  } catch (const std::exception &e) {
    return SystemError(e.what(), unit, operation);
  }
}

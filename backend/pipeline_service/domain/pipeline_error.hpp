#pragma once

#include <string>
#include <string_view>
#include <format>

namespace pipeline_service {

enum class ErrorKind {
  Validation,
  UnsupportedFormat,
  CorruptInput,
  TranscodeTransient,
  TranscodePermanent,
  Storage,
  ConcurrencyConflict,
  NotFound,
  RangeNotSatisfiable,
};

constexpr std::string_view errorKindName(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::Validation:          return "ValidationError";
    case ErrorKind::UnsupportedFormat:   return "UnsupportedFormatError";
    case ErrorKind::CorruptInput:        return "CorruptInputError";
    case ErrorKind::TranscodeTransient:  return "TranscodeError{transient}";
    case ErrorKind::TranscodePermanent:  return "TranscodeError{permanent}";
    case ErrorKind::Storage:             return "StorageError";
    case ErrorKind::ConcurrencyConflict: return "ConcurrencyConflictError";
    case ErrorKind::NotFound:            return "NotFoundError";
    case ErrorKind::RangeNotSatisfiable: return "RangeNotSatisfiableError";
  }
  return "UnknownError";
}

struct PipelineError {
  ErrorKind kind;
  std::string message;

  // Transient transcode failures and storage failures are worth another attempt.
  bool retryable() const {
    return kind == ErrorKind::TranscodeTransient || kind == ErrorKind::Storage;
  }

  std::string describe() const {
    return std::format("{}: {}", errorKindName(kind), message);
  }
};

inline PipelineError validationError(std::string msg) { return {ErrorKind::Validation, std::move(msg)}; }
inline PipelineError unsupportedFormat(std::string msg) { return {ErrorKind::UnsupportedFormat, std::move(msg)}; }
inline PipelineError corruptInput(std::string msg) { return {ErrorKind::CorruptInput, std::move(msg)}; }
inline PipelineError transientTranscode(std::string msg) { return {ErrorKind::TranscodeTransient, std::move(msg)}; }
inline PipelineError permanentTranscode(std::string msg) { return {ErrorKind::TranscodePermanent, std::move(msg)}; }
inline PipelineError storageError(std::string msg) { return {ErrorKind::Storage, std::move(msg)}; }
inline PipelineError conflictError(std::string msg) { return {ErrorKind::ConcurrencyConflict, std::move(msg)}; }
inline PipelineError notFound(std::string msg) { return {ErrorKind::NotFound, std::move(msg)}; }
inline PipelineError rangeNotSatisfiable(std::string msg) { return {ErrorKind::RangeNotSatisfiable, std::move(msg)}; }

} // namespace pipeline_service

#pragma once

#include <exception>
#include <string>

namespace kb_core {

enum class ErrorKind {
  MissingArtifact,
  CorruptArtifact,
  DimensionMismatch,
  ProviderFailure,
  ProviderMismatch,
  OutOfRange,
  InvalidArgument,
  InvalidDocument,
  Config,
  NotLoaded,
  Io
};

inline std::string kind_to_string(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::MissingArtifact: return "missing_artifact";
    case ErrorKind::CorruptArtifact: return "corrupt_artifact";
    case ErrorKind::DimensionMismatch: return "dimension_mismatch";
    case ErrorKind::ProviderFailure: return "provider_failure";
    case ErrorKind::ProviderMismatch: return "provider_mismatch";
    case ErrorKind::OutOfRange: return "out_of_range";
    case ErrorKind::InvalidArgument: return "invalid_argument";
    case ErrorKind::InvalidDocument: return "invalid_document";
    case ErrorKind::Config: return "config";
    case ErrorKind::NotLoaded: return "not_loaded";
    case ErrorKind::Io: return "io";
    default: return "generic";
  }
}

// Base of every error the core raises. Callers that only need to render the
// failure catch this and use kind() to pick a status code.
class KbError : public std::exception {
 public:
  KbError(ErrorKind kind, const std::string &message) : kind_(kind), message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

  ErrorKind kind() const noexcept {
    return kind_;
  }

 private:
  ErrorKind kind_;
  std::string message_;
};

class MissingArtifactError : public KbError {
 public:
  explicit MissingArtifactError(const std::string &message)
      : KbError(ErrorKind::MissingArtifact, message) {}
};

class CorruptArtifactError : public KbError {
 public:
  explicit CorruptArtifactError(const std::string &message)
      : KbError(ErrorKind::CorruptArtifact, message) {}
};

class DimensionMismatchError : public KbError {
 public:
  DimensionMismatchError(size_t expected, size_t actual)
      : KbError(ErrorKind::DimensionMismatch,
                "Vector dimension mismatch. Expected " + std::to_string(expected) + ", got " +
                    std::to_string(actual)) {}
};

class ProviderError : public KbError {
 public:
  explicit ProviderError(const std::string &message)
      : KbError(ErrorKind::ProviderFailure, message) {}
};

class ProviderMismatchError : public KbError {
 public:
  ProviderMismatchError(const std::string &index_model, const std::string &query_model)
      : KbError(ErrorKind::ProviderMismatch,
                "Index was built with embedding model '" + index_model +
                    "' but queries use '" + query_model + "'") {}
};

class OutOfRangeError : public KbError {
 public:
  explicit OutOfRangeError(const std::string &message)
      : KbError(ErrorKind::OutOfRange, message) {}
};

class InvalidArgumentError : public KbError {
 public:
  explicit InvalidArgumentError(const std::string &message)
      : KbError(ErrorKind::InvalidArgument, message) {}
};

class InvalidDocumentError : public KbError {
 public:
  explicit InvalidDocumentError(const std::string &message)
      : KbError(ErrorKind::InvalidDocument, message) {}
};

class ConfigError : public KbError {
 public:
  explicit ConfigError(const std::string &message) : KbError(ErrorKind::Config, message) {}
};

class NotLoadedError : public KbError {
 public:
  NotLoadedError() : KbError(ErrorKind::NotLoaded, "No index is loaded") {}
};

class IoError : public KbError {
 public:
  explicit IoError(const std::string &message) : KbError(ErrorKind::Io, message) {}
};

}  // namespace kb_core

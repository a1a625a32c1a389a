#include <pca/errors.hpp>

#include <sstream>

namespace mousepca {

const char *ErrorKindName(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::kShapeMismatch:
    return "ShapeMismatch";
  case ErrorKind::kInsufficientData:
    return "InsufficientData";
  case ErrorKind::kInvalidState:
    return "InvalidState";
  case ErrorKind::kIOFailure:
    return "IOFailure";
  }
  return "Unknown";
}

std::string PipelineError::ToString() const {
  std::ostringstream result;
  result << ErrorKindName(kind);
  if (!session_key.empty()) {
    result << " [session " << session_key << "]";
  }
  result << ": " << message;
  return result.str();
}

bool SetError(PipelineError *error, ErrorKind kind,
              const std::string &session_key, const std::string &message) {
  if (error != nullptr) {
    error->kind = kind;
    error->session_key = session_key;
    error->message = message;
  }
  return false;
}

std::ostream &operator<<(std::ostream &out, const PipelineError &error) {
  return out << error.ToString();
}

} // namespace mousepca

#ifndef MOUSEPCA_PCA_ERRORS_HPP_
#define MOUSEPCA_PCA_ERRORS_HPP_

#include <ostream>
#include <string>

namespace mousepca {

enum class ErrorKind {
  // Frame, model or basis dimensions disagree.
  kShapeMismatch,
  // Too few observations for the requested number of components.
  kInsufficientData,
  // Trainer operation called out of its state machine order.
  kInvalidState,
  // Frames or results could not be read or written.
  kIOFailure,
};

const char *ErrorKindName(ErrorKind kind);

// Recoverable error attributed to a single session. Fallible pipeline
// operations return false and fill one of these in.
struct PipelineError {
  ErrorKind kind = ErrorKind::kIOFailure;
  std::string session_key;
  std::string message;

  std::string ToString() const;
};

// Fills *error (if not null) and returns false, so that failure paths can be
// written as "return SetError(...);".
bool SetError(PipelineError *error, ErrorKind kind,
              const std::string &session_key, const std::string &message);

std::ostream &operator<<(std::ostream &out, const PipelineError &error);

} // namespace mousepca

#endif // MOUSEPCA_PCA_ERRORS_HPP_

#include "ordex/execution/rejection_classifier.hpp"

#include "ordex/venue/venue_errors.hpp"

namespace ordex {

const char* to_string(RejectionSeverity severity) {
  switch (severity) {
    case RejectionSeverity::Fatal:     return "fatal";
    case RejectionSeverity::Transient: return "transient";
  }
  return "unknown";
}

RejectionSeverity RejectionClassifier::classify(const std::exception& error) {
  if (dynamic_cast<const venue::InsufficientFunds*>(&error) != nullptr ||
      dynamic_cast<const venue::BadSymbol*>(&error) != nullptr) {
    return RejectionSeverity::Fatal;
  }
  // TODO: allow venue connectors to register extra fatal error types (e.g.
  // "order would immediately trigger" on post-only venues).
  return RejectionSeverity::Transient;
}

}  // namespace ordex

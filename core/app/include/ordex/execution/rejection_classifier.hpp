#pragma once

#include <exception>

namespace ordex {

// -----------------------------------------------------------------------------
// RejectionSeverity / RejectionClassifier
// -----------------------------------------------------------------------------
// Splits order-placement failures into:
//   Fatal      permanent business errors (venue::InsufficientFunds,
//              venue::BadSymbol). The order is failed without retry.
//   Transient  everything else: rate limits, network errors, and any error
//              type the classifier does not recognise. The caller retries.
// -----------------------------------------------------------------------------
enum class RejectionSeverity {
  Fatal,
  Transient,
};

const char* to_string(RejectionSeverity severity);

class RejectionClassifier {
 public:
  static RejectionSeverity classify(const std::exception& error);
};

}  // namespace ordex

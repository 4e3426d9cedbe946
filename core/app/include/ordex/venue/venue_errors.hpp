#pragma once

#include <stdexcept>
#include <string>

namespace ordex {
namespace venue {

// -----------------------------------------------------------------------------
// Venue error taxonomy
// -----------------------------------------------------------------------------
// Connectors translate their transport and exchange failures into these
// types. Executors only ever branch on them:
//
//   VenueError
//     NetworkError          transport failure, safe to retry
//       RateLimitExceeded   venue throttled us, safe to retry later
//     ExchangeError         venue processed and refused the request
//       InsufficientFunds   never succeeds on retry
//       BadSymbol           never succeeds on retry
//
// RejectionClassifier maps InsufficientFunds and BadSymbol to FATAL and
// everything else to TRANSIENT. Stream executors reconnect on NetworkError.
// -----------------------------------------------------------------------------
class VenueError : public std::runtime_error {
 public:
  explicit VenueError(const std::string& message)
      : std::runtime_error(message) {}
};

class NetworkError : public VenueError {
 public:
  using VenueError::VenueError;
};

class RateLimitExceeded : public NetworkError {
 public:
  using NetworkError::NetworkError;
};

class ExchangeError : public VenueError {
 public:
  using VenueError::VenueError;
};

class InsufficientFunds : public ExchangeError {
 public:
  using ExchangeError::ExchangeError;
};

class BadSymbol : public ExchangeError {
 public:
  using ExchangeError::ExchangeError;
};

}  // namespace venue
}  // namespace ordex

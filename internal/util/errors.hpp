#pragma once

#include <stdexcept>
#include <string>

namespace walship::util {

/*
  Central error types.

  These get translated to gRPC status codes at the transport boundary and
  back into the same types by the primary client.
*/

// Coordination backend or peer unreachable. Retried with backoff.
class ConnectionError : public std::runtime_error {
 public:
  explicit ConnectionError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class NoPrimaryError : public std::runtime_error {
 public:
  explicit NoPrimaryError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class LeaseHeldError : public std::runtime_error {
 public:
  explicit LeaseHeldError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class LeaseLostError : public std::runtime_error {
 public:
  explicit LeaseLostError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Requested resume position is no longer retained; a snapshot resync is required.
class PositionTooOldError : public std::runtime_error {
 public:
  explicit PositionTooOldError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Received frame does not follow the applied position.
class DesyncError : public std::runtime_error {
 public:
  explicit DesyncError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class NotPrimaryError : public std::runtime_error {
 public:
  explicit NotPrimaryError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class UnknownDatabaseError : public std::runtime_error {
 public:
  explicit UnknownDatabaseError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class AlreadyExists : public std::runtime_error {
 public:
  explicit AlreadyExists(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidArgument : public std::runtime_error {
 public:
  explicit InvalidArgument(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Startup configuration is unusable. Never retried.
class ConfigError : public std::runtime_error {
 public:
  explicit ConfigError(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace walship::util

#pragma once

#include <stdexcept>
#include <string>

namespace repricer::util {

/*
  Central error types.

  Thrown by the service and engine layers, translated to gRPC status
  codes in internal/grpc/grpc_error.cpp. The storage layer never throws
  these; it reports db::Result codes instead.
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
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

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Shared store rejected or failed an operation the caller cannot degrade around.
class StoreUnavailable : public std::runtime_error {
 public:
  explicit StoreUnavailable(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Transport failure talking to the commerce platform bridge.
class GatewayError : public std::runtime_error {
 public:
  explicit GatewayError(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace repricer::util

#pragma once

#include <stdexcept>
#include <string>

namespace trackmatch::util {

/*
  Central error types.

  These get translated later to gRPC status codes.
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
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

// A requester already has a search or verification in flight.
class RequesterBusy : public std::runtime_error {
 public:
  explicit RequesterBusy(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Transport or protocol failure talking to the search provider.
class ProviderError : public std::runtime_error {
 public:
  ProviderError(const std::string& msg, long http_status = 0) : std::runtime_error(msg), http_status_(http_status) {
  }

  long HttpStatus() const {
    return http_status_;
  }

 private:
  long http_status_;
};

class DecodeError : public std::runtime_error {
 public:
  explicit DecodeError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class Cancelled : public std::runtime_error {
 public:
  explicit Cancelled(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace trackmatch::util

#pragma once

#include <stdexcept>
#include <string>

namespace fieldlink::util {

/*
  Central error types.

  Startup errors (ConfigError, ConnectionError) abort the process before the
  listener is bound. Request errors are converted by the resolver into a
  failure response and never escape a request.
*/

class ConfigError : public std::runtime_error {
 public:
  explicit ConfigError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class ConnectionError : public std::runtime_error {
 public:
  explicit ConnectionError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class UnknownFieldError : public std::runtime_error {
 public:
  explicit UnknownFieldError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class LookupError : public std::runtime_error {
 public:
  explicit LookupError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class RequestTimeout : public std::runtime_error {
 public:
  explicit RequestTimeout(const std::string& msg) : std::runtime_error(msg) {
  }
};

class RequestCancelled : public std::runtime_error {
 public:
  explicit RequestCancelled(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace fieldlink::util

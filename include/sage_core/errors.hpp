#pragma once

#include <exception>
#include <string>

namespace sage_core {

// Bad sizes, dimension mismatches and other caller mistakes. Raised before any I/O.
class ConfigurationError : public std::exception {
 public:
  explicit ConfigurationError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

// The embedding or generation backend failed. Surfaced to the caller verbatim.
class ProviderError : public std::exception {
 public:
  explicit ProviderError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

// The remote vector service could not be reached, timed out, rejected the request or
// answered with something unparseable. The vector store absorbs these by degrading.
class RemoteIndexError : public std::exception {
 public:
  explicit RemoteIndexError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

}  // namespace sage_core

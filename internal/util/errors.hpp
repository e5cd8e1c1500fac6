#pragma once

#include <stdexcept>
#include <string>

namespace tracksync::util {

/*
  Central error types.

  Every failure the library reports is one of these. Nothing is swallowed
  on the way up; storage adapters translate their own failures into
  StorageError at the boundary.
*/

class ValidationError : public std::runtime_error {
 public:
  explicit ValidationError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// plain tag using Category:, Status: or Id:
class ReservedKeyword : public ValidationError {
 public:
  explicit ReservedKeyword(const std::string& msg) : ValidationError(msg) {
  }
};

// reserved prefix appearing twice in an encoded tag string
class DuplicateKeyword : public ValidationError {
 public:
  explicit DuplicateKeyword(const std::string& msg) : ValidationError(msg) {
  }
};

class IllegalIdentityChange : public std::runtime_error {
 public:
  explicit IllegalIdentityChange(const std::string& msg) : std::runtime_error(msg) {
  }
};

class UnsupportedOperation : public std::runtime_error {
 public:
  explicit UnsupportedOperation(const std::string& msg) : std::runtime_error(msg) {
  }
};

class CannotMerge : public std::runtime_error {
 public:
  explicit CannotMerge(const std::string& msg) : std::runtime_error(msg) {
  }
};

// record rejected by a collection's match filter
class NoMatch : public std::runtime_error {
 public:
  explicit NoMatch(const std::string& msg) : std::runtime_error(msg) {
  }
};

class StorageError : public std::runtime_error {
 public:
  explicit StorageError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace tracksync::util

#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace loyalty::util {

/*
  Central error types.

  Business-rule failures (InvalidAmount, InvalidArgument, InsufficientFunds,
  AlreadyRolledBackOrMissing) are reported to callers as-is. Everything else is
  logged with context and surfaced as an opaque failure.
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

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidArgument : public std::runtime_error {
 public:
  explicit InvalidArgument(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidAmount : public std::runtime_error {
 public:
  explicit InvalidAmount(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InsufficientFunds : public std::runtime_error {
 public:
  InsufficientFunds(std::int64_t requested, std::int64_t available)
      : std::runtime_error("insufficient funds: requested " + std::to_string(requested) + ", available " + std::to_string(available)),
        requested_(requested),
        available_(available) {
  }

  std::int64_t requested() const {
    return requested_;
  }
  std::int64_t available() const {
    return available_;
  }

 private:
  std::int64_t requested_;
  std::int64_t available_;
};

// Raised by the store when a row changed between read and commit.
// Retried by the engine, never surfaced to callers directly.
class VersionConflict : public std::runtime_error {
 public:
  explicit VersionConflict(const std::string& msg) : std::runtime_error(msg) {
  }
};

class TransientFailure : public std::runtime_error {
 public:
  explicit TransientFailure(const std::string& msg) : std::runtime_error(msg) {
  }
};

class AlreadyRolledBackOrMissing : public std::runtime_error {
 public:
  explicit AlreadyRolledBackOrMissing(const std::string& msg) : std::runtime_error(msg) {
  }
};

// A usage record references a ledger entry that no longer exists. Requires manual audit.
class PartialStateCorruption : public std::runtime_error {
 public:
  PartialStateCorruption(const std::string& usage_id, const std::string& entry_id)
      : std::runtime_error("usage " + usage_id + " references missing ledger entry " + entry_id),
        usage_id_(usage_id),
        entry_id_(entry_id) {
  }

  const std::string& usage_id() const {
    return usage_id_;
  }
  const std::string& entry_id() const {
    return entry_id_;
  }

 private:
  std::string usage_id_;
  std::string entry_id_;
};

} // namespace loyalty::util

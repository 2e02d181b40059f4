#pragma once

#include <stdexcept>
#include <string>

namespace pdserve {

// Invalid or conflicting configuration.  Fatal at startup.
class ConfigError : public std::runtime_error {
 public:
  explicit ConfigError(const std::string &what) : std::runtime_error(what) {}
};

// A broker round-trip failed in a way that may succeed on retry.
class BrokerUnavailable : public std::runtime_error {
 public:
  explicit BrokerUnavailable(const std::string &what) : std::runtime_error(what) {}
};

// PrefillQueue::Enqueue exhausted its retry budget.
class QueueError : public std::runtime_error {
 public:
  explicit QueueError(const std::string &what) : std::runtime_error(what) {}
};

// A queue payload could not be decoded into a PrefillRequest.
class PayloadError : public std::runtime_error {
 public:
  explicit PayloadError(const std::string &what) : std::runtime_error(what) {}
};

// MetadataStore::Get gave up waiting for a peer to publish.
class MetadataUnavailable : public std::runtime_error {
 public:
  explicit MetadataUnavailable(const std::string &what)
      : std::runtime_error(what) {}
};

// Transfer misuse (second writer on a descriptor, stale handle, overflow) or
// a shared-memory failure.
class TransferError : public std::runtime_error {
 public:
  explicit TransferError(const std::string &what) : std::runtime_error(what) {}
};

// Not enough peer instances registered before the startup deadline.
class QuorumError : public std::runtime_error {
 public:
  explicit QuorumError(const std::string &what) : std::runtime_error(what) {}
};

// The inference engine rejected or failed a request.
class EngineError : public std::runtime_error {
 public:
  explicit EngineError(const std::string &what) : std::runtime_error(what) {}
};

}  // namespace pdserve

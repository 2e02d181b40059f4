#pragma once

#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace pdserve {

// Key/value storage shared by the coordination components (engine metadata,
// endpoint instances, load snapshots).  Keys are '/'-separated paths.
// Values are opaque bytes and must round-trip unchanged.
class KeyValueBackend {
 public:
  virtual ~KeyValueBackend() = default;
  virtual void Put(const std::string &key, const std::string &value) = 0;
  virtual std::optional<std::string> Get(const std::string &key) const = 0;
  virtual bool Delete(const std::string &key) = 0;
  // Keys that start with `prefix`, sorted.
  virtual std::vector<std::string> List(const std::string &prefix) const = 0;
};

// Single-process backend.  Default for tests and `store.backend: memory`.
class InMemoryKeyValueBackend : public KeyValueBackend {
 public:
  void Put(const std::string &key, const std::string &value) override;
  std::optional<std::string> Get(const std::string &key) const override;
  bool Delete(const std::string &key) override;
  std::vector<std::string> List(const std::string &prefix) const override;

 private:
  mutable std::mutex mutex_;
  std::map<std::string, std::string> entries_;
};

// One file per key under `root`.  Writes go to a temp file first and are
// renamed into place, so readers in other processes never observe a partial
// value.  Throws BrokerUnavailable on filesystem errors.
class DirectoryKeyValueBackend : public KeyValueBackend {
 public:
  explicit DirectoryKeyValueBackend(std::filesystem::path root);

  void Put(const std::string &key, const std::string &value) override;
  std::optional<std::string> Get(const std::string &key) const override;
  bool Delete(const std::string &key) override;
  std::vector<std::string> List(const std::string &prefix) const override;

  const std::filesystem::path &Root() const { return root_; }

 private:
  std::filesystem::path PathFor(const std::string &key) const;

  std::filesystem::path root_;
};

// Rejects empty keys and keys containing "..", leading '/' or NUL.
bool IsValidStoreKey(const std::string &key);

std::shared_ptr<KeyValueBackend> MakeKeyValueBackend(const std::string &kind,
                                                     const std::string &path);

}  // namespace pdserve

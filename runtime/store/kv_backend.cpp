#include "runtime/store/kv_backend.h"

#include "runtime/errors.h"

#include <algorithm>
#include <atomic>
#include <fstream>
#include <sstream>
#include <system_error>

#include <unistd.h>

namespace fs = std::filesystem;

namespace pdserve {

namespace {
std::atomic<uint64_t> g_tmp_seq{0};
constexpr const char *kTmpSuffix = ".tmp";
}  // namespace

bool IsValidStoreKey(const std::string &key) {
  if (key.empty() || key.front() == '/' || key.back() == '/') {
    return false;
  }
  if (key.find('\0') != std::string::npos) {
    return false;
  }
  std::stringstream ss(key);
  std::string part;
  while (std::getline(ss, part, '/')) {
    if (part.empty() || part == "." || part == "..") {
      return false;
    }
  }
  return true;
}

void InMemoryKeyValueBackend::Put(const std::string &key, const std::string &value) {
  if (!IsValidStoreKey(key)) {
    throw std::invalid_argument("invalid store key: " + key);
  }
  std::lock_guard<std::mutex> lock(mutex_);
  entries_[key] = value;
}

std::optional<std::string> InMemoryKeyValueBackend::Get(const std::string &key) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = entries_.find(key);
  if (it == entries_.end()) {
    return std::nullopt;
  }
  return it->second;
}

bool InMemoryKeyValueBackend::Delete(const std::string &key) {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_.erase(key) > 0;
}

std::vector<std::string> InMemoryKeyValueBackend::List(const std::string &prefix) const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::string> keys;
  for (auto it = entries_.lower_bound(prefix); it != entries_.end(); ++it) {
    if (it->first.compare(0, prefix.size(), prefix) != 0) {
      break;
    }
    keys.push_back(it->first);
  }
  return keys;
}

DirectoryKeyValueBackend::DirectoryKeyValueBackend(fs::path root) : root_(std::move(root)) {
  std::error_code ec;
  fs::create_directories(root_, ec);
  if (ec) {
    throw BrokerUnavailable("cannot create store root " + root_.string() + ": " +
                            ec.message());
  }
}

fs::path DirectoryKeyValueBackend::PathFor(const std::string &key) const {
  if (!IsValidStoreKey(key)) {
    throw std::invalid_argument("invalid store key: " + key);
  }
  return root_ / key;
}

void DirectoryKeyValueBackend::Put(const std::string &key, const std::string &value) {
  fs::path target = PathFor(key);
  std::error_code ec;
  fs::create_directories(target.parent_path(), ec);
  if (ec) {
    throw BrokerUnavailable("mkdir " + target.parent_path().string() + ": " +
                            ec.message());
  }
  fs::path tmp = target;
  tmp += "." + std::to_string(::getpid()) + "." +
         std::to_string(g_tmp_seq.fetch_add(1, std::memory_order_relaxed)) + kTmpSuffix;
  {
    std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
    if (!out) {
      throw BrokerUnavailable("cannot open " + tmp.string());
    }
    out.write(value.data(), static_cast<std::streamsize>(value.size()));
    if (!out) {
      out.close();
      fs::remove(tmp, ec);
      throw BrokerUnavailable("short write to " + tmp.string());
    }
  }
  fs::rename(tmp, target, ec);
  if (ec) {
    std::error_code ignored;
    fs::remove(tmp, ignored);
    throw BrokerUnavailable("rename " + tmp.string() + ": " + ec.message());
  }
}

std::optional<std::string> DirectoryKeyValueBackend::Get(const std::string &key) const {
  fs::path target = PathFor(key);
  std::ifstream in(target, std::ios::binary);
  if (!in) {
    return std::nullopt;
  }
  std::ostringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

bool DirectoryKeyValueBackend::Delete(const std::string &key) {
  std::error_code ec;
  bool removed = fs::remove(PathFor(key), ec);
  return removed && !ec;
}

std::vector<std::string> DirectoryKeyValueBackend::List(const std::string &prefix) const {
  std::vector<std::string> keys;
  std::error_code ec;
  fs::recursive_directory_iterator it(root_, ec);
  if (ec) {
    throw BrokerUnavailable("cannot list " + root_.string() + ": " + ec.message());
  }
  // Keys can vanish mid-scan (Delete, tmp renames); only a failure to walk
  // the tree is an error.
  for (const fs::recursive_directory_iterator end; !ec && it != end; it.increment(ec)) {
    std::error_code entry_ec;
    if (!it->is_regular_file(entry_ec) || entry_ec) {
      continue;
    }
    std::string rel = it->path().lexically_relative(root_).generic_string();
    if (rel.size() >= 4 && rel.compare(rel.size() - 4, 4, kTmpSuffix) == 0) {
      continue;
    }
    if (rel.compare(0, prefix.size(), prefix) == 0) {
      keys.push_back(std::move(rel));
    }
  }
  if (ec) {
    throw BrokerUnavailable("cannot list " + root_.string() + ": " + ec.message());
  }
  std::sort(keys.begin(), keys.end());
  return keys;
}

std::shared_ptr<KeyValueBackend> MakeKeyValueBackend(const std::string &kind,
                                                     const std::string &path) {
  if (kind == "memory") {
    return std::make_shared<InMemoryKeyValueBackend>();
  }
  if (kind == "directory") {
    return std::make_shared<DirectoryKeyValueBackend>(path);
  }
  throw ConfigError("unknown store backend '" + kind + "'");
}

}  // namespace pdserve

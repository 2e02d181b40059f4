#include "runtime/component/endpoint_registry.h"

#include "runtime/errors.h"
#include "server/logging/logger.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <iomanip>
#include <random>
#include <sstream>
#include <stdexcept>
#include <thread>

namespace pdserve {
namespace component {

namespace {

using json = nlohmann::json;

constexpr char kScheme[] = "pd://";

}  // namespace

EndpointAddress EndpointAddress::Parse(const std::string &text) {
  std::string input = text;
  if (input.compare(0, sizeof(kScheme) - 1, kScheme) == 0) {
    input = input.substr(sizeof(kScheme) - 1);
  }
  std::vector<std::string> parts;
  std::string current;
  for (char c : input) {
    if (c == '.' || c == '/') {
      if (!current.empty()) parts.push_back(current);
      current.clear();
    } else if (c != ' ') {
      current.push_back(c);
    }
  }
  if (!current.empty()) parts.push_back(current);

  EndpointAddress out;
  if (parts.size() == 1) {
    out.component = parts[0];
  } else if (parts.size() >= 2) {
    out.ns = parts[0];
    out.component = parts[1];
  }
  if (parts.size() >= 3) {
    out.name = parts[2];
    for (std::size_t i = 3; i < parts.size(); ++i) out.name += "_" + parts[i];
  }
  return out;
}

std::string EndpointAddress::Url() const {
  return std::string(kScheme) + ns + "/" + component + "/" + name;
}

std::string EndpointAddress::InstancePrefix() const {
  return "instances/" + ns + "/" + component + "/" + name + "/";
}

std::string InstanceInfo::ToJson() const {
  json j = {{"instance_id", instance_id}, {"role", role},
            {"host", host},               {"http_port", http_port},
            {"engine_id", engine_id},     {"registered_unix_ms", registered_unix_ms}};
  return j.dump();
}

InstanceInfo InstanceInfo::FromJson(const std::string &text) {
  json j = json::parse(text, nullptr, false);
  if (j.is_discarded() || !j.is_object()) {
    throw std::invalid_argument("instance record is not a JSON object");
  }
  try {
    InstanceInfo info;
    info.instance_id = j.at("instance_id").get<std::string>();
    info.role = j.value("role", std::string());
    info.host = j.value("host", std::string());
    info.http_port = j.value("http_port", 0);
    info.engine_id = j.value("engine_id", std::string());
    info.registered_unix_ms = j.value("registered_unix_ms", int64_t{0});
    return info;
  } catch (const json::exception &e) {
    throw std::invalid_argument(std::string("malformed instance record: ") + e.what());
  }
}

EndpointClient::EndpointClient(std::shared_ptr<KeyValueBackend> backend, EndpointAddress address)
    : backend_(std::move(backend)), address_(std::move(address)) {}

std::vector<InstanceInfo> EndpointClient::Instances() const {
  std::vector<InstanceInfo> out;
  for (const auto &key : backend_->List(address_.InstancePrefix())) {
    auto value = backend_->Get(key);
    if (!value) continue;  // deregistered between List and Get
    try {
      out.push_back(InstanceInfo::FromJson(*value));
    } catch (const std::invalid_argument &e) {
      log::Warn("registry", "skipping malformed instance record",
                "key=" + key + " error=" + e.what());
    }
  }
  return out;
}

bool EndpointClient::WaitForInstances(std::size_t min_instances,
                                      std::chrono::milliseconds timeout,
                                      const CancellationToken *cancel) const {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  auto poll = std::chrono::milliseconds(10);
  std::size_t last_seen = static_cast<std::size_t>(-1);
  while (true) {
    std::size_t seen = 0;
    try {
      seen = Instances().size();
    } catch (const BrokerUnavailable &e) {
      log::Warn("registry", "instance lookup failed", std::string("error=") + e.what());
    }
    if (seen >= min_instances) return true;
    if (seen != last_seen) {
      log::Info("registry", "waiting for instances",
                "endpoint=" + address_.Url() + " have=" + std::to_string(seen) +
                    " need=" + std::to_string(min_instances));
      last_seen = seen;
    }
    const auto now = std::chrono::steady_clock::now();
    if (now >= deadline) return false;
    const auto wait = std::min<std::chrono::steady_clock::duration>(poll, deadline - now);
    if (cancel != nullptr) {
      if (cancel->WaitFor(wait)) return false;
    } else {
      std::this_thread::sleep_for(wait);
    }
    poll = std::min(poll * 2, std::chrono::milliseconds(500));
  }
}

EndpointRegistry::EndpointRegistry(std::shared_ptr<KeyValueBackend> backend)
    : backend_(std::move(backend)) {
  if (!backend_) throw ConfigError("endpoint registry needs a key/value backend");
}

std::string EndpointRegistry::NewInstanceId() {
  std::random_device rd;
  std::mt19937_64 gen((static_cast<uint64_t>(rd()) << 32) ^ rd());
  std::ostringstream oss;
  oss << std::hex << std::setw(16) << std::setfill('0') << gen();
  return oss.str();
}

std::string EndpointRegistry::Register(const EndpointAddress &address, InstanceInfo info) {
  if (info.instance_id.empty()) info.instance_id = NewInstanceId();
  if (info.registered_unix_ms == 0) {
    info.registered_unix_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                                  std::chrono::system_clock::now().time_since_epoch())
                                  .count();
  }
  backend_->Put(address.InstancePrefix() + info.instance_id, info.ToJson());
  log::Info("registry", "registered instance",
            "endpoint=" + address.Url() + " instance_id=" + info.instance_id);
  return info.instance_id;
}

bool EndpointRegistry::Deregister(const EndpointAddress &address, const std::string &instance_id) {
  const bool removed = backend_->Delete(address.InstancePrefix() + instance_id);
  log::Info("registry", "deregistered instance",
            "endpoint=" + address.Url() + " instance_id=" + instance_id);
  return removed;
}

EndpointClient EndpointRegistry::Client(const EndpointAddress &address) const {
  return EndpointClient(backend_, address);
}

}  // namespace component
}  // namespace pdserve

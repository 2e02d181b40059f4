#pragma once

#include "runtime/cancellation.h"
#include "runtime/store/kv_backend.h"

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace pdserve {
namespace component {

// namespace/component/endpoint triple naming one served operation.
struct EndpointAddress {
  std::string ns{"NS"};
  std::string component{"C"};
  std::string name{"E"};

  // Accepts "ns/comp/ep", "ns.comp.ep" and an optional "pd://" prefix.
  // One part is the component, two are namespace and component; parts past
  // the third are joined into the endpoint name with '_'.
  static EndpointAddress Parse(const std::string &text);
  // "pd://ns/comp/ep"
  std::string Url() const;
  // "instances/ns/comp/ep/"
  std::string InstancePrefix() const;

  bool operator==(const EndpointAddress &other) const {
    return ns == other.ns && component == other.component && name == other.name;
  }
};

struct InstanceInfo {
  std::string instance_id;
  std::string role;
  std::string host;
  int http_port{0};
  std::string engine_id;
  int64_t registered_unix_ms{0};

  std::string ToJson() const;
  // Throws std::invalid_argument on malformed records.
  static InstanceInfo FromJson(const std::string &text);
};

// Resolved view of one endpoint's live instances.
class EndpointClient {
 public:
  EndpointClient(std::shared_ptr<KeyValueBackend> backend, EndpointAddress address);

  const EndpointAddress &Address() const { return address_; }
  // Malformed records are skipped with a warning.
  std::vector<InstanceInfo> Instances() const;
  // Polls until at least `min_instances` are registered.  False on timeout
  // or cancellation.
  bool WaitForInstances(std::size_t min_instances, std::chrono::milliseconds timeout,
                        const CancellationToken *cancel = nullptr) const;

 private:
  std::shared_ptr<KeyValueBackend> backend_;
  EndpointAddress address_;
};

// Explicit registration of served endpoints.  A worker advertises itself with
// Register() at startup and resolves peers through Client(); nothing is
// discovered implicitly.
class EndpointRegistry {
 public:
  explicit EndpointRegistry(std::shared_ptr<KeyValueBackend> backend);

  // Writes the instance record and returns its instance id (generated when
  // `info.instance_id` is empty).
  std::string Register(const EndpointAddress &address, InstanceInfo info);
  bool Deregister(const EndpointAddress &address, const std::string &instance_id);
  EndpointClient Client(const EndpointAddress &address) const;

  static std::string NewInstanceId();

 private:
  std::shared_ptr<KeyValueBackend> backend_;
};

}  // namespace component
}  // namespace pdserve

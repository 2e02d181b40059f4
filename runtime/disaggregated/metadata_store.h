#pragma once

#include "runtime/cancellation.h"
#include "runtime/engine/inference_engine.h"
#include "runtime/store/kv_backend.h"

#include <chrono>
#include <memory>
#include <optional>
#include <string>

namespace pdserve {
namespace disaggregated {

struct MetadataStoreOptions {
  std::chrono::milliseconds get_timeout{30000};
  std::chrono::milliseconds initial_poll{10};
  std::chrono::milliseconds max_poll{500};
};

// Exchange of per-engine transfer metadata under "engine_metadata/<id>".
// Entries are written once per engine lifetime and never mutated.
class MetadataStore {
 public:
  MetadataStore(std::shared_ptr<KeyValueBackend> backend, MetadataStoreOptions options = {});

  // Upsert.  Throws BrokerUnavailable if the backend write failed.
  void Put(const EngineMetadata &metadata);

  // Polls with backoff until the peer has published or the timeout passes.
  // Throws MetadataUnavailable on timeout or cancellation.  Callers keep
  // their own set of already-imported ids; this never caches.
  EngineMetadata Get(const std::string &engine_id, const CancellationToken *cancel = nullptr) const;

  // Non-blocking lookup.
  std::optional<EngineMetadata> TryGet(const std::string &engine_id) const;

  static std::string KeyFor(const std::string &engine_id);

 private:
  std::shared_ptr<KeyValueBackend> backend_;
  MetadataStoreOptions options_;
};

}  // namespace disaggregated
}  // namespace pdserve

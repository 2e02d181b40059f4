#include "runtime/disaggregated/metadata_store.h"

#include "runtime/errors.h"
#include "server/logging/logger.h"

#include <algorithm>
#include <thread>

namespace pdserve {
namespace disaggregated {

MetadataStore::MetadataStore(std::shared_ptr<KeyValueBackend> backend, MetadataStoreOptions options)
    : backend_(std::move(backend)), options_(options) {
  if (!backend_) throw ConfigError("metadata store needs a key/value backend");
}

std::string MetadataStore::KeyFor(const std::string &engine_id) {
  if (engine_id.empty() || engine_id.find('/') != std::string::npos ||
      !IsValidStoreKey(engine_id)) {
    throw MetadataUnavailable("invalid engine id '" + engine_id + "'");
  }
  return "engine_metadata/" + engine_id;
}

void MetadataStore::Put(const EngineMetadata &metadata) {
  backend_->Put(KeyFor(metadata.engine_id), metadata.blob);
  log::Info("metadata", "published engine metadata", "engine_id=" + metadata.engine_id);
}

std::optional<EngineMetadata> MetadataStore::TryGet(const std::string &engine_id) const {
  auto blob = backend_->Get(KeyFor(engine_id));
  if (!blob) return std::nullopt;
  return EngineMetadata{engine_id, std::move(*blob)};
}

EngineMetadata MetadataStore::Get(const std::string &engine_id,
                                  const CancellationToken *cancel) const {
  const auto deadline = std::chrono::steady_clock::now() + options_.get_timeout;
  auto poll = options_.initial_poll;
  while (true) {
    try {
      if (auto found = TryGet(engine_id)) return *found;
    } catch (const BrokerUnavailable &e) {
      log::Warn("metadata", "metadata lookup failed, retrying",
                "engine_id=" + engine_id + " error=" + e.what());
    }
    const auto now = std::chrono::steady_clock::now();
    if (now >= deadline) {
      throw MetadataUnavailable("metadata for engine " + engine_id + " not published within " +
                                std::to_string(options_.get_timeout.count()) + "ms");
    }
    const auto wait = std::min<std::chrono::steady_clock::duration>(poll, deadline - now);
    if (cancel != nullptr) {
      if (cancel->WaitFor(wait)) {
        throw MetadataUnavailable("metadata lookup for " + engine_id + " cancelled");
      }
    } else {
      std::this_thread::sleep_for(wait);
    }
    poll = std::min(poll * 2, options_.max_poll);
  }
}

}  // namespace disaggregated
}  // namespace pdserve

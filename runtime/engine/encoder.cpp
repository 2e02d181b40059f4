#include "runtime/engine/encoder.h"

#include "runtime/errors.h"
#include "server/logging/logger.h"

#include <vector>

namespace pdserve {

EchoEncoder::EchoEncoder(disaggregated::TransferSession &session, disaggregated::TensorSpec spec)
    : session_(session), spec_(std::move(spec)) {
  if (spec_.dtype != "float32") {
    throw EngineError("echo encoder produces float32 embeddings, not " + spec_.dtype);
  }
}

// FNV-1a.
uint64_t EchoEncoder::HashUrl(const std::string &url) {
  uint64_t h = 1469598103934665603ULL;
  for (unsigned char c : url) {
    h ^= c;
    h *= 1099511628211ULL;
  }
  return h;
}

void EchoEncoder::Encode(const std::string &request_id, const std::string &image_url,
                         const std::string &writable_handle) {
  if (image_url.empty()) throw EngineError("request " + request_id + " has an empty image_url");
  const std::size_t n = spec_.NumElements();
  const float base = static_cast<float>(HashUrl(image_url) % 1000) / 1000.0f;
  std::vector<float> embeddings(n);
  for (std::size_t i = 0; i < n; ++i) {
    embeddings[i] = base + static_cast<float>(i % 64) / 64.0f;
  }
  session_.Write(writable_handle, embeddings.data(), embeddings.size() * sizeof(float));
  log::Debug("encoder", "embeddings written",
             "request_id=" + request_id + " elements=" + std::to_string(n));
}

}  // namespace pdserve

#pragma once

#include "runtime/engine/inference_engine.h"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace pdserve {
namespace disaggregated {

struct MultimodalDataSource {
  std::string image_url;
};

// Handoff from a decode worker to a prefill worker.  Built once on a remote
// decision, consumed by exactly one prefill worker, never modified.
struct PrefillRequest {
  std::string request_id;
  // Decode engine that reserved the blocks and owns the target buffer.
  std::string engine_id;
  std::vector<int32_t> prompt_token_ids;
  std::vector<int32_t> block_ids;
  std::vector<int32_t> computed_block_ids;
  SamplingParams sampling_params;
  std::optional<MultimodalDataSource> multimodal_data_source;
  // Serialized writable handle of the decode-side KV buffer.  Opaque here;
  // travels base64-encoded on the wire.
  std::string transfer_descriptor;
};

bool operator==(const PrefillRequest &a, const PrefillRequest &b);
inline bool operator!=(const PrefillRequest &a, const PrefillRequest &b) { return !(a == b); }

// Queue payload:
//   {"request_id":..., "engine_id":..., "token_ids":[...], "block_ids":[...],
//    "computed_block_ids":[...], "sampling_params":{...},
//    "multimodal_data_source":{"image_url":...}?, "transfer_descriptor":"<base64>"}
std::string EncodePrefillRequest(const PrefillRequest &request);
// Validates every field once; throws PayloadError on anything malformed,
// including a missing or empty request_id.
PrefillRequest DecodePrefillRequest(const std::string &payload);

std::string Base64Encode(const std::string &bytes);
// Strict: throws PayloadError on characters outside the alphabet.
std::string Base64Decode(const std::string &b64);

}  // namespace disaggregated
}  // namespace pdserve

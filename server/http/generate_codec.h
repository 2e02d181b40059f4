#pragma once

#include "worker/decode_worker.h"

#include <string>

namespace pdserve {

struct GenerateBody {
  GenerateRequest request;
  bool stream{false};
};

// Validates a POST /v1/generate body:
//   {"token_ids":[int], "request_id"?:string,
//    "sampling_options":{"temperature"?,"top_p"?,"top_k"?},
//    "stop_conditions":{"max_tokens"?,"min_tokens"?,"ignore_eos"?},
//    "stream"?:bool}
// Returns false and fills *error on the first problem.
bool ParseGenerateBody(const std::string &body, GenerateBody *out, std::string *error);

// {"token_ids":[...], "finish_reason"?:..., "stop_reason"?:...}
std::string RenderDelta(const ResponseDelta &delta);

}  // namespace pdserve

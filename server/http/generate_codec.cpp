#include "server/http/generate_codec.h"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <limits>

namespace pdserve {

namespace {

using json = nlohmann::json;

bool Fail(std::string *error, const std::string &message) {
  if (error) *error = message;
  return false;
}

bool IsInt32(const json &v) {
  if (v.is_number_unsigned()) {
    return v.get<uint64_t>() <= static_cast<uint64_t>(std::numeric_limits<int32_t>::max());
  }
  if (!v.is_number_integer()) return false;
  const int64_t n = v.get<int64_t>();
  return n >= std::numeric_limits<int32_t>::min() && n <= std::numeric_limits<int32_t>::max();
}

}  // namespace

bool ParseGenerateBody(const std::string &body, GenerateBody *out, std::string *error) {
  json j = json::parse(body, nullptr, false);
  if (j.is_discarded() || !j.is_object()) return Fail(error, "body must be a JSON object");

  GenerateBody parsed;
  auto tokens = j.find("token_ids");
  if (tokens == j.end() || !tokens->is_array() || tokens->empty()) {
    return Fail(error, "token_ids must be a non-empty array");
  }
  for (const auto &t : *tokens) {
    if (!IsInt32(t)) return Fail(error, "token_ids must contain only 32-bit integers");
    parsed.request.token_ids.push_back(t.get<int32_t>());
  }
  if (j.contains("request_id")) {
    if (!j["request_id"].is_string()) return Fail(error, "request_id must be a string");
    parsed.request.request_id = j["request_id"].get<std::string>();
  }
  if (j.contains("stream")) {
    if (!j["stream"].is_boolean()) return Fail(error, "stream must be a boolean");
    parsed.stream = j["stream"].get<bool>();
  }

  auto &sampling = parsed.request.sampling;
  if (j.contains("sampling_options")) {
    const auto &opts = j["sampling_options"];
    if (!opts.is_object()) return Fail(error, "sampling_options must be an object");
    if (opts.contains("temperature")) {
      if (!opts["temperature"].is_number()) return Fail(error, "temperature must be a number");
      sampling.temperature = opts["temperature"].get<float>();
      if (sampling.temperature < 0.0f) return Fail(error, "temperature must be >= 0");
    }
    if (opts.contains("top_p")) {
      if (!opts["top_p"].is_number()) return Fail(error, "top_p must be a number");
      sampling.top_p = opts["top_p"].get<float>();
      if (sampling.top_p <= 0.0f || sampling.top_p > 1.0f) {
        return Fail(error, "top_p must be in (0, 1]");
      }
    }
    if (opts.contains("top_k")) {
      if (!IsInt32(opts["top_k"])) return Fail(error, "top_k must be a 32-bit integer");
      sampling.top_k = opts["top_k"].get<int>();
    }
  }
  if (j.contains("stop_conditions")) {
    const auto &stop = j["stop_conditions"];
    if (!stop.is_object()) return Fail(error, "stop_conditions must be an object");
    if (stop.contains("max_tokens")) {
      if (!IsInt32(stop["max_tokens"]) || stop["max_tokens"].get<int>() <= 0) {
        return Fail(error, "max_tokens must be a positive integer");
      }
      sampling.max_tokens = stop["max_tokens"].get<int>();
    }
    if (stop.contains("min_tokens")) {
      if (!IsInt32(stop["min_tokens"]) || stop["min_tokens"].get<int>() < 0) {
        return Fail(error, "min_tokens must be a non-negative integer");
      }
      sampling.min_tokens = stop["min_tokens"].get<int>();
    }
    if (stop.contains("ignore_eos")) {
      if (!stop["ignore_eos"].is_boolean()) return Fail(error, "ignore_eos must be a boolean");
      sampling.ignore_eos = stop["ignore_eos"].get<bool>();
    }
  }
  *out = std::move(parsed);
  return true;
}

std::string RenderDelta(const ResponseDelta &delta) {
  json j = {{"token_ids", delta.token_ids}};
  if (!delta.finish_reason.empty()) j["finish_reason"] = delta.finish_reason;
  if (!delta.stop_reason.empty()) j["stop_reason"] = delta.stop_reason;
  return j.dump();
}

}  // namespace pdserve

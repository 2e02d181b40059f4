#include "runtime/disaggregated/prefill_request.h"

#include "runtime/errors.h"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <limits>

namespace pdserve {
namespace disaggregated {

namespace {

using json = nlohmann::json;

constexpr char kBase64Table[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

int Base64CharValue(unsigned char c) {
  if (c >= 'A' && c <= 'Z') return c - 'A';
  if (c >= 'a' && c <= 'z') return 26 + (c - 'a');
  if (c >= '0' && c <= '9') return 52 + (c - '0');
  if (c == '+') return 62;
  if (c == '/') return 63;
  return -1;
}

const json &Require(const json &j, const char *field) {
  auto it = j.find(field);
  if (it == j.end() || it->is_null()) {
    throw PayloadError(std::string("prefill payload missing '") + field + "'");
  }
  return *it;
}

// Integral and representable as int32_t; get<int32_t>() would wrap.
bool IsInt32(const json &v) {
  if (v.is_number_unsigned()) {
    return v.get<uint64_t>() <= static_cast<uint64_t>(std::numeric_limits<int32_t>::max());
  }
  if (!v.is_number_integer()) return false;
  const int64_t n = v.get<int64_t>();
  return n >= std::numeric_limits<int32_t>::min() && n <= std::numeric_limits<int32_t>::max();
}

int32_t OptionalInt32(const json &j, const char *field, int32_t fallback) {
  auto it = j.find(field);
  if (it == j.end()) return fallback;
  if (!IsInt32(*it)) {
    throw PayloadError(std::string("bad sampling_params: '") + field +
                       "' must be a 32-bit integer");
  }
  return it->get<int32_t>();
}

std::string RequireString(const json &j, const char *field) {
  const json &v = Require(j, field);
  if (!v.is_string()) throw PayloadError(std::string("'") + field + "' must be a string");
  return v.get<std::string>();
}

std::vector<int32_t> RequireIntArray(const json &j, const char *field) {
  const json &v = Require(j, field);
  if (!v.is_array()) throw PayloadError(std::string("'") + field + "' must be an array");
  std::vector<int32_t> out;
  out.reserve(v.size());
  for (const auto &item : v) {
    if (!IsInt32(item)) {
      throw PayloadError(std::string("'") + field + "' must contain only 32-bit integers");
    }
    out.push_back(item.get<int32_t>());
  }
  return out;
}

json SamplingToJson(const SamplingParams &p) {
  return json{{"temperature", p.temperature}, {"top_p", p.top_p},
              {"top_k", p.top_k},             {"max_tokens", p.max_tokens},
              {"min_tokens", p.min_tokens},   {"ignore_eos", p.ignore_eos}};
}

// Missing fields keep their defaults; present fields must have the right type.
SamplingParams SamplingFromJson(const json &j) {
  if (!j.is_object()) throw PayloadError("'sampling_params' must be an object");
  SamplingParams p;
  p.top_k = OptionalInt32(j, "top_k", p.top_k);
  p.max_tokens = OptionalInt32(j, "max_tokens", p.max_tokens);
  p.min_tokens = OptionalInt32(j, "min_tokens", p.min_tokens);
  try {
    if (j.contains("temperature")) p.temperature = j.at("temperature").get<float>();
    if (j.contains("top_p")) p.top_p = j.at("top_p").get<float>();
    if (j.contains("ignore_eos")) p.ignore_eos = j.at("ignore_eos").get<bool>();
  } catch (const json::exception &e) {
    throw PayloadError(std::string("bad sampling_params: ") + e.what());
  }
  return p;
}

}  // namespace

bool operator==(const PrefillRequest &a, const PrefillRequest &b) {
  const bool mm_equal =
      a.multimodal_data_source.has_value() == b.multimodal_data_source.has_value() &&
      (!a.multimodal_data_source ||
       a.multimodal_data_source->image_url == b.multimodal_data_source->image_url);
  return a.request_id == b.request_id && a.engine_id == b.engine_id &&
         a.prompt_token_ids == b.prompt_token_ids && a.block_ids == b.block_ids &&
         a.computed_block_ids == b.computed_block_ids && a.sampling_params == b.sampling_params &&
         mm_equal && a.transfer_descriptor == b.transfer_descriptor;
}

std::string Base64Encode(const std::string &bytes) {
  std::string out;
  out.reserve((bytes.size() + 2) / 3 * 4);
  uint32_t val = 0;
  int valb = -6;
  for (unsigned char c : bytes) {
    val = (val << 8) + c;
    valb += 8;
    while (valb >= 0) {
      out.push_back(kBase64Table[(val >> valb) & 0x3F]);
      valb -= 6;
    }
  }
  if (valb > -6) out.push_back(kBase64Table[((val << 8) >> (valb + 8)) & 0x3F]);
  while (out.size() % 4 != 0) out.push_back('=');
  return out;
}

std::string Base64Decode(const std::string &b64) {
  std::string out;
  out.reserve((b64.size() * 3) / 4 + 1);
  uint32_t val = 0;
  int valb = -8;
  std::size_t i = 0;
  for (; i < b64.size(); ++i) {
    const unsigned char c = static_cast<unsigned char>(b64[i]);
    if (c == '=') break;
    const int v = Base64CharValue(c);
    if (v < 0) throw PayloadError("invalid base64 character in transfer_descriptor");
    val = (val << 6) + v;
    valb += 6;
    if (valb >= 0) {
      out.push_back(static_cast<char>((val >> valb) & 0xFF));
      valb -= 8;
    }
  }
  for (; i < b64.size(); ++i) {
    if (b64[i] != '=') throw PayloadError("data after base64 padding");
  }
  return out;
}

std::string EncodePrefillRequest(const PrefillRequest &request) {
  json j = {{"request_id", request.request_id},
            {"engine_id", request.engine_id},
            {"token_ids", request.prompt_token_ids},
            {"block_ids", request.block_ids},
            {"computed_block_ids", request.computed_block_ids},
            {"sampling_params", SamplingToJson(request.sampling_params)},
            {"transfer_descriptor", Base64Encode(request.transfer_descriptor)}};
  if (request.multimodal_data_source) {
    j["multimodal_data_source"] = {{"image_url", request.multimodal_data_source->image_url}};
  }
  return j.dump();
}

PrefillRequest DecodePrefillRequest(const std::string &payload) {
  json j = json::parse(payload, nullptr, false);
  if (j.is_discarded()) throw PayloadError("prefill payload is not valid JSON");
  if (!j.is_object()) throw PayloadError("prefill payload is not a JSON object");

  PrefillRequest r;
  r.request_id = RequireString(j, "request_id");
  if (r.request_id.empty()) throw PayloadError("prefill payload has an empty request_id");
  r.engine_id = RequireString(j, "engine_id");
  r.prompt_token_ids = RequireIntArray(j, "token_ids");
  r.block_ids = RequireIntArray(j, "block_ids");
  r.computed_block_ids =
      j.contains("computed_block_ids") ? RequireIntArray(j, "computed_block_ids")
                                       : std::vector<int32_t>{};
  r.sampling_params = j.contains("sampling_params") ? SamplingFromJson(j.at("sampling_params"))
                                                    : SamplingParams{};
  auto mm = j.find("multimodal_data_source");
  if (mm != j.end() && !mm->is_null()) {
    if (!mm->is_object()) throw PayloadError("'multimodal_data_source' must be an object");
    MultimodalDataSource source;
    auto url = mm->find("image_url");
    if (url != mm->end() && !url->is_null()) {
      if (!url->is_string()) throw PayloadError("'image_url' must be a string");
      source.image_url = url->get<std::string>();
    }
    r.multimodal_data_source = source;
  }
  r.transfer_descriptor = Base64Decode(RequireString(j, "transfer_descriptor"));
  return r;
}

}  // namespace disaggregated
}  // namespace pdserve

#pragma once

#include "runtime/disaggregated/transfer_session.h"

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace pdserve {

// Per-request sampling parameters carried end to end, including through the
// prefill queue payload.
struct SamplingParams {
  float temperature{1.0f};  // 0 = greedy
  float top_p{1.0f};        // 1.0 = disabled
  int top_k{-1};            // -1 = disabled
  int max_tokens{16};
  int min_tokens{0};
  bool ignore_eos{false};
};

bool operator==(const SamplingParams &a, const SamplingParams &b);
inline bool operator!=(const SamplingParams &a, const SamplingParams &b) { return !(a == b); }

// Identity of one engine process plus whatever a peer needs to target its
// memory.  A restart yields a new engine_id.
struct EngineMetadata {
  std::string engine_id;
  std::string blob;
};

// Engine-side construction arguments, derived from the validated config.
struct EngineArgs {
  std::string backend{"echo"};
  std::string served_model_name;
  int block_size{16};
  int kv_total_blocks{1024};
  int max_num_seqs{64};
  bool enable_chunked_prefill{false};
  bool enable_prefix_caching{false};
  int pipeline_parallel_size{1};
  bool enforce_eager{false};
  bool remote_prefill{false};
  bool prefill_role{false};
};

struct EngineRequest {
  std::string request_id;
  std::vector<int32_t> token_ids;
  SamplingParams sampling;
  // Multimodal embeddings already resident in registered memory; null for
  // text-only requests.
  std::shared_ptr<const disaggregated::Descriptor> embeddings;
};

// What the decode engine hands to the remote-prefill callback once it has
// reserved KV blocks for the request.
struct RemotePrefillRequest {
  std::string request_id;
  std::vector<int32_t> prompt_token_ids;
  SamplingParams sampling_params;
  std::vector<int32_t> block_ids;
  std::vector<int32_t> computed_block_ids;
  std::string engine_id;
};

struct RemotePrefillParams {
  // Decode side: prefill runs elsewhere.
  bool is_remote_prefill{false};
  // Prefill side: KV state is shipped to a decode engine.
  bool is_remote_decode{false};

  std::vector<int32_t> decode_block_ids;
  std::vector<int32_t> decode_computed_block_ids;
  std::string decode_engine_id;
  // Prefill side: serialized writable handle the KV state is written to.
  std::string transfer_descriptor;

  // Decode side: invoked once with the reserved blocks.  Throws if the
  // handoff could not be queued.
  std::function<void(const RemotePrefillRequest &)> remote_prefill_request_callback;
  // Decode side: blocks until the remote KV state arrived; false on timeout.
  std::function<bool()> wait_for_remote_kv;
  // Decode side: region the remote KV state lands in.
  std::shared_ptr<const disaggregated::Descriptor> remote_kv;
};

struct EngineOutput {
  // Tokens produced by this increment only.
  std::vector<int32_t> token_ids;
  std::string finish_reason;  // empty while generating
  std::string stop_reason;
};

struct EngineResult {
  std::string request_id;
  std::vector<EngineOutput> outputs;
  bool finished{false};
};

struct EngineStats {
  int active_slots{0};
  int total_slots{0};
  int active_kv_blocks{0};
  int total_kv_blocks{0};
  int num_waiting{0};
  double gpu_cache_usage_perc{0.0};
  double gpu_prefix_cache_hit_rate{0.0};
};

using ResultCallback = std::function<void(const EngineResult &)>;

// Opaque token-generation engine.  Generate() runs on the calling thread and
// reports each increment through `on_result`; the last call has
// finished == true.  Failures throw EngineError (or TransferError when the
// KV handoff itself failed).
class InferenceEngine {
 public:
  virtual ~InferenceEngine() = default;

  virtual EngineMetadata Metadata() const = 0;
  // Registers a peer engine so it can be targeted by remote decode.  Costly
  // and not idempotent on real backends; callers deduplicate.
  virtual void AddRemoteMetadata(const EngineMetadata &metadata) = 0;
  virtual void Generate(const EngineRequest &request, const RemotePrefillParams &remote,
                        const ResultCallback &on_result) = 0;
  // Bytes of serialized KV state for a prompt of `num_tokens`.
  virtual std::size_t KvStateBytes(std::size_t num_tokens) const = 0;
  virtual EngineStats Stats() const = 0;
  virtual void Close() = 0;
};

}  // namespace pdserve

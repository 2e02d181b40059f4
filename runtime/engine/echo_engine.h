#pragma once

#include "runtime/engine/inference_engine.h"

#include <atomic>
#include <mutex>
#include <unordered_map>

namespace pdserve {

// Deterministic engine used for integration and tests.  It "generates" by
// replaying the prompt tokens, bounded by max_tokens.  Prefill produces a KV
// state (the encoded prompt) through the same encoding whether it runs
// locally or on a remote prefill engine, so remote and local output match.
class EchoEngine : public InferenceEngine {
 public:
  EchoEngine(const EngineArgs &args, disaggregated::TransferSession &session);
  ~EchoEngine() override;

  EngineMetadata Metadata() const override;
  void AddRemoteMetadata(const EngineMetadata &metadata) override;
  void Generate(const EngineRequest &request, const RemotePrefillParams &remote,
                const ResultCallback &on_result) override;
  std::size_t KvStateBytes(std::size_t num_tokens) const override;
  EngineStats Stats() const override;
  void Close() override;

  // Number of AddRemoteMetadata() calls that registered a new peer.
  int RemoteMetadataImports() const { return imports_.load(); }
  // Requests that consumed multimodal embeddings.
  int EmbeddingsConsumed() const { return embeddings_consumed_.load(); }

  static std::vector<uint8_t> EncodeKvState(const std::vector<int32_t> &tokens);
  // Throws EngineError on a truncated or foreign buffer.
  static std::vector<int32_t> DecodeKvState(const uint8_t *data, std::size_t size);

 private:
  class BlockReservation;

  std::vector<int32_t> ReserveBlocks(std::size_t num_tokens);
  void ReleaseBlocks(const std::vector<int32_t> &blocks);
  void EmitEcho(const EngineRequest &request, const std::vector<int32_t> &kv_tokens,
                const ResultCallback &on_result);
  void PrefillForRemoteDecode(const EngineRequest &request, const RemotePrefillParams &remote,
                              const ResultCallback &on_result);
  bool PrefillRemotely(const EngineRequest &request, const RemotePrefillParams &remote,
                       const std::vector<int32_t> &blocks, const ResultCallback &on_result,
                       std::vector<int32_t> *kv_tokens);

  EngineArgs args_;
  disaggregated::TransferSession &session_;
  std::string engine_id_;

  mutable std::mutex mutex_;
  std::vector<int32_t> free_blocks_;
  int active_slots_{0};
  // engine_id -> transfer namespace of that peer.
  std::unordered_map<std::string, std::string> remotes_;
  std::atomic<bool> closed_{false};
  std::atomic<int> imports_{0};
  std::atomic<int> embeddings_consumed_{0};
};

}  // namespace pdserve

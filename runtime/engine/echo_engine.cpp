#include "runtime/engine/echo_engine.h"

#include "runtime/errors.h"
#include "server/logging/logger.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cstring>
#include <iomanip>
#include <random>
#include <sstream>

namespace pdserve {

namespace {

using json = nlohmann::json;

constexpr uint32_t kKvMagic = 0x564b4450;  // "PDKV"
constexpr std::size_t kKvHeaderBytes = 2 * sizeof(uint32_t);

std::string MakeEngineId() {
  std::random_device rd;
  std::mt19937_64 gen((static_cast<uint64_t>(rd()) << 32) ^ rd());
  std::ostringstream oss;
  oss << "echo-" << std::hex << std::setw(16) << std::setfill('0') << gen();
  return oss.str();
}

}  // namespace

bool operator==(const SamplingParams &a, const SamplingParams &b) {
  return a.temperature == b.temperature && a.top_p == b.top_p && a.top_k == b.top_k &&
         a.max_tokens == b.max_tokens && a.min_tokens == b.min_tokens &&
         a.ignore_eos == b.ignore_eos;
}

// Holds a sequence slot plus the KV blocks for one request.
class EchoEngine::BlockReservation {
 public:
  BlockReservation(EchoEngine &engine, std::size_t num_tokens)
      : engine_(engine), blocks_(engine.ReserveBlocks(num_tokens)) {}
  ~BlockReservation() { engine_.ReleaseBlocks(blocks_); }
  BlockReservation(const BlockReservation &) = delete;
  BlockReservation &operator=(const BlockReservation &) = delete;

  const std::vector<int32_t> &Blocks() const { return blocks_; }

 private:
  EchoEngine &engine_;
  std::vector<int32_t> blocks_;
};

EchoEngine::EchoEngine(const EngineArgs &args, disaggregated::TransferSession &session)
    : args_(args), session_(session), engine_id_(MakeEngineId()) {
  if (args_.block_size <= 0 || args_.kv_total_blocks <= 0 || args_.max_num_seqs <= 0) {
    throw EngineError("echo engine needs positive block_size, kv_total_blocks and max_num_seqs");
  }
  free_blocks_.reserve(static_cast<std::size_t>(args_.kv_total_blocks));
  for (int b = args_.kv_total_blocks - 1; b >= 0; --b) free_blocks_.push_back(b);
  log::Info("echo_engine", "engine created",
            "engine_id=" + engine_id_ + " blocks=" + std::to_string(args_.kv_total_blocks));
}

EchoEngine::~EchoEngine() = default;

EngineMetadata EchoEngine::Metadata() const {
  json blob = {{"engine_id", engine_id_},
               {"backend", "echo"},
               {"transfer_namespace", session_.Namespace()},
               {"block_size", args_.block_size},
               {"kv_total_blocks", args_.kv_total_blocks}};
  return EngineMetadata{engine_id_, blob.dump()};
}

void EchoEngine::AddRemoteMetadata(const EngineMetadata &metadata) {
  json blob = json::parse(metadata.blob, nullptr, false);
  if (blob.is_discarded() || !blob.is_object() || !blob.contains("transfer_namespace") ||
      !blob["transfer_namespace"].is_string()) {
    throw EngineError("metadata for engine " + metadata.engine_id + " is not an echo engine blob");
  }
  if (blob.value("engine_id", std::string()) != metadata.engine_id) {
    throw EngineError("metadata blob does not belong to engine " + metadata.engine_id);
  }
  std::lock_guard<std::mutex> lock(mutex_);
  auto inserted = remotes_.emplace(metadata.engine_id, blob["transfer_namespace"].get<std::string>());
  if (!inserted.second) {
    log::Debug("echo_engine", "remote engine already registered", "engine_id=" + metadata.engine_id);
    return;
  }
  imports_.fetch_add(1);
  log::Info("echo_engine", "registered remote engine", "engine_id=" + metadata.engine_id);
}

std::size_t EchoEngine::KvStateBytes(std::size_t num_tokens) const {
  return kKvHeaderBytes + num_tokens * sizeof(int32_t);
}

std::vector<uint8_t> EchoEngine::EncodeKvState(const std::vector<int32_t> &tokens) {
  std::vector<uint8_t> out(kKvHeaderBytes + tokens.size() * sizeof(int32_t));
  const uint32_t count = static_cast<uint32_t>(tokens.size());
  std::memcpy(out.data(), &kKvMagic, sizeof(kKvMagic));
  std::memcpy(out.data() + sizeof(uint32_t), &count, sizeof(count));
  if (!tokens.empty()) {
    std::memcpy(out.data() + kKvHeaderBytes, tokens.data(), tokens.size() * sizeof(int32_t));
  }
  return out;
}

std::vector<int32_t> EchoEngine::DecodeKvState(const uint8_t *data, std::size_t size) {
  if (data == nullptr || size < kKvHeaderBytes) {
    throw EngineError("KV state shorter than its header");
  }
  uint32_t magic = 0;
  uint32_t count = 0;
  std::memcpy(&magic, data, sizeof(magic));
  std::memcpy(&count, data + sizeof(uint32_t), sizeof(count));
  if (magic != kKvMagic) throw EngineError("KV state has no echo header");
  if (count > (size - kKvHeaderBytes) / sizeof(int32_t)) {
    throw EngineError("KV state truncated: " + std::to_string(count) + " tokens declared");
  }
  std::vector<int32_t> tokens(count);
  if (count > 0) std::memcpy(tokens.data(), data + kKvHeaderBytes, count * sizeof(int32_t));
  return tokens;
}

std::vector<int32_t> EchoEngine::ReserveBlocks(std::size_t num_tokens) {
  const std::size_t block = static_cast<std::size_t>(args_.block_size);
  const std::size_t needed = std::max<std::size_t>(1, (num_tokens + block - 1) / block);
  std::lock_guard<std::mutex> lock(mutex_);
  if (active_slots_ >= args_.max_num_seqs) {
    throw EngineError("no free sequence slot (max_num_seqs=" +
                      std::to_string(args_.max_num_seqs) + ")");
  }
  if (free_blocks_.size() < needed) {
    throw EngineError("KV cache exhausted: need " + std::to_string(needed) + " blocks, " +
                      std::to_string(free_blocks_.size()) + " free");
  }
  std::vector<int32_t> blocks(free_blocks_.end() - static_cast<std::ptrdiff_t>(needed),
                              free_blocks_.end());
  std::reverse(blocks.begin(), blocks.end());
  free_blocks_.resize(free_blocks_.size() - needed);
  ++active_slots_;
  return blocks;
}

void EchoEngine::ReleaseBlocks(const std::vector<int32_t> &blocks) {
  std::lock_guard<std::mutex> lock(mutex_);
  free_blocks_.insert(free_blocks_.end(), blocks.rbegin(), blocks.rend());
  --active_slots_;
}

void EchoEngine::Generate(const EngineRequest &request, const RemotePrefillParams &remote,
                          const ResultCallback &on_result) {
  if (closed_.load()) throw EngineError("engine is closed");
  if (request.token_ids.empty()) throw EngineError("request " + request.request_id + " has no tokens");
  if (request.embeddings) embeddings_consumed_.fetch_add(1);

  if (remote.is_remote_decode) {
    PrefillForRemoteDecode(request, remote, on_result);
    return;
  }

  BlockReservation reservation(*this, request.token_ids.size());
  std::vector<int32_t> kv_tokens;
  if (remote.is_remote_prefill) {
    if (!PrefillRemotely(request, remote, reservation.Blocks(), on_result, &kv_tokens)) return;
  } else {
    const auto state = EncodeKvState(request.token_ids);
    kv_tokens = DecodeKvState(state.data(), state.size());
  }
  EmitEcho(request, kv_tokens, on_result);
}

bool EchoEngine::PrefillRemotely(const EngineRequest &request, const RemotePrefillParams &remote,
                                 const std::vector<int32_t> &blocks,
                                 const ResultCallback &on_result,
                                 std::vector<int32_t> *kv_tokens) {
  if (!remote.remote_prefill_request_callback || !remote.wait_for_remote_kv || !remote.remote_kv) {
    throw EngineError("remote prefill requested without callback, wait hook or KV region");
  }
  RemotePrefillRequest handoff;
  handoff.request_id = request.request_id;
  handoff.prompt_token_ids = request.token_ids;
  handoff.sampling_params = request.sampling;
  handoff.block_ids = blocks;
  handoff.engine_id = engine_id_;
  remote.remote_prefill_request_callback(handoff);

  if (!remote.wait_for_remote_kv()) {
    log::Warn("echo_engine", "remote KV state did not arrive in time",
              "request_id=" + request.request_id);
    EngineResult failed;
    failed.request_id = request.request_id;
    failed.finished = true;
    on_result(failed);
    return false;
  }
  *kv_tokens = DecodeKvState(remote.remote_kv->Data(), remote.remote_kv->Size());
  if (*kv_tokens != request.token_ids) {
    throw EngineError("remote KV state for " + request.request_id + " does not match the prompt");
  }
  return true;
}

void EchoEngine::PrefillForRemoteDecode(const EngineRequest &request,
                                        const RemotePrefillParams &remote,
                                        const ResultCallback &on_result) {
  std::string peer_ns;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = remotes_.find(remote.decode_engine_id);
    if (it == remotes_.end()) {
      throw EngineError("decode engine " + remote.decode_engine_id + " is not registered");
    }
    peer_ns = it->second;
  }
  const auto handle = disaggregated::TransferHandle::Parse(remote.transfer_descriptor);
  if (handle.ns != peer_ns) {
    throw EngineError("transfer handle namespace '" + handle.ns + "' does not belong to engine " +
                      remote.decode_engine_id);
  }

  BlockReservation reservation(*this, request.token_ids.size());
  const auto state = EncodeKvState(request.token_ids);
  session_.Write(remote.transfer_descriptor, state.data(), state.size());
  log::Debug("echo_engine", "KV state shipped",
             "request_id=" + request.request_id + " bytes=" + std::to_string(state.size()) +
                 " decode_blocks=" + std::to_string(remote.decode_block_ids.size()));
  EmitEcho(request, request.token_ids, on_result);
}

void EchoEngine::EmitEcho(const EngineRequest &request, const std::vector<int32_t> &kv_tokens,
                          const ResultCallback &on_result) {
  const std::size_t budget = static_cast<std::size_t>(std::max(0, request.sampling.max_tokens));
  const std::size_t limit = std::min(kv_tokens.size(), budget);
  for (std::size_t i = 0; i < limit; ++i) {
    EngineResult step;
    step.request_id = request.request_id;
    step.outputs.push_back(EngineOutput{{kv_tokens[i]}, {}, {}});
    on_result(step);
  }
  EngineResult last;
  last.request_id = request.request_id;
  last.finished = true;
  EngineOutput tail;
  tail.finish_reason = limit < kv_tokens.size() ? "length" : "stop";
  last.outputs.push_back(tail);
  on_result(last);
}

EngineStats EchoEngine::Stats() const {
  std::lock_guard<std::mutex> lock(mutex_);
  EngineStats stats;
  stats.active_slots = active_slots_;
  stats.total_slots = args_.max_num_seqs;
  stats.total_kv_blocks = args_.kv_total_blocks;
  stats.active_kv_blocks = args_.kv_total_blocks - static_cast<int>(free_blocks_.size());
  stats.gpu_cache_usage_perc =
      static_cast<double>(stats.active_kv_blocks) / static_cast<double>(stats.total_kv_blocks);
  return stats;
}

void EchoEngine::Close() {
  if (closed_.exchange(true)) return;
  log::Info("echo_engine", "engine closed", "engine_id=" + engine_id_);
}

}  // namespace pdserve

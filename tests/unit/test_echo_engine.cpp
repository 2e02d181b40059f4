#include <catch2/catch.hpp>

#include "runtime/disaggregated/transfer_session.h"
#include "runtime/engine/echo_engine.h"
#include "runtime/engine/encoder.h"
#include "runtime/errors.h"

#include <cstring>
#include <string>
#include <vector>

using namespace pdserve;
using namespace pdserve::disaggregated;

namespace {

struct Collected {
  std::vector<int32_t> tokens;
  std::string finish_reason;
  int finished_results{0};
  bool saw_empty_outputs{false};
};

ResultCallback Collect(Collected *out) {
  return [out](const EngineResult &result) {
    if (result.outputs.empty()) {
      out->saw_empty_outputs = true;
    } else {
      const auto &output = result.outputs.front();
      out->tokens.insert(out->tokens.end(), output.token_ids.begin(), output.token_ids.end());
      if (!output.finish_reason.empty()) out->finish_reason = output.finish_reason;
    }
    if (result.finished) ++out->finished_results;
  };
}

EngineRequest MakeRequest(std::vector<int32_t> tokens, int max_tokens) {
  EngineRequest request;
  request.request_id = "req-1";
  request.token_ids = std::move(tokens);
  request.sampling.max_tokens = max_tokens;
  return request;
}

}  // namespace

TEST_CASE("Local generation echoes the prompt", "[echo_engine]") {
  TransferSession session("echo");
  session.Initialize();
  EchoEngine engine(EngineArgs{}, session);

  SECTION("prompt shorter than max_tokens stops") {
    Collected out;
    engine.Generate(MakeRequest({5, 6, 7}, 16), RemotePrefillParams{}, Collect(&out));
    REQUIRE(out.tokens == std::vector<int32_t>{5, 6, 7});
    REQUIRE(out.finish_reason == "stop");
    REQUIRE(out.finished_results == 1);
  }
  SECTION("max_tokens truncates with length") {
    Collected out;
    engine.Generate(MakeRequest({1, 2, 3, 4, 5}, 2), RemotePrefillParams{}, Collect(&out));
    REQUIRE(out.tokens == std::vector<int32_t>{1, 2});
    REQUIRE(out.finish_reason == "length");
  }
  // Blocks and slots are returned after every request.
  REQUIRE(engine.Stats().active_slots == 0);
  REQUIRE(engine.Stats().active_kv_blocks == 0);
}

TEST_CASE("Generate rejects empty prompts and closed engines", "[echo_engine]") {
  TransferSession session("echo");
  session.Initialize();
  EchoEngine engine(EngineArgs{}, session);
  Collected out;
  REQUIRE_THROWS_AS(engine.Generate(MakeRequest({}, 4), RemotePrefillParams{}, Collect(&out)),
                    EngineError);
  engine.Close();
  REQUIRE_THROWS_AS(engine.Generate(MakeRequest({1}, 4), RemotePrefillParams{}, Collect(&out)),
                    EngineError);
}

TEST_CASE("Invalid engine arguments are rejected", "[echo_engine]") {
  TransferSession session("echo");
  EngineArgs args;
  args.block_size = 0;
  REQUIRE_THROWS_AS(EchoEngine(args, session), EngineError);
}

TEST_CASE("KV state encoding", "[echo_engine]") {
  const std::vector<int32_t> tokens{1, -2, 300000};
  auto state = EchoEngine::EncodeKvState(tokens);
  REQUIRE(state.size() == 8 + 4 * tokens.size());
  REQUIRE(EchoEngine::DecodeKvState(state.data(), state.size()) == tokens);

  // Trailing capacity past the declared count is ignored.
  state.resize(state.size() + 16, 0);
  REQUIRE(EchoEngine::DecodeKvState(state.data(), state.size()) == tokens);

  REQUIRE_THROWS_AS(EchoEngine::DecodeKvState(state.data(), 4), EngineError);
  REQUIRE_THROWS_AS(EchoEngine::DecodeKvState(state.data(), 8 + 4), EngineError);
  std::vector<uint8_t> zeros(32, 0);
  REQUIRE_THROWS_AS(EchoEngine::DecodeKvState(zeros.data(), zeros.size()), EngineError);
}

TEST_CASE("KvStateBytes matches the encoding", "[echo_engine]") {
  TransferSession session("echo");
  EchoEngine engine(EngineArgs{}, session);
  REQUIRE(engine.KvStateBytes(10) == EchoEngine::EncodeKvState(std::vector<int32_t>(10)).size());
}

TEST_CASE("Remote metadata is imported once per engine", "[echo_engine]") {
  TransferSession decode_session("decode");
  TransferSession prefill_session("prefill");
  EchoEngine decode(EngineArgs{}, decode_session);
  EchoEngine prefill(EngineArgs{}, prefill_session);

  REQUIRE(decode.Metadata().engine_id != prefill.Metadata().engine_id);
  REQUIRE(decode.Metadata().blob.find("\"transfer_namespace\":\"decode\"") != std::string::npos);

  prefill.AddRemoteMetadata(decode.Metadata());
  prefill.AddRemoteMetadata(decode.Metadata());
  REQUIRE(prefill.RemoteMetadataImports() == 1);

  REQUIRE_THROWS_AS(prefill.AddRemoteMetadata(EngineMetadata{"x", "not json"}), EngineError);
  REQUIRE_THROWS_AS(prefill.AddRemoteMetadata(EngineMetadata{"x", decode.Metadata().blob}),
                    EngineError);
}

TEST_CASE("Remote decode requires a registered engine", "[echo_engine]") {
  TransferSession decode_session("decode");
  TransferSession prefill_session("prefill");
  decode_session.Initialize();
  prefill_session.Initialize();
  EchoEngine decode(EngineArgs{}, decode_session);
  EchoEngine prefill(EngineArgs{}, prefill_session);

  auto descriptor = decode_session.Register(TransferBuffer{TensorSpec{{256}, "uint8"}, {}});
  auto writable = decode_session.CreateWritable(descriptor);

  RemotePrefillParams remote;
  remote.is_remote_decode = true;
  remote.decode_engine_id = decode.Metadata().engine_id;
  remote.transfer_descriptor = writable->Serialize();

  Collected out;
  REQUIRE_THROWS_AS(prefill.Generate(MakeRequest({1, 2}, 1), remote, Collect(&out)), EngineError);

  prefill.AddRemoteMetadata(decode.Metadata());
  prefill.Generate(MakeRequest({1, 2}, 1), remote, Collect(&out));
  REQUIRE(writable->WaitForCompletion(std::chrono::milliseconds(1000)));
  REQUIRE(EchoEngine::DecodeKvState(descriptor->Data(), descriptor->Size()) ==
          std::vector<int32_t>{1, 2});
}

TEST_CASE("Remote prefill consumes the shipped KV state", "[echo_engine]") {
  TransferSession decode_session("decode");
  TransferSession prefill_session("prefill");
  decode_session.Initialize();
  prefill_session.Initialize();
  EchoEngine decode(EngineArgs{}, decode_session);
  EchoEngine prefill(EngineArgs{}, prefill_session);
  prefill.AddRemoteMetadata(decode.Metadata());

  auto descriptor = decode_session.Register(TransferBuffer{TensorSpec{{256}, "uint8"}, {}});
  auto writable = decode_session.CreateWritable(descriptor);
  const std::string handle = writable->Serialize();

  RemotePrefillRequest handed_off;
  RemotePrefillParams remote;
  remote.is_remote_prefill = true;
  remote.remote_kv = descriptor;
  remote.remote_prefill_request_callback = [&](const RemotePrefillRequest &r) {
    handed_off = r;
    RemotePrefillParams ship;
    ship.is_remote_decode = true;
    ship.decode_engine_id = r.engine_id;
    ship.decode_block_ids = r.block_ids;
    ship.transfer_descriptor = handle;
    EngineRequest prefill_request = MakeRequest(r.prompt_token_ids, 1);
    prefill.Generate(prefill_request, ship, [](const EngineResult &) {});
  };
  remote.wait_for_remote_kv = [&] {
    return writable->WaitForCompletion(std::chrono::milliseconds(1000));
  };

  Collected out;
  decode.Generate(MakeRequest({9, 8, 7}, 16), remote, Collect(&out));
  REQUIRE(handed_off.engine_id == decode.Metadata().engine_id);
  REQUIRE(handed_off.block_ids.size() == 1);
  REQUIRE(out.tokens == std::vector<int32_t>{9, 8, 7});
  REQUIRE(out.finish_reason == "stop");
}

TEST_CASE("Remote prefill timeout ends without outputs", "[echo_engine]") {
  TransferSession session("decode");
  session.Initialize();
  EchoEngine decode(EngineArgs{}, session);
  auto descriptor = session.Register(TransferBuffer{TensorSpec{{64}, "uint8"}, {}});

  RemotePrefillParams remote;
  remote.is_remote_prefill = true;
  remote.remote_kv = descriptor;
  remote.remote_prefill_request_callback = [](const RemotePrefillRequest &) {};
  remote.wait_for_remote_kv = [] { return false; };

  Collected out;
  decode.Generate(MakeRequest({1, 2, 3}, 16), remote, Collect(&out));
  REQUIRE(out.saw_empty_outputs);
  REQUIRE(out.finished_results == 1);
  REQUIRE(out.tokens.empty());
  REQUIRE(decode.Stats().active_slots == 0);
}

TEST_CASE("Block exhaustion is an engine error", "[echo_engine]") {
  TransferSession session("echo");
  EngineArgs args;
  args.block_size = 4;
  args.kv_total_blocks = 2;
  EchoEngine engine(args, session);
  Collected out;
  REQUIRE_THROWS_AS(engine.Generate(MakeRequest(std::vector<int32_t>(9, 1), 1),
                                    RemotePrefillParams{}, Collect(&out)),
                    EngineError);
  REQUIRE(engine.Stats().active_kv_blocks == 0);
  REQUIRE_NOTHROW(engine.Generate(MakeRequest(std::vector<int32_t>(8, 1), 1),
                                  RemotePrefillParams{}, Collect(&out)));
}

TEST_CASE("Echo encoder writes float32 embeddings", "[encoder]") {
  TransferSession session("encoder");
  session.Initialize();
  TensorSpec spec{{2, 8}, "float32"};
  EchoEncoder encoder(session, spec);
  REQUIRE(encoder.EmbeddingSpec().Bytes() == 64);

  auto descriptor = session.Register(TransferBuffer{spec, {}});
  auto writable = session.CreateWritable(descriptor);
  encoder.Encode("req-1", "https://example.com/cat.png", writable->Serialize());
  REQUIRE(writable->WaitForCompletion(std::chrono::milliseconds(1000)));
  REQUIRE(writable->BytesTransferred() == 64);

  float first = 0.0f;
  std::memcpy(&first, descriptor->Data(), sizeof(first));
  const float expected =
      static_cast<float>(EchoEncoder::HashUrl("https://example.com/cat.png") % 1000) / 1000.0f;
  REQUIRE(first == expected);
}

TEST_CASE("Echo encoder rejects bad input", "[encoder]") {
  TransferSession session("encoder");
  REQUIRE_THROWS_AS(EchoEncoder(session, TensorSpec{{4}, "float16"}), EngineError);
  EchoEncoder encoder(session, TensorSpec{{4}, "float32"});
  REQUIRE_THROWS_AS(encoder.Encode("req-1", "", "unused"), EngineError);
  REQUIRE(EchoEncoder::HashUrl("a") != EchoEncoder::HashUrl("b"));
}

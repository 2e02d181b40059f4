#pragma once

#include "runtime/disaggregated/transfer_session.h"

#include <memory>
#include <string>

namespace pdserve {

// Produces multimodal embeddings for a prefill request and writes them into
// the caller's registered buffer through a writable handle.
class Encoder {
 public:
  virtual ~Encoder() = default;
  // Shape of the embeddings buffer the prefill worker must register.
  virtual disaggregated::TensorSpec EmbeddingSpec() const = 0;
  // Throws EngineError if the source cannot be encoded and TransferError if
  // the write is rejected.
  virtual void Encode(const std::string &request_id, const std::string &image_url,
                      const std::string &writable_handle) = 0;
};

// Deterministic encoder: embeddings are a float32 ramp seeded from a hash of
// the URL.  Writes through the transfer session like a remote encoder would.
class EchoEncoder : public Encoder {
 public:
  EchoEncoder(disaggregated::TransferSession &session, disaggregated::TensorSpec spec);

  disaggregated::TensorSpec EmbeddingSpec() const override { return spec_; }
  void Encode(const std::string &request_id, const std::string &image_url,
              const std::string &writable_handle) override;

  static uint64_t HashUrl(const std::string &url);

 private:
  disaggregated::TransferSession &session_;
  disaggregated::TensorSpec spec_;
};

}  // namespace pdserve

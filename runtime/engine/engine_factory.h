#pragma once

#include "runtime/engine/inference_engine.h"

#include <memory>
#include <string>
#include <vector>

namespace pdserve {

// Translates EngineArgs into a concrete engine.  One adapter per backend.
class EngineAdapter {
 public:
  virtual ~EngineAdapter() = default;
  virtual std::string Name() const = 0;
  virtual std::unique_ptr<InferenceEngine> Create(const EngineArgs &args,
                                                  disaggregated::TransferSession &session) const = 0;
};

class EngineFactory {
 public:
  // Throws ConfigError for an unknown backend.
  static std::unique_ptr<InferenceEngine> Create(const EngineArgs &args,
                                                 disaggregated::TransferSession &session);
  // Replaces an existing adapter with the same name.
  static void RegisterAdapter(std::shared_ptr<EngineAdapter> adapter);
  static bool HasAdapter(const std::string &backend);
  static std::vector<std::string> Adapters();
  static std::string NormalizeBackend(const std::string &backend);
};

}  // namespace pdserve

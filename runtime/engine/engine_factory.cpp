#include "runtime/engine/engine_factory.h"

#include "runtime/engine/echo_engine.h"
#include "runtime/errors.h"
#include "server/logging/logger.h"

#include <algorithm>
#include <cctype>
#include <map>
#include <mutex>

namespace pdserve {

namespace {

class EchoAdapter : public EngineAdapter {
 public:
  std::string Name() const override { return "echo"; }
  std::unique_ptr<InferenceEngine> Create(const EngineArgs &args,
                                          disaggregated::TransferSession &session) const override {
    return std::make_unique<EchoEngine>(args, session);
  }
};

std::mutex g_adapters_mutex;

std::map<std::string, std::shared_ptr<EngineAdapter>> &AdaptersLocked() {
  static std::map<std::string, std::shared_ptr<EngineAdapter>> adapters{
      {"echo", std::make_shared<EchoAdapter>()}};
  return adapters;
}

}  // namespace

std::string EngineFactory::NormalizeBackend(const std::string &backend) {
  std::string out;
  out.reserve(backend.size());
  for (char c : backend) {
    if (!std::isspace(static_cast<unsigned char>(c))) {
      out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
  }
  return out.empty() ? "echo" : out;
}

void EngineFactory::RegisterAdapter(std::shared_ptr<EngineAdapter> adapter) {
  const std::string name = NormalizeBackend(adapter->Name());
  std::lock_guard<std::mutex> lock(g_adapters_mutex);
  AdaptersLocked()[name] = std::move(adapter);
}

bool EngineFactory::HasAdapter(const std::string &backend) {
  std::lock_guard<std::mutex> lock(g_adapters_mutex);
  return AdaptersLocked().count(NormalizeBackend(backend)) > 0;
}

std::vector<std::string> EngineFactory::Adapters() {
  std::lock_guard<std::mutex> lock(g_adapters_mutex);
  std::vector<std::string> names;
  for (const auto &entry : AdaptersLocked()) names.push_back(entry.first);
  return names;
}

std::unique_ptr<InferenceEngine> EngineFactory::Create(const EngineArgs &args,
                                                       disaggregated::TransferSession &session) {
  const std::string name = NormalizeBackend(args.backend);
  std::shared_ptr<EngineAdapter> adapter;
  {
    std::lock_guard<std::mutex> lock(g_adapters_mutex);
    auto it = AdaptersLocked().find(name);
    if (it == AdaptersLocked().end()) {
      throw ConfigError("unknown engine backend '" + args.backend + "'");
    }
    adapter = it->second;
  }
  log::Info("engine_factory", "creating engine",
            "backend=" + name + " role=" + std::string(args.prefill_role ? "prefill" : "decode"));
  try {
    return adapter->Create(args, session);
  } catch (const EngineError &e) {
    throw ConfigError(std::string("engine backend '") + name + "' rejected its arguments: " +
                      e.what());
  }
}

}  // namespace pdserve

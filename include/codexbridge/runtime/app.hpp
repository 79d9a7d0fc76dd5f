#pragma once

#include "codexbridge/broker/broker.hpp"
#include "codexbridge/broker/runner.hpp"
#include "codexbridge/common/result.hpp"
#include "codexbridge/config/schema.hpp"
#include "codexbridge/sessions/store.hpp"

#include <memory>

namespace codexbridge::runtime {

/// Owns the process-wide pieces: configuration, the session store and the broker wired to
/// them. Not copyable or movable; the broker holds a reference to the store.
class App {
public:
  explicit App(config::Config config);
  App(config::Config config, std::shared_ptr<broker::InvocationRunner> runner);

  App(const App &) = delete;
  App &operator=(const App &) = delete;

  /// Loads and validates configuration, installs the configured observer and builds an App.
  [[nodiscard]] static common::Result<std::unique_ptr<App>> from_disk();

  [[nodiscard]] const config::Config &config() const { return config_; }
  [[nodiscard]] sessions::SessionStore &sessions() { return store_; }
  [[nodiscard]] broker::Broker &broker() { return broker_; }

private:
  config::Config config_;
  sessions::SessionStore store_;
  broker::Broker broker_;
};

/// The supervisor-backed runner described by `config`.
[[nodiscard]] std::shared_ptr<broker::InvocationRunner>
create_codex_runner(const config::Config &config);

} // namespace codexbridge::runtime

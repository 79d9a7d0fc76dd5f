#include "codexbridge/runtime/app.hpp"

#include "codexbridge/config/config.hpp"
#include "codexbridge/observability/factory.hpp"
#include "codexbridge/observability/global.hpp"

namespace codexbridge::runtime {

std::shared_ptr<broker::InvocationRunner> create_codex_runner(const config::Config &config) {
  process::SupervisorOptions options;
  options.terminate_grace = std::chrono::milliseconds(config.process.terminate_grace_ms);
  options.poll_interval = std::chrono::milliseconds(config.process.stderr_poll_ms);
  return std::make_shared<broker::CodexRunner>(config.codex.executable, options);
}

App::App(config::Config config) : App(config, create_codex_runner(config)) {}

App::App(config::Config config, std::shared_ptr<broker::InvocationRunner> runner)
    : config_(std::move(config)), store_(config_.sessions.storage_dir),
      broker_(config_, store_, std::move(runner)) {}

common::Result<std::unique_ptr<App>> App::from_disk() {
  using R = common::Result<std::unique_ptr<App>>;
  auto loaded = config::load_config();
  if (!loaded.ok()) {
    return R::failure(loaded.error());
  }

  const auto problems = config::validate_config(loaded.value());
  if (!problems.empty()) {
    std::string joined = "invalid configuration:";
    for (const auto &problem : problems) {
      joined += "\n  " + problem;
    }
    return R::failure(joined);
  }

  observability::set_global_observer(observability::create_observer(loaded.value()));
  observability::log_debug("runtime", "sessions stored in " + loaded.value().sessions.storage_dir);
  return R::success(std::make_unique<App>(std::move(loaded.value())));
}

} // namespace codexbridge::runtime

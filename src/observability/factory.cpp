#include "codexbridge/observability/factory.hpp"

#include "codexbridge/common/fs.hpp"
#include "codexbridge/observability/log_observer.hpp"
#include "codexbridge/observability/multi_observer.hpp"
#include "codexbridge/observability/noop_observer.hpp"

#include <sstream>

namespace codexbridge::observability {

namespace {

std::unique_ptr<IObserver> create_single(const std::string &backend,
                                         const config::ObservabilityConfig &settings) {
  const LogLevel level = parse_log_level(settings.log_level);
  if (backend == "log") {
    return std::make_unique<LogObserver>(level, settings.log_file);
  }
  if (backend == "stderr") {
    return std::make_unique<LogObserver>(level);
  }
  if (backend.empty() || backend == "none" || backend == "noop") {
    return std::make_unique<NoopObserver>();
  }
  return nullptr;
}

} // namespace

std::unique_ptr<IObserver> create_observer(const config::Config &config) {
  const auto &settings = config.observability;
  const std::string backend = common::to_lower(common::trim(settings.backend));

  if (backend.find(',') != std::string::npos) {
    auto multi = std::make_unique<MultiObserver>();
    std::stringstream stream(backend);
    std::string part;
    while (std::getline(stream, part, ',')) {
      multi->add(create_single(common::to_lower(common::trim(part)), settings));
    }
    return multi;
  }

  if (auto single = create_single(backend, settings); single != nullptr) {
    return single;
  }
  // Unknown names fall back to logging so nothing is silently lost.
  return std::make_unique<LogObserver>(parse_log_level(settings.log_level), settings.log_file);
}

} // namespace codexbridge::observability

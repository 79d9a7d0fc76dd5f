#pragma once

#include "codexbridge/config/schema.hpp"
#include "codexbridge/observability/observer.hpp"

#include <memory>

namespace codexbridge::observability {

[[nodiscard]] std::unique_ptr<IObserver> create_observer(const config::Config &config);

} // namespace codexbridge::observability

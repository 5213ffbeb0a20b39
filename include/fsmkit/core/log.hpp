#pragma once
#include <memory>
#include <spdlog/spdlog.h>

namespace fsmkit::core {

    // Library logger named "fsmkit". Created on first use with a colored stdout
    // sink at level warn unless setLogger() installed another one.
    std::shared_ptr<spdlog::logger> logger();

    // Route library output elsewhere (file sink, test sink, ...). Null restores the default.
    void setLogger(std::shared_ptr<spdlog::logger> replacement);

    void setLogLevel(spdlog::level::level_enum level);

} // namespace fsmkit::core

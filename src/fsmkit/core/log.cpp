#include "fsmkit/core/log.hpp"
#include <mutex>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace fsmkit::core {

    namespace {
        constexpr const char *kLoggerName = "fsmkit";

        std::mutex &loggerMutex() {
            static std::mutex mutex;
            return mutex;
        }

        std::shared_ptr<spdlog::logger> &loggerSlot() {
            static std::shared_ptr<spdlog::logger> slot;
            return slot;
        }

        std::shared_ptr<spdlog::logger> makeDefaultLogger() {
            auto existing = spdlog::get(kLoggerName);
            if (existing) {
                return existing;
            }
            auto created = spdlog::stdout_color_mt(kLoggerName);
            created->set_pattern("[%H:%M:%S.%e] [%n] [%^%l%$] %v");
            created->set_level(spdlog::level::warn);
            return created;
        }
    } // namespace

    std::shared_ptr<spdlog::logger> logger() {
        std::lock_guard<std::mutex> lock(loggerMutex());
        auto &slot = loggerSlot();
        if (!slot) {
            slot = makeDefaultLogger();
        }
        return slot;
    }

    void setLogger(std::shared_ptr<spdlog::logger> replacement) {
        std::lock_guard<std::mutex> lock(loggerMutex());
        loggerSlot() = std::move(replacement);
    }

    void setLogLevel(spdlog::level::level_enum level) { logger()->set_level(level); }

} // namespace fsmkit::core

#include "librtboot/logging.hpp"

#include <mutex>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace librtboot {

namespace {

constexpr const char* logger_name = "librtboot";

std::mutex& logger_mutex() {
    static std::mutex m;
    return m;
}

std::shared_ptr<spdlog::logger>& installed_logger() {
    static std::shared_ptr<spdlog::logger> instance;
    return instance;
}

std::shared_ptr<spdlog::logger> make_default_logger() {
    if (auto existing = spdlog::get(logger_name)) {
        return existing;
    }
    auto created = spdlog::stdout_color_mt(logger_name);
    created->set_level(spdlog::level::info);
    return created;
}

} // namespace

std::shared_ptr<spdlog::logger> logger() {
    std::lock_guard lock(logger_mutex());
    auto& current = installed_logger();
    if (!current) {
        current = make_default_logger();
    }
    return current;
}

void set_logger(std::shared_ptr<spdlog::logger> replacement) {
    std::lock_guard lock(logger_mutex());
    installed_logger() = std::move(replacement);
}

} // namespace librtboot

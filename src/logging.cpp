#include <json-crdt-cpp/logging.hpp>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace json_crdt_cpp {

auto logger() -> std::shared_ptr<spdlog::logger> {
    static auto instance = [] {
        if (auto existing = spdlog::get("json_crdt")) return existing;
        auto created = spdlog::stderr_color_mt("json_crdt");
        created->set_level(spdlog::level::warn);
        return created;
    }();
    return instance;
}

void set_log_level(spdlog::level::level_enum level) {
    logger()->set_level(level);
}

}  // namespace json_crdt_cpp

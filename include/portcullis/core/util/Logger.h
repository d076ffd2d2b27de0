#pragma once
#include <string>
#include <mutex>
#include <chrono>
#include <string_view>
#include <optional>
#include <atomic>

namespace portcullis::core::util {
class Logger {
public:
    enum class Level { trace, debug, info, warn, error, critical };
    static Logger& instance();
    void set_level(Level new_level);
    bool enabled(Level level) const;
    void log(Level level, std::string_view message);
    static std::optional<Level> parse_level(std::string_view name);
private:
    Logger() = default;
    std::mutex guard;
    std::atomic<Level> current_level { Level::info };
    const char* label(Level level) const;
};
void log_debug(std::string_view message);
void log_info(std::string_view message);
void log_warn(std::string_view message);
void log_error(std::string_view message);
}

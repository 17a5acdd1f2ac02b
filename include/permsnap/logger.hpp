#pragma once

#include <fmt/format.h>

#include <mutex>
#include <ostream>
#include <string>
#include <string_view>
#include <tuple>
#include <utility>

namespace permsnap {

class Logger {
public:
    enum class Level {
        Error = 0,
        Warning,
        Info,
        Debug,
        Trace
    };

    static Logger& instance();

    void set_level(Level level) noexcept;
    Level level() const noexcept;

    template <typename... Args>
    void log(Level level, std::string_view pattern, Args&&... args) {
        if (level > level_) {
            return;
        }
        if constexpr (sizeof...(Args) == 0) {
            write(level, std::string{pattern});
        } else {
            auto tuple_args = std::make_tuple(std::forward<Args>(args)...);
            auto formatted = std::apply(
                [&](auto&... unpacked) {
                    return fmt::vformat(pattern, fmt::make_format_args(unpacked...));
                },
                tuple_args);
            write(level, formatted);
        }
    }

    template <typename... Args>
    void trace(std::string_view pattern, Args&&... args) {
        log(Level::Trace, pattern, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void debug(std::string_view pattern, Args&&... args) {
        log(Level::Debug, pattern, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void info(std::string_view pattern, Args&&... args) {
        log(Level::Info, pattern, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void warn(std::string_view pattern, Args&&... args) {
        log(Level::Warning, pattern, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void error(std::string_view pattern, Args&&... args) {
        log(Level::Error, pattern, std::forward<Args>(args)...);
    }

    // nullptr restores std::clog.
    void set_output(std::ostream* stream) noexcept;

private:
    Logger();
    void write(Level level, std::string_view message);

    std::ostream* stream_;
    Level level_;
    std::mutex mutex_;
};

} // namespace permsnap

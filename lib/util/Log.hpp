#pragma once

#include <sstream>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

namespace lexpath::util {

/**
 * @brief Tagged console log. Lines look like "[TAG/W]: message"
 *
 * Messages below the threshold are dropped. Debug messages are compiled out
 * of release builds regardless of the threshold.
 */
struct Log final {
    enum class Level: unsigned {
        Debug,
        Info,
        Warning,
        Error,
        Silent
    };

    Log() = delete;
    ~Log() = delete;
    Log(const Log&) = delete;
    Log& operator=(const Log&) = delete;

    static void setLevel(Level level) noexcept;

    [[nodiscard]] static Level level() noexcept;

    [[nodiscard]] static bool enabled(Level level) noexcept;

#ifndef NDEBUG
    template <typename ... Ts>
    static inline void d(std::string_view tag, Ts&& ... args) {
        write(Level::Debug, tag, std::forward<Ts>(args)...);
    }
#else
    template <typename ... Ts>
    static inline void d(std::string_view, Ts&& ...) {
    }
#endif

    template <typename ... Ts>
    static inline void i(std::string_view tag, Ts&& ... args) {
        write(Level::Info, tag, std::forward<Ts>(args)...);
    }

    template <typename ... Ts>
    static inline void w(std::string_view tag, Ts&& ... args) {
        write(Level::Warning, tag, std::forward<Ts>(args)...);
    }

    template <typename ... Ts>
    static inline void e(std::string_view tag, Ts&& ... args) {
        write(Level::Error, tag, std::forward<Ts>(args)...);
    }

private:
    template <typename ... Ts>
    static inline void write(Level level, std::string_view tag, Ts&& ... args) {
        if (!enabled(level))
            return;

        std::stringstream stream;

        ((stream << to_string(std::forward<Ts>(args))), ...);

        Log::write_(level, tag, stream.str());
    }

    template <typename T>
    static inline std::string to_string(T&& arg) {
        if constexpr (std::is_convertible_v<T, std::string_view>) {
            return std::string{std::string_view{arg}};
        }
        else if constexpr (std::is_same_v<std::decay_t<T>, char>) {
            return std::string(1, arg);
        }
        else {
            return std::to_string(arg);
        }
    }

    static void write_(Level level, std::string_view tag, std::string_view msg);
};

}

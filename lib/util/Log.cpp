#include "Log.hpp"

#include <atomic>
#include <iostream>

namespace lexpath::util {

namespace {

#ifndef NDEBUG
std::atomic<Log::Level> threshold{Log::Level::Debug};
#else
std::atomic<Log::Level> threshold{Log::Level::Info};
#endif

constexpr char letter(Log::Level level) noexcept {
    switch (level) {
        case Log::Level::Debug:   return 'D';
        case Log::Level::Info:    return 'I';
        case Log::Level::Warning: return 'W';
        case Log::Level::Error:   return 'E';
        case Log::Level::Silent:  break;
    }

    return '?';
}

}

void Log::setLevel(Level level) noexcept {
    threshold.store(level, std::memory_order_relaxed);
}

Log::Level Log::level() noexcept {
    return threshold.load(std::memory_order_relaxed);
}

bool Log::enabled(Level level) noexcept {
    return level != Level::Silent && level >= Log::level();
}

void Log::write_(Level level, std::string_view tag, std::string_view msg) {
    auto& out = level == Level::Error ? std::cerr : std::cout;

    out << "[" << tag << "/" << letter(level) << "]: " << msg << std::endl;
}

}

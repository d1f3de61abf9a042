// diagnostics.hpp
//
// Description:
//   Process-wide logging entry point of the library.
//   Messages are filtered by a threshold level and then forwarded
//   to the installed handler which writes to std::cerr by default.
//
// Usage:
//   TS_LOG(Enum_Log_Levels::Warning, "message");
//   set_log_threshold(Enum_Log_Levels::Debug);
//   set_log_handler([](Enum_Log_Levels, const char*, int, std::string_view) {...});
//
// CAUTION:
//   The handler may be called concurrently from several threads.
//   Replacing the handler while other threads log is serialized by a mutex
//   but the handler itself must be thread safe.

#ifndef DIAGNOSTICS_HPP
#define DIAGNOSTICS_HPP

#include <cstdint>
#include <atomic>
#include <mutex>
#include <iostream>
#include <string_view>
#include <functional>
#include <utility>

#define TS_LOG(lvl, msg) ::TS_Concurrency::log_msg(lvl, __FILE__, __LINE__, msg)

namespace TS_Concurrency {
    enum class Enum_Log_Levels : std::uint8_t {
        Debug,
        Info,
        Warning,
        Error };

    using log_handler_t = std::function<void(Enum_Log_Levels, const char*, int, std::string_view)>;

    constexpr std::string_view to_string(Enum_Log_Levels lvl) noexcept {
        switch (lvl) {
            case Enum_Log_Levels::Debug:   return "DEBUG";
            case Enum_Log_Levels::Info:    return "INFO";
            case Enum_Log_Levels::Warning: return "WARNING";
            case Enum_Log_Levels::Error:   return "ERROR";
        }
        return "UNKNOWN";
    }

    namespace detail {
        inline void log_to_stderr(
            Enum_Log_Levels lvl,
            const char* file,
            int line,
            std::string_view msg)
        {
            std::cerr << '[' << to_string(lvl) << "] " << file << ':' << line << ' ' << msg << '\n';
        }

        struct Log_State {
            std::atomic<Enum_Log_Levels> _threshold{ Enum_Log_Levels::Warning };
            std::mutex _handler_mutex;
            log_handler_t _handler{ &log_to_stderr };
        };

        inline Log_State& log_state() {
            static Log_State state;
            return state;
        }
    } // namespace detail

    inline void set_log_threshold(Enum_Log_Levels lvl) noexcept {
        detail::log_state()._threshold.store(lvl, std::memory_order_relaxed);
    }

    inline Enum_Log_Levels get_log_threshold() noexcept {
        return detail::log_state()._threshold.load(std::memory_order_relaxed);
    }

    // installs a new handler and returns the previous one.
    // an empty handler restores the default (std::cerr).
    inline log_handler_t set_log_handler(log_handler_t handler) {
        auto& state = detail::log_state();
        if (!handler) handler = &detail::log_to_stderr;
        std::lock_guard lock(state._handler_mutex);
        return std::exchange(state._handler, std::move(handler));
    }

    inline void log_msg(Enum_Log_Levels lvl, const char* file, int line, std::string_view msg) {
        auto& state = detail::log_state();
        if (lvl < state._threshold.load(std::memory_order_relaxed)) return;
        std::lock_guard lock(state._handler_mutex);
        state._handler(lvl, file, line, msg);
    }
} // namespace TS_Concurrency

#endif // DIAGNOSTICS_HPP

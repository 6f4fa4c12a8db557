#pragma once

#include "utils.hpp"

#include <cstdint>
#include <ostream>
#include <source_location>
#include <sstream>
#include <string_view>

namespace tether {

    using namespace std::string_view_literals;

    enum class log_level : uint8_t { debug, info, warn, error, off };

    inline constexpr std::string_view to_string(log_level level) {
        switch (level) {
            case log_level::debug:
                return "debug"sv;
            case log_level::info:
                return "info"sv;
            case log_level::warn:
                return "warn"sv;
            case log_level::error:
                return "error"sv;
            case log_level::off:
                return "off"sv;
        }
        return "info"sv;
    }

    inline constexpr bool try_parse_log_level(std::string_view text, log_level& out) {
        if (utils::str_case_eq(text, "debug"sv) || utils::str_case_eq(text, "trace"sv)) {
            out = log_level::debug;
            return true;
        }
        if (utils::str_case_eq(text, "info"sv)) {
            out = log_level::info;
            return true;
        }
        if (utils::str_case_eq(text, "warn"sv) || utils::str_case_eq(text, "warning"sv)) {
            out = log_level::warn;
            return true;
        }
        if (utils::str_case_eq(text, "error"sv)) {
            out = log_level::error;
            return true;
        }
        if (utils::str_case_eq(text, "off"sv) || utils::str_case_eq(text, "none"sv)) {
            out = log_level::off;
            return true;
        }
        return false;
    }

    namespace log {
        void set_level(log_level level);
        log_level level();
        bool enabled(log_level level);

        // nullptr restores std::cerr
        void set_sink(std::ostream* sink);

        namespace detail {
            constexpr std::string_view sloc_fname(const std::source_location& loc) {
                std::string_view sv{loc.file_name()};
                if (auto p = sv.rfind('/'); p != sv.npos)
                    sv.remove_prefix(p + 1);
                return sv;
            }

            void write_record(log_level level, const std::source_location& loc, std::string_view text);

            template <typename... Args>
            void emit(log_level level, const std::source_location& loc, Args&&... args) {
                if (!enabled(level)) {
                    return;
                }
                std::ostringstream os{};
                (os << ... << std::forward<Args>(args));
                write_record(level, loc, os.str());
            }
        }  // namespace detail
    }  // namespace log

// Debug records are compiled out of release builds
#ifndef NDEBUG
    template <typename... Args>
    struct log_debug {
        constexpr explicit log_debug(
                Args&&... args, const std::source_location& loc = std::source_location::current()) {
            log::detail::emit(log_level::debug, loc, std::forward<Args>(args)...);
        }
    };
#else
    template <typename... Args>
    struct log_debug {
        constexpr explicit log_debug(Args&&...) {}
    };
#endif

    template <typename... Args>
    struct log_info {
        explicit log_info(Args&&... args, const std::source_location& loc = std::source_location::current()) {
            log::detail::emit(log_level::info, loc, std::forward<Args>(args)...);
        }
    };

    template <typename... Args>
    struct log_warn {
        explicit log_warn(Args&&... args, const std::source_location& loc = std::source_location::current()) {
            log::detail::emit(log_level::warn, loc, std::forward<Args>(args)...);
        }
    };

    template <typename... Args>
    struct log_error {
        explicit log_error(Args&&... args, const std::source_location& loc = std::source_location::current()) {
            log::detail::emit(log_level::error, loc, std::forward<Args>(args)...);
        }
    };

    // deduction guides
    template <typename... Args>
    log_debug(Args&&...) -> log_debug<Args...>;
    template <typename... Args>
    log_info(Args&&...) -> log_info<Args...>;
    template <typename... Args>
    log_warn(Args&&...) -> log_warn<Args...>;
    template <typename... Args>
    log_error(Args&&...) -> log_error<Args...>;

}  // namespace tether

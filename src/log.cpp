#include "tether/log.hpp"

#include <atomic>
#include <iostream>
#include <mutex>

namespace tether::log {

    namespace detail {
        static std::atomic<log_level> threshold{log_level::info};
        static std::atomic<std::ostream*> sink_override{nullptr};
        static std::mutex write_mutex{};

        void write_record(log_level level, const std::source_location& loc, std::string_view text) {
            std::lock_guard lock{write_mutex};
            auto* os = sink_override.load();
            if (os == nullptr) {
                os = &std::cerr;
            }
            *os << to_string(level) << " [" << sloc_fname(loc) << ':' << loc.line() << "] " << text << '\n';
            os->flush();
        }
    }  // namespace detail

    void set_level(log_level level) {
        detail::threshold.store(level);
    }

    log_level level() {
        return detail::threshold.load();
    }

    bool enabled(log_level level) {
        auto current = detail::threshold.load();
        return current != log_level::off && level >= current;
    }

    void set_sink(std::ostream* sink) {
        std::lock_guard lock{detail::write_mutex};
        detail::sink_override.store(sink);
    }

}  // namespace tether::log

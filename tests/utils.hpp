#pragma once

#include "tether.hpp"
#include "tether/cli.hpp"

#include <catch2/catch_test_macros.hpp>
#include <glaze/glaze.hpp>

extern "C" {
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>
}

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>
#include <thread>
#include <vector>

namespace tether::test { namespace detail {

    namespace fs = std::filesystem;
    using namespace std::chrono_literals;
    using namespace std::string_view_literals;

    struct temp_dir {
        fs::path path{};

        explicit temp_dir(std::string_view prefix) {
            auto now = std::chrono::system_clock::now().time_since_epoch().count();
            std::ostringstream dir_name{};
            dir_name << prefix << "_" << static_cast<long>(::getpid()) << "_" << now;
            path = fs::temp_directory_path() / dir_name.str();
            fs::create_directories(path);
        }

        ~temp_dir() {
            std::error_code ec{};
            fs::remove_all(path, ec);
        }

        temp_dir(const temp_dir&) = delete;
        temp_dir& operator=(const temp_dir&) = delete;
    };

    inline void write_file(const fs::path& p, std::string_view content) {
        std::ofstream out{p};
        REQUIRE(out.good());
        out << content;
    }

    // sets an environment variable for the lifetime of the guard
    struct scoped_env {
        std::string name{};
        std::optional<std::string> previous{};

        scoped_env(std::string key, const std::string& value) : name{std::move(key)} {
            if (const char* old = std::getenv(name.c_str())) {
                previous = old;
            }
            REQUIRE(::setenv(name.c_str(), value.c_str(), 1) == 0);
        }

        ~scoped_env() {
            if (previous) {
                ::setenv(name.c_str(), previous->c_str(), 1);
            }
            else {
                ::unsetenv(name.c_str());
            }
        }

        scoped_env(const scoped_env&) = delete;
        scoped_env& operator=(const scoped_env&) = delete;
    };

    // client_config that launches the scripted test peer with the given flags
    inline client_config peer_config(std::vector<std::string> flags = {}) {
        client_config cfg{};
        cfg.command = TETHER_TEST_PEER_PATH;
        cfg.args = std::move(flags);
        cfg.request_timeout_ms = 10'000;
        cfg.handshake_timeout_ms = 10'000;
        cfg.stop_grace_ms = 500;
        return cfg;
    }

    // errors observed through client::on_error, read from the reader thread
    struct error_log {
        mutable std::mutex mutex{};
        std::vector<std::pair<error_kind, std::string>> entries{};

        void attach(client& c) {
            c.on_error([this](const error& e) {
                std::lock_guard lock{mutex};
                entries.emplace_back(e.kind(), e.what());
            });
        }

        std::size_t count(error_kind kind) const {
            std::lock_guard lock{mutex};
            return static_cast<std::size_t>(
                    std::ranges::count_if(entries, [kind](const auto& entry) { return entry.first == kind; }));
        }

        bool contains(error_kind kind, std::string_view text) const {
            std::lock_guard lock{mutex};
            return std::ranges::any_of(entries, [&](const auto& entry) {
                return entry.first == kind && entry.second.find(text) != std::string::npos;
            });
        }
    };

    inline bool eventually(const std::function<bool()>& predicate, std::chrono::milliseconds timeout = 5000ms) {
        auto deadline = std::chrono::steady_clock::now() + timeout;
        while (std::chrono::steady_clock::now() < deadline) {
            if (predicate()) {
                return true;
            }
            std::this_thread::sleep_for(5ms);
        }
        return predicate();
    }

    inline glz::raw_json echo_args(std::string_view text) {
        return glz::raw_json{R"({"text":")" + std::string{text} + R"("})"};
    }

    // captures log records for the lifetime of the guard
    struct log_capture {
        std::ostringstream buffer{};
        log_level previous{log::level()};

        explicit log_capture(log_level level = log_level::debug) {
            log::set_level(level);
            log::set_sink(&buffer);
        }

        ~log_capture() {
            log::set_sink(nullptr);
            log::set_level(previous);
        }

        std::string text() const { return buffer.str(); }

        log_capture(const log_capture&) = delete;
        log_capture& operator=(const log_capture&) = delete;
    };

}}  // namespace tether::test::detail

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 *
 * The Lucenia project is free software: you can redistribute it
 * and/or modify it under the terms of the GNU Affero General
 * Public License as published by the Free Software Foundation,
 * either version 3 of the License, or (at your option) any later
 * version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 * GNU Affero General Public License for more details.
 *
 * You should have received a copy of the GNU Affero General Public
 * License along with this program. If not, see:
 * https://www.gnu.org/licenses/agpl-3.0.html
 */

#pragma once

#include "log.h"
#include "logmanager.h"

namespace pollcache {

/**
 * LogRuntime - lifecycle owner for the logging layer
 *
 * Usage:
 *   - Tests: hold a LogRuntimeGuard for the duration of the test
 *   - Production: create at startup, destroy at shutdown
 */
class LogRuntime {
public:
    struct Config {
        bool enable_file_logging;
        std::string log_dir;
        std::string log_file_name;
        bool append;
        LogLevel initial_level;

        Config()
            : enable_file_logging(false)
            , log_file_name("pollcache.log")
            , append(true)
            , initial_level(POLLCACHE_DEFAULT_LOG_LEVEL) {}

        std::string log_path() const {
            if (log_dir.empty()) return log_file_name;
            return log_dir + "/" + log_file_name;
        }

        /**
         * Defaults overridden from POLLCACHE_LOG_* environment variables
         */
        static Config fromEnv() {
            Config config;

            if (const char* enable = std::getenv("POLLCACHE_LOG_ENABLE_FILE")) {
                config.enable_file_logging = (std::string(enable) != "0");
            }

            if (const char* dir = std::getenv("POLLCACHE_LOG_DIR")) {
                config.log_dir = dir;
            }

            return config;
        }
    };

    explicit LogRuntime(const Config& config = Config())
        : config_(config) {

        logLevel.store(config_.initial_level, std::memory_order_relaxed);
        initLoggingFromEnv();

        if (config_.enable_file_logging) {
            log_manager_ = std::make_unique<LogManager>(config_.log_path(), config_.append);
        }
    }

    ~LogRuntime() {
        shutdown();
    }

    /**
     * Safe to call multiple times
     */
    void shutdown() {
        std::lock_guard<std::mutex> lock(mutex_);
        log_manager_.reset();
        Logger::setLogFile(nullptr);
    }

    void rotate() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (log_manager_) log_manager_->rotate();
    }

    bool file_logging() const { return log_manager_ != nullptr; }
    const Config& config() const { return config_; }

    LogRuntime(const LogRuntime&) = delete;
    LogRuntime& operator=(const LogRuntime&) = delete;

private:
    Config config_;
    std::unique_ptr<LogManager> log_manager_;
    std::mutex mutex_;
};

/**
 * Test helper: RAII guard restoring the previous log level
 */
class LogRuntimeGuard {
public:
    explicit LogRuntimeGuard(const LogRuntime::Config& config = LogRuntime::Config())
        : original_level_(logLevel.load(std::memory_order_relaxed)),  // Save BEFORE construction
          runtime_(std::make_unique<LogRuntime>(config)) {
    }

    ~LogRuntimeGuard() {
        runtime_->shutdown();
        logLevel.store(original_level_, std::memory_order_relaxed);
    }

    LogRuntime* operator->() { return runtime_.get(); }
    LogRuntime& operator*() { return *runtime_; }

private:
    int original_level_;
    std::unique_ptr<LogRuntime> runtime_;
};

} // namespace pollcache

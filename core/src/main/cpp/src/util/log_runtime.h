/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#pragma once

#include "log.h"
#include "logmanager.h"
#include <memory>
#include <mutex>

namespace indexlist {

/**
 * RAII manager for the entire logging subsystem.
 * Ensures proper initialization and teardown of all logging components.
 *
 * Usage:
 *   - Tests: Create in SetUpTestSuite(), destroy in TearDownTestSuite()
 *   - Production: Create at startup, destroy at shutdown
 *   - Singleton pattern available via getInstance()
 */
class LogRuntime {
public:
    struct Config {
        // Logging output
        bool enable_file_logging;
        std::string log_dir;  // Empty = INDEXLIST_LOG_DIR or the temp directory

        // Initial log level
        LogLevel initial_level;

        Config()
            : enable_file_logging(false)
            , initial_level(LOG_WARNING) {}

        /**
         * Build a config from INDEXLIST_LOG_* environment variables.
         * Unset variables keep the defaults above.
         */
        static Config fromEnv() {
            Config cfg;

            if (const char* enable = std::getenv(config::logging::kEnableFileEnvVar)) {
                cfg.enable_file_logging = (std::string(enable) != "0");
            }

            if (const char* dir = std::getenv(config::logging::kDirEnvVar)) {
                cfg.log_dir = dir;
            }

            int saved = logLevel.load(std::memory_order_relaxed);
            logLevel.store(cfg.initial_level, std::memory_order_relaxed);
            initLoggingFromEnv();
            cfg.initial_level = static_cast<LogLevel>(logLevel.load(std::memory_order_relaxed));
            logLevel.store(saved, std::memory_order_relaxed);

            return cfg;
        }
    };

    /**
     * Create a LogRuntime with the given configuration
     */
    explicit LogRuntime(const Config& config = Config())
        : config_(config), log_manager_(nullptr) {

        // Set initial log level
        logLevel.store(config_.initial_level, std::memory_order_relaxed);

        // Set up file logging if requested
        if (config_.enable_file_logging) {
            log_manager_ = std::make_unique<LogManager>(config_.log_dir);
            info() << "logging to " << log_manager_->path();
        }
    }

    /**
     * Destructor ensures clean shutdown of all components
     */
    ~LogRuntime() {
        shutdown();
    }

    /**
     * Explicitly shutdown all logging components
     * Safe to call multiple times
     */
    void shutdown() {
        std::lock_guard<std::mutex> lock(mutex_);

        // Destroy LogManager (closes the file and resets the logger to stderr)
        log_manager_.reset();
    }

    const LogManager* logManager() const { return log_manager_.get(); }

    /**
     * Global singleton instance configured from the environment
     */
    static LogRuntime* getInstance() {
        static std::unique_ptr<LogRuntime> instance;
        static std::once_flag init_flag;

        std::call_once(init_flag, []() {
            instance = std::make_unique<LogRuntime>(Config::fromEnv());
        });

        return instance.get();
    }

    // Prevent copying
    LogRuntime(const LogRuntime&) = delete;
    LogRuntime& operator=(const LogRuntime&) = delete;

private:
    Config config_;
    std::unique_ptr<LogManager> log_manager_;
    std::mutex mutex_;
};

/**
 * Test helper: RAII guard for tests
 */
class LogRuntimeGuard {
public:
    explicit LogRuntimeGuard(const LogRuntime::Config& config = LogRuntime::Config())
        : original_level_(logLevel.load(std::memory_order_relaxed)),  // Save BEFORE construction
          runtime_(std::make_unique<LogRuntime>(config)) {
    }

    ~LogRuntimeGuard() {
        // Ensure clean shutdown
        runtime_->shutdown();

        // Restore original log level
        logLevel.store(original_level_, std::memory_order_relaxed);
    }

    LogRuntime* operator->() { return runtime_.get(); }
    LogRuntime& operator*() { return *runtime_; }

private:
    int original_level_;
    std::unique_ptr<LogRuntime> runtime_;
};

} // namespace indexlist

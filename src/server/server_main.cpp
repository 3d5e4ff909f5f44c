// Copyright (c) 2025 Faultline Contributors
// SPDX-License-Identifier: GPL-3.0-or-later

#include <faultline/app/service.h>
#include <faultline/config/config.h>

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <CLI/CLI.hpp>

#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include <execinfo.h>

namespace {

void log_fatal(const char* what) {
    spdlog::critical("FATAL: {}", what);
    spdlog::critical("Aborting after fatal error");
    spdlog::default_logger()->flush();
}

void signal_handler(int signo) {
    const char* sigstr = (signo == SIGSEGV)   ? "SIGSEGV"
                         : (signo == SIGABRT) ? "SIGABRT"
                                              : "UNKNOWN";
    log_fatal(sigstr);
    void* bt[64];
    int n = backtrace(bt, 64);
    char** syms = backtrace_symbols(bt, n);
    if (syms) {
        for (int i = 0; i < n; ++i) {
            spdlog::critical("Backtrace[{}]: {}", i, syms[i]);
        }
        free(syms);
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    std::_Exit(128 + signo);
}

void setup_fatal_handlers() {
    std::signal(SIGSEGV, signal_handler);
    std::signal(SIGABRT, signal_handler);
    std::set_terminate([]() noexcept {
        log_fatal("std::terminate called");
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        std::_Exit(1);
    });
}

void setup_logging(const faultline::config::LoggingConfig& logging) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    if (!logging.file.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(logging.file.parent_path(), ec);
        try {
            const size_t max_size = 10 * 1024 * 1024; // 10MB per file
            const size_t max_files = 5;
            sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                logging.file.string(), max_size, max_files));
        } catch (const spdlog::spdlog_ex& e) {
            std::fprintf(stderr, "cannot open log file %s: %s\n", logging.file.string().c_str(),
                         e.what());
        }
    }
    auto logger = std::make_shared<spdlog::logger>("faultline", sinks.begin(), sinks.end());
    spdlog::set_default_logger(logger);
    spdlog::flush_on(spdlog::level::warn);

    auto level = spdlog::level::from_str(logging.level);
    if (level == spdlog::level::off && logging.level != "off") {
        spdlog::warn("Unknown log level '{}', using info", logging.level);
        level = spdlog::level::info;
    }
    spdlog::set_level(level);
}

} // namespace

int main(int argc, char* argv[]) {
    setup_fatal_handlers();

    CLI::App app{"Faultline - failure injection and benchmarking for replicated stores"};

    std::string configPath;
    std::optional<uint16_t> port;
    std::optional<std::string> bind;
    std::optional<std::string> logLevel;
    std::optional<std::string> logFile;
    std::optional<std::size_t> workers;
    bool synthetic = false;

    app.add_option("-c,--config", configPath, "Configuration file path");
    app.add_option("-p,--port", port, "HTTP listen port");
    app.add_option("--bind", bind, "HTTP bind address");
    app.add_option("--log-level", logLevel, "Log level (trace/debug/info/warn/error)");
    app.add_option("--log-file", logFile, "Rotating log file path");
    app.add_option("--workers", workers, "Worker threads for blocking calls");
    app.add_flag("--synthetic", synthetic, "Never contact the orchestrator");

    CLI11_PARSE(app, argc, argv);

    // Precedence: config file < environment < command line
    if (configPath.empty()) {
        if (const char* env = std::getenv("FAULTLINE_CONFIG"); env && *env)
            configPath = env;
    }
    const auto resolvedPath = faultline::config::get_config_path(configPath);

    auto loaded = faultline::config::loadConfig(resolvedPath);
    if (!loaded) {
        std::fprintf(stderr, "Failed to load config %s: %s\n", resolvedPath.string().c_str(),
                     loaded.error().message.c_str());
        return 1;
    }
    auto config = std::move(loaded).value();
    faultline::config::applyEnvironment(config);

    if (port)
        config.server.port = *port;
    if (bind)
        config.server.bindAddress = *bind;
    if (logLevel)
        config.logging.level = *logLevel;
    if (logFile)
        config.logging.file = *logFile;
    if (workers)
        config.server.workerThreads = *workers;
    if (synthetic)
        config.infrastructure.forceSynthetic = true;

    setup_logging(config.logging);

    if (auto valid = faultline::config::validate(config); !valid) {
        spdlog::error("Invalid configuration: {}", valid.error().message);
        return 1;
    }

    try {
        faultline::app::Service service(std::move(config));
        if (auto started = service.start(); !started) {
            spdlog::error("Failed to start service: {}", started.error().message);
            return 1;
        }
        service.run();
        return 0;
    } catch (const std::exception& e) {
        spdlog::error("Service error: {}", e.what());
        return 1;
    }
}

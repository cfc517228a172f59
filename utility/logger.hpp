// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  GraphStax

#pragma once

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/null_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <array>
#include <chrono>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace logger_tag {
    inline constexpr std::string_view TABLE_RESOLVER = "TableResolver";
    inline constexpr std::string_view MEMORY_CATALOG = "MemoryCatalog";
    inline constexpr std::string_view CATALOG_LOADER = "CatalogLoader";
    inline constexpr std::string_view CLI = "Cli";
} // namespace logger_tag

// thin handle over a named spdlog logger
class log_t {
public:
    using level = spdlog::level::level_enum;

    log_t() = default;
    log_t(std::shared_ptr<spdlog::logger> logger)
        : logger_(std::move(logger)) {}

    bool is_valid() const noexcept { return logger_ != nullptr; }

    spdlog::logger* operator->() const noexcept { return logger_.get(); }

private:
    std::shared_ptr<spdlog::logger> logger_;
};

inline log_t find_logger(const std::string& name) { return spdlog::get(name); }

// Loggers which were never initialized fall back to a silent logger, so components
// (and tests) can log unconditionally.
inline log_t get_logger(std::string_view tag) {
    std::string name(tag);
    if (auto log_ptr = find_logger(name); log_ptr.is_valid()) {
        return log_ptr;
    }
    auto logger = std::make_shared<spdlog::logger>(name, std::make_shared<spdlog::sinks::null_sink_mt>());
    return logger;
}

inline log_t initialize_logger(std::string name, std::string prefix, log_t::level lvl = log_t::level::info) {
    if (auto log_ptr = find_logger(name); log_ptr.is_valid()) {
        // prevent creating two loggers with same name
        return log_ptr;
    }

    std::vector<spdlog::sink_ptr> sinks{std::make_shared<spdlog::sinks::stdout_color_sink_mt>()};
    if (!prefix.empty()) {
        std::filesystem::create_directories(prefix);
        if (prefix.back() != '/') {
            prefix += '/';
        }

        using namespace std::chrono;
        system_clock::duration dtn = system_clock::now().time_since_epoch();
        auto file_name = fmt::format("{}{}-{}.txt", prefix, name, duration_cast<seconds>(dtn).count());
        sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(file_name, true));
    }

    auto logger = std::make_shared<spdlog::logger>(std::move(name), sinks.begin(), sinks.end());
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%l] [pid %P tid %t] %v");
    logger->set_level(lvl);
    logger->flush_on(spdlog::level::warn);
    spdlog::register_logger(logger);
    return logger;
}

inline void initialize_all_loggers(const std::string& prefix, log_t::level lvl = log_t::level::info) {
    static constexpr std::array<std::string_view, 4> all_loggers = {
        logger_tag::TABLE_RESOLVER,
        logger_tag::MEMORY_CATALOG,
        logger_tag::CATALOG_LOADER,
        logger_tag::CLI,
    };

    for (auto tag : all_loggers) {
        initialize_logger(std::string(tag), prefix, lvl);
    }
}

// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  GraphStax

#pragma once

#include "logger.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

struct describe_config {
    std::filesystem::path catalog_path;
    // empty - log to stdout only
    std::string log_path;
    log_t::level log_level = log_t::level::warn;
    std::vector<std::string> tables;
};

inline describe_config make_describe_config(const std::filesystem::path& catalog_path) {
    describe_config config;
    config.catalog_path = catalog_path;
    config.log_path = "/tmp/graphstax/log";
    config.log_level = log_t::level::info;
    return config;
}

// spdlog maps unknown names to "off"; only the literal "off" is accepted as such
inline std::optional<log_t::level> parse_log_level(const std::string& name) {
    auto lvl = spdlog::level::from_str(name);
    if (lvl == log_t::level::off && name != "off") {
        return std::nullopt;
    }
    return lvl;
}

// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  GraphStax

#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace catalog {
    enum class catalog_mistake_t : uint8_t
    {
        NONE,
        UNDEFINED_TABLE,
        BAD_DATA_FORMAT,
        CORRUPT_SCHEMA,
        UNSUPPORTED_KIND,
        TYPE_EXPRESSION,
    };

    std::string_view to_string(catalog_mistake_t mistake) noexcept;

    class catalog_error {
    public:
        catalog_error() = default;
        catalog_error(catalog_mistake_t mistake, std::string what, std::vector<uint8_t> raw_data = {});

        // true if an error is present
        explicit operator bool() const noexcept;

        catalog_mistake_t type() const noexcept;
        const std::string& what() const noexcept;
        // bytes of the offending row, filled for BAD_DATA_FORMAT
        const std::vector<uint8_t>& raw_data() const noexcept;

        std::string to_string() const;

    private:
        catalog_mistake_t type_ = catalog_mistake_t::NONE;
        std::string what_;
        std::vector<uint8_t> raw_data_;
    };

    // carries a catalog_error out of nested decoding steps up to the resolver boundary
    class catalog_exception : public std::runtime_error {
    public:
        explicit catalog_exception(catalog_error error);

        const catalog_error& error() const noexcept;

    private:
        catalog_error error_;
    };

    [[noreturn]] void throw_catalog_error(catalog_mistake_t mistake, std::string what, std::vector<uint8_t> raw_data = {});
} // namespace catalog

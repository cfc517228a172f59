// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  GraphStax

#include "catalog_error.hpp"
#include "storage/byte_utils.hpp"

namespace catalog {
    std::string_view to_string(catalog_mistake_t mistake) noexcept {
        switch (mistake) {
            case catalog_mistake_t::NONE:
                return "none";
            case catalog_mistake_t::UNDEFINED_TABLE:
                return "undefined table";
            case catalog_mistake_t::BAD_DATA_FORMAT:
                return "bad data format";
            case catalog_mistake_t::CORRUPT_SCHEMA:
                return "corrupt schema";
            case catalog_mistake_t::UNSUPPORTED_KIND:
                return "unsupported kind";
            case catalog_mistake_t::TYPE_EXPRESSION:
                return "type expression error";
        }
        return "unknown";
    }

    catalog_error::catalog_error(catalog_mistake_t mistake, std::string what, std::vector<uint8_t> raw_data)
        : type_(mistake)
        , what_(std::move(what))
        , raw_data_(std::move(raw_data)) {}

    catalog_error::operator bool() const noexcept { return type_ != catalog_mistake_t::NONE; }

    catalog_mistake_t catalog_error::type() const noexcept { return type_; }

    const std::string& catalog_error::what() const noexcept { return what_; }

    const std::vector<uint8_t>& catalog_error::raw_data() const noexcept { return raw_data_; }

    std::string catalog_error::to_string() const {
        std::string result(catalog::to_string(type_));
        if (!what_.empty()) {
            result += ": " + what_;
        }
        if (!raw_data_.empty()) {
            result += " [" + storage::hex_dump(raw_data_) + "]";
        }
        return result;
    }

    catalog_exception::catalog_exception(catalog_error error)
        : std::runtime_error(error.to_string())
        , error_(std::move(error)) {}

    const catalog_error& catalog_exception::error() const noexcept { return error_; }

    void throw_catalog_error(catalog_mistake_t mistake, std::string what, std::vector<uint8_t> raw_data) {
        throw catalog_exception(catalog_error(mistake, std::move(what), std::move(raw_data)));
    }
} // namespace catalog

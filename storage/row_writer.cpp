// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  GraphStax

#include "row_writer.hpp"
#include "byte_utils.hpp"

#include <bit>
#include <stdexcept>
#include <utility>

namespace storage {
    row_writer::row_writer(uint32_t prefix)
        : prefix_(prefix) {
        write_be(payload_, prefix_);
    }

    row_writer& row_writer::write_null() {
        payload_.push_back(static_cast<uint8_t>(field_tag::Null));
        return *this;
    }

    row_writer& row_writer::write_bool(bool value) {
        payload_.push_back(static_cast<uint8_t>(value ? field_tag::BoolTrue : field_tag::BoolFalse));
        return *this;
    }

    row_writer& row_writer::write_int(int64_t value) {
        payload_.push_back(static_cast<uint8_t>(field_tag::Int));
        write_be(payload_, value);
        return *this;
    }

    row_writer& row_writer::write_float(double value) {
        payload_.push_back(static_cast<uint8_t>(field_tag::Float));
        write_be(payload_, std::bit_cast<uint64_t>(value));
        return *this;
    }

    row_writer& row_writer::write_text(std::string_view value) {
        if (value.size() > UINT32_MAX) {
            throw std::length_error("Text field too long for a catalog row");
        }
        payload_.push_back(static_cast<uint8_t>(field_tag::Text));
        write_be(payload_, static_cast<uint32_t>(value.size()));
        payload_.insert(payload_.end(), value.begin(), value.end());
        return *this;
    }

    raw_row_t row_writer::build() {
        auto data = std::exchange(payload_, {});
        write_be(payload_, prefix_);
        return raw_row_t(std::move(data));
    }
} // namespace storage

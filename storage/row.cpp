// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  GraphStax

#include "row.hpp"
#include "byte_utils.hpp"

#include <bit>

namespace storage {
    raw_row_t::raw_row_t(std::vector<uint8_t> data)
        : data_(std::move(data)) {}

    const std::vector<uint8_t>& raw_row_t::data() const noexcept { return data_; }

    std::optional<uint32_t> raw_row_t::prefix() const {
        if (data_.size() < ROW_PREFIX_SIZE) {
            return std::nullopt;
        }
        return read_be<uint32_t>(data_, 0);
    }

    std::optional<bool> raw_row_t::get_bool(size_t pos) const {
        auto offset = field_offset(pos);
        if (!offset) {
            return std::nullopt;
        }
        switch (static_cast<field_tag>(data_[*offset])) {
            case field_tag::BoolTrue:
                return true;
            case field_tag::BoolFalse:
                return false;
            default:
                return std::nullopt;
        }
    }

    std::optional<int64_t> raw_row_t::get_int(size_t pos) const {
        auto offset = field_offset(pos);
        if (!offset || static_cast<field_tag>(data_[*offset]) != field_tag::Int) {
            return std::nullopt;
        }
        return read_be<int64_t>(data_, *offset + 1);
    }

    std::optional<double> raw_row_t::get_float(size_t pos) const {
        auto offset = field_offset(pos);
        if (!offset || static_cast<field_tag>(data_[*offset]) != field_tag::Float) {
            return std::nullopt;
        }
        return std::bit_cast<double>(read_be<uint64_t>(data_, *offset + 1));
    }

    std::optional<std::string> raw_row_t::get_text(size_t pos) const {
        auto offset = field_offset(pos);
        if (!offset || static_cast<field_tag>(data_[*offset]) != field_tag::Text) {
            return std::nullopt;
        }
        auto start = *offset + 1 + TEXT_LENGTH_SIZE;
        auto length = read_be<uint32_t>(data_, *offset + 1);
        return std::string(data_.begin() + start, data_.begin() + start + length);
    }

    bool raw_row_t::is_null(size_t pos) const {
        auto offset = field_offset(pos);
        return offset && static_cast<field_tag>(data_[*offset]) == field_tag::Null;
    }

    size_t raw_row_t::size() const {
        if (data_.size() < ROW_PREFIX_SIZE) {
            return 0;
        }
        size_t count = 0;
        size_t offset = ROW_PREFIX_SIZE;
        while (offset < data_.size()) {
            auto end = field_end(offset);
            if (!end) {
                break;
            }
            offset = *end;
            ++count;
        }
        return count;
    }

    // offset of the tag byte of field `pos`, only if the whole field fits in the row
    std::optional<size_t> raw_row_t::field_offset(size_t pos) const {
        if (data_.size() < ROW_PREFIX_SIZE) {
            return std::nullopt;
        }
        size_t offset = ROW_PREFIX_SIZE;
        for (size_t i = 0; i < pos; ++i) {
            if (offset >= data_.size()) {
                return std::nullopt;
            }
            auto end = field_end(offset);
            if (!end) {
                return std::nullopt;
            }
            offset = *end;
        }
        if (offset >= data_.size() || !field_end(offset)) {
            return std::nullopt;
        }
        return offset;
    }

    std::optional<size_t> raw_row_t::field_end(size_t offset) const {
        size_t payload = 0;
        switch (static_cast<field_tag>(data_.at(offset))) {
            case field_tag::Null:
            case field_tag::BoolTrue:
            case field_tag::BoolFalse:
                payload = 0;
                break;
            case field_tag::Int:
            case field_tag::Float:
                payload = 8;
                break;
            case field_tag::Text: {
                if (offset + 1 + TEXT_LENGTH_SIZE > data_.size()) {
                    return std::nullopt;
                }
                payload = TEXT_LENGTH_SIZE + read_be<uint32_t>(data_, offset + 1);
                break;
            }
            default:
                return std::nullopt;
        }
        if (offset + 1 + payload > data_.size()) {
            return std::nullopt;
        }
        return offset + 1 + payload;
    }
} // namespace storage

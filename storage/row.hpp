// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  GraphStax

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace storage {
    constexpr size_t ROW_PREFIX_SIZE = 4;
    constexpr size_t TEXT_LENGTH_SIZE = 4;

    enum class field_tag : uint8_t
    {
        Null = 0,
        BoolTrue = 1,
        BoolFalse = 2,
        Int = 3,
        Float = 4,
        Text = 5,
    };

    // A persisted row: [4-byte BE prefix][tag payload]*
    // Fields are only reachable by walking the preceding ones, so every accessor
    // returns nothing for a position that is past the end, truncated, or of another type.
    class raw_row_t {
    public:
        raw_row_t() = default;
        explicit raw_row_t(std::vector<uint8_t> data);

        const std::vector<uint8_t>& data() const noexcept;

        std::optional<uint32_t> prefix() const;

        std::optional<bool> get_bool(size_t pos) const;
        std::optional<int64_t> get_int(size_t pos) const;
        std::optional<double> get_float(size_t pos) const;
        std::optional<std::string> get_text(size_t pos) const;
        bool is_null(size_t pos) const;

        // number of well-formed fields
        size_t size() const;

        friend bool operator==(const raw_row_t& lhs, const raw_row_t& rhs) { return lhs.data_ == rhs.data_; }

    private:
        std::optional<size_t> field_offset(size_t pos) const;
        std::optional<size_t> field_end(size_t offset) const;

        std::vector<uint8_t> data_;
    };
} // namespace storage

// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  GraphStax

#pragma once

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

namespace typing {
    enum class typing_kind : uint8_t
    {
        Any,
        Bool,
        Int,
        Float,
        Text,
        Uuid,
        Nullable,
        Homogeneous,
        UnnamedTuple,
        NamedTuple,
    };

    class typing_t;

    // ordered (column name, typing) pairs; order is the physical column order
    using named_column_t = std::pair<std::string, typing_t>;
    using named_columns_t = std::vector<named_column_t>;

    class typing_t {
    public:
        typing_t(typing_kind kind = typing_kind::Any);

        static typing_t nullable(typing_t inner);
        static typing_t homogeneous(typing_t element);
        static typing_t unnamed_tuple(std::vector<typing_t> elements);
        static typing_t named_tuple(named_columns_t columns);

        typing_kind kind() const noexcept;
        bool is_primitive() const noexcept;

        // inner typing for Nullable and Homogeneous, element typings for tuples
        const std::vector<typing_t>& children() const noexcept;

        // view the typing as a list of named columns, nothing if it is not a named tuple
        std::optional<named_columns_t> extract_named_tuple() const;

        std::string to_string() const;

        friend bool operator==(const typing_t& lhs, const typing_t& rhs);
        friend bool operator!=(const typing_t& lhs, const typing_t& rhs) { return !(lhs == rhs); }

    private:
        typing_kind kind_;
        std::vector<typing_t> children_;
        std::vector<std::string> names_;
    };

    std::ostream& operator<<(std::ostream& os, const typing_t& typing);

    std::string to_string(const named_columns_t& columns);
} // namespace typing

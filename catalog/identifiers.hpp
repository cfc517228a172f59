// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  GraphStax

#pragma once

#include "utility/hash.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <ostream>
#include <string>
#include <type_traits>

namespace catalog {
    // Tables live either in the permanent root scope or in a session-local scope.
    // The two scopes are disjoint id spaces, so an id only means something together
    // with its scope flag.
    struct table_id_t {
        bool in_root = false;
        int64_t id = -1;

        table_id_t() = default;
        // signed and unsigned ids are both normalized to signed storage
        template<typename Int>
        requires std::is_integral_v<Int> table_id_t(bool in_root, Int id)
            : in_root(in_root)
            , id(static_cast<int64_t>(id)) {}

        bool is_valid() const noexcept { return id >= 0; }
        std::string to_string() const;
    };

    bool operator==(const table_id_t& lhs, const table_id_t& rhs) noexcept;
    bool operator!=(const table_id_t& lhs, const table_id_t& rhs) noexcept;
    bool operator<(const table_id_t& lhs, const table_id_t& rhs) noexcept;
    bool operator>(const table_id_t& lhs, const table_id_t& rhs) noexcept;
    bool operator<=(const table_id_t& lhs, const table_id_t& rhs) noexcept;
    bool operator>=(const table_id_t& lhs, const table_id_t& rhs) noexcept;
    std::ostream& operator<<(std::ostream& os, const table_id_t& id);

    // position of a column inside the key or the value part of a table
    struct col_id_t {
        bool is_key = false;
        int64_t id = -1;

        col_id_t() = default;
        template<typename Int>
        requires std::is_integral_v<Int> col_id_t(bool is_key, Int id)
            : is_key(is_key)
            , id(static_cast<int64_t>(id)) {}

        std::string to_string() const;
    };

    bool operator==(const col_id_t& lhs, const col_id_t& rhs) noexcept;
    bool operator!=(const col_id_t& lhs, const col_id_t& rhs) noexcept;
    bool operator<(const col_id_t& lhs, const col_id_t& rhs) noexcept;
    std::ostream& operator<<(std::ostream& os, const col_id_t& id);
} // namespace catalog

template<>
struct std::hash<catalog::table_id_t> {
    std::size_t operator()(const catalog::table_id_t& id) const noexcept {
        std::size_t seed = 42;
        hash_combine(seed, id.in_root, id.id);
        return seed;
    }
};

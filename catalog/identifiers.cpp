// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  GraphStax

#include "identifiers.hpp"

namespace catalog {
    std::string table_id_t::to_string() const { return "#" + std::string(in_root ? "G" : "L") + std::to_string(id); }

    bool operator==(const table_id_t& lhs, const table_id_t& rhs) noexcept {
        return lhs.in_root == rhs.in_root && lhs.id == rhs.id;
    }

    bool operator!=(const table_id_t& lhs, const table_id_t& rhs) noexcept { return !(lhs == rhs); }

    // scope first: every local id sorts before every root id
    bool operator<(const table_id_t& lhs, const table_id_t& rhs) noexcept {
        if (lhs.in_root != rhs.in_root) {
            return !lhs.in_root;
        }
        return lhs.id < rhs.id;
    }

    bool operator>(const table_id_t& lhs, const table_id_t& rhs) noexcept { return rhs < lhs; }

    bool operator<=(const table_id_t& lhs, const table_id_t& rhs) noexcept { return !(rhs < lhs); }

    bool operator>=(const table_id_t& lhs, const table_id_t& rhs) noexcept { return !(lhs < rhs); }

    std::ostream& operator<<(std::ostream& os, const table_id_t& id) { return os << id.to_string(); }

    std::string col_id_t::to_string() const { return "." + std::string(is_key ? "K" : "D") + std::to_string(id); }

    bool operator==(const col_id_t& lhs, const col_id_t& rhs) noexcept {
        return lhs.is_key == rhs.is_key && lhs.id == rhs.id;
    }

    bool operator!=(const col_id_t& lhs, const col_id_t& rhs) noexcept { return !(lhs == rhs); }

    bool operator<(const col_id_t& lhs, const col_id_t& rhs) noexcept {
        if (lhs.is_key != rhs.is_key) {
            return !lhs.is_key;
        }
        return lhs.id < rhs.id;
    }

    std::ostream& operator<<(std::ostream& os, const col_id_t& id) { return os << id.to_string(); }
} // namespace catalog

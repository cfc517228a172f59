// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  GraphStax

#include "data_kind.hpp"

namespace catalog {
    std::optional<data_kind> data_kind_from_prefix(uint32_t prefix) noexcept {
        switch (static_cast<data_kind>(prefix)) {
            case data_kind::Data:
            case data_kind::Node:
            case data_kind::Edge:
            case data_kind::Assoc:
            case data_kind::Index:
            case data_kind::Val:
            case data_kind::Type:
            case data_kind::Empty:
                return static_cast<data_kind>(prefix);
            default:
                return std::nullopt;
        }
    }

    std::string_view to_string(data_kind kind) noexcept {
        switch (kind) {
            case data_kind::Data:
                return "Data";
            case data_kind::Node:
                return "Node";
            case data_kind::Edge:
                return "Edge";
            case data_kind::Assoc:
                return "Assoc";
            case data_kind::Index:
                return "Index";
            case data_kind::Val:
                return "Val";
            case data_kind::Type:
                return "Type";
            case data_kind::Empty:
                return "Empty";
        }
        return "Unknown";
    }
} // namespace catalog

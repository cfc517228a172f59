// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  GraphStax

#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace catalog {
    // Discriminant stored in the prefix of every catalog row.
    enum class data_kind : uint32_t
    {
        Data = 0,
        Node = 1,
        Edge = 2,
        Assoc = 3,
        Index = 4,
        Val = 5,
        Type = 6,
        Empty = 99,
    };

    std::optional<data_kind> data_kind_from_prefix(uint32_t prefix) noexcept;

    std::string_view to_string(data_kind kind) noexcept;
} // namespace catalog

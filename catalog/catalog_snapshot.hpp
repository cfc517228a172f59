// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  GraphStax

#pragma once

#include "storage/row.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace catalog {
    using related_rows_t = std::vector<std::pair<std::string, storage::raw_row_t>>;

    // Read-only view of the catalog as seen by one session. All reads made through one
    // snapshot are expected to observe the same state of the catalog.
    class ICatalogSnapshot {
    public:
        virtual ~ICatalogSnapshot() = default;

        // catalog row of a table by name, session-local tables shadow root ones
        virtual std::optional<storage::raw_row_t> resolve(std::string_view name) = 0;

        virtual std::optional<storage::raw_row_t> table_data(int64_t id, bool in_root) = 0;

        // associate rows attached to a table, in catalog order
        virtual related_rows_t resolve_related_tables(std::string_view name) = 0;
    };
} // namespace catalog

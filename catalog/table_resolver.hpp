// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  GraphStax

#pragma once

#include "catalog_error.hpp"
#include "catalog_snapshot.hpp"
#include "table_info.hpp"
#include "typing/typing_parser.hpp"
#include "utility/logger.hpp"

#include <string_view>
#include <variant>
#include <vector>

namespace catalog {
    // either a resolved table or the reason it could not be resolved
    class table_info_result {
    public:
        table_info_result(table_info_t info);
        table_info_result(catalog_error error);

        bool is_success() const noexcept;
        bool is_error() const noexcept;

        const catalog_error& get_error() const;
        const table_info_t& value() const&;
        table_info_t value() &&;

    private:
        std::variant<table_info_t, catalog_error> data_;
    };

    // Builds table_info_t out of catalog rows. Holds no state of its own: every call
    // reads the snapshot afresh and hands a new record to the caller.
    class TableResolver {
    public:
        TableResolver(ICatalogSnapshot& snapshot, typing::ITypingParser& parser);

        table_info_result resolve_table_info(std::string_view name);

    private:
        table_info_t assemble(std::string_view name);
        typing::named_columns_t referenced_key_typing(std::string_view edge_name, std::string_view role, table_id_t ref);
        std::vector<associate_info_t> resolve_associates(std::string_view name);

        log_t log_;
        ICatalogSnapshot& snapshot_;
        typing::ITypingParser& parser_;
    };
} // namespace catalog

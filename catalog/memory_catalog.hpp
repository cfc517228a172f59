// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  GraphStax

#pragma once

#include "catalog_snapshot.hpp"
#include "identifiers.hpp"
#include "utility/logger.hpp"

#include <cstdint>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace catalog {
    // In-memory catalog with a root scope and a stack of session-local scopes.
    // Rows are encoded with the same layouts the resolver decodes.
    class MemoryCatalog final : public ICatalogSnapshot {
    public:
        MemoryCatalog();

        void push_local_scope();
        // drops every table defined in the innermost local scope
        void pop_local_scope();
        size_t local_depth() const;

        table_id_t define_node(const std::string& name, bool in_root, std::string_view key_typing, std::string_view val_typing);
        table_id_t define_edge(const std::string& name,
                               bool in_root,
                               std::string_view src_name,
                               std::string_view dst_name,
                               std::string_view key_typing,
                               std::string_view val_typing);
        table_id_t define_assoc(const std::string& name, bool in_root, std::string_view main_name, std::string_view val_typing);

        // store a row as is, without checking its layout
        table_id_t put_row(const std::string& name, bool in_root, storage::raw_row_t row);
        table_id_t attach_row(std::string_view main_name, const std::string& name, bool in_root, storage::raw_row_t row);

        std::optional<storage::raw_row_t> resolve(std::string_view name) override;
        std::optional<storage::raw_row_t> table_data(int64_t id, bool in_root) override;
        related_rows_t resolve_related_tables(std::string_view name) override;

    private:
        struct entry_t {
            std::string name;
            storage::raw_row_t row;
        };

        // associates are filed in the scope of the associate itself, under the id of
        // their main table, which may live in another scope
        struct scope_t {
            std::unordered_map<std::string, table_id_t> names;
            std::unordered_map<table_id_t, std::vector<table_id_t>> associates;
        };

        scope_t& target_scope(bool in_root);
        std::optional<table_id_t> find_name(std::string_view name) const;
        table_id_t find_main(std::string_view caller, std::string_view main_name) const;
        void attach(table_id_t main, const std::string& name, table_id_t id, storage::raw_row_t row);
        table_id_t next_id(bool in_root);
        void insert(const std::string& name, table_id_t id, storage::raw_row_t row);

        log_t log_;
        mutable std::shared_mutex mtx_;
        scope_t root_;
        std::vector<scope_t> locals_;
        std::unordered_map<table_id_t, entry_t> rows_;
        int64_t next_root_id_{0};
        int64_t next_local_id_{0};
    };
} // namespace catalog

// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  GraphStax

#pragma once

#include "data_kind.hpp"
#include "identifiers.hpp"
#include "typing/typing.hpp"

#include <optional>
#include <ostream>
#include <string>
#include <unordered_set>
#include <vector>

namespace catalog {
    using data_keys_t = std::unordered_set<std::string>;

    // Auxiliary table extending a main table with sparse value columns.
    // It has no key part, no src/dst and never carries associates of its own.
    class associate_info_t {
    public:
        associate_info_t(std::string name, table_id_t table_id, typing::named_columns_t val_typing);

        data_kind kind() const noexcept { return data_kind::Assoc; }
        const std::string& name() const noexcept { return name_; }
        table_id_t table_id() const noexcept { return table_id_; }
        table_id_t src_table_id() const noexcept { return {}; }
        table_id_t dst_table_id() const noexcept { return {}; }
        const typing::named_columns_t& key_typing() const noexcept;
        const typing::named_columns_t& val_typing() const noexcept { return val_typing_; }
        const data_keys_t& data_keys() const noexcept { return data_keys_; }

        friend bool operator==(const associate_info_t& lhs, const associate_info_t& rhs);

    private:
        std::string name_;
        table_id_t table_id_;
        typing::named_columns_t val_typing_;
        data_keys_t data_keys_;
    };

    // Resolved schema of a Node or Edge table, assembled once and read-only afterwards.
    class table_info_t {
    public:
        static table_info_t make_node(table_id_t table_id,
                                      typing::named_columns_t key_typing,
                                      typing::named_columns_t val_typing,
                                      std::vector<associate_info_t> associates = {});

        static table_info_t make_edge(table_id_t table_id,
                                      table_id_t src_table_id,
                                      table_id_t dst_table_id,
                                      typing::named_columns_t key_typing,
                                      typing::named_columns_t val_typing,
                                      typing::named_columns_t src_key_typing,
                                      typing::named_columns_t dst_key_typing,
                                      std::vector<associate_info_t> associates = {});

        data_kind kind() const noexcept { return kind_; }
        table_id_t table_id() const noexcept { return table_id_; }
        table_id_t src_table_id() const noexcept { return src_table_id_; }
        table_id_t dst_table_id() const noexcept { return dst_table_id_; }
        const typing::named_columns_t& key_typing() const noexcept { return key_typing_; }
        const typing::named_columns_t& val_typing() const noexcept { return val_typing_; }
        const data_keys_t& data_keys() const noexcept { return data_keys_; }
        const typing::named_columns_t& src_key_typing() const noexcept { return src_key_typing_; }
        const typing::named_columns_t& dst_key_typing() const noexcept { return dst_key_typing_; }
        const std::vector<associate_info_t>& associates() const noexcept { return associates_; }

        // own key columns first, then value columns
        std::optional<col_id_t> find_column(const std::string& name) const;

        std::string to_string() const;

        friend bool operator==(const table_info_t& lhs, const table_info_t& rhs);

    private:
        table_info_t(data_kind kind,
                     table_id_t table_id,
                     table_id_t src_table_id,
                     table_id_t dst_table_id,
                     typing::named_columns_t key_typing,
                     typing::named_columns_t val_typing,
                     typing::named_columns_t src_key_typing,
                     typing::named_columns_t dst_key_typing,
                     std::vector<associate_info_t> associates);

        data_kind kind_;
        table_id_t table_id_;
        table_id_t src_table_id_;
        table_id_t dst_table_id_;
        typing::named_columns_t key_typing_;
        typing::named_columns_t val_typing_;
        data_keys_t data_keys_;
        typing::named_columns_t src_key_typing_;
        typing::named_columns_t dst_key_typing_;
        std::vector<associate_info_t> associates_;
    };

    data_keys_t make_data_keys(const typing::named_columns_t& val_typing);

    std::ostream& operator<<(std::ostream& os, const table_info_t& info);
} // namespace catalog

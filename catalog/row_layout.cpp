// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  GraphStax

#include "row_layout.hpp"
#include "catalog_error.hpp"

#include <fmt/format.h>

using namespace catalog;

namespace {
    bool read_bool(const storage::raw_row_t& row, size_t pos, std::string_view field) {
        auto value = row.get_bool(pos);
        if (!value) {
            throw_catalog_error(catalog_mistake_t::CORRUPT_SCHEMA,
                                fmt::format("{} missing at position {}", field, pos));
        }
        return *value;
    }

    int64_t read_int(const storage::raw_row_t& row, size_t pos, std::string_view field) {
        auto value = row.get_int(pos);
        if (!value) {
            throw_catalog_error(catalog_mistake_t::CORRUPT_SCHEMA,
                                fmt::format("{} missing at position {}", field, pos));
        }
        return *value;
    }

    // Node and Edge rows report a missing text field together with the row bytes,
    // associates treat it as a broken schema entry.
    std::string read_text(const storage::raw_row_t& row, size_t pos, std::string_view field, catalog_mistake_t mistake) {
        auto value = row.get_text(pos);
        if (!value) {
            auto what = fmt::format("{} missing at position {}", field, pos);
            if (mistake == catalog_mistake_t::BAD_DATA_FORMAT) {
                throw_catalog_error(mistake, std::move(what), row.data());
            }
            throw_catalog_error(mistake, std::move(what));
        }
        return std::move(*value);
    }

    // parse failures leave as type_expression_error untouched
    typing::named_columns_t
    to_named_columns(const std::string& text, std::string_view field, typing::ITypingParser& parser) {
        auto columns = parser.parse(text).extract_named_tuple();
        if (!columns) {
            throw_catalog_error(catalog_mistake_t::CORRUPT_SCHEMA,
                                fmt::format("{} '{}' is not a named tuple", field, text));
        }
        return std::move(*columns);
    }

    table_id_t read_table_id(const storage::raw_row_t& row,
                             size_t in_root_pos,
                             size_t id_pos,
                             std::string_view in_root_field,
                             std::string_view id_field) {
        auto in_root = read_bool(row, in_root_pos, in_root_field);
        auto id = read_int(row, id_pos, id_field);
        return {in_root, id};
    }
} // namespace

namespace catalog::row_layout {
    data_kind decode_kind(const storage::raw_row_t& row) {
        auto prefix = row.prefix();
        if (!prefix) {
            throw_catalog_error(catalog_mistake_t::CORRUPT_SCHEMA, "catalog row is too short to carry a data kind");
        }
        auto kind = data_kind_from_prefix(*prefix);
        if (!kind) {
            throw_catalog_error(catalog_mistake_t::CORRUPT_SCHEMA, fmt::format("unknown data kind {}", *prefix));
        }
        return *kind;
    }

    table_id_t node_table_id(const storage::raw_row_t& row) {
        return read_table_id(row, node::IN_ROOT, node::TABLE_ID, "node row: in_root", "node row: table id");
    }

    typing::named_columns_t node_key_typing(const storage::raw_row_t& row, typing::ITypingParser& parser) {
        auto text = read_text(row, node::KEY_TYPING, "node row: key typing", catalog_mistake_t::BAD_DATA_FORMAT);
        return to_named_columns(text, "node row: key typing", parser);
    }

    typing::named_columns_t node_val_typing(const storage::raw_row_t& row, typing::ITypingParser& parser) {
        auto text = read_text(row, node::VAL_TYPING, "node row: value typing", catalog_mistake_t::BAD_DATA_FORMAT);
        return to_named_columns(text, "node row: value typing", parser);
    }

    table_id_t edge_table_id(const storage::raw_row_t& row) {
        return read_table_id(row, edge::IN_ROOT, edge::TABLE_ID, "edge row: in_root", "edge row: table id");
    }

    table_id_t edge_src_table_id(const storage::raw_row_t& row) {
        return read_table_id(row,
                             edge::SRC_IN_ROOT,
                             edge::SRC_TABLE_ID,
                             "edge row: src in_root",
                             "edge row: src table id");
    }

    table_id_t edge_dst_table_id(const storage::raw_row_t& row) {
        return read_table_id(row,
                             edge::DST_IN_ROOT,
                             edge::DST_TABLE_ID,
                             "edge row: dst in_root",
                             "edge row: dst table id");
    }

    typing::named_columns_t edge_key_typing(const storage::raw_row_t& row, typing::ITypingParser& parser) {
        auto text = read_text(row, edge::KEY_TYPING, "edge row: key typing", catalog_mistake_t::BAD_DATA_FORMAT);
        return to_named_columns(text, "edge row: key typing", parser);
    }

    typing::named_columns_t edge_val_typing(const storage::raw_row_t& row, typing::ITypingParser& parser) {
        auto text = read_text(row, edge::VAL_TYPING, "edge row: value typing", catalog_mistake_t::BAD_DATA_FORMAT);
        return to_named_columns(text, "edge row: value typing", parser);
    }

    table_id_t assoc_table_id(const storage::raw_row_t& row) {
        return read_table_id(row, assoc::IN_ROOT, assoc::TABLE_ID, "assoc row: in_root", "assoc row: table id");
    }

    typing::named_columns_t assoc_val_typing(const storage::raw_row_t& row, typing::ITypingParser& parser) {
        auto text = read_text(row, assoc::VAL_TYPING, "assoc row: value typing", catalog_mistake_t::CORRUPT_SCHEMA);
        return to_named_columns(text, "assoc row: value typing", parser);
    }
} // namespace catalog::row_layout

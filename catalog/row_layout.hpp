// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  GraphStax

#pragma once

#include "data_kind.hpp"
#include "identifiers.hpp"
#include "storage/row.hpp"
#include "typing/typing_parser.hpp"

// Positional layouts of catalog rows. Every decoder either returns the value of one
// semantic field or throws catalog_exception naming that field.
namespace catalog::row_layout {
    namespace node {
        constexpr size_t IN_ROOT = 0;
        constexpr size_t TABLE_ID = 1;
        constexpr size_t KEY_TYPING = 2;
        constexpr size_t VAL_TYPING = 3;
    } // namespace node

    namespace edge {
        constexpr size_t IN_ROOT = 0;
        constexpr size_t TABLE_ID = 1;
        constexpr size_t SRC_IN_ROOT = 2;
        constexpr size_t SRC_TABLE_ID = 3;
        constexpr size_t DST_IN_ROOT = 4;
        constexpr size_t DST_TABLE_ID = 5;
        constexpr size_t KEY_TYPING = 6;
        constexpr size_t VAL_TYPING = 7;
    } // namespace edge

    namespace assoc {
        constexpr size_t IN_ROOT = 0;
        constexpr size_t TABLE_ID = 1;
        constexpr size_t MAIN_IN_ROOT = 2;
        constexpr size_t MAIN_TABLE_ID = 3;
        constexpr size_t VAL_TYPING = 4;
    } // namespace assoc

    data_kind decode_kind(const storage::raw_row_t& row);

    // Node rows
    table_id_t node_table_id(const storage::raw_row_t& row);
    typing::named_columns_t node_key_typing(const storage::raw_row_t& row, typing::ITypingParser& parser);
    typing::named_columns_t node_val_typing(const storage::raw_row_t& row, typing::ITypingParser& parser);

    // Edge rows
    table_id_t edge_table_id(const storage::raw_row_t& row);
    table_id_t edge_src_table_id(const storage::raw_row_t& row);
    table_id_t edge_dst_table_id(const storage::raw_row_t& row);
    typing::named_columns_t edge_key_typing(const storage::raw_row_t& row, typing::ITypingParser& parser);
    typing::named_columns_t edge_val_typing(const storage::raw_row_t& row, typing::ITypingParser& parser);

    // Assoc rows
    table_id_t assoc_table_id(const storage::raw_row_t& row);
    typing::named_columns_t assoc_val_typing(const storage::raw_row_t& row, typing::ITypingParser& parser);
} // namespace catalog::row_layout

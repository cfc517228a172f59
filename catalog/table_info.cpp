// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  GraphStax

#include "table_info.hpp"

#include <fmt/format.h>

namespace catalog {
    data_keys_t make_data_keys(const typing::named_columns_t& val_typing) {
        data_keys_t keys;
        keys.reserve(val_typing.size());
        for (const auto& [name, _] : val_typing) {
            keys.insert(name);
        }
        return keys;
    }

    associate_info_t::associate_info_t(std::string name, table_id_t table_id, typing::named_columns_t val_typing)
        : name_(std::move(name))
        , table_id_(table_id)
        , val_typing_(std::move(val_typing))
        , data_keys_(make_data_keys(val_typing_)) {}

    const typing::named_columns_t& associate_info_t::key_typing() const noexcept {
        static const typing::named_columns_t empty;
        return empty;
    }

    bool operator==(const associate_info_t& lhs, const associate_info_t& rhs) {
        return lhs.name_ == rhs.name_ && lhs.table_id_ == rhs.table_id_ && lhs.val_typing_ == rhs.val_typing_;
    }

    table_info_t::table_info_t(data_kind kind,
                               table_id_t table_id,
                               table_id_t src_table_id,
                               table_id_t dst_table_id,
                               typing::named_columns_t key_typing,
                               typing::named_columns_t val_typing,
                               typing::named_columns_t src_key_typing,
                               typing::named_columns_t dst_key_typing,
                               std::vector<associate_info_t> associates)
        : kind_(kind)
        , table_id_(table_id)
        , src_table_id_(src_table_id)
        , dst_table_id_(dst_table_id)
        , key_typing_(std::move(key_typing))
        , val_typing_(std::move(val_typing))
        , data_keys_(make_data_keys(val_typing_))
        , src_key_typing_(std::move(src_key_typing))
        , dst_key_typing_(std::move(dst_key_typing))
        , associates_(std::move(associates)) {}

    table_info_t table_info_t::make_node(table_id_t table_id,
                                         typing::named_columns_t key_typing,
                                         typing::named_columns_t val_typing,
                                         std::vector<associate_info_t> associates) {
        return table_info_t(data_kind::Node,
                            table_id,
                            {},
                            {},
                            std::move(key_typing),
                            std::move(val_typing),
                            {},
                            {},
                            std::move(associates));
    }

    table_info_t table_info_t::make_edge(table_id_t table_id,
                                         table_id_t src_table_id,
                                         table_id_t dst_table_id,
                                         typing::named_columns_t key_typing,
                                         typing::named_columns_t val_typing,
                                         typing::named_columns_t src_key_typing,
                                         typing::named_columns_t dst_key_typing,
                                         std::vector<associate_info_t> associates) {
        return table_info_t(data_kind::Edge,
                            table_id,
                            src_table_id,
                            dst_table_id,
                            std::move(key_typing),
                            std::move(val_typing),
                            std::move(src_key_typing),
                            std::move(dst_key_typing),
                            std::move(associates));
    }

    std::optional<col_id_t> table_info_t::find_column(const std::string& name) const {
        for (size_t i = 0; i < key_typing_.size(); ++i) {
            if (key_typing_[i].first == name) {
                return col_id_t(true, i);
            }
        }
        for (size_t i = 0; i < val_typing_.size(); ++i) {
            if (val_typing_[i].first == name) {
                return col_id_t(false, i);
            }
        }
        return std::nullopt;
    }

    std::string table_info_t::to_string() const {
        std::string result = fmt::format("{} {}\n", catalog::to_string(kind_), table_id_.to_string());
        if (kind_ == data_kind::Edge) {
            result += fmt::format("  src: {} key {}\n", src_table_id_.to_string(), typing::to_string(src_key_typing_));
            result += fmt::format("  dst: {} key {}\n", dst_table_id_.to_string(), typing::to_string(dst_key_typing_));
        }
        result += fmt::format("  key: {}\n", typing::to_string(key_typing_));
        result += fmt::format("  val: {}\n", typing::to_string(val_typing_));
        for (const auto& assoc : associates_) {
            result += fmt::format("  assoc {} {}: {}\n",
                                  assoc.name(),
                                  assoc.table_id().to_string(),
                                  typing::to_string(assoc.val_typing()));
        }
        return result;
    }

    bool operator==(const table_info_t& lhs, const table_info_t& rhs) {
        return lhs.kind_ == rhs.kind_ && lhs.table_id_ == rhs.table_id_ && lhs.src_table_id_ == rhs.src_table_id_ &&
               lhs.dst_table_id_ == rhs.dst_table_id_ && lhs.key_typing_ == rhs.key_typing_ &&
               lhs.val_typing_ == rhs.val_typing_ && lhs.src_key_typing_ == rhs.src_key_typing_ &&
               lhs.dst_key_typing_ == rhs.dst_key_typing_ && lhs.associates_ == rhs.associates_;
    }

    std::ostream& operator<<(std::ostream& os, const table_info_t& info) { return os << info.to_string(); }
} // namespace catalog

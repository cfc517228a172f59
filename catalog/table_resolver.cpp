// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  GraphStax

#include "table_resolver.hpp"
#include "row_layout.hpp"

#include <fmt/format.h>

#include <stdexcept>

namespace catalog {
    table_info_result::table_info_result(table_info_t info)
        : data_(std::move(info)) {}

    table_info_result::table_info_result(catalog_error error)
        : data_(std::move(error)) {}

    bool table_info_result::is_success() const noexcept { return std::holds_alternative<table_info_t>(data_); }

    bool table_info_result::is_error() const noexcept { return !is_success(); }

    const catalog_error& table_info_result::get_error() const {
        if (auto* err = std::get_if<catalog_error>(&data_)) {
            return *err;
        }
        throw std::logic_error("table_info_result: no error in a successful result");
    }

    const table_info_t& table_info_result::value() const& {
        if (auto* info = std::get_if<table_info_t>(&data_)) {
            return *info;
        }
        throw std::logic_error("table_info_result: " + get_error().to_string());
    }

    table_info_t table_info_result::value() && {
        if (auto* info = std::get_if<table_info_t>(&data_)) {
            return std::move(*info);
        }
        throw std::logic_error("table_info_result: " + get_error().to_string());
    }

    TableResolver::TableResolver(ICatalogSnapshot& snapshot, typing::ITypingParser& parser)
        : log_(get_logger(logger_tag::TABLE_RESOLVER))
        , snapshot_(snapshot)
        , parser_(parser) {}

    table_info_result TableResolver::resolve_table_info(std::string_view name) {
        try {
            auto info = assemble(name);
            log_->debug("resolve_table_info: {} resolved as {} {} with {} associates",
                        name,
                        to_string(info.kind()),
                        info.table_id().to_string(),
                        info.associates().size());
            return info;
        } catch (const catalog_exception& e) {
            return e.error();
        } catch (const typing::type_expression_error& e) {
            return catalog_error(catalog_mistake_t::TYPE_EXPRESSION, e.what());
        }
    }

    table_info_t TableResolver::assemble(std::string_view name) {
        auto row = snapshot_.resolve(name);
        if (!row) {
            throw_catalog_error(catalog_mistake_t::UNDEFINED_TABLE, fmt::format("table '{}' is not defined", name));
        }

        auto kind = row_layout::decode_kind(*row);
        log_->trace("assemble: {} has kind {}", name, to_string(kind));

        switch (kind) {
            case data_kind::Node: {
                auto table_id = row_layout::node_table_id(*row);
                auto key_typing = row_layout::node_key_typing(*row, parser_);
                auto val_typing = row_layout::node_val_typing(*row, parser_);
                return table_info_t::make_node(table_id,
                                               std::move(key_typing),
                                               std::move(val_typing),
                                               resolve_associates(name));
            }
            case data_kind::Edge: {
                auto table_id = row_layout::edge_table_id(*row);
                auto src_table_id = row_layout::edge_src_table_id(*row);
                auto dst_table_id = row_layout::edge_dst_table_id(*row);
                auto key_typing = row_layout::edge_key_typing(*row, parser_);
                auto val_typing = row_layout::edge_val_typing(*row, parser_);
                auto src_key_typing = referenced_key_typing(name, "src", src_table_id);
                auto dst_key_typing = referenced_key_typing(name, "dst", dst_table_id);
                return table_info_t::make_edge(table_id,
                                               src_table_id,
                                               dst_table_id,
                                               std::move(key_typing),
                                               std::move(val_typing),
                                               std::move(src_key_typing),
                                               std::move(dst_key_typing),
                                               resolve_associates(name));
            }
            default:
                throw_catalog_error(catalog_mistake_t::UNSUPPORTED_KIND,
                                    fmt::format("'{}' is a {} entry, not a table", name, to_string(kind)));
        }
    }

    // the edge row itself exists, so a missing endpoint is a dangling reference
    typing::named_columns_t
    TableResolver::referenced_key_typing(std::string_view edge_name, std::string_view role, table_id_t ref) {
        auto row = snapshot_.table_data(ref.id, ref.in_root);
        if (!row) {
            throw_catalog_error(catalog_mistake_t::CORRUPT_SCHEMA,
                                fmt::format("edge '{}': {} table {} does not exist", edge_name, role, ref.to_string()));
        }
        if (auto kind = row_layout::decode_kind(*row); kind != data_kind::Node) {
            throw_catalog_error(catalog_mistake_t::CORRUPT_SCHEMA,
                                fmt::format("edge '{}': {} table {} is a {} entry, not a node table",
                                            edge_name,
                                            role,
                                            ref.to_string(),
                                            to_string(kind)));
        }
        return row_layout::node_key_typing(*row, parser_);
    }

    std::vector<associate_info_t> TableResolver::resolve_associates(std::string_view name) {
        std::vector<associate_info_t> associates;
        for (auto& [assoc_name, row] : snapshot_.resolve_related_tables(name)) {
            if (auto kind = row_layout::decode_kind(row); kind != data_kind::Assoc) {
                throw_catalog_error(catalog_mistake_t::CORRUPT_SCHEMA,
                                    fmt::format("associate '{}' of '{}' is a {} entry", assoc_name, name, to_string(kind)));
            }
            auto table_id = row_layout::assoc_table_id(row);
            auto val_typing = row_layout::assoc_val_typing(row, parser_);

            // only one level of associates is supported, deeper ones are rejected, not dropped
            if (!snapshot_.resolve_related_tables(assoc_name).empty()) {
                throw_catalog_error(catalog_mistake_t::CORRUPT_SCHEMA,
                                    fmt::format("associate '{}' of '{}' has associates of its own", assoc_name, name));
            }

            log_->trace("resolve_associates: {} has associate {} {}", name, assoc_name, table_id.to_string());
            associates.emplace_back(std::move(assoc_name), table_id, std::move(val_typing));
        }
        return associates;
    }
} // namespace catalog

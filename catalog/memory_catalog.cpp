// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  GraphStax

#include "memory_catalog.hpp"
#include "data_kind.hpp"
#include "storage/row_writer.hpp"

#include <fmt/format.h>

#include <mutex>
#include <stdexcept>

namespace catalog {
    MemoryCatalog::MemoryCatalog()
        : log_(get_logger(logger_tag::MEMORY_CATALOG)) {}

    void MemoryCatalog::push_local_scope() {
        std::unique_lock lock(mtx_);
        locals_.emplace_back();
    }

    void MemoryCatalog::pop_local_scope() {
        std::unique_lock lock(mtx_);
        if (locals_.empty()) {
            throw std::logic_error("pop_local_scope: no local scope to pop");
        }
        auto drop_associates = [this](scope_t& scope, table_id_t main) {
            if (auto it = scope.associates.find(main); it != scope.associates.end()) {
                for (const auto& id : it->second) {
                    rows_.erase(id);
                }
                scope.associates.erase(it);
            }
        };

        auto popped = std::move(locals_.back());
        locals_.pop_back();
        for (const auto& [main, ids] : popped.associates) {
            for (const auto& id : ids) {
                rows_.erase(id);
            }
        }
        for (const auto& [name, id] : popped.names) {
            rows_.erase(id);
            // associates defined in outer scopes on a table of the popped scope
            drop_associates(root_, id);
            for (auto& scope : locals_) {
                drop_associates(scope, id);
            }
        }
    }

    size_t MemoryCatalog::local_depth() const {
        std::shared_lock lock(mtx_);
        return locals_.size();
    }

    table_id_t MemoryCatalog::define_node(const std::string& name,
                                          bool in_root,
                                          std::string_view key_typing,
                                          std::string_view val_typing) {
        std::unique_lock lock(mtx_);
        auto id = next_id(in_root);
        auto row = storage::row_writer(static_cast<uint32_t>(data_kind::Node))
                       .write_bool(id.in_root)
                       .write_int(id.id)
                       .write_text(key_typing)
                       .write_text(val_typing)
                       .build();
        insert(name, id, std::move(row));
        log_->debug("define_node: {} as {}", name, id.to_string());
        return id;
    }

    table_id_t MemoryCatalog::define_edge(const std::string& name,
                                          bool in_root,
                                          std::string_view src_name,
                                          std::string_view dst_name,
                                          std::string_view key_typing,
                                          std::string_view val_typing) {
        std::unique_lock lock(mtx_);
        auto endpoint = [this](std::string_view endpoint_name) {
            auto found = find_name(endpoint_name);
            if (!found) {
                throw std::invalid_argument(fmt::format("define_edge: endpoint '{}' is not defined", endpoint_name));
            }
            return *found;
        };
        auto src = endpoint(src_name);
        auto dst = endpoint(dst_name);
        if (in_root && (!src.in_root || !dst.in_root)) {
            throw std::invalid_argument(fmt::format("define_edge: root edge '{}' cannot point to local tables", name));
        }

        auto id = next_id(in_root);
        auto row = storage::row_writer(static_cast<uint32_t>(data_kind::Edge))
                       .write_bool(id.in_root)
                       .write_int(id.id)
                       .write_bool(src.in_root)
                       .write_int(src.id)
                       .write_bool(dst.in_root)
                       .write_int(dst.id)
                       .write_text(key_typing)
                       .write_text(val_typing)
                       .build();
        insert(name, id, std::move(row));
        log_->debug("define_edge: {} as {} ({} -> {})", name, id.to_string(), src.to_string(), dst.to_string());
        return id;
    }

    table_id_t MemoryCatalog::define_assoc(const std::string& name,
                                           bool in_root,
                                           std::string_view main_name,
                                           std::string_view val_typing) {
        std::unique_lock lock(mtx_);
        auto main = find_main("define_assoc", main_name);
        auto id = next_id(in_root);
        auto row = storage::row_writer(static_cast<uint32_t>(data_kind::Assoc))
                       .write_bool(id.in_root)
                       .write_int(id.id)
                       .write_bool(main.in_root)
                       .write_int(main.id)
                       .write_text(val_typing)
                       .build();
        attach(main, name, id, std::move(row));
        log_->debug("define_assoc: {} as {} on {} {}", name, id.to_string(), main_name, main.to_string());
        return id;
    }

    table_id_t MemoryCatalog::put_row(const std::string& name, bool in_root, storage::raw_row_t row) {
        std::unique_lock lock(mtx_);
        auto id = next_id(in_root);
        insert(name, id, std::move(row));
        return id;
    }

    table_id_t MemoryCatalog::attach_row(std::string_view main_name,
                                         const std::string& name,
                                         bool in_root,
                                         storage::raw_row_t row) {
        std::unique_lock lock(mtx_);
        auto main = find_main("attach_row", main_name);
        auto id = next_id(in_root);
        attach(main, name, id, std::move(row));
        return id;
    }

    std::optional<storage::raw_row_t> MemoryCatalog::resolve(std::string_view name) {
        std::shared_lock lock(mtx_);
        auto id = find_name(name);
        if (!id) {
            return std::nullopt;
        }
        return rows_.at(*id).row;
    }

    std::optional<storage::raw_row_t> MemoryCatalog::table_data(int64_t id, bool in_root) {
        std::shared_lock lock(mtx_);
        if (auto it = rows_.find(table_id_t(in_root, id)); it != rows_.end()) {
            return it->second.row;
        }
        return std::nullopt;
    }

    // associates of the table the name resolves to: root ones first, then those of
    // each local scope from the outermost in
    related_rows_t MemoryCatalog::resolve_related_tables(std::string_view name) {
        std::shared_lock lock(mtx_);
        related_rows_t related;
        auto main = find_name(name);
        if (!main) {
            return related;
        }
        auto collect = [this, &related, &main](const scope_t& scope) {
            if (auto it = scope.associates.find(*main); it != scope.associates.end()) {
                for (const auto& id : it->second) {
                    const auto& entry = rows_.at(id);
                    related.emplace_back(entry.name, entry.row);
                }
            }
        };
        collect(root_);
        for (const auto& scope : locals_) {
            collect(scope);
        }
        return related;
    }

    MemoryCatalog::scope_t& MemoryCatalog::target_scope(bool in_root) {
        if (in_root) {
            return root_;
        }
        if (locals_.empty()) {
            throw std::logic_error("local table defined without a local scope");
        }
        return locals_.back();
    }

    std::optional<table_id_t> MemoryCatalog::find_name(std::string_view name) const {
        std::string key(name);
        for (auto it = locals_.rbegin(); it != locals_.rend(); ++it) {
            if (auto found = it->names.find(key); found != it->names.end()) {
                return found->second;
            }
        }
        if (auto found = root_.names.find(key); found != root_.names.end()) {
            return found->second;
        }
        return std::nullopt;
    }

    table_id_t MemoryCatalog::find_main(std::string_view caller, std::string_view main_name) const {
        auto main = find_name(main_name);
        if (!main) {
            throw std::invalid_argument(fmt::format("{}: main table '{}' is not defined", caller, main_name));
        }
        return *main;
    }

    table_id_t MemoryCatalog::next_id(bool in_root) {
        if (!in_root && locals_.empty()) {
            throw std::logic_error("local table defined without a local scope");
        }
        return in_root ? table_id_t(true, next_root_id_++) : table_id_t(false, next_local_id_++);
    }

    void MemoryCatalog::insert(const std::string& name, table_id_t id, storage::raw_row_t row) {
        auto& scope = target_scope(id.in_root);
        if (scope.names.contains(name)) {
            throw std::invalid_argument(fmt::format("table '{}' is already defined in this scope", name));
        }
        scope.names.emplace(name, id);
        rows_.emplace(id, entry_t{name, std::move(row)});
    }

    void MemoryCatalog::attach(table_id_t main, const std::string& name, table_id_t id, storage::raw_row_t row) {
        target_scope(id.in_root).associates[main].push_back(id);
        rows_.emplace(id, entry_t{name, std::move(row)});
    }
} // namespace catalog

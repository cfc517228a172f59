// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  GraphStax

#include "catalog_loader.hpp"
#include "utility/logger.hpp"

#include <fmt/format.h>

#include <fstream>
#include <sstream>
#include <string>

namespace {
    std::string trim(std::string_view str) {
        auto begin = str.find_first_not_of(" \t\r");
        if (begin == std::string_view::npos) {
            return {};
        }
        auto end = str.find_last_not_of(" \t\r");
        return std::string(str.substr(begin, end - begin + 1));
    }

    class line_reader {
    public:
        line_reader(std::string line, size_t line_no)
            : stream_(line)
            , line_no_(line_no) {}

        std::string word(std::string_view what) {
            std::string result;
            if (!(stream_ >> result)) {
                fail(fmt::format("{} expected", what));
            }
            return result;
        }

        bool scope() {
            auto value = word("scope");
            if (value == "root") {
                return true;
            } else if (value == "local") {
                return false;
            }
            fail(fmt::format("scope must be 'root' or 'local', got '{}'", value));
        }

        std::string rest(std::string_view what) {
            std::string result;
            std::getline(stream_, result);
            result = trim(result);
            if (result.empty()) {
                fail(fmt::format("{} expected", what));
            }
            return result;
        }

        // "<key typing> | <value typing>"
        std::pair<std::string, std::string> key_and_value() {
            auto typings = rest("key and value typing");
            auto bar = typings.find('|');
            if (bar == std::string::npos) {
                fail("key and value typing must be separated by '|'");
            }
            auto key = trim(std::string_view(typings).substr(0, bar));
            auto val = trim(std::string_view(typings).substr(bar + 1));
            if (key.empty() || val.empty()) {
                fail("key and value typing must not be empty");
            }
            return {std::move(key), std::move(val)};
        }

        [[noreturn]] void fail(const std::string& reason) const {
            throw catalog::catalog_load_error(fmt::format("line {}: {}", line_no_, reason));
        }

    private:
        std::istringstream stream_;
        size_t line_no_;
    };
} // namespace

namespace catalog {
    size_t load_catalog(std::istream& in, MemoryCatalog& catalog) {
        auto log = get_logger(logger_tag::CATALOG_LOADER);
        size_t loaded = 0;
        size_t line_no = 0;
        bool local_opened = false;
        std::string line;

        while (std::getline(in, line)) {
            ++line_no;
            if (auto comment = line.find('#'); comment != std::string::npos) {
                line.erase(comment);
            }
            if (trim(line).empty()) {
                continue;
            }

            line_reader reader(line, line_no);
            auto kind = reader.word("definition kind");
            auto name = reader.word("table name");
            auto in_root = reader.scope();
            if (!in_root && !local_opened) {
                catalog.push_local_scope();
                local_opened = true;
            }

            try {
                if (kind == "node") {
                    auto [key, val] = reader.key_and_value();
                    catalog.define_node(name, in_root, key, val);
                } else if (kind == "edge") {
                    auto src = reader.word("src table name");
                    auto dst = reader.word("dst table name");
                    auto [key, val] = reader.key_and_value();
                    catalog.define_edge(name, in_root, src, dst, key, val);
                } else if (kind == "assoc") {
                    auto main = reader.word("main table name");
                    catalog.define_assoc(name, in_root, main, reader.rest("value typing"));
                } else {
                    reader.fail(fmt::format("unknown definition kind '{}'", kind));
                }
            } catch (const std::invalid_argument& e) {
                reader.fail(e.what());
            }
            ++loaded;
        }

        log->info("load_catalog: {} definitions loaded", loaded);
        return loaded;
    }

    size_t load_catalog_file(const std::filesystem::path& path, MemoryCatalog& catalog) {
        std::ifstream in(path);
        if (!in) {
            throw catalog_load_error(fmt::format("cannot open catalog file {}", path.string()));
        }
        return load_catalog(in, catalog);
    }
} // namespace catalog

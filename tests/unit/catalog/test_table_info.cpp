// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  GraphStax

#include "catalog/table_info.hpp"

#include <catch2/catch.hpp>

using namespace catalog;
using typing::typing_kind;

namespace {
    typing::named_columns_t columns(std::initializer_list<std::pair<std::string, typing_kind>> list) {
        typing::named_columns_t result;
        for (const auto& [name, kind] : list) {
            result.emplace_back(name, typing::typing_t(kind));
        }
        return result;
    }
} // namespace

TEST_CASE("table_info: node record") {
    auto info = table_info_t::make_node({true, 4},
                                        columns({{"id", typing_kind::Int}}),
                                        columns({{"name", typing_kind::Text}, {"age", typing_kind::Int}}));

    REQUIRE(info.kind() == data_kind::Node);
    REQUIRE(info.table_id() == table_id_t(true, 4));
    REQUIRE_FALSE(info.src_table_id().is_valid());
    REQUIRE_FALSE(info.dst_table_id().is_valid());
    REQUIRE(info.src_key_typing().empty());
    REQUIRE(info.dst_key_typing().empty());
    REQUIRE(info.data_keys() == data_keys_t{"name", "age"});
    REQUIRE(info.associates().empty());

    SECTION("find_column") {
        REQUIRE(info.find_column("id") == col_id_t(true, 0));
        REQUIRE(info.find_column("name") == col_id_t(false, 0));
        REQUIRE(info.find_column("age") == col_id_t(false, 1));
        REQUIRE_FALSE(info.find_column("missing"));
    }

    SECTION("key column shadows value column of the same name") {
        auto clash = table_info_t::make_node({true, 0},
                                             columns({{"x", typing_kind::Int}}),
                                             columns({{"x", typing_kind::Text}}));
        REQUIRE(clash.find_column("x") == col_id_t(true, 0));
    }

    SECTION("display") {
        REQUIRE(info.to_string() == "Node #G4\n"
                                    "  key: [(id, Int)]\n"
                                    "  val: [(name, Text), (age, Int)]\n");
    }
}

TEST_CASE("table_info: edge record with associates") {
    std::vector<associate_info_t> associates{
        associate_info_t("tags", {false, 2}, columns({{"tag", typing_kind::Text}})),
    };
    auto info = table_info_t::make_edge({false, 1},
                                        {true, 0},
                                        {true, 3},
                                        {},
                                        columns({{"since", typing_kind::Int}}),
                                        columns({{"id", typing_kind::Int}}),
                                        columns({{"code", typing_kind::Text}}),
                                        associates);

    REQUIRE(info.kind() == data_kind::Edge);
    REQUIRE(info.src_table_id() == table_id_t(true, 0));
    REQUIRE(info.dst_table_id() == table_id_t(true, 3));
    REQUIRE(info.key_typing().empty());
    REQUIRE(info.data_keys() == data_keys_t{"since"});
    REQUIRE(info.associates() == associates);

    const auto& assoc = info.associates().front();
    REQUIRE(assoc.kind() == data_kind::Assoc);
    REQUIRE(assoc.key_typing().empty());
    REQUIRE_FALSE(assoc.src_table_id().is_valid());
    REQUIRE(assoc.data_keys() == data_keys_t{"tag"});

    REQUIRE(info.to_string() == "Edge #L1\n"
                                "  src: #G0 key [(id, Int)]\n"
                                "  dst: #G3 key [(code, Text)]\n"
                                "  key: []\n"
                                "  val: [(since, Int)]\n"
                                "  assoc tags #L2: [(tag, Text)]\n");
}

TEST_CASE("table_info: equality") {
    auto make = [](int64_t id) {
        return table_info_t::make_node({true, id}, columns({{"id", typing_kind::Int}}), {});
    };
    REQUIRE(make(1) == make(1));
    REQUIRE_FALSE(make(1) == make(2));
}

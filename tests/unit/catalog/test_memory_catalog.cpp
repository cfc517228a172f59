// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  GraphStax

#include "catalog/memory_catalog.hpp"
#include "catalog/row_layout.hpp"
#include "catalog/table_resolver.hpp"
#include "storage/row_writer.hpp"

#include <catch2/catch.hpp>

using namespace catalog;

TEST_CASE("memory_catalog: root definitions") {
    MemoryCatalog catalog;
    auto person = catalog.define_node("person", true, "{id: Int}", "{name: Text}");
    auto city = catalog.define_node("city", true, "{code: Text}", "{}");
    auto lives_in = catalog.define_edge("lives_in", true, "person", "city", "{}", "{since: Int}");

    REQUIRE(person == table_id_t(true, 0));
    REQUIRE(city == table_id_t(true, 1));
    REQUIRE(lives_in == table_id_t(true, 2));

    SECTION("rows follow the catalog layouts") {
        auto row = catalog.resolve("lives_in");
        REQUIRE(row);
        REQUIRE(row_layout::decode_kind(*row) == data_kind::Edge);
        REQUIRE(row_layout::edge_table_id(*row) == lives_in);
        REQUIRE(row_layout::edge_src_table_id(*row) == person);
        REQUIRE(row_layout::edge_dst_table_id(*row) == city);
    }

    SECTION("lookup by id") {
        REQUIRE(catalog.table_data(0, true) == catalog.resolve("person"));
        REQUIRE_FALSE(catalog.table_data(0, false));
        REQUIRE_FALSE(catalog.table_data(17, true));
    }

    SECTION("unknown names") {
        REQUIRE_FALSE(catalog.resolve("nobody"));
        REQUIRE(catalog.resolve_related_tables("nobody").empty());
    }

    SECTION("definition errors") {
        REQUIRE_THROWS_AS(catalog.define_node("person", true, "{id: Int}", "{}"), std::invalid_argument);
        REQUIRE_THROWS_AS(catalog.define_edge("e", true, "person", "nowhere", "{}", "{}"), std::invalid_argument);
        REQUIRE_THROWS_AS(catalog.define_assoc("a", true, "nowhere", "{x: Int}"), std::invalid_argument);
        REQUIRE_THROWS_AS(catalog.define_node("tmp", false, "{}", "{}"), std::logic_error);
        REQUIRE_THROWS_AS(catalog.pop_local_scope(), std::logic_error);
    }
}

TEST_CASE("memory_catalog: local scopes") {
    MemoryCatalog catalog;
    auto root_person = catalog.define_node("person", true, "{id: Int}", "{name: Text}");

    catalog.push_local_scope();
    REQUIRE(catalog.local_depth() == 1);
    auto local_person = catalog.define_node("person", false, "{id: Uuid}", "{}");
    auto visit = catalog.define_node("visit", false, "{n: Int}", "{}");
    REQUIRE(local_person == table_id_t(false, 0));

    SECTION("local name shadows root name") {
        auto row = catalog.resolve("person");
        REQUIRE(row);
        REQUIRE(row_layout::node_table_id(*row) == local_person);
        REQUIRE(catalog.table_data(root_person.id, true));
    }

    SECTION("root edge cannot point into a local scope") {
        REQUIRE_THROWS_AS(catalog.define_edge("e", true, "visit", "visit", "{}", "{}"), std::invalid_argument);
        REQUIRE_NOTHROW(catalog.define_edge("e", false, "visit", "visit", "{}", "{}"));
    }

    SECTION("pop drops the scope") {
        catalog.pop_local_scope();
        REQUIRE(catalog.local_depth() == 0);
        REQUIRE_FALSE(catalog.table_data(visit.id, false));
        REQUIRE_FALSE(catalog.resolve("visit"));
        auto row = catalog.resolve("person");
        REQUIRE(row);
        REQUIRE(row_layout::node_table_id(*row) == root_person);
    }

    SECTION("inner scope shadows outer scope") {
        catalog.push_local_scope();
        auto inner = catalog.define_node("visit", false, "{m: Int}", "{}");
        REQUIRE(row_layout::node_table_id(*catalog.resolve("visit")) == inner);
        catalog.pop_local_scope();
        REQUIRE(row_layout::node_table_id(*catalog.resolve("visit")) == visit);
    }
}

TEST_CASE("memory_catalog: associates") {
    MemoryCatalog catalog;
    catalog.define_node("person", true, "{id: Int}", "{}");
    catalog.define_assoc("email", true, "person", "{address: Text}");
    catalog.push_local_scope();
    catalog.define_assoc("nickname", false, "person", "{nick: Text}");
    catalog.define_assoc("avatar", true, "person", "{url: Text}");

    auto related = catalog.resolve_related_tables("person");
    REQUIRE(related.size() == 3);
    REQUIRE(related[0].first == "email");
    REQUIRE(related[1].first == "avatar");
    REQUIRE(related[2].first == "nickname");
    REQUIRE(row_layout::decode_kind(related[2].second) == data_kind::Assoc);

    catalog.pop_local_scope();
    REQUIRE(catalog.resolve_related_tables("person").size() == 2);
}

TEST_CASE("memory_catalog: associate rows name their main table") {
    MemoryCatalog catalog;
    auto person = catalog.define_node("person", true, "{id: Int}", "{}");
    catalog.define_assoc("email", true, "person", "{address: Text}");

    auto related = catalog.resolve_related_tables("person");
    REQUIRE(related.size() == 1);
    const auto& row = related.front().second;
    REQUIRE(row.get_bool(row_layout::assoc::MAIN_IN_ROOT) == person.in_root);
    REQUIRE(row.get_int(row_layout::assoc::MAIN_TABLE_ID) == person.id);

    REQUIRE_THROWS_AS(catalog.attach_row("nowhere", "x", true, storage::row_writer(0).build()), std::invalid_argument);
}

TEST_CASE("memory_catalog: associates follow the table, not its name") {
    MemoryCatalog catalog;
    typing::TypingParser parser;
    TableResolver resolver(catalog, parser);

    SECTION("shadowing table does not inherit root associates") {
        catalog.define_node("person", true, "{id: Int}", "{}");
        catalog.define_assoc("email", true, "person", "{address: Text}");
        catalog.push_local_scope();
        auto local_person = catalog.define_node("person", false, "{id: Uuid}", "{}");

        REQUIRE(catalog.resolve_related_tables("person").empty());
        auto result = resolver.resolve_table_info("person");
        REQUIRE(result.is_success());
        REQUIRE(result.value().table_id() == local_person);
        REQUIRE(result.value().associates().empty());

        catalog.pop_local_scope();
        auto root = resolver.resolve_table_info("person");
        REQUIRE(root.is_success());
        REQUIRE(root.value().associates().size() == 1);
        REQUIRE(root.value().associates().front().name() == "email");
    }

    SECTION("root associate of a local table goes away with its scope") {
        catalog.push_local_scope();
        catalog.define_node("tmp", false, "{id: Int}", "{}");
        auto extra = catalog.define_assoc("tmp_extra", true, "tmp", "{note: Text}");
        REQUIRE(catalog.resolve_related_tables("tmp").size() == 1);

        catalog.pop_local_scope();
        REQUIRE_FALSE(catalog.table_data(extra.id, true));

        catalog.define_node("tmp", true, "{id: Int}", "{}");
        REQUIRE(catalog.resolve_related_tables("tmp").empty());
        auto result = resolver.resolve_table_info("tmp");
        REQUIRE(result.is_success());
        REQUIRE(result.value().associates().empty());
    }
}

TEST_CASE("memory_catalog: resolved through the table resolver") {
    MemoryCatalog catalog;
    auto person = catalog.define_node("person", true, "{id: Int}", "{name: Text}");
    auto city = catalog.define_node("city", true, "{code: Text, zip: Int}", "{}");
    catalog.define_edge("lives_in", true, "person", "city", "{}", "{since: Int}");
    auto email = catalog.define_assoc("email", true, "lives_in", "{address: Text}");

    typing::TypingParser parser;
    TableResolver resolver(catalog, parser);

    auto result = resolver.resolve_table_info("lives_in");
    REQUIRE(result.is_success());
    const auto& info = result.value();
    REQUIRE(info.kind() == data_kind::Edge);
    REQUIRE(info.src_table_id() == person);
    REQUIRE(info.dst_table_id() == city);
    REQUIRE(typing::to_string(info.src_key_typing()) == "[(id, Int)]");
    REQUIRE(typing::to_string(info.dst_key_typing()) == "[(code, Text), (zip, Int)]");
    REQUIRE(info.data_keys() == data_keys_t{"since"});
    REQUIRE(info.associates().size() == 1);
    REQUIRE(info.associates().front().table_id() == email);

    SECTION("rows stored without checks are reported") {
        catalog.put_row("broken", true, storage::row_writer(static_cast<uint32_t>(data_kind::Node)).write_bool(true).build());
        auto broken = resolver.resolve_table_info("broken");
        REQUIRE(broken.is_error());
        REQUIRE(broken.get_error().type() == catalog_mistake_t::CORRUPT_SCHEMA);

        catalog.attach_row("person", "bad_assoc", true, storage::row_writer(static_cast<uint32_t>(data_kind::Index)).build());
        auto bad = resolver.resolve_table_info("person");
        REQUIRE(bad.is_error());
        REQUIRE(bad.get_error().type() == catalog_mistake_t::CORRUPT_SCHEMA);
    }
}

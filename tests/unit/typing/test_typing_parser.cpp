// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  GraphStax

#include "typing/typing_parser.hpp"

#include <catch2/catch.hpp>

using namespace typing;

TEST_CASE("typing_parser: primitives") {
    TypingParser parser;

    REQUIRE(parser.parse("Any") == typing_t(typing_kind::Any));
    REQUIRE(parser.parse("Bool") == typing_t(typing_kind::Bool));
    REQUIRE(parser.parse(" Int ") == typing_t(typing_kind::Int));
    REQUIRE(parser.parse("Float") == typing_t(typing_kind::Float));
    REQUIRE(parser.parse("Text") == typing_t(typing_kind::Text));
    REQUIRE(parser.parse("Uuid") == typing_t(typing_kind::Uuid));
    REQUIRE(parser.parse("Int").is_primitive());
}

TEST_CASE("typing_parser: composite types") {
    TypingParser parser;

    SECTION("nullable and list") {
        auto t = parser.parse("?[Text]");
        REQUIRE(t.kind() == typing_kind::Nullable);
        REQUIRE(t.children().front() == typing_t::homogeneous(typing_kind::Text));
        REQUIRE(t.to_string() == "?[Text]");
    }

    SECTION("unnamed tuple") {
        auto t = parser.parse("(Int, ?Float,)");
        REQUIRE(t == typing_t::unnamed_tuple({typing_kind::Int, typing_t::nullable(typing_kind::Float)}));
        REQUIRE(parser.parse("()") == typing_t::unnamed_tuple({}));
        REQUIRE_FALSE(t.extract_named_tuple());
    }

    SECTION("named tuple keeps field order") {
        auto t = parser.parse("{ zeta: Int, alpha: {inner: [Uuid]} }");
        auto columns = t.extract_named_tuple();
        REQUIRE(columns);
        REQUIRE(columns->size() == 2);
        REQUIRE(columns->at(0).first == "zeta");
        REQUIRE(columns->at(0).second == typing_t(typing_kind::Int));
        REQUIRE(columns->at(1).first == "alpha");
        REQUIRE(columns->at(1).second.kind() == typing_kind::NamedTuple);
        REQUIRE(t.to_string() == "{zeta:Int,alpha:{inner:[Uuid]}}");
    }

    SECTION("empty named tuple") {
        auto columns = parser.parse("{}").extract_named_tuple();
        REQUIRE(columns);
        REQUIRE(columns->empty());
    }

    SECTION("printed form parses back") {
        auto t = parser.parse("{a: ?(Int, [Text]), b_2: Any}");
        REQUIRE(parser.parse(t.to_string()) == t);
    }
}

TEST_CASE("typing_parser: malformed expressions") {
    TypingParser parser;

    for (std::string text : {"", "Txt", "{a Int}", "{a: Int", "[Int", "(Int Text)", "{a: Int, a: Text}", "Int Int", "?"}) {
        INFO(text);
        REQUIRE_THROWS_AS(parser.parse(text), type_expression_error);
    }

    REQUIRE_THROWS_WITH(parser.parse("{a: Int, a: Text}"), Catch::Contains("duplicate field 'a'"));
    REQUIRE_THROWS_WITH(parser.parse("Int }"), Catch::Contains("unexpected trailing input"));
}

TEST_CASE("typing: equality is structural") {
    auto a = typing_t::named_tuple({{"x", typing_kind::Int}, {"y", typing_kind::Text}});
    auto b = typing_t::named_tuple({{"x", typing_kind::Int}, {"y", typing_kind::Text}});
    auto reordered = typing_t::named_tuple({{"y", typing_kind::Text}, {"x", typing_kind::Int}});
    REQUIRE(a == b);
    REQUIRE(a != reordered);
    REQUIRE(typing_t::unnamed_tuple({typing_kind::Int}) != typing_t::homogeneous(typing_kind::Int));
    REQUIRE(to_string(*a.extract_named_tuple()) == "[(x, Int), (y, Text)]");
}

TEST_CASE("typing_parser: nesting depth is bounded") {
    TypingParser parser;

    SECTION("deep enough") {
        std::string text = std::string(255, '[') + "Int" + std::string(255, ']');
        REQUIRE(parser.parse(text).kind() == typing_kind::Homogeneous);
    }

    SECTION("too deep") {
        std::string text = std::string(257, '?') + "Int";
        REQUIRE_THROWS_WITH(parser.parse(text), Catch::Contains("nesting too deep"));
    }

    SECTION("corrupt text far beyond the limit") {
        for (char open : {'[', '?', '(', '{'}) {
            INFO(open);
            REQUIRE_THROWS_AS(parser.parse(std::string(2000000, open)), type_expression_error);
        }
    }
}

// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  GraphStax

#include "typing_parser.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cctype>

namespace {
    using namespace typing;

    // deeper typings are rejected as corrupt
    constexpr size_t MAX_NESTING_DEPTH = 256;

    class typing_reader {
    public:
        explicit typing_reader(std::string_view text)
            : text_(text)
            , pos_(0)
            , depth_(0) {}

        typing_t read_all() {
            auto result = read_typing();
            skip_spaces();
            if (pos_ != text_.size()) {
                fail(fmt::format("unexpected trailing input '{}'", text_.substr(pos_)));
            }
            return result;
        }

    private:
        typing_t read_typing() {
            if (++depth_ > MAX_NESTING_DEPTH) {
                fail(fmt::format("nesting too deep, at most {} levels", MAX_NESTING_DEPTH));
            }
            auto result = read_nested();
            --depth_;
            return result;
        }

        typing_t read_nested() {
            skip_spaces();
            if (pos_ == text_.size()) {
                fail("unexpected end of input");
            }

            switch (text_[pos_]) {
                case '?': {
                    ++pos_;
                    return typing_t::nullable(read_typing());
                }
                case '[': {
                    ++pos_;
                    auto element = read_typing();
                    expect(']');
                    return typing_t::homogeneous(std::move(element));
                }
                case '(':
                    return read_unnamed_tuple();
                case '{':
                    return read_named_tuple();
                default:
                    return read_primitive();
            }
        }

        typing_t read_unnamed_tuple() {
            expect('(');
            std::vector<typing_t> elements;
            while (!try_consume(')')) {
                elements.push_back(read_typing());
                if (!try_consume(',')) {
                    expect(')');
                    break;
                }
            }
            return typing_t::unnamed_tuple(std::move(elements));
        }

        typing_t read_named_tuple() {
            expect('{');
            named_columns_t columns;
            while (!try_consume('}')) {
                auto name = read_ident();
                if (std::any_of(columns.begin(), columns.end(), [&name](const named_column_t& col) {
                        return col.first == name;
                    })) {
                    fail(fmt::format("duplicate field '{}' in named tuple", name));
                }
                expect(':');
                columns.emplace_back(std::move(name), read_typing());
                if (!try_consume(',')) {
                    expect('}');
                    break;
                }
            }
            return typing_t::named_tuple(std::move(columns));
        }

        typing_t read_primitive() {
            auto name = read_ident();
            if (name == "Any") {
                return typing_kind::Any;
            } else if (name == "Bool") {
                return typing_kind::Bool;
            } else if (name == "Int") {
                return typing_kind::Int;
            } else if (name == "Float") {
                return typing_kind::Float;
            } else if (name == "Text") {
                return typing_kind::Text;
            } else if (name == "Uuid") {
                return typing_kind::Uuid;
            }
            fail(fmt::format("unknown type '{}'", name));
        }

        std::string read_ident() {
            skip_spaces();
            size_t start = pos_;
            while (pos_ < text_.size() && (std::isalnum(static_cast<unsigned char>(text_[pos_])) || text_[pos_] == '_')) {
                ++pos_;
            }
            if (start == pos_) {
                fail("identifier expected");
            }
            return std::string(text_.substr(start, pos_ - start));
        }

        bool try_consume(char c) {
            skip_spaces();
            if (pos_ < text_.size() && text_[pos_] == c) {
                ++pos_;
                return true;
            }
            return false;
        }

        void expect(char c) {
            if (!try_consume(c)) {
                fail(fmt::format("'{}' expected", c));
            }
        }

        void skip_spaces() {
            while (pos_ < text_.size() && std::isspace(static_cast<unsigned char>(text_[pos_]))) {
                ++pos_;
            }
        }

        [[noreturn]] void fail(const std::string& reason) const {
            throw type_expression_error(fmt::format("bad type expression '{}' at {}: {}", text_, pos_, reason));
        }

        std::string_view text_;
        size_t pos_;
        size_t depth_;
    };
} // namespace

namespace typing {
    typing_t TypingParser::parse(std::string_view text) { return typing_reader(text).read_all(); }
} // namespace typing

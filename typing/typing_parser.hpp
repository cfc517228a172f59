// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  GraphStax

#pragma once

#include "typing.hpp"

#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>

namespace typing {
    class type_expression_error : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    class ITypingParser {
    public:
        virtual ~ITypingParser() = default;

        // throws type_expression_error on malformed text
        virtual typing_t parse(std::string_view text) = 0;
    };

    // Grammar:
    //   typing    := '?' typing | '[' typing ']' | '(' [typing {',' typing} [',']] ')'
    //              | '{' [field {',' field} [',']] '}' | primitive
    //   field     := ident ':' typing
    //   primitive := Any | Bool | Int | Float | Text | Uuid
    class TypingParser : public ITypingParser {
    public:
        typing_t parse(std::string_view text) override;
    };

    using typing_parser_ptr = std::unique_ptr<ITypingParser>;

    inline typing_parser_ptr make_typing_parser() { return std::make_unique<TypingParser>(); }
} // namespace typing

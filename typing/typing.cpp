// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  GraphStax

#include "typing.hpp"

#include <sstream>

namespace typing {
    typing_t::typing_t(typing_kind kind)
        : kind_(kind) {}

    typing_t typing_t::nullable(typing_t inner) {
        typing_t result(typing_kind::Nullable);
        result.children_.push_back(std::move(inner));
        return result;
    }

    typing_t typing_t::homogeneous(typing_t element) {
        typing_t result(typing_kind::Homogeneous);
        result.children_.push_back(std::move(element));
        return result;
    }

    typing_t typing_t::unnamed_tuple(std::vector<typing_t> elements) {
        typing_t result(typing_kind::UnnamedTuple);
        result.children_ = std::move(elements);
        return result;
    }

    typing_t typing_t::named_tuple(named_columns_t columns) {
        typing_t result(typing_kind::NamedTuple);
        result.children_.reserve(columns.size());
        result.names_.reserve(columns.size());
        for (auto& [name, col] : columns) {
            result.names_.push_back(std::move(name));
            result.children_.push_back(std::move(col));
        }
        return result;
    }

    typing_kind typing_t::kind() const noexcept { return kind_; }

    bool typing_t::is_primitive() const noexcept {
        switch (kind_) {
            case typing_kind::Nullable:
            case typing_kind::Homogeneous:
            case typing_kind::UnnamedTuple:
            case typing_kind::NamedTuple:
                return false;
            default:
                return true;
        }
    }

    const std::vector<typing_t>& typing_t::children() const noexcept { return children_; }

    std::optional<named_columns_t> typing_t::extract_named_tuple() const {
        if (kind_ != typing_kind::NamedTuple) {
            return std::nullopt;
        }

        named_columns_t columns;
        columns.reserve(children_.size());
        for (size_t i = 0; i < children_.size(); ++i) {
            columns.emplace_back(names_[i], children_[i]);
        }
        return columns;
    }

    std::string typing_t::to_string() const {
        switch (kind_) {
            case typing_kind::Any:
                return "Any";
            case typing_kind::Bool:
                return "Bool";
            case typing_kind::Int:
                return "Int";
            case typing_kind::Float:
                return "Float";
            case typing_kind::Text:
                return "Text";
            case typing_kind::Uuid:
                return "Uuid";
            case typing_kind::Nullable:
                return "?" + children_.front().to_string();
            case typing_kind::Homogeneous:
                return "[" + children_.front().to_string() + "]";
            case typing_kind::UnnamedTuple: {
                std::string result = "(";
                for (size_t i = 0; i < children_.size(); ++i) {
                    if (i) {
                        result += ",";
                    }
                    result += children_[i].to_string();
                }
                return result + ")";
            }
            case typing_kind::NamedTuple: {
                std::string result = "{";
                for (size_t i = 0; i < children_.size(); ++i) {
                    if (i) {
                        result += ",";
                    }
                    result += names_[i] + ":" + children_[i].to_string();
                }
                return result + "}";
            }
        }
        return {};
    }

    bool operator==(const typing_t& lhs, const typing_t& rhs) {
        return lhs.kind_ == rhs.kind_ && lhs.names_ == rhs.names_ && lhs.children_ == rhs.children_;
    }

    std::ostream& operator<<(std::ostream& os, const typing_t& typing) { return os << typing.to_string(); }

    std::string to_string(const named_columns_t& columns) {
        std::ostringstream oss;
        oss << "[";
        for (size_t i = 0; i < columns.size(); ++i) {
            if (i) {
                oss << ", ";
            }
            oss << "(" << columns[i].first << ", " << columns[i].second << ")";
        }
        oss << "]";
        return oss.str();
    }
} // namespace typing

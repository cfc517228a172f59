// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  GraphStax

#pragma once

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <string>
#include <type_traits>
#include <vector>

// Catalog rows store every fixed width integer big-endian, so rows sort the same way
// byte-wise as they do numerically.
namespace storage {
    // reads sizeof(T) bytes at `pos`; throws std::out_of_range past the end of `data`
    template<std::integral T>
    T read_be(const std::vector<uint8_t>& data, size_t pos) {
        using U = std::make_unsigned_t<T>;
        U raw = 0;
        for (size_t i = 0; i < sizeof(T); ++i) {
            raw = static_cast<U>((raw << 8) | data.at(pos + i));
        }
        return static_cast<T>(raw);
    }

    template<std::integral T>
    void write_be(std::vector<uint8_t>& payload, T value) {
        using U = std::make_unsigned_t<T>;
        auto raw = static_cast<U>(value);
        for (size_t i = sizeof(T); i > 0; --i) {
            payload.push_back(static_cast<uint8_t>(raw >> ((i - 1) * 8)));
        }
    }

    std::string hex_dump(const std::vector<uint8_t>& data, size_t max_bytes = 32);
} // namespace storage

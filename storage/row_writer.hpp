// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  GraphStax

#pragma once

#include "row.hpp"

#include <cstdint>
#include <string_view>
#include <vector>

namespace storage {
    class row_writer {
    public:
        explicit row_writer(uint32_t prefix);

        row_writer& write_null();
        row_writer& write_bool(bool value);
        row_writer& write_int(int64_t value);
        row_writer& write_float(double value);
        row_writer& write_text(std::string_view value);

        // moves the encoded row out, the writer starts over with the same prefix
        raw_row_t build();

    private:
        uint32_t prefix_;
        std::vector<uint8_t> payload_;
    };
} // namespace storage

// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  GraphStax

#include "byte_utils.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>

namespace storage {
    std::string hex_dump(const std::vector<uint8_t>& data, size_t max_bytes) {
        std::ostringstream oss;
        size_t limit = std::min(data.size(), max_bytes);
        for (size_t i = 0; i < limit; ++i) {
            oss << std::hex << std::setfill('0') << std::setw(2) << static_cast<int>(data[i]);
            if (i < limit - 1)
                oss << " ";
        }
        if (data.size() > max_bytes) {
            oss << "... (+" << std::dec << (data.size() - max_bytes) << " more bytes)";
        }
        return oss.str();
    }
} // namespace storage

// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  GraphStax

#pragma once

#include "memory_catalog.hpp"

#include <filesystem>
#include <istream>
#include <stdexcept>

namespace catalog {
    class catalog_load_error : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    // Text catalog description, one definition per line, '#' starts a comment:
    //   node  <name> <root|local> <key typing> | <value typing>
    //   edge  <name> <root|local> <src name> <dst name> <key typing> | <value typing>
    //   assoc <name> <root|local> <main name> <value typing>
    // Local definitions go to a single local scope opened on first use.
    // Returns the number of definitions loaded.
    size_t load_catalog(std::istream& in, MemoryCatalog& catalog);
    size_t load_catalog_file(const std::filesystem::path& path, MemoryCatalog& catalog);
} // namespace catalog

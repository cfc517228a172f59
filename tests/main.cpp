// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  GraphStax

#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>

// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  GraphStax

#pragma once

#include <string>

struct mock_config {
    bool can_throw = false;
    bool return_empty = false;
    std::string error_message = "";
};

/*
 * Part of the OneTimeStore (OTS) project.
 *
 * SPDX-FileCopyrightText: 2025 OneTimeStore contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of OneTimeStore (OTS). See LICENSE for details.
 */

#include "ots/id.hpp"
#include "ots/internal/utils.hpp"
#include <climits>
#include <stdexcept>

namespace ots {

std::string new_id(std::size_t n_bytes) {
    if (n_bytes == 0) {
        throw std::invalid_argument("new_id: n_bytes must be positive");
    }
    if (n_bytes > static_cast<std::size_t>(INT_MAX)) {
        throw std::invalid_argument("new_id: n_bytes too large");
    }
    std::string id = internal::random_hex(n_bytes);
    if (id.empty()) {
        throw std::runtime_error("new_id: RAND_bytes failed");
    }
    return id;
}

} // namespace ots

/*
 * Part of the OneTimeStore (OTS) project.
 *
 * SPDX-FileCopyrightText: 2025 OneTimeStore contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of OneTimeStore (OTS). See LICENSE for details.
 */

#pragma once
#include <string>
#include <cstddef>

namespace ots {

// Random token identifier: 2*n_bytes lowercase hex chars.
// Throws std::invalid_argument for n_bytes == 0, std::runtime_error if the
// CSPRNG is unavailable.
std::string new_id(std::size_t n_bytes = 16);

} // namespace ots

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

namespace ots::internal {

std::string bytes_to_hex(const unsigned char* p, std::size_t n);

// n_bytes random bytes from OpenSSL's CSPRNG, hex encoded. Empty on failure.
std::string random_hex(std::size_t n_bytes);

// Securely wipe string contents
void secure_wipe(std::string& s);

} // namespace ots::internal

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

namespace ots {

/**
 * Capability contract handed to token generators (captcha, OTP, e-mail codes).
 * Implementations must be safe to call from multiple threads.
 */
class Store {
public:
    virtual ~Store() = default;

    // Insert or overwrite. Never fails.
    virtual void set(const std::string& id, const std::string& value) = 0;

    // Value for id; clear=true removes it in the same step.
    // A missing id yields "" (same as a stored empty value).
    virtual std::string get(const std::string& id, bool clear) = 0;
};

} // namespace ots

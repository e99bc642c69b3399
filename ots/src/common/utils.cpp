/*
 * Part of the OneTimeStore (OTS) project.
 *
 * SPDX-FileCopyrightText: 2025 OneTimeStore contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of OneTimeStore (OTS). See LICENSE for details.
 */

#include "ots/internal/utils.hpp"
#include <climits>
#include <openssl/crypto.h>
#include <openssl/rand.h>

namespace ots::internal {

std::string bytes_to_hex(const unsigned char* p, std::size_t n){
    static const char* H="0123456789abcdef";
    std::string s; s.resize(n*2);
    for(std::size_t i=0;i<n;++i){ s[2*i]=H[p[i]>>4]; s[2*i+1]=H[p[i]&0xF]; }
    return s;
}

std::string random_hex(std::size_t n_bytes){
    if (n_bytes == 0 || n_bytes > static_cast<std::size_t>(INT_MAX)) return {};
    std::string b; b.resize(n_bytes);
    if (RAND_bytes((unsigned char*)b.data(), (int)b.size()) != 1) return {};
    std::string hex = bytes_to_hex((const unsigned char*)b.data(), b.size());
    secure_wipe(b);
    return hex;
}

void secure_wipe(std::string& s){
    if(!s.empty()){
        OPENSSL_cleanse(s.data(), s.size());
        s.clear();
        s.shrink_to_fit();
    }
}

} // namespace ots::internal

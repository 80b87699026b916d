/*-
 * Copyright (c) 2021 Ribose Inc.
 * All rights reserved.
 *
 * Redistribution and use in source and binary forms, with or without
 * modification, are permitted provided that the following conditions
 * are met:
 * 1. Redistributions of source code must retain the above copyright
 *    notice, this list of conditions and the following disclaimer.
 * 2. Redistributions in binary form must reproduce the above copyright
 *    notice, this list of conditions and the following disclaimer in the
 *    documentation and/or other materials provided with the distribution.
 *
 * THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS
 * ``AS IS'' AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED
 * TO, THE IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR
 * PURPOSE ARE DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT HOLDERS OR CONTRIBUTORS
 * BE LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR
 * CONSEQUENTIAL DAMAGES (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF
 * SUBSTITUTE GOODS OR SERVICES; LOSS OF USE, DATA, OR PROFITS; OR BUSINESS
 * INTERRUPTION) HOWEVER CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN
 * CONTRACT, STRICT LIABILITY, OR TORT (INCLUDING NEGLIGENCE OR OTHERWISE)
 * ARISING IN ANY WAY OUT OF THE USE OF THIS SOFTWARE, EVEN IF ADVISED OF THE
 * POSSIBILITY OF SUCH DAMAGE.
 */

#include <string.h>
#include "fingerprint.hpp"
#include "crypto/hash.h"
#include "crypto/mem.h"
#include "str-utils.h"

namespace seal {

Fingerprint::Fingerprint() : fp_({})
{
}

Fingerprint::Fingerprint(const uint8_t *data, size_t size) : Fingerprint()
{
    memcpy(fp_.data(), data, std::min(size, fp_.size()));
}

Fingerprint
Fingerprint::from_pem(const std::string &pem)
{
    auto digest = sha256(pem.data(), pem.size());
    return Fingerprint(digest.data(), SEAL_FINGERPRINT_SIZE);
}

bool
Fingerprint::parse(const std::string &str, Fingerprint &fp)
{
    std::string hex = strip_hex(str);
    if (hex.size() != SEAL_FINGERPRINT_SIZE * 2) {
        return false;
    }
    Fingerprint res;
    if (hex_decode(hex.c_str(), res.fp_.data(), res.fp_.size()) != SEAL_FINGERPRINT_SIZE) {
        return false;
    }
    fp = res;
    return true;
}

bool
Fingerprint::operator==(const Fingerprint &src) const
{
    return fp_ == src.fp_;
}

bool
Fingerprint::operator!=(const Fingerprint &src) const
{
    return !(*this == src);
}

KeyID
Fingerprint::keyid() const
{
    KeyID res;
    memcpy(res.data(), fp_.data() + SEAL_FINGERPRINT_SIZE - SEAL_KEY_ID_SIZE, res.size());
    return res;
}

std::string
Fingerprint::keyid_str() const
{
    return bin_to_hex(keyid());
}

std::string
Fingerprint::str() const
{
    std::string hex = bin_to_hex(fp_);
    std::string res;
    res.reserve(SEAL_FINGERPRINT_STR_SIZE);
    for (size_t i = 0; i < hex.size(); i += 4) {
        if (i) {
            res.push_back(' ');
        }
        res.append(hex, i, 4);
    }
    return res;
}

const uint8_t *
Fingerprint::data() const noexcept
{
    return fp_.data();
}

size_t
Fingerprint::size() const noexcept
{
    return fp_.size();
}

} // namespace seal

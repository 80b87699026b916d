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

#ifndef SEAL_FINGERPRINT_HPP_
#define SEAL_FINGERPRINT_HPP_

#include <array>
#include <string>
#include <cstring>
#include <algorithm>
#include "config.h"

/* Size of the fingerprint: leading bytes of the SHA-256 digest */
#define SEAL_FINGERPRINT_SIZE 20
/* Size of the keyid: trailing bytes of the fingerprint */
#define SEAL_KEY_ID_SIZE 8
/* Hex fingerprint with spaces between 4-char groups */
#define SEAL_FINGERPRINT_STR_SIZE (SEAL_FINGERPRINT_SIZE * 2 + SEAL_FINGERPRINT_SIZE / 2 - 1)

namespace seal {

using KeyID = std::array<uint8_t, SEAL_KEY_ID_SIZE>;

class Fingerprint {
    std::array<uint8_t, SEAL_FINGERPRINT_SIZE> fp_;

  public:
    Fingerprint();
    Fingerprint(const uint8_t *data, size_t size);

    /**
     * @brief Calculate fingerprint of the public key.
     *
     * @param pem canonical SubjectPublicKeyInfo PEM text
     */
    static Fingerprint from_pem(const std::string &pem);

    /**
     * @brief Parse user-supplied fingerprint. Spaces are ignored as well as the character
     *        case, exactly 40 hex digits are required.
     *
     * @param str fingerprint text
     * @param fp parsed value will be stored here
     * @return true on success or false if str is not a fingerprint.
     */
    static bool parse(const std::string &str, Fingerprint &fp);

    bool operator==(const Fingerprint &src) const;
    bool operator!=(const Fingerprint &src) const;

    KeyID       keyid() const;
    std::string keyid_str() const;
    /* Uppercase hex, grouped by 4 characters */
    std::string    str() const;
    const uint8_t *data() const noexcept;
    size_t         size() const noexcept;
};

} // namespace seal

namespace std {
template <> struct hash<seal::Fingerprint> {
    std::size_t
    operator()(seal::Fingerprint const &fp) const noexcept
    {
        /* since fingerprint value is hash itself, we may use its low bytes */
        size_t res = 0;
        size_t cpy = std::min(sizeof(res), fp.size());
        std::memcpy(&res, fp.data(), cpy);
        return res;
    }
};
} // namespace std

#endif

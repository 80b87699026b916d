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

#include <cstdint>
#include <climits>
#include <openssl/evp.h>
#include "s2k.h"
#include "types.h"
#include "logging.h"
#include "ossl_utils.hpp"

namespace seal {
secure_bytes
pbkdf2_sha256(const std::string &password,
              const uint8_t *    salt,
              size_t             salt_len,
              size_t             iterations,
              size_t             length)
{
    if (!salt && salt_len) {
        throw seal_exception(SEAL_ERROR_NULL_POINTER);
    }
    if (!iterations || !length || (iterations > INT_MAX) || (length > INT_MAX) ||
        (password.size() > INT_MAX) || (salt_len > INT_MAX)) {
        SEAL_LOG("Wrong PBKDF2 parameters: %zu iterations, %zu bytes", iterations, length);
        throw seal_exception(SEAL_ERROR_BAD_PARAMETERS);
    }
    secure_bytes key(length);
    if (PKCS5_PBKDF2_HMAC(password.data(),
                          password.size(),
                          salt,
                          salt_len,
                          iterations,
                          EVP_sha256(),
                          key.size(),
                          key.data()) != 1) {
        SEAL_LOG("PBKDF2 failed: %s", ossl::latest_err());
        throw seal_exception(SEAL_ERROR_BAD_STATE);
    }
    return key;
}
} // namespace seal

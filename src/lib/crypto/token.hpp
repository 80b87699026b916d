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

#ifndef SEAL_TOKEN_HPP_
#define SEAL_TOKEN_HPP_

#include <stdint.h>
#include <string>
#include "mem.h"

/* Token layout: version(1) || timestamp(8, BE) || iv(16) || ciphertext || hmac(32) */
#define SEAL_TOKEN_VERSION 0x80
#define SEAL_TOKEN_HDR_SIZE 25
#define SEAL_TOKEN_MAC_SIZE 32

namespace seal {
namespace token {

/**
 * @brief Encrypt and authenticate payload. First 16 bytes of the key are used for HMAC-SHA256,
 *        last 16 bytes for AES-128-CBC.
 *
 * @param key 32-byte key
 * @param data payload
 * @param len payload length
 * @return token, encoded with url-safe base64
 */
std::string encrypt(const secure_bytes &key, const uint8_t *data, size_t len);
std::string encrypt(const secure_bytes &key, const std::string &data);

/**
 * @brief Verify and decrypt token. Throws seal_exception(SEAL_ERROR_DECRYPT_FAILED) on bad
 *        encoding, version, length, MAC or padding.
 */
secure_bytes decrypt(const secure_bytes &key, const std::string &token);

} // namespace token
} // namespace seal

#endif

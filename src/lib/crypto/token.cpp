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

#include <cstring>
#include <ctime>
#include "token.hpp"
#include "cipher.hpp"
#include "hash.h"
#include "rng.h"
#include "types.h"
#include "logging.h"
#include "base64.h"

#define TOKEN_HALF_KEY_SIZE 16

namespace seal {
namespace token {

static void
check_key(const secure_bytes &key)
{
    if (key.size() != 2 * TOKEN_HALF_KEY_SIZE) {
        SEAL_LOG("Wrong token key size: %zu", key.size());
        throw seal_exception(SEAL_ERROR_BAD_PARAMETERS);
    }
}

std::string
encrypt(const secure_bytes &key, const uint8_t *data, size_t len)
{
    check_key(key);
    RNG                  rng;
    std::vector<uint8_t> iv = rng.bytes(SEAL_AES_BLOCK_SIZE);
    auto                 ct = aes_cbc_encrypt(
      key.data() + TOKEN_HALF_KEY_SIZE, TOKEN_HALF_KEY_SIZE, iv.data(), data, len);

    std::vector<uint8_t> tok;
    tok.reserve(SEAL_TOKEN_HDR_SIZE + ct.size() + SEAL_TOKEN_MAC_SIZE);
    tok.push_back(SEAL_TOKEN_VERSION);
    uint64_t ts = (uint64_t) time(NULL);
    for (int i = 7; i >= 0; i--) {
        tok.push_back((ts >> (i * 8)) & 0xff);
    }
    tok.insert(tok.end(), iv.begin(), iv.end());
    tok.insert(tok.end(), ct.begin(), ct.end());
    auto mac = hmac_sha256(key.data(), TOKEN_HALF_KEY_SIZE, tok.data(), tok.size());
    tok.insert(tok.end(), mac.begin(), mac.end());
    return b64::encode(tok, b64::Alphabet::UrlSafe);
}

std::string
encrypt(const secure_bytes &key, const std::string &data)
{
    return encrypt(key, (const uint8_t *) data.data(), data.size());
}

secure_bytes
decrypt(const secure_bytes &key, const std::string &token)
{
    check_key(key);
    std::vector<uint8_t> tok;
    if (!b64::decode(token, tok, b64::Alphabet::UrlSafe)) {
        SEAL_LOG("Invalid token encoding");
        throw seal_exception(SEAL_ERROR_DECRYPT_FAILED, "Invalid token encoding");
    }
    if ((tok.size() < SEAL_TOKEN_HDR_SIZE + SEAL_AES_BLOCK_SIZE + SEAL_TOKEN_MAC_SIZE) ||
        ((tok.size() - SEAL_TOKEN_HDR_SIZE - SEAL_TOKEN_MAC_SIZE) % SEAL_AES_BLOCK_SIZE)) {
        SEAL_LOG("Invalid token length: %zu", tok.size());
        throw seal_exception(SEAL_ERROR_DECRYPT_FAILED, "Invalid token length");
    }
    if (tok[0] != SEAL_TOKEN_VERSION) {
        SEAL_LOG("Unsupported token version: %d", (int) tok[0]);
        throw seal_exception(SEAL_ERROR_DECRYPT_FAILED, "Unsupported token version");
    }
    size_t signed_len = tok.size() - SEAL_TOKEN_MAC_SIZE;
    auto   mac = hmac_sha256(key.data(), TOKEN_HALF_KEY_SIZE, tok.data(), signed_len);
    if (!const_time_eq(mac.data(), tok.data() + signed_len, SEAL_TOKEN_MAC_SIZE)) {
        throw seal_exception(SEAL_ERROR_DECRYPT_FAILED, "Token signature mismatch");
    }
    const uint8_t *iv = tok.data() + SEAL_TOKEN_HDR_SIZE - SEAL_AES_BLOCK_SIZE;
    return aes_cbc_decrypt(key.data() + TOKEN_HALF_KEY_SIZE,
                           TOKEN_HALF_KEY_SIZE,
                           iv,
                           tok.data() + SEAL_TOKEN_HDR_SIZE,
                           signed_len - SEAL_TOKEN_HDR_SIZE);
}

} // namespace token
} // namespace seal

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

#ifndef CRYPTO_HASH_H_
#define CRYPTO_HASH_H_

#include "types.h"
#include "config.h"
#include "mem.h"
#include <memory>
#include <vector>
#include <array>
#include <openssl/evp.h>

/* Output size of SHA-256 */
#define SEAL_SHA256_SIZE 32

namespace seal {
class Hash {
    const EVP_MD *md_;
    EVP_MD_CTX *  fn_;
    size_t        size_;

    Hash(const char *name);

  public:
    Hash(const Hash &src) = delete;
    Hash &operator=(const Hash &) = delete;

    /* Create SHA-256 hash context */
    static std::unique_ptr<Hash> sha256();

    void add(const void *buf, size_t len);
    void add(const std::string &str);
    /**
     * @brief Finalize hash calculation. Context can't be used after this call.
     * @return digest
     */
    std::vector<uint8_t> finish();
    size_t               size() const;

    ~Hash();
};

std::vector<uint8_t> sha256(const void *buf, size_t len);

/**
 * @brief Calculate HMAC-SHA256 of the data.
 *
 * @param key MAC key
 * @param keylen length of the key
 * @param buf data to authenticate
 * @param len length of the data
 * @return 32-byte MAC value
 */
std::vector<uint8_t> hmac_sha256(const uint8_t *key,
                                 size_t         keylen,
                                 const uint8_t *buf,
                                 size_t         len);

} // namespace seal

#endif

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

#include <stdio.h>
#include <memory>
#include <openssl/err.h>
#include <openssl/hmac.h>
#include "hash.h"
#include "logging.h"
#include "ossl_utils.hpp"

namespace seal {
Hash::Hash(const char *name)
{
    md_ = EVP_get_digestbyname(name);
    if (!md_) {
        SEAL_LOG("Error creating hash object for '%s'", name);
        throw seal_exception(SEAL_ERROR_BAD_STATE);
    }
    fn_ = EVP_MD_CTX_new();
    if (!fn_) {
        SEAL_LOG("Allocation failure");
        throw seal_exception(SEAL_ERROR_OUT_OF_MEMORY);
    }
    int res = EVP_DigestInit_ex(fn_, md_, NULL);
    if (res != 1) {
        SEAL_LOG("Digest initialization error %d : %lu", res, ERR_peek_last_error());
        EVP_MD_CTX_free(fn_);
        throw seal_exception(SEAL_ERROR_BAD_STATE);
    }
    size_ = EVP_MD_size(md_);
}

std::unique_ptr<Hash>
Hash::sha256()
{
    return std::unique_ptr<Hash>(new Hash("sha256"));
}

void
Hash::add(const void *buf, size_t len)
{
    if (!fn_) {
        throw seal_exception(SEAL_ERROR_NULL_POINTER);
    }
    int res = EVP_DigestUpdate(fn_, buf, len);
    if (res != 1) {
        SEAL_LOG("Digest updating error %d: %lu", res, ERR_peek_last_error());
        throw seal_exception(SEAL_ERROR_GENERIC);
    }
}

void
Hash::add(const std::string &str)
{
    add(str.data(), str.size());
}

std::vector<uint8_t>
Hash::finish()
{
    if (!fn_) {
        throw seal_exception(SEAL_ERROR_NULL_POINTER);
    }
    std::vector<uint8_t> res(size_);
    int                  ret = EVP_DigestFinal_ex(fn_, res.data(), NULL);
    EVP_MD_CTX_free(fn_);
    fn_ = NULL;
    if (ret != 1) {
        SEAL_LOG("Digest finalization error %d: %lu", ret, ERR_peek_last_error());
        throw seal_exception(SEAL_ERROR_BAD_STATE);
    }
    return res;
}

size_t
Hash::size() const
{
    return size_;
}

Hash::~Hash()
{
    if (!fn_) {
        return;
    }
    EVP_MD_CTX_free(fn_);
}

std::vector<uint8_t>
sha256(const void *buf, size_t len)
{
    auto hash = Hash::sha256();
    hash->add(buf, len);
    return hash->finish();
}

std::vector<uint8_t>
hmac_sha256(const uint8_t *key, size_t keylen, const uint8_t *buf, size_t len)
{
    std::vector<uint8_t> res(SEAL_SHA256_SIZE);
    unsigned int         reslen = res.size();
    if (!HMAC(EVP_sha256(), key, keylen, buf, len, res.data(), &reslen)) {
        SEAL_LOG("HMAC calculation failed: %s", ossl::latest_err());
        throw seal_exception(SEAL_ERROR_BAD_STATE);
    }
    res.resize(reslen);
    return res;
}
} // namespace seal

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

#ifndef SEAL_OSSL_UTILS_HPP_
#define SEAL_OSSL_UTILS_HPP_

#include <cstdio>
#include <cstdint>
#include "config.h"
#include <memory>
#include <openssl/bio.h>
#include <openssl/evp.h>
#include <openssl/err.h>

namespace seal {
namespace ossl {

namespace evp {

struct PKeyDeleter {
    void
    operator()(EVP_PKEY *ptr) const
    {
        EVP_PKEY_free(ptr);
    }
};

using PKey = std::unique_ptr<EVP_PKEY, PKeyDeleter>;

struct PKeyCtxDeleter {
    void
    operator()(EVP_PKEY_CTX *ptr) const
    {
        EVP_PKEY_CTX_free(ptr);
    }
};

using PKeyCtx = std::unique_ptr<EVP_PKEY_CTX, PKeyCtxDeleter>;

struct CipherCtxDeleter {
    void
    operator()(EVP_CIPHER_CTX *ptr) const
    {
        EVP_CIPHER_CTX_free(ptr);
    }
};

using CipherCtx = std::unique_ptr<EVP_CIPHER_CTX, CipherCtxDeleter>;

struct MDCtxDeleter {
    void
    operator()(EVP_MD_CTX *ptr) const
    {
        EVP_MD_CTX_free(ptr);
    }
};

using MDCtx = std::unique_ptr<EVP_MD_CTX, MDCtxDeleter>;
} // namespace evp

struct BIODeleter {
    void
    operator()(::BIO *ptr) const
    {
        BIO_free_all(ptr);
    }
};

using BIO = std::unique_ptr<::BIO, BIODeleter>;

inline const char *
latest_err()
{
    return ERR_error_string(ERR_peek_last_error(), NULL);
}

} // namespace ossl
} // namespace seal

#endif

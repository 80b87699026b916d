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

#include <string>
#include <cstring>
#include <climits>
#include "rsa.h"
#include "config.h"
#include "types.h"
#include "defaults.h"
#include "logging.h"
#include <openssl/rsa.h>
#include <openssl/pem.h>
#include <openssl/err.h>
#include <openssl/evp.h>

namespace seal {
namespace rsa {

static void
check_rsa(const ossl::evp::PKey &key)
{
    if (EVP_PKEY_base_id(key.get()) != EVP_PKEY_RSA) {
        SEAL_LOG("Not an RSA key: %d", EVP_PKEY_base_id(key.get()));
        throw seal_exception(SEAL_ERROR_NOT_SUPPORTED, "Only RSA keys are supported");
    }
}

static ossl::evp::PKeyCtx
init_context(EVP_PKEY *key)
{
    ossl::evp::PKeyCtx ctx(EVP_PKEY_CTX_new(key, NULL));
    if (!ctx) {
        /* LCOV_EXCL_START */
        SEAL_LOG("Context allocation failed: %lu", ERR_peek_last_error());
        throw seal_exception(SEAL_ERROR_OUT_OF_MEMORY);
        /* LCOV_EXCL_END */
    }
    return ctx;
}

static void
setup_oaep(ossl::evp::PKeyCtx &ctx)
{
    if (EVP_PKEY_CTX_set_rsa_padding(ctx.get(), RSA_PKCS1_OAEP_PADDING) <= 0) {
        SEAL_LOG("Failed to set padding: %lu", ERR_peek_last_error());
        throw seal_exception(SEAL_ERROR_BAD_STATE);
    }
    if (EVP_PKEY_CTX_set_rsa_oaep_md(ctx.get(), EVP_sha256()) <= 0) {
        SEAL_LOG("Failed to set OAEP digest: %lu", ERR_peek_last_error());
        throw seal_exception(SEAL_ERROR_BAD_STATE);
    }
    if (EVP_PKEY_CTX_set_rsa_mgf1_md(ctx.get(), EVP_sha256()) <= 0) {
        SEAL_LOG("Failed to set MGF1 digest: %lu", ERR_peek_last_error());
        throw seal_exception(SEAL_ERROR_BAD_STATE);
    }
}

void
generate(size_t bits, secure_bytes &secpem, std::string &pubpem)
{
    if ((bits < RSA_MIN_BITS) || (bits > RSA_MAX_BITS)) {
        SEAL_LOG("Invalid RSA key length: %zu", bits);
        throw seal_exception(SEAL_ERROR_BAD_PARAMETERS, "Invalid RSA key length");
    }
    ossl::evp::PKeyCtx ctx(EVP_PKEY_CTX_new_id(EVP_PKEY_RSA, NULL));
    if (!ctx) {
        /* LCOV_EXCL_START */
        SEAL_LOG("Failed to create ctx: %lu", ERR_peek_last_error());
        throw seal_exception(SEAL_ERROR_OUT_OF_MEMORY);
        /* LCOV_EXCL_END */
    }
    if (EVP_PKEY_keygen_init(ctx.get()) <= 0) {
        /* LCOV_EXCL_START */
        SEAL_LOG("Failed to init keygen: %lu", ERR_peek_last_error());
        throw seal_exception(SEAL_ERROR_KEY_GENERATION);
        /* LCOV_EXCL_END */
    }
    if (EVP_PKEY_CTX_set_rsa_keygen_bits(ctx.get(), (int) bits) <= 0) {
        /* LCOV_EXCL_START */
        SEAL_LOG("Failed to set rsa bits: %lu", ERR_peek_last_error());
        throw seal_exception(SEAL_ERROR_KEY_GENERATION);
        /* LCOV_EXCL_END */
    }
    EVP_PKEY *rawkey = NULL;
    if (EVP_PKEY_keygen(ctx.get(), &rawkey) <= 0) {
        /* LCOV_EXCL_START */
        SEAL_LOG("RSA keygen failed: %lu", ERR_peek_last_error());
        throw seal_exception(SEAL_ERROR_KEY_GENERATION);
        /* LCOV_EXCL_END */
    }
    ossl::evp::PKey pkey(rawkey);
    secpem = secret_pem(pkey.get());
    pubpem = public_pem(pkey.get());
}

ossl::evp::PKey
load_public(const std::string &pem)
{
    if (pem.size() > INT_MAX) {
        throw seal_exception(SEAL_ERROR_BAD_PARAMETERS);
    }
    ossl::BIO bio(BIO_new_mem_buf(pem.data(), (int) pem.size()));
    if (!bio) {
        throw seal_exception(SEAL_ERROR_OUT_OF_MEMORY); // LCOV_EXCL_LINE
    }
    ossl::evp::PKey key(PEM_read_bio_PUBKEY(bio.get(), NULL, NULL, NULL));
    if (!key) {
        SEAL_LOG("Failed to load public key: %s", ossl::latest_err());
        ERR_clear_error();
        throw seal_exception(SEAL_ERROR_BAD_FORMAT, "Invalid public key data");
    }
    check_rsa(key);
    return key;
}

ossl::evp::PKey
load_secret(const uint8_t *pem, size_t len)
{
    if (len > INT_MAX) {
        throw seal_exception(SEAL_ERROR_BAD_PARAMETERS);
    }
    ossl::BIO bio(BIO_new_mem_buf(pem, (int) len));
    if (!bio) {
        throw seal_exception(SEAL_ERROR_OUT_OF_MEMORY); // LCOV_EXCL_LINE
    }
    /* empty password: encrypted PEM must fail instead of prompting */
    char            empty[] = "";
    ossl::evp::PKey key(PEM_read_bio_PrivateKey(bio.get(), NULL, NULL, empty));
    if (!key) {
        SEAL_LOG("Failed to load secret key: %s", ossl::latest_err());
        ERR_clear_error();
        throw seal_exception(SEAL_ERROR_BAD_FORMAT, "Invalid private key data");
    }
    check_rsa(key);
    return key;
}

static std::string
bio_str(::BIO *bio)
{
    char *data = NULL;
    long  len = BIO_get_mem_data(bio, &data);
    if ((len <= 0) || !data) {
        throw seal_exception(SEAL_ERROR_BAD_STATE); // LCOV_EXCL_LINE
    }
    return std::string(data, len);
}

std::string
public_pem(EVP_PKEY *key)
{
    ossl::BIO bio(BIO_new(BIO_s_mem()));
    if (!bio) {
        throw seal_exception(SEAL_ERROR_OUT_OF_MEMORY); // LCOV_EXCL_LINE
    }
    if (PEM_write_bio_PUBKEY(bio.get(), key) != 1) {
        SEAL_LOG("Failed to write public key: %s", ossl::latest_err());
        throw seal_exception(SEAL_ERROR_BAD_STATE);
    }
    return bio_str(bio.get());
}

secure_bytes
secret_pem(EVP_PKEY *key)
{
    ossl::BIO bio(BIO_new(BIO_s_secmem()));
    if (!bio) {
        throw seal_exception(SEAL_ERROR_OUT_OF_MEMORY); // LCOV_EXCL_LINE
    }
    if (PEM_write_bio_PKCS8PrivateKey(bio.get(), key, NULL, NULL, 0, NULL, NULL) != 1) {
        SEAL_LOG("Failed to write secret key: %s", ossl::latest_err());
        throw seal_exception(SEAL_ERROR_BAD_STATE);
    }
    char *data = NULL;
    long  len = BIO_get_mem_data(bio.get(), &data);
    if ((len <= 0) || !data) {
        throw seal_exception(SEAL_ERROR_BAD_STATE); // LCOV_EXCL_LINE
    }
    return secure_bytes(data, data + len);
}

size_t
bits(EVP_PKEY *key)
{
    return EVP_PKEY_bits(key);
}

std::vector<uint8_t>
encrypt_oaep(EVP_PKEY *key, const uint8_t *data, size_t len)
{
    auto ctx = init_context(key);
    if (EVP_PKEY_encrypt_init(ctx.get()) <= 0) {
        /* LCOV_EXCL_START */
        SEAL_LOG("Failed to initialize encryption: %lu", ERR_peek_last_error());
        throw seal_exception(SEAL_ERROR_ENCRYPT_FAILED);
        /* LCOV_EXCL_END */
    }
    setup_oaep(ctx);
    size_t outlen = 0;
    if (EVP_PKEY_encrypt(ctx.get(), NULL, &outlen, data, len) <= 0) {
        SEAL_LOG("Failed to get output size: %lu", ERR_peek_last_error());
        throw seal_exception(SEAL_ERROR_ENCRYPT_FAILED);
    }
    std::vector<uint8_t> res(outlen);
    if (EVP_PKEY_encrypt(ctx.get(), res.data(), &outlen, data, len) <= 0) {
        SEAL_LOG("Encryption failed: %lu", ERR_peek_last_error());
        throw seal_exception(SEAL_ERROR_ENCRYPT_FAILED);
    }
    res.resize(outlen);
    return res;
}

secure_bytes
decrypt_oaep(EVP_PKEY *key, const uint8_t *data, size_t len)
{
    auto ctx = init_context(key);
    if (EVP_PKEY_decrypt_init(ctx.get()) <= 0) {
        /* LCOV_EXCL_START */
        SEAL_LOG("Failed to initialize decryption: %lu", ERR_peek_last_error());
        throw seal_exception(SEAL_ERROR_DECRYPT_FAILED);
        /* LCOV_EXCL_END */
    }
    setup_oaep(ctx);
    size_t outlen = 0;
    if (EVP_PKEY_decrypt(ctx.get(), NULL, &outlen, data, len) <= 0) {
        ERR_clear_error();
        throw seal_exception(SEAL_ERROR_DECRYPT_FAILED);
    }
    secure_bytes res(outlen);
    if (EVP_PKEY_decrypt(ctx.get(), res.data(), &outlen, data, len) <= 0) {
        /* wrong key or corrupted data, caller tries other keys */
        ERR_clear_error();
        throw seal_exception(SEAL_ERROR_DECRYPT_FAILED);
    }
    res.resize(outlen);
    return res;
}

} // namespace rsa
} // namespace seal

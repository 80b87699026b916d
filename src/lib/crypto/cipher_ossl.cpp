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

#include <algorithm>
#include <climits>
#include <cstring>
#include <openssl/err.h>

#include "cipher.hpp"
#include "types.h"
#include "logging.h"
#include "ossl_utils.hpp"

namespace seal {

static const id_str_pair cipher_map[] = {
  {static_cast<int>(SymmAlg::AES_128), "AES-128-CBC"},
  {static_cast<int>(SymmAlg::AES_256), "AES-256-CBC"},
  {0, NULL},
};

EVP_CIPHER_CTX *
Cipher::create(SymmAlg alg, bool encrypt)
{
    const char *      name = id_str_pair::lookup(cipher_map, static_cast<int>(alg), NULL);
    const EVP_CIPHER *cipher = name ? EVP_get_cipherbyname(name) : NULL;
    if (!cipher) {
        SEAL_LOG("Unsupported cipher: %d", static_cast<int>(alg));
        return nullptr;
    }
    EVP_CIPHER_CTX *ctx = EVP_CIPHER_CTX_new();
    if (!ctx) {
        SEAL_LOG("Failed to create cipher context: %lu", ERR_peek_last_error());
        return nullptr;
    }
    if (EVP_CipherInit_ex(ctx, cipher, NULL, NULL, NULL, encrypt ? 1 : 0) != 1) {
        SEAL_LOG("Failed to initialize cipher: %lu", ERR_peek_last_error());
        EVP_CIPHER_CTX_free(ctx);
        return nullptr;
    }
    /* padding is handled by pkcs7_pad/pkcs7_unpad */
    EVP_CIPHER_CTX_set_padding(ctx, 0);
    return ctx;
}

std::unique_ptr<Cipher>
Cipher::encryption(SymmAlg alg)
{
    EVP_CIPHER_CTX *ossl_ctx = create(alg, true);
    if (!ossl_ctx) {
        throw seal_exception(SEAL_ERROR_BAD_STATE);
    }
    return std::unique_ptr<Cipher>(new Cipher(alg, ossl_ctx, true));
}

std::unique_ptr<Cipher>
Cipher::decryption(SymmAlg alg)
{
    EVP_CIPHER_CTX *ossl_ctx = create(alg, false);
    if (!ossl_ctx) {
        throw seal_exception(SEAL_ERROR_BAD_STATE);
    }
    return std::unique_ptr<Cipher>(new Cipher(alg, ossl_ctx, false));
}

SymmAlg
Cipher::alg_by_key_size(size_t key_size)
{
    switch (key_size) {
    case 16:
        return SymmAlg::AES_128;
    case 32:
        return SymmAlg::AES_256;
    default:
        SEAL_LOG("Unsupported key size: %zu", key_size);
        throw seal_exception(SEAL_ERROR_BAD_PARAMETERS);
    }
}

size_t
Cipher::key_size(SymmAlg alg)
{
    return alg == SymmAlg::AES_128 ? 16 : 32;
}

Cipher::Cipher(SymmAlg alg, EVP_CIPHER_CTX *ctx, bool encrypt)
    : m_alg(alg), m_ctx(ctx), m_encrypt(encrypt), m_has_key(false), m_has_iv(false)
{
    m_block_size = EVP_CIPHER_CTX_block_size(m_ctx);
}

Cipher::~Cipher()
{
    EVP_CIPHER_CTX_free(m_ctx);
}

size_t
Cipher::block_size() const
{
    return m_block_size;
}

void
Cipher::set_key(const uint8_t *key, size_t key_length)
{
    if (key_length != key_size(m_alg)) {
        SEAL_LOG("Wrong key length: %zu", key_length);
        throw seal_exception(SEAL_ERROR_BAD_PARAMETERS);
    }
    if (EVP_CipherInit_ex(m_ctx, NULL, NULL, key, NULL, -1) != 1) {
        SEAL_LOG("Failed to set key: %lu", ERR_peek_last_error());
        throw seal_exception(SEAL_ERROR_BAD_STATE);
    }
    m_has_key = true;
}

void
Cipher::set_iv(const uint8_t *iv, size_t iv_length)
{
    if (iv_length != (size_t) EVP_CIPHER_CTX_iv_length(m_ctx)) {
        SEAL_LOG("Wrong IV length: %zu", iv_length);
        throw seal_exception(SEAL_ERROR_BAD_PARAMETERS);
    }
    if (EVP_CipherInit_ex(m_ctx, NULL, NULL, NULL, iv, -1) != 1) {
        SEAL_LOG("Failed to set IV: %lu", ERR_peek_last_error());
        throw seal_exception(SEAL_ERROR_BAD_STATE);
    }
    m_has_iv = true;
}

void
Cipher::process(const uint8_t *input, size_t input_length, uint8_t *output)
{
    if (!m_has_key || !m_has_iv) {
        SEAL_LOG("Key or IV is not set");
        throw seal_exception(SEAL_ERROR_BAD_STATE);
    }
    if (input_length % m_block_size) {
        SEAL_LOG("Input is not a multiple of the block size: %zu", input_length);
        throw seal_exception(m_encrypt ? SEAL_ERROR_BAD_PARAMETERS :
                                         SEAL_ERROR_DECRYPT_FAILED);
    }
    /* update input length should not exceed INT_MAX */
    if (input_length > INT_MAX) {
        SEAL_LOG("Too large input: %zu", input_length);
        throw seal_exception(SEAL_ERROR_BAD_PARAMETERS);
    }
    int done = 0;
    if (EVP_CipherUpdate(m_ctx, output, &done, input, (int) input_length) != 1) {
        SEAL_LOG("EVP_CipherUpdate failed: %lu", ERR_peek_last_error());
        throw seal_exception(SEAL_ERROR_BAD_STATE);
    }
    int outl = 0;
    if (EVP_CipherFinal_ex(m_ctx, output + done, &outl) != 1) {
        SEAL_LOG("EVP_CipherFinal_ex failed: %lu", ERR_peek_last_error());
        throw seal_exception(SEAL_ERROR_BAD_STATE);
    }
}

secure_bytes
pkcs7_pad(const uint8_t *data, size_t len)
{
    size_t       padlen = SEAL_AES_BLOCK_SIZE - (len % SEAL_AES_BLOCK_SIZE);
    secure_bytes res(len + padlen, (uint8_t) padlen);
    if (len) {
        memcpy(res.data(), data, len);
    }
    return res;
}

secure_bytes
pkcs7_unpad(const uint8_t *data, size_t len)
{
    if (!len || (len % SEAL_AES_BLOCK_SIZE)) {
        SEAL_LOG("Invalid padded data length: %zu", len);
        throw seal_exception(SEAL_ERROR_DECRYPT_FAILED, "Invalid padding");
    }
    uint8_t padlen = data[len - 1];
    if (!padlen || (padlen > SEAL_AES_BLOCK_SIZE) || (padlen > len)) {
        throw seal_exception(SEAL_ERROR_DECRYPT_FAILED, "Invalid padding");
    }
    for (size_t i = len - padlen; i < len; i++) {
        if (data[i] != padlen) {
            throw seal_exception(SEAL_ERROR_DECRYPT_FAILED, "Invalid padding");
        }
    }
    return secure_bytes(data, data + len - padlen);
}

std::vector<uint8_t>
aes_cbc_encrypt(
  const uint8_t *key, size_t key_len, const uint8_t *iv, const uint8_t *data, size_t len)
{
    auto cipher = Cipher::encryption(Cipher::alg_by_key_size(key_len));
    cipher->set_key(key, key_len);
    cipher->set_iv(iv, SEAL_AES_BLOCK_SIZE);
    auto                 padded = pkcs7_pad(data, len);
    std::vector<uint8_t> res(padded.size());
    cipher->process(padded.data(), padded.size(), res.data());
    return res;
}

secure_bytes
aes_cbc_decrypt(
  const uint8_t *key, size_t key_len, const uint8_t *iv, const uint8_t *data, size_t len)
{
    if (!len || (len % SEAL_AES_BLOCK_SIZE)) {
        SEAL_LOG("Invalid ciphertext length: %zu", len);
        throw seal_exception(SEAL_ERROR_DECRYPT_FAILED, "Invalid ciphertext length");
    }
    auto cipher = Cipher::decryption(Cipher::alg_by_key_size(key_len));
    cipher->set_key(key, key_len);
    cipher->set_iv(iv, SEAL_AES_BLOCK_SIZE);
    secure_bytes padded(len);
    cipher->process(data, len, padded.data());
    return pkcs7_unpad(padded.data(), padded.size());
}

} // namespace seal

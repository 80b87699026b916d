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

#ifndef SEAL_CIPHER_HPP
#define SEAL_CIPHER_HPP

#include <memory>
#include <string>
#include <vector>
#include <openssl/evp.h>
#include "mem.h"
#include "defaults.h"

namespace seal {

enum class SymmAlg { AES_128, AES_256 };

/**
 * @brief AES in CBC mode over already padded data. Cipher-internal padding is always
 *        disabled, see pkcs7_pad()/pkcs7_unpad().
 */
class Cipher {
  public:
    static std::unique_ptr<Cipher> encryption(SymmAlg alg);
    static std::unique_ptr<Cipher> decryption(SymmAlg alg);
    /* Algorithm matching the key length: 16 or 32 bytes */
    static SymmAlg alg_by_key_size(size_t key_size);

    static size_t key_size(SymmAlg alg);
    size_t        block_size() const;

    void set_key(const uint8_t *key, size_t key_length);
    void set_iv(const uint8_t *iv, size_t iv_length);

    /**
     * @brief Process the whole buffer. Its length must be a multiple of the block size.
     *
     * @param input input data
     * @param input_length length of the input
     * @param output output data will be stored here, has the same length as input.
     */
    void process(const uint8_t *input, size_t input_length, uint8_t *output);

    ~Cipher();

  private:
    Cipher(SymmAlg alg, EVP_CIPHER_CTX *ctx, bool encrypt);

    SymmAlg         m_alg;
    EVP_CIPHER_CTX *m_ctx;
    size_t          m_block_size;
    bool            m_encrypt;
    bool            m_has_key;
    bool            m_has_iv;

    static EVP_CIPHER_CTX *create(SymmAlg alg, bool encrypt);
};

/* PKCS#7 padding with the block size of 16 */
secure_bytes pkcs7_pad(const uint8_t *data, size_t len);
/**
 * @brief Remove PKCS#7 padding. Throws seal_exception(SEAL_ERROR_DECRYPT_FAILED) if input is
 *        empty, not a multiple of 16, or padding bytes are inconsistent.
 */
secure_bytes pkcs7_unpad(const uint8_t *data, size_t len);

/**
 * @brief Pad and encrypt data with AES-CBC, key length selects AES-128 or AES-256.
 */
std::vector<uint8_t> aes_cbc_encrypt(const uint8_t *key,
                                     size_t         key_len,
                                     const uint8_t *iv,
                                     const uint8_t *data,
                                     size_t         len);

/**
 * @brief Decrypt data with AES-CBC and remove padding.
 *        Throws seal_exception(SEAL_ERROR_DECRYPT_FAILED) on wrong length or padding.
 */
secure_bytes aes_cbc_decrypt(const uint8_t *key,
                             size_t         key_len,
                             const uint8_t *iv,
                             const uint8_t *data,
                             size_t         len);

} // namespace seal

#endif

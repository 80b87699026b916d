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

#ifndef SEAL_RSA_H_
#define SEAL_RSA_H_

#include <stdint.h>
#include <string>
#include <vector>
#include "mem.h"
#include "ossl_utils.hpp"

namespace seal {
namespace rsa {

/**
 * @brief Generate RSA key pair with public exponent 65537.
 *
 * @param bits key length, in range 1024..16384
 * @param secpem PKCS#8 PEM of the secret key will be stored here
 * @param pubpem SubjectPublicKeyInfo PEM of the public key will be stored here
 */
void generate(size_t bits, secure_bytes &secpem, std::string &pubpem);

/* Load public key from PEM, throws seal_exception(SEAL_ERROR_BAD_FORMAT) on failure */
ossl::evp::PKey load_public(const std::string &pem);
/* Load secret key from PEM (PKCS#8 or traditional), throws on failure */
ossl::evp::PKey load_secret(const uint8_t *pem, size_t len);

std::string  public_pem(EVP_PKEY *key);
secure_bytes secret_pem(EVP_PKEY *key);
size_t       bits(EVP_PKEY *key);

/**
 * @brief RSA-OAEP encryption, SHA-256 is used as OAEP hash and MGF1 hash, label is empty.
 */
std::vector<uint8_t> encrypt_oaep(EVP_PKEY *key, const uint8_t *data, size_t len);
/**
 * @brief RSA-OAEP decryption. Throws seal_exception(SEAL_ERROR_DECRYPT_FAILED) if
 *        ciphertext was not produced for this key.
 */
secure_bytes decrypt_oaep(EVP_PKEY *key, const uint8_t *data, size_t len);

} // namespace rsa
} // namespace seal

#endif

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

#ifndef SEAL_KEY_HPP_
#define SEAL_KEY_HPP_

#include <stdint.h>
#include <string>
#include <vector>
#include "types.h"
#include "fingerprint.hpp"
#include "json-utils.h"
#include "crypto/mem.h"

namespace seal {

/* Form of the secret key payload, stored within the record as "protection" */
enum class KeyProtection {
    None,       /* public key record */
    Wrapped,    /* base64(salt || iv || AES-256-CBC(PEM)), passphrase-derived key */
    PlainPEM,   /* PEM text as is */
    EncodedPEM, /* base64 of the PEM text */
    Corrupt     /* legacy payload of unknown shape */
};

/* keyring record: public key, or secret key with the same identity fields */
class Key {
  private:
    Fingerprint              fp_{};
    std::vector<std::string> uids_{};
    size_t                   bits_{};
    int64_t                  created_{};
    std::string              expires_{};
    std::string              trust_{};
    std::string              pubpem_{};
    KeyProtection            protection_{KeyProtection::None};
    std::string              secdata_{};

  public:
    Key() = default;
    /**
     * @brief Construct public key record.
     *
     * @param pubpem canonical public key PEM, fingerprint is calculated over it.
     * @param bits key length
     * @param uid user id
     * @param trust trust label
     * @param created creation time
     */
    Key(const std::string &pubpem,
        size_t             bits,
        const std::string &uid,
        const std::string &trust,
        int64_t            created);

    const Fingerprint &             fp() const;
    std::string                     keyid() const;
    const std::vector<std::string> &uids() const;
    size_t                          bits() const;
    int64_t                         created() const;
    const std::string &             expires() const;
    const std::string &             trust() const;
    const std::string &             pubpem() const;

    bool               is_secret() const;
    KeyProtection      protection() const;
    const std::string &secret_data() const;
    /* attach secret payload of the specified form, making this a secret key record */
    void set_secret(KeyProtection protection, const std::string &data);
    /* copy of the record without the secret payload */
    Key public_part() const;

    /**
     * @brief Get the secret key PEM.
     *
     * @param passphrase password, used for the Wrapped payload only.
     * @return PEM text. Throws seal_exception(SEAL_ERROR_DECRYPT_FAILED) if passphrase is
     *         wrong, or seal_exception(SEAL_ERROR_CORRUPT_KEY) if payload is damaged.
     */
    secure_bytes unlock(const std::string &passphrase) const;

    /* Record, as stored in the keyring file */
    json_object *to_json() const;
    /* Key listing entry */
    json_object *metadata() const;
    /**
     * @brief Load record from the keyring file.
     *
     * @param obj JSON object with the record
     * @param secret whether record comes from the secret keyring
     * @return key record, throws seal_exception(SEAL_ERROR_BAD_FORMAT) if required fields
     *         are missing.
     */
    static Key from_json(json_object *obj, bool secret);

    /* Encrypt secret key PEM with the passphrase */
    static std::string wrap(const secure_bytes &pem, const std::string &passphrase);
    /* Decrypt Wrapped payload, see unlock() */
    static secure_bytes unwrap(const std::string &data, const std::string &passphrase);
    /* Guess form of the untagged payload */
    static KeyProtection classify(const std::string &data);
};

const char *  key_protection_str(KeyProtection prot);
KeyProtection key_protection_by_str(const std::string &str);

} // namespace seal

#endif

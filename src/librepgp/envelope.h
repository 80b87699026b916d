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

#ifndef SEAL_ENVELOPE_H_
#define SEAL_ENVELOPE_H_

#include <stdint.h>
#include <string>
#include <vector>
#include "types.h"
#include "crypto/mem.h"
#include "librekey/key_store.h"

namespace seal {

/* Multi-recipient message: session key wrapped for each recipient, body encrypted once */
struct MessageEnvelope {
    std::vector<std::vector<uint8_t>> keys;
    std::vector<uint8_t>              iv;
    std::vector<uint8_t>              body;

    std::string serialize() const;
    /* Parse envelope JSON, throws seal_exception(SEAL_ERROR_BAD_MESSAGE) */
    static MessageEnvelope parse(const std::string &text);
};

/* Outcome of the attempt to use the single secret key */
struct KeyAttempt {
    std::string fp;
    bool        unlocked;
    std::string error;
};

/* Result of the search for the session key over the secret keyring */
struct KeySearchResult {
    /* number of keys in the secret ring */
    size_t                  available{};
    size_t                  tried{};
    /* keys which were unlocked with the passphrase and tried against the wrapped keys */
    size_t                  unlocked{};
    std::vector<KeyAttempt> attempts{};
    bool                    found{};
    std::string             fp{};
    secure_bytes            key{};

    /* Reason of the failure, suitable for the user */
    std::string failure() const;
};

/**
 * @brief Find the session key, trying every secret key against every wrapped key entry.
 *
 * @param secring secret keys, tried in the insertion order
 * @param env parsed message envelope
 * @param passphrase password for the protected secret keys
 * @return search result, key is set if found is true.
 */
KeySearchResult find_session_key(const KeyRing &        secring,
                                 const MessageEnvelope &env,
                                 const std::string &    passphrase);

/**
 * @brief Encrypt message for the recipients.
 *
 * @param store keystore with recipients' public keys
 * @param plaintext message text
 * @param recipients recipients' fingerprints
 * @return armored message. Throws seal_exception(SEAL_ERROR_NO_RECIPIENTS) if recipients
 *         list is empty, or seal_exception(SEAL_ERROR_KEY_NOT_FOUND) if one of keys is absent.
 */
std::string encrypt_message(const KeyStore &                store,
                            const std::string &             plaintext,
                            const std::vector<std::string> &recipients);

/**
 * @brief Decrypt armored message with one of the secret keys.
 *
 * @param store keystore with secret keys
 * @param armored armored message
 * @param passphrase password for the protected secret keys
 * @param search if not NULL then details of the key search are stored here
 * @return decrypted message
 */
secure_bytes decrypt_message(const KeyStore &   store,
                             const std::string &armored,
                             const std::string &passphrase,
                             KeySearchResult *  search = NULL);

} // namespace seal

#endif

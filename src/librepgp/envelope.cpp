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

#include "envelope.h"
#include "stream-armor.h"
#include "defaults.h"
#include "logging.h"
#include "base64.h"
#include "json-utils.h"
#include "crypto/rng.h"
#include "crypto/rsa.h"
#include "crypto/cipher.hpp"

namespace seal {

std::string
MessageEnvelope::serialize() const
{
    JSONObject   obj(json::new_object());
    json_object *jkeys = json::new_array();
    if (!json_add(obj.get(), "version", SEAL_ENVELOPE_VERSION) ||
        !json_add(obj.get(), "encrypted_keys", jkeys)) {
        throw seal_exception(SEAL_ERROR_OUT_OF_MEMORY); // LCOV_EXCL_LINE
    }
    for (auto &key : keys) {
        if (!json_array_add(jkeys, b64::encode(key))) {
            throw seal_exception(SEAL_ERROR_OUT_OF_MEMORY); // LCOV_EXCL_LINE
        }
    }
    if (!json_add(obj.get(), "iv", b64::encode(iv)) ||
        !json_add(obj.get(), "encrypted_message", b64::encode(body))) {
        throw seal_exception(SEAL_ERROR_OUT_OF_MEMORY); // LCOV_EXCL_LINE
    }
    return json::serialize(obj.get());
}

static void
get_b64_field(json_object *obj, const char *name, std::vector<uint8_t> &value)
{
    std::string str;
    if (!json_get_str(obj, name, str) || !b64::decode(str, value)) {
        SEAL_LOG("Missing or invalid envelope field %s", name);
        throw seal_exception(SEAL_ERROR_BAD_MESSAGE, "Invalid message format");
    }
}

MessageEnvelope
MessageEnvelope::parse(const std::string &text)
{
    JSONObject obj;
    try {
        obj = json::parse(text);
    } catch (const seal_exception &) {
        throw seal_exception(SEAL_ERROR_BAD_MESSAGE, "Invalid message format");
    }
    if (!json_object_is_type(obj.get(), json_type_object)) {
        throw seal_exception(SEAL_ERROR_BAD_MESSAGE, "Invalid message format");
    }
    std::string version;
    if (json_get_str(obj.get(), "version", version) && (version != SEAL_ENVELOPE_VERSION)) {
        SEAL_LOG("Warning: unexpected envelope version %s", version.c_str());
    }

    MessageEnvelope env;
    json_object *   jkeys = json_get_arr(obj.get(), "encrypted_keys");
    if (!jkeys) {
        SEAL_LOG("Missing encrypted keys");
        throw seal_exception(SEAL_ERROR_BAD_MESSAGE, "Invalid message format");
    }
    for (size_t i = 0; i < (size_t) json_object_array_length(jkeys); i++) {
        json_object *        item = json_object_array_get_idx(jkeys, i);
        std::vector<uint8_t> key;
        if (!json_object_is_type(item, json_type_string) ||
            !b64::decode(json_object_get_string(item), key)) {
            SEAL_LOG("Invalid encrypted key at %zu", i);
            throw seal_exception(SEAL_ERROR_BAD_MESSAGE, "Invalid message format");
        }
        env.keys.push_back(key);
    }
    get_b64_field(obj.get(), "iv", env.iv);
    get_b64_field(obj.get(), "encrypted_message", env.body);
    if (env.iv.size() != SEAL_AES_BLOCK_SIZE) {
        SEAL_LOG("Wrong iv length: %zu", env.iv.size());
        throw seal_exception(SEAL_ERROR_BAD_MESSAGE, "Invalid message format");
    }
    return env;
}

std::string
KeySearchResult::failure() const
{
    /* keys which couldn't be unlocked are not available for decryption */
    if (!unlocked) {
        return "No private keys available for decryption (0 available, " +
               std::to_string(available) + " stored)";
    }
    return "Could not decrypt message with any of the " + std::to_string(unlocked) +
           " available private keys";
}

KeySearchResult
find_session_key(const KeyRing &        secring,
                 const MessageEnvelope &env,
                 const std::string &    passphrase)
{
    KeySearchResult res;
    res.available = secring.key_count();
    for (auto &key : secring.keys) {
        KeyAttempt attempt;
        attempt.fp = key.fp().str();
        attempt.unlocked = false;
        res.tried++;

        ossl::evp::PKey pkey;
        try {
            secure_bytes pem = key.unlock(passphrase);
            pkey = rsa::load_secret(pem.data(), pem.size());
        } catch (const seal_exception &e) {
            attempt.error = e.what();
            res.attempts.push_back(attempt);
            continue;
        }
        attempt.unlocked = true;
        res.unlocked++;

        for (auto &wrapped : env.keys) {
            try {
                secure_bytes sk = rsa::decrypt_oaep(pkey.get(), wrapped.data(), wrapped.size());
                if (sk.size() != SEAL_SYMM_KEY_SIZE) {
                    continue;
                }
                res.found = true;
                res.fp = attempt.fp;
                res.key = sk;
                break;
            } catch (const seal_exception &) {
                /* entry is for another recipient */
                continue;
            }
        }
        if (res.found) {
            res.attempts.push_back(attempt);
            return res;
        }
        attempt.error = "No matching encrypted key";
        res.attempts.push_back(attempt);
    }
    return res;
}

std::string
encrypt_message(const KeyStore &                store,
                const std::string &             plaintext,
                const std::vector<std::string> &recipients)
{
    if (recipients.empty()) {
        throw seal_exception(SEAL_ERROR_NO_RECIPIENTS, "No recipients specified");
    }
    std::vector<ossl::evp::PKey> pkeys;
    for (auto &fp : recipients) {
        const Key *key = store.get_key(fp, false);
        if (!key) {
            SEAL_LOG("Recipient key not found: %s", fp.c_str());
            throw seal_exception(SEAL_ERROR_KEY_NOT_FOUND, "Public key not found for " + fp);
        }
        pkeys.push_back(rsa::load_public(key->pubpem()));
    }

    RNG             rng;
    secure_bytes    sk = rng.secure(SEAL_SYMM_KEY_SIZE);
    MessageEnvelope env;
    env.iv = rng.bytes(SEAL_AES_BLOCK_SIZE);
    env.body = aes_cbc_encrypt(sk.data(),
                               sk.size(),
                               env.iv.data(),
                               (const uint8_t *) plaintext.data(),
                               plaintext.size());
    for (auto &pkey : pkeys) {
        env.keys.push_back(rsa::encrypt_oaep(pkey.get(), sk.data(), sk.size()));
    }
    return armor_encode(SEAL_ARMORED_MESSAGE, b64::encode(env.serialize()));
}

secure_bytes
decrypt_message(const KeyStore &   store,
                const std::string &armored,
                const std::string &passphrase,
                KeySearchResult *  search)
{
    ArmorBlock block = armor_decode(armored);
    if (block.msgtype() != SEAL_ARMORED_MESSAGE) {
        SEAL_LOG("Wrong armor type: %s", block.type.c_str());
        throw seal_exception(SEAL_ERROR_BAD_MESSAGE, "Invalid message format");
    }
    std::string text;
    if (!b64::decode(block.body, text)) {
        throw seal_exception(SEAL_ERROR_BAD_MESSAGE, "Invalid message format");
    }
    MessageEnvelope env = MessageEnvelope::parse(text);

    KeySearchResult res = find_session_key(store.secring(), env, passphrase);
    if (search) {
        *search = res;
    }
    if (!res.found) {
        for (auto &attempt : res.attempts) {
            SEAL_LOG("Key %s: %s", attempt.fp.c_str(), attempt.error.c_str());
        }
        throw seal_exception(SEAL_ERROR_DECRYPT_FAILED, res.failure());
    }
    return aes_cbc_decrypt(
      res.key.data(), res.key.size(), env.iv.data(), env.body.data(), env.body.size());
}

} // namespace seal

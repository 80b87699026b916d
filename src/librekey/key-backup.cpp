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

#include <time.h>
#include "key_store.h"
#include "defaults.h"
#include "logging.h"
#include "base64.h"
#include "crypto/rng.h"
#include "crypto/s2k.h"
#include "crypto/token.hpp"

namespace seal {

static json_object *
backup_entry(const Key &key, const std::string &key_data)
{
    JSONObject entry(json::new_object());
    if (!json_add(entry.get(), "fingerprint", key.fp().str()) ||
        !json_add(entry.get(), "key_data", key_data) ||
        !json_add(entry.get(), "metadata", key.metadata())) {
        throw seal_exception(SEAL_ERROR_OUT_OF_MEMORY); // LCOV_EXCL_LINE
    }
    return entry.release();
}

std::string
KeyStore::create_backup(const std::string &backup_password,
                        const std::string &key_passphrase) const
{
    JSONObject   data(json::new_object());
    json_object *pubkeys = json::new_array();
    json_object *seckeys = json::new_array();
    if (!json_add(data.get(), "version", SEAL_BACKUP_VERSION) ||
        !json_add(data.get(), "created", (int64_t) time(NULL)) ||
        !json_add(data.get(), "public_keys", pubkeys) ||
        !json_add(data.get(), "private_keys", seckeys)) {
        throw seal_exception(SEAL_ERROR_OUT_OF_MEMORY); // LCOV_EXCL_LINE
    }
    for (auto &key : pubring_.keys) {
        std::string fp = key.fp().str();
        if (!json_array_add(pubkeys, backup_entry(key, export_public_key(fp)))) {
            throw seal_exception(SEAL_ERROR_OUT_OF_MEMORY); // LCOV_EXCL_LINE
        }
    }
    for (auto &key : secring_.keys) {
        std::string armored;
        try {
            armored = export_private_key(key.fp().str(), key_passphrase);
        } catch (const seal_exception &e) {
            /* keys protected with another passphrase are not included */
            SEAL_LOG("Skipping secret key %s: %s", key.fp().str().c_str(), e.what());
            continue;
        }
        json_object *entry = backup_entry(key, armored);
        secure_clear(&armored[0], armored.size());
        if (!json_array_add(seckeys, entry)) {
            throw seal_exception(SEAL_ERROR_OUT_OF_MEMORY); // LCOV_EXCL_LINE
        }
    }

    RNG          rng;
    auto         res = rng.bytes(SEAL_SALT_SIZE);
    secure_bytes key = pbkdf2_sha256(backup_password, res.data(), res.size());
    std::string  text = json::serialize(data.get());
    std::string  tok = token::encrypt(key, text);
    secure_clear(&text[0], text.size());
    res.insert(res.end(), tok.begin(), tok.end());
    return b64::encode(res);
}

static size_t
restore_keys(KeyStore &store, json_object *data, const char *name)
{
    json_object *arr = json_get_arr(data, name);
    if (!arr) {
        return 0;
    }
    size_t count = 0;
    for (size_t i = 0; i < (size_t) json_object_array_length(arr); i++) {
        std::string key_data;
        if (!json_get_str(json_object_array_get_idx(arr, i), "key_data", key_data)) {
            SEAL_LOG("Backup entry %zu of %s has no key data", i, name);
            continue;
        }
        try {
            store.import_key(key_data, NULL);
            count++;
        } catch (const seal_exception &e) {
            SEAL_LOG("Failed to restore key %zu of %s: %s", i, name, e.what());
        }
    }
    return count;
}

BackupCounts
KeyStore::restore_backup(const std::string &backup, const std::string &backup_password)
{
    check_unlocked();
    std::vector<uint8_t> raw;
    if (!b64::decode(backup, raw) || (raw.size() <= SEAL_SALT_SIZE)) {
        throw seal_exception(SEAL_ERROR_BAD_FORMAT, "Invalid backup data");
    }
    secure_bytes key = pbkdf2_sha256(backup_password, raw.data(), SEAL_SALT_SIZE);
    std::string  tok(raw.begin() + SEAL_SALT_SIZE, raw.end());
    secure_bytes text;
    try {
        text = token::decrypt(key, tok);
    } catch (const seal_exception &e) {
        SEAL_LOG("Backup decryption failed: %s", e.what());
        throw seal_exception(SEAL_ERROR_DECRYPT_FAILED,
                             "Wrong backup password or corrupted backup");
    }
    JSONObject data = json::parse(std::string(text.begin(), text.end()));
    if (!json_object_is_type(data.get(), json_type_object)) {
        throw seal_exception(SEAL_ERROR_BAD_FORMAT, "Invalid backup data");
    }
    BackupCounts res;
    res.pub = restore_keys(*this, data.get(), "public_keys");
    res.sec = restore_keys(*this, data.get(), "private_keys");
    return res;
}

void
KeyStore::emergency_wipe()
{
    clear();
    storage_.wipe();
}

} // namespace seal

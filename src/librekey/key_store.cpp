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
#include <iterator>
#include "key_store.h"
#include "defaults.h"
#include "logging.h"
#include "base64.h"
#include "crypto/rsa.h"
#include "librepgp/stream-armor.h"

namespace seal {

size_t
KeyRing::key_count() const
{
    return keys.size();
}

Key *
KeyRing::get_key(const Fingerprint &fp)
{
    auto it = keybyfp.find(fp);
    if (it == keybyfp.end()) {
        return nullptr;
    }
    return &*it->second;
}

const Key *
KeyRing::get_key(const Fingerprint &fp) const
{
    auto it = keybyfp.find(fp);
    if (it == keybyfp.end()) {
        return nullptr;
    }
    return &*it->second;
}

Key *
KeyRing::add_key(const Key &key)
{
    Key *added = get_key(key.fp());
    if (added) {
        *added = key;
        return added;
    }
    keys.push_back(key);
    auto it = std::prev(keys.end());
    keybyfp[key.fp()] = it;
    return &*it;
}

bool
KeyRing::remove_key(const Fingerprint &fp)
{
    auto it = keybyfp.find(fp);
    if (it == keybyfp.end()) {
        return false;
    }
    keys.erase(it->second);
    keybyfp.erase(it);
    return true;
}

void
KeyRing::clear()
{
    keybyfp.clear();
    keys.clear();
}

json_object *
KeyRing::to_json() const
{
    JSONObject obj(json::new_object());
    for (auto &key : keys) {
        if (!json_add(obj.get(), key.fp().str().c_str(), key.to_json())) {
            throw seal_exception(SEAL_ERROR_OUT_OF_MEMORY); // LCOV_EXCL_LINE
        }
    }
    return obj.release();
}

void
KeyRing::from_json(json_object *obj, bool secret)
{
    if (!json_object_is_type(obj, json_type_object)) {
        SEAL_LOG("Wrong keyring JSON type");
        throw seal_exception(SEAL_ERROR_BAD_FORMAT, "Invalid keyring data");
    }
    clear();
    json_object_object_foreach(obj, name, val)
    {
        Key key = Key::from_json(val, secret);
        if (key.protection() == KeyProtection::Corrupt) {
            SEAL_LOG("Warning: corrupted secret key payload for %s", name);
        }
        add_key(key);
    }
}

void
KeyStore::load_ring(KeyRing &ring, const char *filename, bool secret)
{
    JSONObject data;
    if (!storage_.load(filename, data) || !data) {
        ring.clear();
        return;
    }
    ring.from_json(data.get(), secret);
}

void
KeyStore::load()
{
    load_ring(pubring_, SEAL_PUBRING_FILE, false);
    load_ring(secring_, SEAL_SECRING_FILE, true);
}

void
KeyStore::save()
{
    JSONObject pub(pubring_.to_json());
    JSONObject sec(secring_.to_json());
    storage_.save(SEAL_PUBRING_FILE, pub.get());
    storage_.save(SEAL_SECRING_FILE, sec.get());
}

void
KeyStore::clear()
{
    pubring_.clear();
    secring_.clear();
}

const KeyRing &
KeyStore::pubring() const
{
    return pubring_;
}

const KeyRing &
KeyStore::secring() const
{
    return secring_;
}

const Key *
KeyStore::get_key(const std::string &fp, bool secret) const
{
    Fingerprint keyfp;
    if (!Fingerprint::parse(fp, keyfp)) {
        return nullptr;
    }
    return secret ? secring_.get_key(keyfp) : pubring_.get_key(keyfp);
}

const Key &
KeyStore::get_existing(const std::string &fp, bool secret) const
{
    const Key *key = get_key(fp, secret);
    if (!key) {
        SEAL_LOG("%s key not found: %s", secret ? "Private" : "Public", fp.c_str());
        throw seal_exception(SEAL_ERROR_KEY_NOT_FOUND,
                             secret ? "Private key not found" : "Public key not found");
    }
    return *key;
}

void
KeyStore::check_unlocked() const
{
    if (!storage_.unlocked()) {
        throw seal_exception(SEAL_ERROR_NOT_INITIALIZED, "Encryption not initialized");
    }
}

std::string
KeyStore::generate_key(const std::string &name,
                       const std::string &email,
                       const std::string &passphrase,
                       size_t             bits)
{
    check_unlocked();
    secure_bytes secpem;
    std::string  pubpem;
    rsa::generate(bits, secpem, pubpem);

    Key key(pubpem, bits, name + " <" + email + ">", SEAL_TRUST_ULTIMATE, time(NULL));
    Key seckey(key);
    seckey.set_secret(KeyProtection::Wrapped, Key::wrap(secpem, passphrase));
    pubring_.add_key(key);
    secring_.add_key(seckey);
    save();
    return key.fp().str();
}

json_object *
KeyStore::list_keys(bool secret) const
{
    JSONObject arr(json::new_array());
    for (auto &key : secret ? secring_.keys : pubring_.keys) {
        if (!json_array_add(arr.get(), key.metadata())) {
            throw seal_exception(SEAL_ERROR_OUT_OF_MEMORY); // LCOV_EXCL_LINE
        }
    }
    return arr.release();
}

json_object *
KeyStore::get_key_info(const std::string &fp, bool secret) const
{
    return get_existing(fp, secret).metadata();
}

std::string
KeyStore::export_public_key(const std::string &fp) const
{
    const Key &key = get_existing(fp, false);
    return armor_encode(SEAL_ARMORED_PUBLIC_KEY, b64::encode(key.pubpem()));
}

std::string
KeyStore::export_private_key(const std::string &fp, const std::string &passphrase) const
{
    const Key &  key = get_existing(fp, true);
    secure_bytes pem = key.unlock(passphrase);
    return armor_encode(SEAL_ARMORED_SECRET_KEY, b64::encode(pem.data(), pem.size()));
}

std::string
KeyStore::import_key(const std::string &armored, const std::string *passphrase)
{
    check_unlocked();
    ArmorBlock         block = armor_decode(armored);
    seal_armored_msg_t msgtype = block.msgtype();
    if ((msgtype != SEAL_ARMORED_PUBLIC_KEY) && (msgtype != SEAL_ARMORED_SECRET_KEY)) {
        SEAL_LOG("Unsupported armor type: %s", block.type.c_str());
        throw seal_exception(SEAL_ERROR_BAD_FORMAT, "Not a key block: " + block.type);
    }
    std::vector<uint8_t> pem;
    if (!b64::decode(block.body, pem)) {
        throw seal_exception(SEAL_ERROR_BAD_FORMAT, "Invalid key data encoding");
    }
    bool          secret = msgtype == SEAL_ARMORED_SECRET_KEY;
    std::string   pubpem;
    size_t        bits = 0;
    std::string   secdata;
    KeyProtection prot = KeyProtection::None;
    if (secret) {
        auto skey = rsa::load_secret(pem.data(), pem.size());
        pubpem = rsa::public_pem(skey.get());
        bits = rsa::bits(skey.get());
        /* store the canonical PEM, input may carry text around the block */
        secure_bytes spem = rsa::secret_pem(skey.get());
        if (passphrase) {
            prot = KeyProtection::Wrapped;
            secdata = Key::wrap(spem, *passphrase);
        } else {
            prot = KeyProtection::EncodedPEM;
            secdata = b64::encode(spem.data(), spem.size());
        }
        secure_clear(pem.data(), pem.size());
    } else {
        /* canonicalize, so fingerprint doesn't depend on the formatting */
        auto pkey = rsa::load_public(std::string(pem.begin(), pem.end()));
        pubpem = rsa::public_pem(pkey.get());
        bits = rsa::bits(pkey.get());
    }

    Key key(pubpem, bits, SEAL_IMPORTED_UID, SEAL_TRUST_UNKNOWN, time(NULL));
    pubring_.add_key(key);
    if (secret) {
        Key seckey(key);
        seckey.set_secret(prot, secdata);
        secring_.add_key(seckey);
    }
    save();
    return key.fp().str();
}

void
KeyStore::delete_key(const std::string &fp, bool secret)
{
    check_unlocked();
    Fingerprint keyfp = get_existing(fp, secret).fp();
    (secret ? secring_ : pubring_).remove_key(keyfp);
    save();
}

bool
KeyStore::verify_passphrase(const std::string &fp, const std::string &passphrase) const
{
    const Key &key = get_existing(fp, true);
    try {
        secure_bytes pem = key.unlock(passphrase);
        rsa::load_secret(pem.data(), pem.size());
        return true;
    } catch (const seal_exception &) {
        SEAL_LOG_KEY("Failed to unlock %s", &key);
        return false;
    }
}

} // namespace seal

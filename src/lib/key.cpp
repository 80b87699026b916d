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

#include <cstdlib>
#include <cstring>
#include "key.hpp"
#include "defaults.h"
#include "logging.h"
#include "base64.h"
#include "str-utils.h"
#include "crypto/rng.h"
#include "crypto/s2k.h"
#include "crypto/cipher.hpp"

namespace seal {

static const id_str_pair protection_map[] = {
  {(int) KeyProtection::Wrapped, "wrapped"},
  {(int) KeyProtection::PlainPEM, "pem"},
  {(int) KeyProtection::EncodedPEM, "base64-pem"},
  {0, NULL},
};

const char *
key_protection_str(KeyProtection prot)
{
    return id_str_pair::lookup(protection_map, (int) prot, NULL);
}

KeyProtection
key_protection_by_str(const std::string &str)
{
    return (KeyProtection) id_str_pair::lookup(
      protection_map, str.c_str(), (int) KeyProtection::Corrupt);
}

Key::Key(const std::string &pubpem,
         size_t             bits,
         const std::string &uid,
         const std::string &trust,
         int64_t            created)
    : fp_(Fingerprint::from_pem(pubpem)), uids_({uid}), bits_(bits), created_(created),
      trust_(trust), pubpem_(pubpem)
{
}

const Fingerprint &
Key::fp() const
{
    return fp_;
}

std::string
Key::keyid() const
{
    return fp_.keyid_str();
}

const std::vector<std::string> &
Key::uids() const
{
    return uids_;
}

size_t
Key::bits() const
{
    return bits_;
}

int64_t
Key::created() const
{
    return created_;
}

const std::string &
Key::expires() const
{
    return expires_;
}

const std::string &
Key::trust() const
{
    return trust_;
}

const std::string &
Key::pubpem() const
{
    return pubpem_;
}

bool
Key::is_secret() const
{
    return protection_ != KeyProtection::None;
}

KeyProtection
Key::protection() const
{
    return protection_;
}

const std::string &
Key::secret_data() const
{
    return secdata_;
}

void
Key::set_secret(KeyProtection protection, const std::string &data)
{
    protection_ = protection;
    secdata_ = data;
}

Key
Key::public_part() const
{
    Key res(*this);
    res.protection_ = KeyProtection::None;
    res.secdata_.clear();
    return res;
}

/* wrapped payload is salt || iv || at least one cipher block */
static bool
wrapped_size_valid(size_t size)
{
    size_t hdr = SEAL_SALT_SIZE + SEAL_AES_BLOCK_SIZE;
    return (size > hdr) && !((size - hdr) % SEAL_AES_BLOCK_SIZE);
}

static bool
is_pem(const uint8_t *data, size_t len)
{
    static const char pem_hdr[] = "-----BEGIN";
    return (len >= strlen(pem_hdr)) && !memcmp(data, pem_hdr, strlen(pem_hdr));
}

static secure_bytes
decode_secret(const std::string &data)
{
    std::vector<uint8_t> buf;
    if (!b64::decode(data, buf)) {
        throw seal_exception(SEAL_ERROR_CORRUPT_KEY, "Corrupted private key data");
    }
    secure_bytes res(buf.begin(), buf.end());
    secure_clear(buf.data(), buf.size());
    return res;
}

KeyProtection
Key::classify(const std::string &data)
{
    if (starts_with(data, "-----")) {
        return KeyProtection::PlainPEM;
    }
    std::vector<uint8_t> buf;
    if (!b64::decode(data, buf)) {
        return KeyProtection::Corrupt;
    }
    KeyProtection res = KeyProtection::Corrupt;
    if (is_pem(buf.data(), buf.size())) {
        res = KeyProtection::EncodedPEM;
    } else if (wrapped_size_valid(buf.size())) {
        res = KeyProtection::Wrapped;
    }
    secure_clear(buf.data(), buf.size());
    return res;
}

std::string
Key::wrap(const secure_bytes &pem, const std::string &passphrase)
{
    RNG                  rng;
    std::vector<uint8_t> res = rng.bytes(SEAL_SALT_SIZE + SEAL_AES_BLOCK_SIZE);
    const uint8_t *      salt = res.data();
    const uint8_t *      iv = res.data() + SEAL_SALT_SIZE;
    secure_bytes         key = pbkdf2_sha256(passphrase, salt, SEAL_SALT_SIZE);
    auto ct = aes_cbc_encrypt(key.data(), key.size(), iv, pem.data(), pem.size());
    res.insert(res.end(), ct.begin(), ct.end());
    return b64::encode(res);
}

secure_bytes
Key::unwrap(const std::string &data, const std::string &passphrase)
{
    secure_bytes buf = decode_secret(data);
    if (!wrapped_size_valid(buf.size())) {
        SEAL_LOG("Wrong wrapped key length: %zu", buf.size());
        throw seal_exception(SEAL_ERROR_CORRUPT_KEY, "Corrupted private key data");
    }
    const uint8_t *salt = buf.data();
    const uint8_t *iv = buf.data() + SEAL_SALT_SIZE;
    size_t         hdr = SEAL_SALT_SIZE + SEAL_AES_BLOCK_SIZE;
    secure_bytes   key = pbkdf2_sha256(passphrase, salt, SEAL_SALT_SIZE);
    secure_bytes   pem;
    try {
        pem = aes_cbc_decrypt(key.data(), key.size(), iv, buf.data() + hdr, buf.size() - hdr);
    } catch (const seal_exception &) {
        throw seal_exception(SEAL_ERROR_DECRYPT_FAILED, "Wrong passphrase");
    }
    /* padding may match by chance, so check the result as well */
    if (!is_pem(pem.data(), pem.size())) {
        throw seal_exception(SEAL_ERROR_DECRYPT_FAILED, "Wrong passphrase");
    }
    return pem;
}

secure_bytes
Key::unlock(const std::string &passphrase) const
{
    switch (protection_) {
    case KeyProtection::Wrapped:
        return unwrap(secdata_, passphrase);
    case KeyProtection::PlainPEM:
        return to_secure(secdata_);
    case KeyProtection::EncodedPEM: {
        secure_bytes pem = decode_secret(secdata_);
        if (!is_pem(pem.data(), pem.size())) {
            throw seal_exception(SEAL_ERROR_CORRUPT_KEY, "Corrupted private key data");
        }
        return pem;
    }
    case KeyProtection::Corrupt:
        SEAL_LOG_KEY("Corrupted secret key payload: %s", this);
        throw seal_exception(SEAL_ERROR_CORRUPT_KEY, "Corrupted private key data");
    default:
        throw seal_exception(SEAL_ERROR_BAD_PARAMETERS, "Not a secret key");
    }
}

json_object *
Key::to_json() const
{
    JSONObject obj(json::new_object());
    json_object *jso = obj.get();
    if (!json_add(jso, "fingerprint", fp_.str()) || !json_add(jso, "keyid", keyid()) ||
        !json_add(jso, "uids", uids_) || !json_add(jso, "length", std::to_string(bits_)) ||
        !json_add(jso, "algo", SEAL_KEY_ALGO) || !json_add(jso, "created", created_) ||
        !json_add(jso, "expires", expires_) || !json_add(jso, "trust", trust_)) {
        throw seal_exception(SEAL_ERROR_OUT_OF_MEMORY); // LCOV_EXCL_LINE
    }
    if (!is_secret()) {
        if (!json_add(jso, "public_key", pubpem_)) {
            throw seal_exception(SEAL_ERROR_OUT_OF_MEMORY); // LCOV_EXCL_LINE
        }
        return obj.release();
    }
    if (!json_add(jso, "private_key", secdata_)) {
        throw seal_exception(SEAL_ERROR_OUT_OF_MEMORY); // LCOV_EXCL_LINE
    }
    /* corrupt payload is left untagged, so it is classified again on the next load */
    const char *prot = key_protection_str(protection_);
    if (prot && !json_add(jso, "protection", prot)) {
        throw seal_exception(SEAL_ERROR_OUT_OF_MEMORY); // LCOV_EXCL_LINE
    }
    return obj.release();
}

json_object *
Key::metadata() const
{
    JSONObject   obj(json::new_object());
    json_object *jso = obj.get();
    if (!json_add(jso, "fingerprint", fp_.str()) || !json_add(jso, "keyid", keyid()) ||
        !json_add(jso, "uids", uids_) || !json_add(jso, "length", std::to_string(bits_)) ||
        !json_add(jso, "algo", SEAL_KEY_ALGO) || !json_add(jso, "created", created_) ||
        !json_add(jso, "date", created_) || !json_add(jso, "expires", expires_) ||
        !json_add(jso, "trust", trust_)) {
        throw seal_exception(SEAL_ERROR_OUT_OF_MEMORY); // LCOV_EXCL_LINE
    }
    return obj.release();
}

/* numbers could be stored either as JSON number or decimal string */
static bool
get_number(json_object *obj, const char *name, int64_t &value)
{
    if (json_get_int64(obj, name, value)) {
        return true;
    }
    std::string str;
    if (!json_get_str(obj, name, str) || str.empty()) {
        return false;
    }
    char *end = NULL;
    value = strtoll(str.c_str(), &end, 10);
    return !*end;
}

Key
Key::from_json(json_object *obj, bool secret)
{
    if (!json_object_is_type(obj, json_type_object)) {
        throw seal_exception(SEAL_ERROR_BAD_FORMAT, "Invalid key record");
    }
    Key         key;
    std::string fpstr;
    if (!json_get_str(obj, "fingerprint", fpstr) || !Fingerprint::parse(fpstr, key.fp_)) {
        SEAL_LOG("Missing or invalid fingerprint");
        throw seal_exception(SEAL_ERROR_BAD_FORMAT, "Invalid key record");
    }
    if (!json_get_str_arr(obj, "uids", key.uids_)) {
        key.uids_.clear();
    }
    int64_t num = 0;
    if (get_number(obj, "length", num) && (num > 0)) {
        key.bits_ = num;
    }
    if (get_number(obj, "created", num)) {
        key.created_ = num;
    }
    if (!json_get_str(obj, "expires", key.expires_)) {
        key.expires_.clear();
    }
    if (!json_get_str(obj, "trust", key.trust_)) {
        key.trust_ = SEAL_TRUST_UNKNOWN;
    }
    if (!secret) {
        if (!json_get_str(obj, "public_key", key.pubpem_)) {
            SEAL_LOG_KEY("Missing public key data: %s", &key);
            throw seal_exception(SEAL_ERROR_BAD_FORMAT, "Invalid key record");
        }
        return key;
    }
    if (!json_get_str(obj, "private_key", key.secdata_)) {
        SEAL_LOG_KEY("Missing private key data: %s", &key);
        throw seal_exception(SEAL_ERROR_BAD_FORMAT, "Invalid key record");
    }
    std::string prot;
    if (json_get_str(obj, "protection", prot)) {
        key.protection_ = key_protection_by_str(prot);
    } else {
        key.protection_ = classify(key.secdata_);
    }
    return key;
}

} // namespace seal

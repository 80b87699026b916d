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

#ifndef SEAL_KEY_STORE_H_
#define SEAL_KEY_STORE_H_

#include <stdint.h>
#include <string>
#include <list>
#include <unordered_map>
#include "types.h"
#include "defaults.h"
#include "key.hpp"
#include "json-utils.h"
#include "secure-storage.h"

namespace seal {

typedef std::unordered_map<Fingerprint, std::list<Key>::iterator> KeyFingerprintMap;

/* Keys in the insertion order, indexed by the fingerprint */
class KeyRing {
  public:
    std::list<Key>    keys;
    KeyFingerprintMap keybyfp;

    KeyRing() = default;
    KeyRing(const KeyRing &src) = delete;
    KeyRing &operator=(const KeyRing &) = delete;

    size_t     key_count() const;
    Key *      get_key(const Fingerprint &fp);
    const Key *get_key(const Fingerprint &fp) const;
    /**
     * @brief Add key to the ring, copying it. Key with the same fingerprint is replaced,
     *        keeping its position.
     * @return pointer to the stored key
     */
    Key *add_key(const Key &key);
    bool remove_key(const Fingerprint &fp);
    void clear();

    /* JSON object, mapping fingerprint to the key record */
    json_object *to_json() const;
    /* Replace contents with records of the JSON object */
    void from_json(json_object *obj, bool secret);
};

/* Counts of keys, restored from the backup */
struct BackupCounts {
    size_t pub;
    size_t sec;
};

class KeyStore {
  private:
    SecureStorage &storage_;
    KeyRing        pubring_;
    KeyRing        secring_;

    void       load_ring(KeyRing &ring, const char *filename, bool secret);
    const Key &get_existing(const std::string &fp, bool secret) const;
    void       check_unlocked() const;

  public:
    KeyStore(SecureStorage &storage) : storage_(storage){};
    KeyStore(const KeyStore &src) = delete;
    KeyStore &operator=(const KeyStore &) = delete;

    /* Load both rings from the storage, session must be unlocked */
    void load();
    /* Write both rings to the storage */
    void save();
    /* Forget loaded keys, used when session is locked */
    void clear();

    const KeyRing &pubring() const;
    const KeyRing &secring() const;

    /**
     * @brief Find key by the user-supplied fingerprint.
     *
     * @param fp fingerprint, spaces and case are ignored
     * @param secret search within the secret keyring
     * @return pointer to the key or nullptr if fingerprint is malformed or key is not found.
     */
    const Key *get_key(const std::string &fp, bool secret) const;

    /**
     * @brief Generate RSA key pair and store it in both rings.
     *
     * @param name user name
     * @param email user email
     * @param passphrase password to protect the secret key
     * @param bits key length
     * @return fingerprint of the generated key
     */
    std::string generate_key(const std::string &name,
                             const std::string &email,
                             const std::string &passphrase,
                             size_t             bits = DEFAULT_RSA_NUMBITS);

    /* JSON array with metadata of every key, in the insertion order */
    json_object *list_keys(bool secret) const;
    json_object *get_key_info(const std::string &fp, bool secret) const;

    std::string export_public_key(const std::string &fp) const;
    /* Throws seal_exception(SEAL_ERROR_DECRYPT_FAILED) if passphrase is wrong */
    std::string export_private_key(const std::string &fp, const std::string &passphrase) const;

    /**
     * @brief Import armored public or private key.
     *
     * @param armored armored key block
     * @param passphrase if not NULL then imported secret key is protected with it,
     *                   otherwise secret key is stored unprotected.
     * @return fingerprint of the imported key
     */
    std::string import_key(const std::string &armored, const std::string *passphrase);

    void delete_key(const std::string &fp, bool secret);
    bool verify_passphrase(const std::string &fp, const std::string &passphrase) const;

    /**
     * @brief Export all public keys and secret keys unlockable with key_passphrase,
     *        encrypted with the backup password.
     */
    std::string create_backup(const std::string &backup_password,
                              const std::string &key_passphrase) const;
    /* Import keys from the backup, throws seal_exception(SEAL_ERROR_DECRYPT_FAILED) */
    BackupCounts restore_backup(const std::string &backup, const std::string &backup_password);
    /* Drop all keys and securely delete the data directory */
    void emergency_wipe();
};

} // namespace seal

#endif

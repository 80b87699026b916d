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

#ifndef SEAL_SECURE_STORAGE_H_
#define SEAL_SECURE_STORAGE_H_

#include <string>
#include <vector>
#include "types.h"
#include "json-utils.h"
#include "crypto/mem.h"

namespace seal {

/**
 * @brief Encrypted JSON records within the data directory. Every record is protected with
 *        the key derived from the master password and the installation salt. Directory is
 *        locked for the lifetime of the object.
 */
class SecureStorage {
    std::string  home_;
    int          lockfd_;
    secure_bytes key_;
    bool         unlocked_;

    std::string          full_path(const std::string &filename) const;
    std::vector<uint8_t> read_salt();
    void                 check_unlocked() const;
    void                 acquire_lock();
    void                 release_lock();
    static std::string   encrypt_with(const secure_bytes &key, json_object *data);
    static JSONObject    decrypt_with(const secure_bytes &key, const std::string &data);
    static JSONObject    read_file(const std::string &path);
    static JSONObject    load_with(const secure_bytes &key, const std::string &path);
    static std::string   record_text(const secure_bytes &key, json_object *data);
    static bool          record_encrypted(json_object *record);
    static bool          key_works(const secure_bytes &key);

  public:
    /**
     * @brief Open the data directory, creating it if needed, and lock it.
     *        Throws seal_exception(SEAL_ERROR_LOCKED) if directory is used by another owner.
     */
    SecureStorage(const std::string &home);
    ~SecureStorage();
    SecureStorage(const SecureStorage &) = delete;
    SecureStorage &operator=(const SecureStorage &) = delete;

    const std::string &home() const;

    /* Read or create the installation salt and derive key from the password */
    secure_bytes derive_key(const std::string &password);
    void         set_master_password(const std::string &password);
    /* wipe the session key */
    void lock();
    bool unlocked() const;

    /* Encrypt data with the session key, result is stored as record's data field */
    std::string encrypt_record(json_object *data) const;
    /* Decrypt record's data field. Throws seal_exception(SEAL_ERROR_DECRYPT_FAILED). */
    JSONObject decrypt_record(const std::string &data) const;

    /**
     * @brief Encrypt and atomically write the record.
     *
     * @param filename file name, relative to the data directory
     * @param data JSON data to store
     */
    void save(const std::string &filename, json_object *data);
    /**
     * @brief Load and decrypt the record. Legacy unencrypted records are returned as is.
     *
     * @param filename file name, relative to the data directory
     * @param data loaded data will be stored here
     * @return false if file doesn't exist, true otherwise. Throws on read, parse or
     *         decryption failure.
     */
    bool load(const std::string &filename, JSONObject &data) const;
    bool exists(const std::string &filename) const;
    bool is_encrypted(const std::string &filename) const;
    /**
     * @brief Encrypt legacy unencrypted record in place.
     * @return true if record was migrated, false if it is absent or already encrypted.
     */
    bool migrate(const std::string &filename);
    /* Migrate all records within the directory, returns names of the failed ones */
    std::vector<std::string> migrate_all();
    /* Overwrite file with random data and unlink it, no-op if file doesn't exist */
    void secure_delete(const std::string &filename);
    /* Check whether session key is usable with encrypt/decrypt round trip */
    bool verify_key() const;
    /**
     * @brief Re-encrypt all records with the key derived from the new password.
     *
     * @param oldpass current master password
     * @param newpass new master password
     * @return names of records which could not be decrypted with the old key and were
     *         left untouched.
     */
    std::vector<std::string> rotate_password(const std::string &oldpass,
                                             const std::string &newpass);
    /* Names of the *.json records within the directory, hidden ones are skipped */
    std::vector<std::string> list_records() const;
    /* Securely delete every file within the directory, locking session. Directory is
     * recreated empty and locked again, so the object may be unlocked with a new salt. */
    void wipe();

    /* Overwrite file with random data and unlink it */
    static void secure_delete_path(const std::string &path);
};

} // namespace seal

#endif

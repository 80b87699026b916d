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

#ifndef SEAL_H_
#define SEAL_H_

#include <seal/seal_export.h>
#include <stdbool.h>
#include <stddef.h>
#include <stdint.h>

#if defined(__cplusplus)
extern "C" {
#endif

/**
 * Function return type. 0 == SUCCESS, all other values indicate an error.
 * See seal_err.h for the list of codes.
 */
typedef uint32_t seal_result_t;

/**
 * Opaque handle owning one data directory: the master-password session, both key rings
 * and the directory lock.
 */
typedef struct seal_ffi_st *seal_ffi_t;

/**
 * Return a constant string describing the result code
 */
SEAL_API const char *seal_result_to_string(seal_result_t result);

SEAL_API const char *seal_version_string();

/** create the top-level object used for interacting with the library
 *
 *  The data directory is created if it does not exist, and locked for exclusive use until
 *  the handle is destroyed. Keys are not available until seal_unlock() is called.
 *
 *  @param ffi pointer that will be set to the created ffi object
 *  @param homedir path to the data directory
 *  @return SEAL_SUCCESS on success, SEAL_ERROR_LOCKED if directory is owned by another
 *          handle or process, or other error code.
 */
SEAL_API seal_result_t seal_ffi_create(seal_ffi_t *ffi, const char *homedir);

/** destroy the top-level object, wiping the in-memory master key and releasing the lock
 *
 *  @param ffi the ffi object, may be NULL
 *  @return SEAL_SUCCESS on success, or any other value on error
 */
SEAL_API seal_result_t seal_ffi_destroy(seal_ffi_t ffi);

/** set the log file descriptor used to report failures at the API boundary
 *
 *  @param ffi the ffi object
 *  @param fd file descriptor, opened for writing
 *  @return SEAL_SUCCESS on success, or any other value on error
 */
SEAL_API seal_result_t seal_ffi_set_log_fd(seal_ffi_t ffi, int fd);

/** get the human-readable detail of the last failed call on this handle
 *
 *  @param ffi the ffi object
 *  @param detail pointer to the string, owned by the ffi object and valid until the next
 *         call on it. Empty string if the last call succeeded.
 *  @return SEAL_SUCCESS on success, or any other value on error
 */
SEAL_API seal_result_t seal_ffi_last_error(seal_ffi_t ffi, const char **detail);

/**
 * @brief Free buffer allocated by a function in this API.
 *
 * @param ptr previously allocated buffer. May be NULL, then nothing is done.
 */
SEAL_API void seal_buffer_destroy(void *ptr);

/**
 * @brief Securely clear buffer contents.
 *
 * @param ptr pointer to the buffer contents, may be NULL.
 * @param size number of bytes in buffer.
 */
SEAL_API void seal_buffer_clear(void *ptr, size_t size);

/* Master password session */

/** open the master-password session
 *
 *  Derives the storage key from the password and the per-installation salt, migrates
 *  legacy plaintext *.json files under the data directory and loads both key rings.
 *  If stored data can't be decrypted with the derived key the session stays closed.
 *
 *  @param ffi the ffi object
 *  @param password master password
 *  @param failed if not NULL, receives a JSON array with names of files which failed
 *         migration. Must be freed with seal_buffer_destroy().
 *  @return SEAL_SUCCESS, or SEAL_ERROR_DECRYPT_FAILED on wrong password.
 */
SEAL_API seal_result_t seal_unlock(seal_ffi_t ffi, const char *password, char **failed);

/** close the session: wipe the in-memory key and unload key rings. */
SEAL_API seal_result_t seal_lock(seal_ffi_t ffi);

SEAL_API seal_result_t seal_is_unlocked(seal_ffi_t ffi, bool *result);

/** change the master password, re-encrypting every encrypted file in the data directory
 *
 *  Records are decrypted with the old key into memory first, then written under the new
 *  key into temporary files which replace the originals only when all writes succeeded.
 *  Files which could not be decrypted with the old key are left untouched and reported.
 *
 *  @param ffi the ffi object
 *  @param old_password current master password
 *  @param new_password new master password
 *  @param failed if not NULL, receives JSON array of names of files left on the old key.
 *  @return SEAL_SUCCESS, SEAL_ERROR_DECRYPT_FAILED if old password is wrong, or
 *          SEAL_ERROR_WRITE if re-encrypted data could not be written.
 */
SEAL_API seal_result_t seal_change_master_password(seal_ffi_t  ffi,
                                                   const char *old_password,
                                                   const char *new_password,
                                                   char **     failed);

/** encrypt every legacy plaintext *.json file in the data directory
 *
 *  @param failed if not NULL, receives JSON array of names of files which failed.
 */
SEAL_API seal_result_t seal_migrate_directory(seal_ffi_t ffi, char **failed);

/* Encrypted application data */

/** store JSON value in the data directory, encrypted with the session key
 *
 *  @param ffi the ffi object
 *  @param filename file name relative to the data directory
 *  @param json JSON text of the value to store
 *  @return SEAL_SUCCESS, SEAL_ERROR_NOT_INITIALIZED if session is closed, or other code.
 */
SEAL_API seal_result_t seal_save_data(seal_ffi_t ffi, const char *filename, const char *json);

/** load JSON value from the data directory
 *
 *  @param def JSON text returned when file does not exist. May be NULL, then "null".
 *  @param json on success receives JSON text. Must be freed with seal_buffer_destroy().
 */
SEAL_API seal_result_t seal_load_data(seal_ffi_t  ffi,
                                      const char *filename,
                                      const char *def,
                                      char **     json);

SEAL_API seal_result_t seal_migrate_data(seal_ffi_t ffi, const char *filename);

/** overwrite file contents with random data three times, then remove it */
SEAL_API seal_result_t seal_delete_data(seal_ffi_t ffi, const char *filename);

SEAL_API seal_result_t seal_data_exists(seal_ffi_t ffi, const char *filename, bool *result);

SEAL_API seal_result_t seal_data_is_encrypted(seal_ffi_t  ffi,
                                              const char *filename,
                                              bool *      result);

/* Keys */

/** generate RSA key pair and store it in both key rings
 *
 *  @param ffi the ffi object, session must be unlocked
 *  @param name user name, used in the user id "name <email>"
 *  @param email user email
 *  @param passphrase passphrase protecting the private key
 *  @param bits key length, 0 for the default 2048
 *  @param fingerprint on success receives fingerprint. Must be freed with
 *         seal_buffer_destroy().
 */
SEAL_API seal_result_t seal_generate_key(seal_ffi_t  ffi,
                                         const char *name,
                                         const char *email,
                                         const char *passphrase,
                                         uint32_t    bits,
                                         char **     fingerprint);

/** list keys of the public or secret key ring as a JSON array, in insertion order */
SEAL_API seal_result_t seal_list_keys(seal_ffi_t ffi, bool secret, char **json);

SEAL_API seal_result_t seal_get_key_info(seal_ffi_t  ffi,
                                         const char *fingerprint,
                                         bool        secret,
                                         char **     json);

SEAL_API seal_result_t seal_export_public_key(seal_ffi_t  ffi,
                                              const char *fingerprint,
                                              char **     armored);

/** export private key as armored PEM, the passphrase must unlock it */
SEAL_API seal_result_t seal_export_private_key(seal_ffi_t  ffi,
                                               const char *fingerprint,
                                               const char *passphrase,
                                               char **     armored);

/** import armored public or private key
 *
 *  @param armored armored PUBLIC KEY BLOCK or PRIVATE KEY BLOCK
 *  @param passphrase if not NULL, an imported private key is stored protected with it.
 *         Otherwise it is stored base64-encoded without protection.
 *  @param fingerprint if not NULL, receives fingerprint of the imported key.
 */
SEAL_API seal_result_t seal_import_key(seal_ffi_t  ffi,
                                       const char *armored,
                                       const char *passphrase,
                                       char **     fingerprint);

SEAL_API seal_result_t seal_delete_key(seal_ffi_t ffi, const char *fingerprint, bool secret);

SEAL_API seal_result_t seal_verify_passphrase(seal_ffi_t  ffi,
                                              const char *fingerprint,
                                              const char *passphrase,
                                              bool *      result);

/* Messages */

/** encrypt message for the recipients
 *
 *  @param plaintext NULL-terminated message
 *  @param recipients array of recipient fingerprints
 *  @param count number of recipients
 *  @param armored on success receives armored MESSAGE. Must be freed with
 *         seal_buffer_destroy().
 *  @return SEAL_SUCCESS, SEAL_ERROR_NO_RECIPIENTS, SEAL_ERROR_KEY_NOT_FOUND or other code.
 */
SEAL_API seal_result_t seal_encrypt_message(seal_ffi_t         ffi,
                                            const char *       plaintext,
                                            const char *const *recipients,
                                            size_t             count,
                                            char **            armored);

/** decrypt armored message trying every private key in the secret ring
 *
 *  @return SEAL_SUCCESS, SEAL_ERROR_BAD_ARMOR, SEAL_ERROR_BAD_MESSAGE or
 *          SEAL_ERROR_DECRYPT_FAILED. Details, including the number of private keys tried,
 *          are available via seal_ffi_last_error().
 */
SEAL_API seal_result_t seal_decrypt_message(seal_ffi_t  ffi,
                                            const char *armored,
                                            const char *passphrase,
                                            char **     plaintext);

/* Backup */

/** create password-protected backup of all keys
 *
 *  @param backup_password password used to encrypt the backup
 *  @param key_passphrase passphrase used to unlock private keys for export. Keys which
 *         can't be unlocked with it are skipped.
 *  @param backup on success receives base64 text. Must be freed with seal_buffer_destroy().
 */
SEAL_API seal_result_t seal_create_backup(seal_ffi_t  ffi,
                                          const char *backup_password,
                                          const char *key_passphrase,
                                          char **     backup);

SEAL_API seal_result_t seal_restore_backup(seal_ffi_t  ffi,
                                           const char *backup,
                                           const char *backup_password,
                                           size_t *    public_count,
                                           size_t *    secret_count);

/** remove both key rings and securely delete every file of the data directory.
 *  The session is closed afterwards, the directory is recreated empty and may be unlocked
 *  again with a new master password. */
SEAL_API seal_result_t seal_emergency_wipe(seal_ffi_t ffi);

#if defined(__cplusplus)
}

#include "seal_err.h"

#else
#include <seal/seal_err.h>
#endif

#endif

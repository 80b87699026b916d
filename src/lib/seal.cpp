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

#include <stdlib.h>
#include <string.h>
#include <stdio.h>
#include <new>
#include <string>
#include <vector>
#include <seal/seal.h>
#include "config.h"
#include "ffi-priv-types.h"
#include "types.h"
#include "defaults.h"
#include "logging.h"
#include "json-utils.h"
#include "file-utils.h"
#include "crypto/mem.h"
#include "librepgp/envelope.h"

static uint32_t
ffi_exception(seal_ffi_t  ffi,
              const char *func,
              const char *msg,
              uint32_t    ret = SEAL_ERROR_GENERIC)
{
    FILE *fp = stderr;
    if (ffi) {
        std::lock_guard<std::mutex> lock(ffi->mutex);
        ffi->last_error = msg;
        if (ffi->errs) {
            fp = ffi->errs;
        }
    }
    if (seal_log_switch()) {
        fprintf(
          fp, "[%s()] Error 0x%08X (%s): %s\n", func, ret, seal_result_to_string(ret), msg);
    }
    return ret;
}

#define FFI_GUARD_FFI(ffi)                                                           \
    catch (seal::seal_exception & e)                                                 \
    {                                                                                \
        return ffi_exception((ffi),                                                  \
                             __func__,                                               \
                             e.detail().empty() ? seal_result_to_string(e.code()) :  \
                                                  e.what(),                          \
                             e.code());                                              \
    }                                                                                \
    catch (std::bad_alloc &)                                                         \
    {                                                                                \
        return ffi_exception((ffi), __func__, "bad_alloc", SEAL_ERROR_OUT_OF_MEMORY); \
    }                                                                                \
    catch (std::exception & e)                                                       \
    {                                                                                \
        return ffi_exception((ffi), __func__, e.what());                             \
    }

#define FFI_GUARD FFI_GUARD_FFI(NULL)

/* Serializes calls on the handle and resets the error detail */
class FFICall {
    std::lock_guard<std::mutex> lock_;

  public:
    FFICall(seal_ffi_t ffi) : lock_(ffi->mutex)
    {
        ffi->last_error.clear();
    }
};

static seal_result_t
ret_str_value(const std::string &str, char **res)
{
    char *strcp = (char *) malloc(str.size() + 1);
    if (!strcp) {
        *res = NULL;                     // LCOV_EXCL_LINE
        return SEAL_ERROR_OUT_OF_MEMORY; // LCOV_EXCL_LINE
    }
    memcpy(strcp, str.data(), str.size());
    strcp[str.size()] = '\0';
    *res = strcp;
    return SEAL_SUCCESS;
}

static seal_result_t
ret_json_value(json_object *obj, char **res)
{
    seal::JSONObject jso(obj);
    return ret_str_value(seal::json::serialize(jso.get()), res);
}

static seal_result_t
ret_str_list(const std::vector<std::string> &list, char **res)
{
    json_object *arr = seal::json::new_array();
    for (auto &str : list) {
        if (!json_array_add(arr, str)) {
            json_object_put(arr);            // LCOV_EXCL_LINE
            return SEAL_ERROR_OUT_OF_MEMORY; // LCOV_EXCL_LINE
        }
    }
    return ret_json_value(arr, res);
}

seal_ffi_st::seal_ffi_st(const std::string &home) : storage(home), keys(storage)
{
    errs = stderr;
}

static bool
is_std_file(FILE *fp)
{
    return fp == stdout || fp == stderr;
}

static void
close_io_file(FILE **fp)
{
    if (*fp && !is_std_file(*fp)) {
        fclose(*fp);
    }
    *fp = NULL;
}

seal_ffi_st::~seal_ffi_st()
{
    close_io_file(&errs);
    keys.clear();
}

const char *
seal_result_to_string(seal_result_t result)
{
    switch (result) {
    case SEAL_SUCCESS:
        return "Success";

    case SEAL_ERROR_GENERIC:
        return "Unknown error";
    case SEAL_ERROR_BAD_FORMAT:
        return "Bad format";
    case SEAL_ERROR_BAD_PARAMETERS:
        return "Bad parameters";
    case SEAL_ERROR_NOT_IMPLEMENTED:
        return "Not implemented";
    case SEAL_ERROR_NOT_SUPPORTED:
        return "Not supported";
    case SEAL_ERROR_OUT_OF_MEMORY:
        return "Out of memory";
    case SEAL_ERROR_NULL_POINTER:
        return "Null pointer";

    case SEAL_ERROR_ACCESS:
        return "Error accessing file";
    case SEAL_ERROR_READ:
        return "Error reading file";
    case SEAL_ERROR_WRITE:
        return "Error writing file";
    case SEAL_ERROR_LOCKED:
        return "Data directory is locked";
    case SEAL_ERROR_NOT_INITIALIZED:
        return "Encryption not initialized";

    case SEAL_ERROR_BAD_STATE:
        return "Bad state";
    case SEAL_ERROR_KEY_GENERATION:
        return "Error during key generation";
    case SEAL_ERROR_KEY_NOT_FOUND:
        return "Key not found";
    case SEAL_ERROR_DECRYPT_FAILED:
        return "Decryption failed";
    case SEAL_ERROR_ENCRYPT_FAILED:
        return "Encryption failed";
    case SEAL_ERROR_RNG:
        return "Failure of random number generator";
    case SEAL_ERROR_CORRUPT_KEY:
        return "Corrupted key data";
    case SEAL_ERROR_NO_RECIPIENTS:
        return "No recipients";

    case SEAL_ERROR_BAD_ARMOR:
        return "Invalid armor format";
    case SEAL_ERROR_BAD_MESSAGE:
        return "Invalid message format";
    }

    return "Unsupported error code";
}

const char *
seal_version_string()
{
    return SEAL_VERSION_STRING;
}

seal_result_t
seal_ffi_create(seal_ffi_t *ffi, const char *homedir)
try {
    if (!ffi || !homedir) {
        return SEAL_ERROR_NULL_POINTER;
    }
    *ffi = new seal_ffi_st(homedir);
    return SEAL_SUCCESS;
}
FFI_GUARD

seal_result_t
seal_ffi_destroy(seal_ffi_t ffi)
try {
    if (ffi) {
        delete ffi;
    }
    return SEAL_SUCCESS;
}
FFI_GUARD

seal_result_t
seal_ffi_set_log_fd(seal_ffi_t ffi, int fd)
try {
    // checks
    if (!ffi) {
        return SEAL_ERROR_NULL_POINTER;
    }
    FFICall call(ffi);
    // open
    FILE *errs = seal_fdopen(fd, "a");
    if (!errs) {
        return SEAL_ERROR_ACCESS;
    }
    // close previous stream and replace it
    close_io_file(&ffi->errs);
    ffi->errs = errs;
    return SEAL_SUCCESS;
}
FFI_GUARD_FFI(ffi)

seal_result_t
seal_ffi_last_error(seal_ffi_t ffi, const char **detail)
try {
    if (!ffi || !detail) {
        return SEAL_ERROR_NULL_POINTER;
    }
    std::lock_guard<std::mutex> lock(ffi->mutex);
    *detail = ffi->last_error.c_str();
    return SEAL_SUCCESS;
}
FFI_GUARD_FFI(ffi)

void
seal_buffer_destroy(void *ptr)
{
    free(ptr);
}

void
seal_buffer_clear(void *ptr, size_t size)
{
    if (ptr) {
        secure_clear(ptr, size);
    }
}

/* wrong password is detected by the first encrypted record, keyrings are checked first */
static void
check_session_key(seal::SecureStorage &storage)
{
    std::vector<std::string> names = {SEAL_PUBRING_FILE, SEAL_SECRING_FILE};
    auto                     records = storage.list_records();
    names.insert(names.end(), records.begin(), records.end());
    for (auto &name : names) {
        if (!storage.is_encrypted(name)) {
            continue;
        }
        seal::JSONObject data;
        storage.load(name, data);
        return;
    }
}

seal_result_t
seal_unlock(seal_ffi_t ffi, const char *password, char **failed)
try {
    if (!ffi || !password) {
        return SEAL_ERROR_NULL_POINTER;
    }
    FFICall call(ffi);
    ffi->storage.set_master_password(password);
    std::vector<std::string> fails;
    try {
        check_session_key(ffi->storage);
        ffi->keys.load();
        fails = ffi->storage.migrate_all();
    } catch (const seal::seal_exception &) {
        ffi->keys.clear();
        ffi->storage.lock();
        throw;
    }
    if (failed) {
        return ret_str_list(fails, failed);
    }
    return SEAL_SUCCESS;
}
FFI_GUARD_FFI(ffi)

seal_result_t
seal_lock(seal_ffi_t ffi)
try {
    if (!ffi) {
        return SEAL_ERROR_NULL_POINTER;
    }
    FFICall call(ffi);
    ffi->keys.clear();
    ffi->storage.lock();
    return SEAL_SUCCESS;
}
FFI_GUARD_FFI(ffi)

seal_result_t
seal_is_unlocked(seal_ffi_t ffi, bool *result)
try {
    if (!ffi || !result) {
        return SEAL_ERROR_NULL_POINTER;
    }
    FFICall call(ffi);
    *result = ffi->storage.unlocked();
    return SEAL_SUCCESS;
}
FFI_GUARD_FFI(ffi)

seal_result_t
seal_change_master_password(seal_ffi_t  ffi,
                            const char *old_password,
                            const char *new_password,
                            char **     failed)
try {
    if (!ffi || !old_password || !new_password) {
        return SEAL_ERROR_NULL_POINTER;
    }
    FFICall call(ffi);
    auto    fails = ffi->storage.rotate_password(old_password, new_password);
    ffi->keys.load();
    if (failed) {
        return ret_str_list(fails, failed);
    }
    return SEAL_SUCCESS;
}
FFI_GUARD_FFI(ffi)

seal_result_t
seal_migrate_directory(seal_ffi_t ffi, char **failed)
try {
    if (!ffi) {
        return SEAL_ERROR_NULL_POINTER;
    }
    FFICall call(ffi);
    auto    fails = ffi->storage.migrate_all();
    if (failed) {
        return ret_str_list(fails, failed);
    }
    return SEAL_SUCCESS;
}
FFI_GUARD_FFI(ffi)

seal_result_t
seal_save_data(seal_ffi_t ffi, const char *filename, const char *json)
try {
    if (!ffi || !filename || !json) {
        return SEAL_ERROR_NULL_POINTER;
    }
    FFICall          call(ffi);
    seal::JSONObject data = seal::json::parse(json);
    ffi->storage.save(filename, data.get());
    return SEAL_SUCCESS;
}
FFI_GUARD_FFI(ffi)

seal_result_t
seal_load_data(seal_ffi_t ffi, const char *filename, const char *def, char **json)
try {
    if (!ffi || !filename || !json) {
        return SEAL_ERROR_NULL_POINTER;
    }
    FFICall          call(ffi);
    seal::JSONObject data;
    if (!ffi->storage.load(filename, data)) {
        return ret_str_value(def ? def : "null", json);
    }
    return ret_str_value(seal::json::serialize(data.get()), json);
}
FFI_GUARD_FFI(ffi)

seal_result_t
seal_migrate_data(seal_ffi_t ffi, const char *filename)
try {
    if (!ffi || !filename) {
        return SEAL_ERROR_NULL_POINTER;
    }
    FFICall call(ffi);
    ffi->storage.migrate(filename);
    return SEAL_SUCCESS;
}
FFI_GUARD_FFI(ffi)

seal_result_t
seal_delete_data(seal_ffi_t ffi, const char *filename)
try {
    if (!ffi || !filename) {
        return SEAL_ERROR_NULL_POINTER;
    }
    FFICall call(ffi);
    ffi->storage.secure_delete(filename);
    return SEAL_SUCCESS;
}
FFI_GUARD_FFI(ffi)

seal_result_t
seal_data_exists(seal_ffi_t ffi, const char *filename, bool *result)
try {
    if (!ffi || !filename || !result) {
        return SEAL_ERROR_NULL_POINTER;
    }
    FFICall call(ffi);
    *result = ffi->storage.exists(filename);
    return SEAL_SUCCESS;
}
FFI_GUARD_FFI(ffi)

seal_result_t
seal_data_is_encrypted(seal_ffi_t ffi, const char *filename, bool *result)
try {
    if (!ffi || !filename || !result) {
        return SEAL_ERROR_NULL_POINTER;
    }
    FFICall call(ffi);
    *result = ffi->storage.is_encrypted(filename);
    return SEAL_SUCCESS;
}
FFI_GUARD_FFI(ffi)

seal_result_t
seal_generate_key(seal_ffi_t  ffi,
                  const char *name,
                  const char *email,
                  const char *passphrase,
                  uint32_t    bits,
                  char **     fingerprint)
try {
    if (!ffi || !name || !email || !passphrase || !fingerprint) {
        return SEAL_ERROR_NULL_POINTER;
    }
    if ((strlen(name) + strlen(email) + 3 > MAX_ID_LENGTH) ||
        (strlen(passphrase) > MAX_PASSWORD_LENGTH)) {
        return SEAL_ERROR_BAD_PARAMETERS;
    }
    FFICall     call(ffi);
    std::string fp =
      ffi->keys.generate_key(name, email, passphrase, bits ? bits : DEFAULT_RSA_NUMBITS);
    return ret_str_value(fp, fingerprint);
}
FFI_GUARD_FFI(ffi)

seal_result_t
seal_list_keys(seal_ffi_t ffi, bool secret, char **json)
try {
    if (!ffi || !json) {
        return SEAL_ERROR_NULL_POINTER;
    }
    FFICall call(ffi);
    return ret_json_value(ffi->keys.list_keys(secret), json);
}
FFI_GUARD_FFI(ffi)

seal_result_t
seal_get_key_info(seal_ffi_t ffi, const char *fingerprint, bool secret, char **json)
try {
    if (!ffi || !fingerprint || !json) {
        return SEAL_ERROR_NULL_POINTER;
    }
    FFICall call(ffi);
    return ret_json_value(ffi->keys.get_key_info(fingerprint, secret), json);
}
FFI_GUARD_FFI(ffi)

seal_result_t
seal_export_public_key(seal_ffi_t ffi, const char *fingerprint, char **armored)
try {
    if (!ffi || !fingerprint || !armored) {
        return SEAL_ERROR_NULL_POINTER;
    }
    FFICall call(ffi);
    return ret_str_value(ffi->keys.export_public_key(fingerprint), armored);
}
FFI_GUARD_FFI(ffi)

seal_result_t
seal_export_private_key(seal_ffi_t  ffi,
                        const char *fingerprint,
                        const char *passphrase,
                        char **     armored)
try {
    if (!ffi || !fingerprint || !passphrase || !armored) {
        return SEAL_ERROR_NULL_POINTER;
    }
    FFICall     call(ffi);
    std::string res = ffi->keys.export_private_key(fingerprint, passphrase);
    seal_result_t ret = ret_str_value(res, armored);
    secure_clear(&res[0], res.size());
    return ret;
}
FFI_GUARD_FFI(ffi)

seal_result_t
seal_import_key(seal_ffi_t ffi, const char *armored, const char *passphrase, char **fingerprint)
try {
    if (!ffi || !armored) {
        return SEAL_ERROR_NULL_POINTER;
    }
    FFICall     call(ffi);
    std::string pass = passphrase ? passphrase : "";
    std::string fp = ffi->keys.import_key(armored, passphrase ? &pass : NULL);
    if (fingerprint) {
        return ret_str_value(fp, fingerprint);
    }
    return SEAL_SUCCESS;
}
FFI_GUARD_FFI(ffi)

seal_result_t
seal_delete_key(seal_ffi_t ffi, const char *fingerprint, bool secret)
try {
    if (!ffi || !fingerprint) {
        return SEAL_ERROR_NULL_POINTER;
    }
    FFICall call(ffi);
    ffi->keys.delete_key(fingerprint, secret);
    return SEAL_SUCCESS;
}
FFI_GUARD_FFI(ffi)

seal_result_t
seal_verify_passphrase(seal_ffi_t  ffi,
                       const char *fingerprint,
                       const char *passphrase,
                       bool *      result)
try {
    if (!ffi || !fingerprint || !passphrase || !result) {
        return SEAL_ERROR_NULL_POINTER;
    }
    FFICall call(ffi);
    *result = ffi->keys.verify_passphrase(fingerprint, passphrase);
    return SEAL_SUCCESS;
}
FFI_GUARD_FFI(ffi)

seal_result_t
seal_encrypt_message(seal_ffi_t         ffi,
                     const char *       plaintext,
                     const char *const *recipients,
                     size_t             count,
                     char **            armored)
try {
    if (!ffi || !plaintext || !armored || (count && !recipients)) {
        return SEAL_ERROR_NULL_POINTER;
    }
    std::vector<std::string> rcpts;
    for (size_t i = 0; i < count; i++) {
        if (!recipients[i]) {
            return SEAL_ERROR_NULL_POINTER;
        }
        rcpts.push_back(recipients[i]);
    }
    FFICall call(ffi);
    return ret_str_value(seal::encrypt_message(ffi->keys, plaintext, rcpts), armored);
}
FFI_GUARD_FFI(ffi)

seal_result_t
seal_decrypt_message(seal_ffi_t  ffi,
                     const char *armored,
                     const char *passphrase,
                     char **     plaintext)
try {
    if (!ffi || !armored || !plaintext) {
        return SEAL_ERROR_NULL_POINTER;
    }
    FFICall            call(ffi);
    seal::secure_bytes res =
      seal::decrypt_message(ffi->keys, armored, passphrase ? passphrase : "");
    *plaintext = (char *) malloc(res.size() + 1);
    if (!*plaintext) {
        return SEAL_ERROR_OUT_OF_MEMORY; // LCOV_EXCL_LINE
    }
    memcpy(*plaintext, res.data(), res.size());
    (*plaintext)[res.size()] = '\0';
    return SEAL_SUCCESS;
}
FFI_GUARD_FFI(ffi)

seal_result_t
seal_create_backup(seal_ffi_t  ffi,
                   const char *backup_password,
                   const char *key_passphrase,
                   char **     backup)
try {
    if (!ffi || !backup_password || !key_passphrase || !backup) {
        return SEAL_ERROR_NULL_POINTER;
    }
    FFICall call(ffi);
    return ret_str_value(ffi->keys.create_backup(backup_password, key_passphrase), backup);
}
FFI_GUARD_FFI(ffi)

seal_result_t
seal_restore_backup(seal_ffi_t  ffi,
                    const char *backup,
                    const char *backup_password,
                    size_t *    public_count,
                    size_t *    secret_count)
try {
    if (!ffi || !backup || !backup_password) {
        return SEAL_ERROR_NULL_POINTER;
    }
    FFICall call(ffi);
    auto    counts = ffi->keys.restore_backup(backup, backup_password);
    if (public_count) {
        *public_count = counts.pub;
    }
    if (secret_count) {
        *secret_count = counts.sec;
    }
    return SEAL_SUCCESS;
}
FFI_GUARD_FFI(ffi)

seal_result_t
seal_emergency_wipe(seal_ffi_t ffi)
try {
    if (!ffi) {
        return SEAL_ERROR_NULL_POINTER;
    }
    FFICall call(ffi);
    ffi->keys.emergency_wipe();
    return SEAL_SUCCESS;
}
FFI_GUARD_FFI(ffi)

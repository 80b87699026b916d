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

#include <errno.h>
#include <string.h>
#include <algorithm>
#include <fcntl.h>
#include <unistd.h>
#include <sys/file.h>
#include "config.h"
#include "secure-storage.h"
#include "defaults.h"
#include "logging.h"
#include "file-utils.h"
#include "str-utils.h"
#include "base64.h"
#include "crypto/rng.h"
#include "crypto/s2k.h"
#include "crypto/token.hpp"

namespace seal {

SecureStorage::SecureStorage(const std::string &home)
    : home_(home), lockfd_(-1), unlocked_(false)
{
    if (home_.empty()) {
        throw seal_exception(SEAL_ERROR_BAD_PARAMETERS, "Empty data directory path");
    }
    acquire_lock();
}

SecureStorage::~SecureStorage()
{
    lock();
    release_lock();
}

void
SecureStorage::acquire_lock()
{
    if (!path::mkdirs(home_, S_IRWXU)) {
        throw seal_exception(SEAL_ERROR_ACCESS, "Failed to create directory " + home_);
    }
    std::string lockpath = path::append(home_, SEAL_LOCK_FILE);
    lockfd_ = seal_open(lockpath.c_str(), O_RDWR | O_CREAT, 0600);
    if (lockfd_ < 0) {
        SEAL_LOG("Failed to open %s: %s", lockpath.c_str(), strerror(errno));
        throw seal_exception(SEAL_ERROR_ACCESS, "Failed to open lock file " + lockpath);
    }
    if (flock(lockfd_, LOCK_EX | LOCK_NB)) {
        int err = errno;
        close(lockfd_);
        lockfd_ = -1;
        if (err == EWOULDBLOCK) {
            throw seal_exception(SEAL_ERROR_LOCKED, "Data directory is in use: " + home_);
        }
        SEAL_LOG("flock(%s): %s", lockpath.c_str(), strerror(err));
        throw seal_exception(SEAL_ERROR_ACCESS, "Failed to lock " + home_);
    }
}

void
SecureStorage::release_lock()
{
    if (lockfd_ >= 0) {
        flock(lockfd_, LOCK_UN);
        close(lockfd_);
        lockfd_ = -1;
    }
}

const std::string &
SecureStorage::home() const
{
    return home_;
}

std::string
SecureStorage::full_path(const std::string &filename) const
{
    if (filename.empty() || is_slash(filename[0])) {
        throw seal_exception(SEAL_ERROR_BAD_PARAMETERS, "Invalid file name");
    }
    /* records must stay within the data directory */
    size_t start = 0;
    while (start <= filename.size()) {
        size_t end = filename.find('/', start);
        if (end == std::string::npos) {
            end = filename.size();
        }
        if (!filename.compare(start, end - start, "..")) {
            throw seal_exception(SEAL_ERROR_BAD_PARAMETERS, "Invalid file name");
        }
        start = end + 1;
    }
    return path::append(home_, filename);
}

std::vector<uint8_t>
SecureStorage::read_salt()
{
    std::string saltpath = path::append(home_, SEAL_SALT_FILE);
    if (path::exists(saltpath)) {
        std::string salt = file::read(saltpath);
        if (salt.empty()) {
            SEAL_LOG("Empty salt file %s", saltpath.c_str());
            throw seal_exception(SEAL_ERROR_BAD_FORMAT, "Empty salt file");
        }
        return std::vector<uint8_t>(salt.begin(), salt.end());
    }
    RNG  rng;
    auto salt = rng.bytes(SEAL_MASTER_SALT_SIZE);
    file::write_atomic(saltpath, std::string(salt.begin(), salt.end()));
    return salt;
}

secure_bytes
SecureStorage::derive_key(const std::string &password)
{
    auto salt = read_salt();
    return pbkdf2_sha256(password, salt.data(), salt.size());
}

void
SecureStorage::set_master_password(const std::string &password)
{
    key_ = derive_key(password);
    unlocked_ = true;
}

void
SecureStorage::lock()
{
    secure_bytes().swap(key_);
    unlocked_ = false;
}

bool
SecureStorage::unlocked() const
{
    return unlocked_;
}

void
SecureStorage::check_unlocked() const
{
    if (!unlocked_) {
        throw seal_exception(SEAL_ERROR_NOT_INITIALIZED, "Encryption not initialized");
    }
}

std::string
SecureStorage::encrypt_with(const secure_bytes &key, json_object *data)
{
    std::string text = json::serialize(data);
    std::string res = b64::encode(token::encrypt(key, text));
    secure_clear(&text[0], text.size());
    return res;
}

JSONObject
SecureStorage::decrypt_with(const secure_bytes &key, const std::string &data)
{
    std::string tok;
    if (!b64::decode(data, tok)) {
        SEAL_LOG("Invalid record encoding");
        throw seal_exception(SEAL_ERROR_DECRYPT_FAILED, "Failed to decrypt data");
    }
    secure_bytes text;
    try {
        text = token::decrypt(key, tok);
    } catch (const seal_exception &e) {
        SEAL_LOG("Record decryption failed: %s", e.what());
        throw seal_exception(SEAL_ERROR_DECRYPT_FAILED, "Failed to decrypt data");
    }
    return json::parse(std::string(text.begin(), text.end()));
}

std::string
SecureStorage::encrypt_record(json_object *data) const
{
    check_unlocked();
    return encrypt_with(key_, data);
}

JSONObject
SecureStorage::decrypt_record(const std::string &data) const
{
    check_unlocked();
    return decrypt_with(key_, data);
}

std::string
SecureStorage::record_text(const secure_bytes &key, json_object *data)
{
    JSONObject   record(json::new_object());
    json_object *jso = record.get();
    if (!json_add(jso, "version", SEAL_FILE_VERSION) || !json_add(jso, "encrypted", true) ||
        !json_add(jso, "data", encrypt_with(key, data))) {
        throw seal_exception(SEAL_ERROR_OUT_OF_MEMORY); // LCOV_EXCL_LINE
    }
    return json::serialize(jso);
}

bool
SecureStorage::record_encrypted(json_object *record)
{
    bool encrypted = false;
    return json_object_is_type(record, json_type_object) &&
           json_get_bool(record, "encrypted", encrypted) && encrypted;
}

JSONObject
SecureStorage::read_file(const std::string &path)
{
    JSONObject res = json::parse(file::read(path));
    if (!res) {
        SEAL_LOG("Null record in %s", path.c_str());
        throw seal_exception(SEAL_ERROR_BAD_FORMAT, "Invalid record in " + path);
    }
    return res;
}

JSONObject
SecureStorage::load_with(const secure_bytes &key, const std::string &path)
{
    JSONObject record = read_file(path);
    if (!record_encrypted(record.get())) {
        /* legacy unencrypted record: payload in data field, or the whole object */
        json_object *data = NULL;
        if (json_object_is_type(record.get(), json_type_object) &&
            json_object_object_get_ex(record.get(), "data", &data)) {
            return JSONObject(json_object_get(data));
        }
        return record;
    }
    std::string data;
    if (!json_get_str(record.get(), "data", data)) {
        SEAL_LOG("Missing data field in %s", path.c_str());
        throw seal_exception(SEAL_ERROR_BAD_FORMAT, "Invalid record in " + path);
    }
    return decrypt_with(key, data);
}

void
SecureStorage::save(const std::string &filename, json_object *data)
{
    check_unlocked();
    std::string path = full_path(filename);
    size_t      slash = filename.find_last_of('/');
    if ((slash != std::string::npos) && !path::mkdirs(full_path(filename.substr(0, slash)))) {
        throw seal_exception(SEAL_ERROR_WRITE, "Failed to create directory for " + filename);
    }
    file::write_atomic(path, record_text(key_, data));
}

bool
SecureStorage::load(const std::string &filename, JSONObject &data) const
{
    check_unlocked();
    std::string path = full_path(filename);
    if (!path::exists(path)) {
        return false;
    }
    data = load_with(key_, path);
    return true;
}

bool
SecureStorage::exists(const std::string &filename) const
{
    return path::exists(full_path(filename));
}

bool
SecureStorage::is_encrypted(const std::string &filename) const
{
    std::string path = full_path(filename);
    if (!path::exists(path)) {
        return false;
    }
    try {
        return record_encrypted(read_file(path).get());
    } catch (const seal_exception &e) {
        SEAL_LOG("Failed to check %s: %s", filename.c_str(), e.what());
        return false;
    }
}

bool
SecureStorage::migrate(const std::string &filename)
{
    check_unlocked();
    std::string path = full_path(filename);
    if (!path::exists(path)) {
        return false;
    }
    JSONObject record = read_file(path);
    if (record_encrypted(record.get())) {
        return false;
    }
    /* same payload rules as load_with: data field if present, else the whole object */
    json_object *data = record.get();
    json_object *payload = NULL;
    if (json_object_is_type(data, json_type_object) &&
        json_object_object_get_ex(data, "data", &payload)) {
        data = payload;
    }
    file::write_atomic(path, record_text(key_, data));
    return true;
}

std::vector<std::string>
SecureStorage::list_records() const
{
    std::vector<std::string> res;
    for (auto &name : path::list_files(home_, true)) {
        if (path::extension(name) == ".json") {
            res.push_back(name);
        }
    }
    return res;
}

std::vector<std::string>
SecureStorage::migrate_all()
{
    check_unlocked();
    std::vector<std::string> failed;
    for (auto &name : list_records()) {
        try {
            if (migrate(name)) {
                SEAL_LOG("Migrated %s", name.c_str());
            }
        } catch (const seal_exception &e) {
            SEAL_LOG("Failed to migrate %s: %s", name.c_str(), e.what());
            failed.push_back(name);
        }
    }
    return failed;
}

void
SecureStorage::secure_delete_path(const std::string &path)
{
    if (!path::exists(path)) {
        return;
    }
    int64_t size = seal_filesize(path.c_str());
    int     fd = seal_open(path.c_str(), O_WRONLY, 0);
    if ((size < 0) || (fd < 0)) {
        SEAL_LOG("Failed to open %s: %s", path.c_str(), strerror(errno));
        if (fd >= 0) {
            close(fd);
        }
        throw seal_exception(SEAL_ERROR_ACCESS, "Failed to open file " + path);
    }
    RNG     rng;
    uint8_t buf[4096];
    for (int pass = 0; pass < SECURE_DELETE_PASSES; pass++) {
        if (lseek(fd, 0, SEEK_SET)) {
            SEAL_LOG("Failed to seek %s: %s", path.c_str(), strerror(errno));
            close(fd);
            throw seal_exception(SEAL_ERROR_WRITE, "Failed to overwrite file " + path);
        }
        int64_t left = size;
        while (left > 0) {
            size_t  len = std::min<int64_t>(left, sizeof(buf));
            rng.get(buf, len);
            ssize_t res = write(fd, buf, len);
            if (res <= 0) {
                if ((res < 0) && (errno == EINTR)) {
                    continue;
                }
                SEAL_LOG("Failed to overwrite %s: %s", path.c_str(), strerror(errno));
                close(fd);
                throw seal_exception(SEAL_ERROR_WRITE, "Failed to overwrite file " + path);
            }
            left -= res;
        }
        if (fsync(fd)) {
            SEAL_LOG("Failed to sync %s: %s", path.c_str(), strerror(errno));
            close(fd);
            throw seal_exception(SEAL_ERROR_WRITE, "Failed to overwrite file " + path);
        }
    }
    close(fd);
    if (seal_unlink(path.c_str())) {
        SEAL_LOG("Failed to remove %s: %s", path.c_str(), strerror(errno));
        throw seal_exception(SEAL_ERROR_WRITE, "Failed to remove file " + path);
    }
}

void
SecureStorage::secure_delete(const std::string &filename)
{
    secure_delete_path(full_path(filename));
}

bool
SecureStorage::key_works(const secure_bytes &key)
{
    JSONObject probe(json::new_object());
    if (!json_add(probe.get(), "test", "verification") ||
        !json_add(probe.get(), "timestamp", 12345)) {
        throw seal_exception(SEAL_ERROR_OUT_OF_MEMORY); // LCOV_EXCL_LINE
    }
    try {
        JSONObject res = decrypt_with(key, encrypt_with(key, probe.get()));
        return json_object_equal(res.get(), probe.get());
    } catch (const seal_exception &e) {
        SEAL_LOG("Key verification failed: %s", e.what());
        return false;
    }
}

bool
SecureStorage::verify_key() const
{
    return unlocked_ && key_works(key_);
}

static void
remove_tmps(const std::vector<std::string> &tmps)
{
    for (auto &tmp : tmps) {
        if (seal_unlink(tmp.c_str())) {
            SEAL_LOG("Failed to remove %s: %s", tmp.c_str(), strerror(errno));
        }
    }
}

std::vector<std::string>
SecureStorage::rotate_password(const std::string &oldpass, const std::string &newpass)
{
    secure_bytes oldkey = derive_key(oldpass);
    if (!key_works(oldkey) ||
        (unlocked_ && ((oldkey.size() != key_.size()) ||
                       !const_time_eq(oldkey.data(), key_.data(), key_.size())))) {
        throw seal_exception(SEAL_ERROR_DECRYPT_FAILED, "Old password is incorrect");
    }

    /* decrypt everything with the old key */
    std::vector<std::string> failed;
    std::vector<std::string> names;
    std::vector<JSONObject>  staged;
    for (auto &name : list_records()) {
        if (!is_encrypted(name)) {
            continue;
        }
        try {
            JSONObject data = load_with(oldkey, full_path(name));
            names.push_back(name);
            staged.push_back(std::move(data));
        } catch (const seal_exception &e) {
            SEAL_LOG("Failed to decrypt %s: %s", name.c_str(), e.what());
            failed.push_back(name);
        }
    }
    if (!unlocked_ && staged.empty() && !failed.empty()) {
        /* without an open session the old key could be checked against records only */
        throw seal_exception(SEAL_ERROR_DECRYPT_FAILED, "Old password is incorrect");
    }

    /* write re-encrypted records to the temporary files */
    secure_bytes             newkey = derive_key(newpass);
    std::vector<std::string> tmps;
    try {
        for (size_t i = 0; i < staged.size(); i++) {
            tmps.push_back(file::write_tmp(full_path(names[i]),
                                           record_text(newkey, staged[i].get())));
        }
    } catch (const seal_exception &e) {
        SEAL_LOG("Failed to re-encrypt records: %s", e.what());
        remove_tmps(tmps);
        throw;
    }

    /* replace originals, record which is not replaced stays on the old key */
    for (size_t i = 0; i < tmps.size(); i++) {
        std::string path = full_path(names[i]);
        if (seal_rename(tmps[i].c_str(), path.c_str())) {
            SEAL_LOG("Failed to rename %s: %s", tmps[i].c_str(), strerror(errno));
            remove_tmps({tmps[i]});
            failed.push_back(names[i]);
        }
    }
    key_ = newkey;
    unlocked_ = true;
    return failed;
}

void
SecureStorage::wipe()
{
    lock();
    bool failed = false;
    for (auto &name : path::list_files(home_, false)) {
        try {
            secure_delete_path(path::append(home_, name));
        } catch (const seal_exception &e) {
            SEAL_LOG("Failed to wipe %s: %s", name.c_str(), e.what());
            failed = true;
        }
    }
    if (!path::rmdirs(home_)) {
        failed = true;
    }
    /* lock file is gone, start over with an empty directory */
    release_lock();
    acquire_lock();
    if (failed) {
        throw seal_exception(SEAL_ERROR_WRITE, "Failed to wipe some of the data");
    }
}

} // namespace seal

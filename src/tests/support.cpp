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

#include "seal_tests.h"
#include "support.h"
#include "types.h"
#include "file-utils.h"
#include "crypto/mem.h"

#include <stdarg.h>
#include <limits.h>
#include <unistd.h>
#include <ftw.h>
#include <sys/stat.h>
#include <fstream>
#include <iterator>

std::string
file_to_str(const std::string &path)
{
    std::ifstream infile(path);
    return std::string(std::istreambuf_iterator<char>(infile),
                       std::istreambuf_iterator<char>());
}

std::vector<uint8_t>
file_to_vec(const std::string &path)
{
    std::ifstream stream(path, std::ios::in | std::ios::binary);
    return std::vector<uint8_t>((std::istreambuf_iterator<char>(stream)),
                                std::istreambuf_iterator<char>());
}

void
str_to_file(const std::string &path, const char *str)
{
    std::ofstream stream(path, std::ios::out | std::ios::binary);
    stream.write(str, strlen(str));
}

off_t
file_size(const char *path)
{
    struct stat path_stat;
    if (seal_stat(path, &path_stat) != -1) {
        if (S_ISDIR(path_stat.st_mode)) {
            return -1;
        }
        return path_stat.st_size;
    }
    return -1;
}

static int
remove_cb(const char *fpath, const struct stat *sb, int typeflag, struct FTW *ftwbuf)
{
    int ret = remove(fpath);
    if (ret)
        perror(fpath);

    return ret;
}

static const char *
get_tmp()
{
    const char *tmp = getenv("TEMP");
    return tmp ? tmp : "/tmp";
}

static bool
is_tmp_path(const char *path)
{
    char *rlpath = realpath(path, NULL);
    if (!rlpath) {
        rlpath = strdup(path);
    }
    const char *tmp = get_tmp();
    char *      rltmp = realpath(tmp, NULL);
    if (!rltmp) {
        rltmp = strdup(tmp);
    }
    bool res = rlpath && rltmp && !strncmp(rlpath, rltmp, strlen(rltmp));
    free(rlpath);
    free(rltmp);
    return res;
}

void
delete_recursively(const char *path)
{
    std::string fullpath = path;
    if (*path != '/') {
        char *cwd = getcwd(NULL, 0);
        fullpath = seal::path::append(cwd, fullpath);
        free(cwd);
    }
    /* sanity check, we should only be purging things from /tmp/ */
    assert_true(is_tmp_path(fullpath.c_str()));
    nftw(fullpath.c_str(), remove_cb, 64, FTW_DEPTH | FTW_PHYS);
}

char *
make_temp_dir()
{
    char rltmp[PATH_MAX] = {0};
    if (!realpath(get_tmp(), rltmp)) {
        printf("Fatal: realpath on tmp folder failed. Error %d.\n", errno);
        return NULL;
    }

    const char *tmplate = "/seal-gtest-XXXXXX";
    char *      buffer = (char *) calloc(1, strlen(rltmp) + strlen(tmplate) + 1);
    if (buffer == NULL) {
        return NULL;
    }
    memcpy(buffer, rltmp, strlen(rltmp));
    memcpy(buffer + strlen(rltmp), tmplate, strlen(tmplate));
    buffer[strlen(rltmp) + strlen(tmplate)] = '\0';
    char *res = mkdtemp(buffer);
    if (!res) {
        free(buffer);
    }
    return res;
}

void
clean_temp_dir(const char *path)
{
    if (!getenv("SEAL_KEEP_TEMP")) {
        delete_recursively(path);
    }
}

bool
bin_eq_hex(const uint8_t *data, size_t len, const char *val)
{
    size_t stlen = strlen(val);
    if (stlen != len * 2) {
        return false;
    }

    std::vector<uint8_t> dec(len);
    seal::hex_decode(val, dec.data(), len);
    return !memcmp(data, dec.data(), len);
}

std::string
fmt(const char *format, ...)
{
    int     size;
    va_list ap;

    va_start(ap, format);
    size = vsnprintf(NULL, 0, format, ap);
    va_end(ap);

    // +1 for terminating null
    std::string buf(size + 1, '\0');

    va_start(ap, format);
    size = vsnprintf(&buf[0], buf.size(), format, ap);
    va_end(ap);

    // drop terminating null
    buf.resize(size);
    return buf;
}

seal_result_t
seal_exception_code(const std::function<void()> &func)
{
    try {
        func();
    } catch (const seal::seal_exception &e) {
        return e.code();
    }
    return SEAL_SUCCESS;
}

static bool
jso_get_field(json_object *obj, json_object **fld, const std::string &name)
{
    if (!obj || !json_object_is_type(obj, json_type_object)) {
        return false;
    }
    return json_object_object_get_ex(obj, name.c_str(), fld);
}

bool
check_json_field_str(json_object *obj, const std::string &field, const std::string &value)
{
    json_object *fld = NULL;
    if (!jso_get_field(obj, &fld, field)) {
        return false;
    }
    if (!json_object_is_type(fld, json_type_string)) {
        return false;
    }
    const char *jsoval = json_object_get_string(fld);
    return jsoval && (value == jsoval);
}

bool
check_json_field_int(json_object *obj, const std::string &field, int64_t value)
{
    json_object *fld = NULL;
    if (!jso_get_field(obj, &fld, field)) {
        return false;
    }
    if (!json_object_is_type(fld, json_type_int)) {
        return false;
    }
    return json_object_get_int64(fld) == value;
}

bool
check_json_field_bool(json_object *obj, const std::string &field, bool value)
{
    json_object *fld = NULL;
    if (!jso_get_field(obj, &fld, field)) {
        return false;
    }
    if (!json_object_is_type(fld, json_type_boolean)) {
        return false;
    }
    return (json_object_get_boolean(fld) ? true : false) == value;
}

std::vector<std::string>
json_str_list(const char *json)
{
    std::vector<std::string> res;
    seal::JSONObject         jso = seal::json::parse(json);
    if (!json_object_is_type(jso.get(), json_type_array)) {
        return res;
    }
    for (size_t i = 0; i < (size_t) json_object_array_length(jso.get()); i++) {
        res.push_back(json_object_get_string(json_object_array_get_idx(jso.get(), i)));
    }
    return res;
}

void
test_ffi_init(seal_ffi_t *ffi, const std::string &home, const char *password)
{
    assert_seal_success(seal_ffi_create(ffi, home.c_str()));
    assert_seal_success(seal_unlock(*ffi, password, NULL));
}

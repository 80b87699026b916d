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

#ifndef SUPPORT_H_
#define SUPPORT_H_

#include <stdio.h>
#include <stdlib.h>
#include <stdint.h>
#include <string.h>
#include <sys/types.h>
#include <functional>
#include <string>
#include <vector>
#include <seal/seal.h>
#include "json-utils.h"
#include "crypto/mem.h"

/* Read file contents into the std::string */
std::string file_to_str(const std::string &path);

/* Read binary file contents into the vector */
std::vector<uint8_t> file_to_vec(const std::string &path);

/* Write string contents to the file */
void str_to_file(const std::string &path, const char *str);

/* -1 if file doesn't exist or is a directory */
off_t file_size(const char *path);

/* Recursively remove a directory, which must be located in temporary folder. */
void delete_recursively(const char *path);

/* Creates and returns a temporary directory path.
 * Caller must free the string.
 */
char *make_temp_dir(void);

/* Remove temporary directory unless SEAL_KEEP_TEMP is set */
void clean_temp_dir(const char *path);

bool bin_eq_hex(const uint8_t *data, size_t len, const char *val);

template <typename T>
bool
bin_eq_hex(const T &data, const char *val)
{
    return bin_eq_hex(data.data(), data.size(), val);
}

std::string fmt(const char *format, ...);

/* Run function and return code of the thrown seal_exception, SEAL_SUCCESS if nothing is
 * thrown */
seal_result_t seal_exception_code(const std::function<void()> &func);

bool check_json_field_str(json_object *      obj,
                          const std::string &field,
                          const std::string &value);
bool check_json_field_int(json_object *obj, const std::string &field, int64_t value);
bool check_json_field_bool(json_object *obj, const std::string &field, bool value);

/* Parse JSON array of strings, returned by the API */
std::vector<std::string> json_str_list(const char *json);

/* Create ffi object over the home directory and open the session */
void test_ffi_init(seal_ffi_t *ffi, const std::string &home, const char *password);

/* Small RSA keys make tests faster */
#define TEST_RSA_BITS 1024

#endif /* SUPPORT_H_ */

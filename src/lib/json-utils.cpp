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

#include <cstring>
#include "json-utils.h"
#include "logging.h"

/* Shortcut function to add field checking it for null to avoid allocation failure.
   Please note that it deallocates val on failure. */
bool
json_add(json_object *obj, const char *name, json_object *val)
{
    if (!val) {
        return false;
    }
    // TODO: in JSON-C 0.13 json_object_object_add returns bool instead of void
    json_object_object_add(obj, name, val);
    if (!json_object_object_get_ex(obj, name, NULL)) {
        json_object_put(val);
        return false;
    }

    return true;
}

bool
json_add(json_object *obj, const char *name, const char *value)
{
    return json_add(obj, name, json_object_new_string(value));
}

bool
json_add(json_object *obj, const char *name, const std::string &value)
{
    return json_add(obj, name, json_object_new_string_len(value.data(), value.size()));
}

bool
json_add(json_object *obj, const char *name, bool value)
{
    return json_add(obj, name, json_object_new_boolean(value));
}

bool
json_add(json_object *obj, const char *name, int value)
{
    return json_add(obj, name, json_object_new_int(value));
}

bool
json_add(json_object *obj, const char *name, int64_t value)
{
    return json_add(obj, name, json_object_new_int64(value));
}

bool
json_add(json_object *obj, const char *name, const std::vector<std::string> &value)
{
    json_object *arr = json_object_new_array();
    if (!json_add(obj, name, arr)) {
        return false;
    }
    for (auto &str : value) {
        if (!json_array_add(arr, str)) {
            return false;
        }
    }
    return true;
}

bool
json_array_add(json_object *obj, const char *val)
{
    return json_array_add(obj, json_object_new_string(val));
}

bool
json_array_add(json_object *obj, const std::string &val)
{
    return json_array_add(obj, json_object_new_string_len(val.data(), val.size()));
}

bool
json_array_add(json_object *obj, json_object *val)
{
    if (!val) {
        return false;
    }
    if (json_object_array_add(obj, val)) {
        json_object_put(val);
        return false;
    }
    return true;
}

static json_object *
json_get_field(json_object *obj, const char *name, json_type type)
{
    json_object *res = NULL;
    if (!json_object_object_get_ex(obj, name, &res) || !json_object_is_type(res, type)) {
        return NULL;
    }
    return res;
}

bool
json_get_str(json_object *obj, const char *name, std::string &value, bool del)
{
    auto str = json_get_field(obj, name, json_type_string);
    if (!str) {
        return false;
    }
    value.assign(json_object_get_string(str), json_object_get_string_len(str));
    if (del) {
        json_object_object_del(obj, name);
    }
    return true;
}

bool
json_get_int64(json_object *obj, const char *name, int64_t &value, bool del)
{
    auto num = json_get_field(obj, name, json_type_int);
    if (!num) {
        return false;
    }
    value = json_object_get_int64(num);
    if (del) {
        json_object_object_del(obj, name);
    }
    return true;
}

bool
json_get_bool(json_object *obj, const char *name, bool &value, bool del)
{
    auto val = json_get_field(obj, name, json_type_boolean);
    if (!val) {
        return false;
    }
    value = json_object_get_boolean(val);
    if (del) {
        json_object_object_del(obj, name);
    }
    return true;
}

bool
json_get_str_arr(json_object *obj, const char *name, std::vector<std::string> &value, bool del)
{
    auto arr = json_get_field(obj, name, json_type_array);
    if (!arr) {
        return false;
    }
    value.clear();
    for (size_t i = 0; i < (size_t) json_object_array_length(arr); i++) {
        json_object *item = json_object_array_get_idx(arr, i);
        if (!json_object_is_type(item, json_type_string)) {
            return false;
        }
        value.push_back(json_object_get_string(item));
    }
    if (del) {
        json_object_object_del(obj, name);
    }
    return true;
}

json_object *
json_get_obj(json_object *obj, const char *name)
{
    return json_get_field(obj, name, json_type_object);
}

json_object *
json_get_arr(json_object *obj, const char *name)
{
    return json_get_field(obj, name, json_type_array);
}

#ifdef JSON_C_TO_STRING_NOSLASHESCAPE
#define JSON_SLASH_FLAGS JSON_C_TO_STRING_NOSLASHESCAPE
#else
#define JSON_SLASH_FLAGS 0
#endif

namespace seal {
namespace json {
JSONObject
parse(const std::string &text)
{
    json_tokener *tok = json_tokener_new();
    if (!tok) {
        throw seal_exception(SEAL_ERROR_OUT_OF_MEMORY); // LCOV_EXCL_LINE
    }
    json_object *      obj = json_tokener_parse_ex(tok, text.c_str(), text.size());
    json_tokener_error err = json_tokener_get_error(tok);
#if (JSON_C_MAJOR_VERSION == 0) && (JSON_C_MINOR_VERSION < 15)
    size_t offset = tok->char_offset;
#else
    size_t offset = json_tokener_get_parse_end(tok);
#endif
    json_tokener_free(tok);
    JSONObject res(obj);
    if (err != json_tokener_success) {
        SEAL_LOG("Failed to parse JSON: %s", json_tokener_error_desc(err));
        throw seal_exception(SEAL_ERROR_BAD_FORMAT, "Invalid JSON data");
    }
    /* only whitespaces are allowed after the value */
    for (size_t i = offset; i < text.size(); i++) {
        if (!strchr(" \t\r\n", text[i])) {
            SEAL_LOG("Trailing data after JSON value at %zu", i);
            throw seal_exception(SEAL_ERROR_BAD_FORMAT, "Invalid JSON data");
        }
    }
    return res;
}

std::string
serialize(json_object *obj)
{
    if (!obj) {
        return "null";
    }
    return json_object_to_json_string_ext(obj, JSON_C_TO_STRING_PLAIN | JSON_SLASH_FLAGS);
}

json_object *
new_object()
{
    json_object *obj = json_object_new_object();
    if (!obj) {
        throw seal_exception(SEAL_ERROR_OUT_OF_MEMORY); // LCOV_EXCL_LINE
    }
    return obj;
}

json_object *
new_array()
{
    json_object *obj = json_object_new_array();
    if (!obj) {
        throw seal_exception(SEAL_ERROR_OUT_OF_MEMORY); // LCOV_EXCL_LINE
    }
    return obj;
}
} // namespace json
} // namespace seal

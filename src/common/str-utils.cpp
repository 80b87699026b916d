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

/** String utilities
 *  @file
 */

#include <cstddef>
#include <cstring>
#include <cctype>
#include <algorithm>
#include "str-utils.h"

namespace seal {

bool
strip_eol(std::string &s)
{
    size_t len = s.size();
    while (len && ((s[len - 1] == '\n') || (s[len - 1] == '\r'))) {
        len--;
    }
    if (len == s.size()) {
        return false;
    }
    s.resize(len);
    return true;
}

std::string
trim(const std::string &s)
{
    static const char *ws = " \t\r\n\v\f";
    size_t             start = s.find_first_not_of(ws);
    if (start == std::string::npos) {
        return "";
    }
    size_t end = s.find_last_not_of(ws);
    return s.substr(start, end - start + 1);
}

bool
str_case_eq(const char *s1, const char *s2)
{
    while (*s1 && *s2) {
        if (std::tolower((unsigned char) *s1) != std::tolower((unsigned char) *s2)) {
            return false;
        }
        s1++;
        s2++;
    }
    return !*s1 && !*s2;
}

bool
str_case_eq(const std::string &s1, const std::string &s2)
{
    if (s2.size() != s1.size()) {
        return false;
    }
    return str_case_eq(s1.c_str(), s2.c_str());
}

bool
starts_with(const std::string &s, const std::string &prefix)
{
    return (s.size() >= prefix.size()) && !s.compare(0, prefix.size(), prefix);
}

bool
ends_with(const std::string &s, const std::string &suffix)
{
    return (s.size() >= suffix.size()) &&
           !s.compare(s.size() - suffix.size(), suffix.size(), suffix);
}

std::vector<std::string>
split_lines(const std::string &s)
{
    std::vector<std::string> res;
    size_t                   pos = 0;
    while (pos <= s.size()) {
        size_t eol = s.find('\n', pos);
        if (eol == std::string::npos) {
            eol = s.size();
        }
        std::string line = s.substr(pos, eol - pos);
        strip_eol(line);
        res.push_back(line);
        pos = eol + 1;
    }
    return res;
}

static size_t
hex_prefix_len(const std::string &str)
{
    if ((str.length() >= 2) && (str[0] == '0') && ((str[1] == 'x') || (str[1] == 'X'))) {
        return 2;
    }
    return 0;
}

bool
is_hex(const std::string &s)
{
    for (size_t i = hex_prefix_len(s); i < s.length(); i++) {
        auto &ch = s[i];
        if ((ch >= '0') && (ch <= '9')) {
            continue;
        }
        if ((ch >= 'a') && (ch <= 'f')) {
            continue;
        }
        if ((ch >= 'A') && (ch <= 'F')) {
            continue;
        }
        if ((ch == ' ') || (ch == '\t')) {
            continue;
        }
        return false;
    }
    return true;
}

std::string
strip_hex(const std::string &s)
{
    std::string res = "";
    for (size_t idx = hex_prefix_len(s); idx < s.length(); idx++) {
        auto ch = s[idx];
        if ((ch == ' ') || (ch == '\t')) {
            continue;
        }
        res.push_back(ch);
    }
    return res;
}

std::string
uppercase(const std::string &s)
{
    std::string res(s);
    std::transform(res.begin(), res.end(), res.begin(), [](unsigned char ch) {
        return (char) std::toupper(ch);
    });
    return res;
}

bool
is_slash(char c)
{
    return c == '/';
}

} // namespace seal

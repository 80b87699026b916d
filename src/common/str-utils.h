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

#ifndef SEAL_STR_UTILS_H_
#define SEAL_STR_UTILS_H_

#include <string>
#include <vector>

namespace seal {
/**
 * @brief Strip EOL characters from the string's end.
 *
 * @param s string to check
 * @return true if EOL was found and stripped, or false otherwise.
 */
bool strip_eol(std::string &s);
/* strip leading and trailing whitespaces */
std::string trim(const std::string &s);
bool        str_case_eq(const char *s1, const char *s2);
bool        str_case_eq(const std::string &s1, const std::string &s2);
bool        starts_with(const std::string &s, const std::string &prefix);
bool        ends_with(const std::string &s, const std::string &suffix);
/* split text into lines, both \n and \r\n are accepted */
std::vector<std::string> split_lines(const std::string &s);

bool        is_hex(const std::string &s);
std::string strip_hex(const std::string &s);
std::string uppercase(const std::string &s);
bool        is_slash(char c);
} // namespace seal

#endif

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

#ifndef SEAL_BASE64_H_
#define SEAL_BASE64_H_

#include <stdint.h>
#include <string>
#include <vector>

namespace seal {
namespace b64 {

enum class Alphabet { Standard, UrlSafe };

std::string encode(const uint8_t *buf, size_t len, Alphabet abc = Alphabet::Standard);
std::string encode(const std::vector<uint8_t> &vec, Alphabet abc = Alphabet::Standard);
std::string encode(const std::string &str, Alphabet abc = Alphabet::Standard);

/**
 * @brief Decode base64 text. Whitespace and line breaks are skipped, padding is required,
 *        any other character outside of the alphabet makes decoding fail.
 *
 * @param in base64 text
 * @param out decoded bytes will be stored here
 * @param abc alphabet
 * @return true on success or false otherwise
 */
bool decode(const std::string &in, std::vector<uint8_t> &out, Alphabet abc = Alphabet::Standard);
bool decode(const std::string &in, std::string &out, Alphabet abc = Alphabet::Standard);

} // namespace b64
} // namespace seal

#endif

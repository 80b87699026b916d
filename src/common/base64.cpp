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

#include "base64.h"

namespace seal {
namespace b64 {

static const char B64ENC[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
static const char B64URLENC[] =
  "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789-_";

/*
   Decoded value of the base64 character:
   0xff - wrong character,
   0xfe - '='
   0xfd - eol/whitespace,
   0..0x3f - represented 6-bit number
*/
static uint8_t
b64_dec(char ch, Alphabet abc)
{
    if ((ch >= 'A') && (ch <= 'Z')) {
        return ch - 'A';
    }
    if ((ch >= 'a') && (ch <= 'z')) {
        return ch - 'a' + 26;
    }
    if ((ch >= '0') && (ch <= '9')) {
        return ch - '0' + 52;
    }
    switch (ch) {
    case '+':
        return abc == Alphabet::Standard ? 0x3e : 0xff;
    case '/':
        return abc == Alphabet::Standard ? 0x3f : 0xff;
    case '-':
        return abc == Alphabet::UrlSafe ? 0x3e : 0xff;
    case '_':
        return abc == Alphabet::UrlSafe ? 0x3f : 0xff;
    case '=':
        return 0xfe;
    case ' ':
    case '\t':
    case '\r':
    case '\n':
        return 0xfd;
    default:
        return 0xff;
    }
}

std::string
encode(const uint8_t *buf, size_t len, Alphabet abc)
{
    const char *enc = abc == Alphabet::Standard ? B64ENC : B64URLENC;
    std::string res;
    res.reserve(((len + 2) / 3) * 4);

    size_t i = 0;
    for (; i + 3 <= len; i += 3) {
        uint32_t t = (buf[i] << 16) | (buf[i + 1] << 8) | buf[i + 2];
        res.push_back(enc[(t >> 18) & 0x3f]);
        res.push_back(enc[(t >> 12) & 0x3f]);
        res.push_back(enc[(t >> 6) & 0x3f]);
        res.push_back(enc[t & 0x3f]);
    }
    if (len - i == 1) {
        res.push_back(enc[buf[i] >> 2]);
        res.push_back(enc[(buf[i] << 4) & 0x3f]);
        res.append("==");
    } else if (len - i == 2) {
        res.push_back(enc[buf[i] >> 2]);
        res.push_back(enc[((buf[i] << 4) | (buf[i + 1] >> 4)) & 0x3f]);
        res.push_back(enc[(buf[i + 1] << 2) & 0x3f]);
        res.push_back('=');
    }
    return res;
}

std::string
encode(const std::vector<uint8_t> &vec, Alphabet abc)
{
    return encode(vec.data(), vec.size(), abc);
}

std::string
encode(const std::string &str, Alphabet abc)
{
    return encode((const uint8_t *) str.data(), str.size(), abc);
}

bool
decode(const std::string &in, std::vector<uint8_t> &out, Alphabet abc)
{
    std::vector<uint8_t> res;
    res.reserve(in.size() / 4 * 3);

    uint32_t t = 0;
    size_t   cnt = 0;
    size_t   pad = 0;
    for (char ch : in) {
        uint8_t val = b64_dec(ch, abc);
        if (val == 0xfd) {
            continue;
        }
        if (val == 0xff) {
            return false;
        }
        if (val == 0xfe) {
            pad++;
            /* padding may appear only at 3rd or 4th position of the quad */
            if ((pad > 2) || (cnt + pad > 4) || (cnt < 2)) {
                return false;
            }
            continue;
        }
        /* data after padding */
        if (pad) {
            return false;
        }
        t = (t << 6) | val;
        if (++cnt == 4) {
            res.push_back((t >> 16) & 0xff);
            res.push_back((t >> 8) & 0xff);
            res.push_back(t & 0xff);
            t = 0;
            cnt = 0;
        }
    }
    if (!cnt) {
        if (pad) {
            return false;
        }
        out.swap(res);
        return true;
    }
    if (cnt + pad != 4) {
        return false;
    }
    if (cnt == 2) {
        res.push_back((t >> 4) & 0xff);
    } else {
        res.push_back((t >> 10) & 0xff);
        res.push_back((t >> 2) & 0xff);
    }
    out.swap(res);
    return true;
}

bool
decode(const std::string &in, std::string &out, Alphabet abc)
{
    std::vector<uint8_t> res;
    if (!decode(in, res, abc)) {
        return false;
    }
    out.assign(res.begin(), res.end());
    return true;
}

} // namespace b64
} // namespace seal

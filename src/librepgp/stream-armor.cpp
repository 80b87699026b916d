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

#include <string.h>
#include "stream-armor.h"
#include "defaults.h"
#include "logging.h"
#include "str-utils.h"

#define ARMOR_BEGIN_PREFIX "-----BEGIN PGP "
#define ARMOR_END_PREFIX "-----END PGP "
#define ARMOR_DASHES "-----"

static const id_str_pair armor_type_map[] = {
  {SEAL_ARMORED_MESSAGE, ARMOR_MESSAGE},
  {SEAL_ARMORED_PUBLIC_KEY, ARMOR_PUBLIC_KEY},
  {SEAL_ARMORED_SECRET_KEY, ARMOR_PRIVATE_KEY},
  {0, NULL},
};

namespace seal {

seal_armored_msg_t
ArmorBlock::msgtype() const
{
    /* labels are matched exactly */
    for (const id_str_pair *pair = armor_type_map; pair->str; pair++) {
        if (type == pair->str) {
            return (seal_armored_msg_t) pair->id;
        }
    }
    return SEAL_ARMORED_UNKNOWN;
}

const char *
armor_type_str(seal_armored_msg_t msgtype)
{
    return id_str_pair::lookup(armor_type_map, msgtype, NULL);
}

std::string
armor_encode(const std::string &type, const std::string &body)
{
    std::string res = ARMOR_BEGIN_PREFIX + type + ARMOR_DASHES "\n\n";
    for (size_t pos = 0; pos < body.size(); pos += ARMOR_LINE_LENGTH) {
        if (pos) {
            res.push_back('\n');
        }
        res.append(body, pos, ARMOR_LINE_LENGTH);
    }
    res.append("\n" ARMOR_END_PREFIX);
    res.append(type);
    res.append(ARMOR_DASHES);
    return res;
}

std::string
armor_encode(seal_armored_msg_t msgtype, const std::string &body)
{
    const char *type = armor_type_str(msgtype);
    if (!type) {
        SEAL_LOG("Unknown armor type: %d", (int) msgtype);
        throw seal_exception(SEAL_ERROR_BAD_PARAMETERS);
    }
    return armor_encode(type, body);
}

ArmorBlock
armor_decode(const std::string &text)
{
    auto   lines = split_lines(trim(text));
    size_t hdr = lines.size();
    for (size_t i = 0; i < lines.size(); i++) {
        if (starts_with(trim(lines[i]), ARMOR_BEGIN_PREFIX)) {
            hdr = i;
            break;
        }
    }
    if (hdr == lines.size()) {
        SEAL_LOG("Armor header not found");
        throw seal_exception(SEAL_ERROR_BAD_ARMOR, "Invalid ASCII armor format");
    }
    size_t ftr = lines.size();
    for (size_t i = hdr + 1; i < lines.size(); i++) {
        if (starts_with(trim(lines[i]), ARMOR_END_PREFIX)) {
            ftr = i;
            break;
        }
    }
    if (ftr == lines.size()) {
        SEAL_LOG("Armor footer not found");
        throw seal_exception(SEAL_ERROR_BAD_ARMOR, "Invalid ASCII armor format");
    }

    ArmorBlock  res;
    std::string header = trim(lines[hdr]);
    res.type = header.substr(strlen(ARMOR_BEGIN_PREFIX));
    if (ends_with(res.type, ARMOR_DASHES)) {
        res.type.resize(res.type.size() - strlen(ARMOR_DASHES));
    }
    for (size_t i = hdr + 1; i < ftr; i++) {
        res.body.append(trim(lines[i]));
    }
    return res;
}

} // namespace seal

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

#ifndef SEAL_STREAM_ARMOR_H_
#define SEAL_STREAM_ARMOR_H_

#include <string>
#include "types.h"

typedef enum {
    SEAL_ARMORED_UNKNOWN,
    SEAL_ARMORED_MESSAGE,
    SEAL_ARMORED_PUBLIC_KEY,
    SEAL_ARMORED_SECRET_KEY
} seal_armored_msg_t;

namespace seal {

/* Dearmored block: type label and joined base64 body */
struct ArmorBlock {
    std::string type;
    std::string body;

    seal_armored_msg_t msgtype() const;
};

/* @brief Armor the base64 text, splitting it into lines of 64 characters
 * @param type armor type label, like "MESSAGE"
 * @param body base64 text
 * @return armored text, without the trailing EOL
 **/
std::string armor_encode(const std::string &type, const std::string &body);
std::string armor_encode(seal_armored_msg_t msgtype, const std::string &body);

/* @brief Find the first armored block within the text
 * @param text armored text, may be surrounded by other lines
 * @return type and body of the block. Throws seal_exception(SEAL_ERROR_BAD_ARMOR) if
 *         header or footer line is missing.
 **/
ArmorBlock armor_decode(const std::string &text);

const char *armor_type_str(seal_armored_msg_t msgtype);

} // namespace seal

#endif

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

#ifndef SEAL_RANDOM_H_
#define SEAL_RANDOM_H_

#include <stdint.h>
#include <stdlib.h>
#include <vector>
#include "config.h"
#include "mem.h"

namespace seal {
/**
 * @brief Cryptographically secure random number generator, backed by the OpenSSL
 *        DRBG which is seeded from the system entropy source.
 */
class RNG {
  public:
    RNG();
    ~RNG();

    /**
     *  @brief  Used to retrieve random data.
     *
     *  @param data [out] output buffer of size at least `len`
     *  @param len number of bytes to get
     *  @throws seal_exception(SEAL_ERROR_RNG) on failure
     **/
    void get(uint8_t *data, size_t len);

    std::vector<uint8_t> bytes(size_t len);
    secure_bytes         secure(size_t len);
};
} // namespace seal

#endif // SEAL_RANDOM_H_

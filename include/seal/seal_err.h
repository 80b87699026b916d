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

#ifndef SEAL_ERR_H_
#define SEAL_ERR_H_

/**
 * Error code definitions
 */
enum {

    SEAL_SUCCESS = 0x00000000,

    /* Common error codes */
    SEAL_ERROR_GENERIC = 0x10000000, // 268435456
    SEAL_ERROR_BAD_FORMAT,           // 268435457
    SEAL_ERROR_BAD_PARAMETERS,       // 268435458
    SEAL_ERROR_NOT_IMPLEMENTED,      // 268435459
    SEAL_ERROR_NOT_SUPPORTED,        // 268435460
    SEAL_ERROR_OUT_OF_MEMORY,        // 268435461
    SEAL_ERROR_NULL_POINTER,         // 268435462

    /* Storage */
    SEAL_ERROR_ACCESS = 0x11000000, // 285212672
    SEAL_ERROR_READ,                // 285212673
    SEAL_ERROR_WRITE,               // 285212674
    SEAL_ERROR_LOCKED,              // 285212675
    SEAL_ERROR_NOT_INITIALIZED,     // 285212676

    /* Crypto */
    SEAL_ERROR_BAD_STATE = 0x12000000, // 301989888
    SEAL_ERROR_KEY_GENERATION,         // 301989889
    SEAL_ERROR_KEY_NOT_FOUND,          // 301989890
    SEAL_ERROR_DECRYPT_FAILED,         // 301989891
    SEAL_ERROR_ENCRYPT_FAILED,         // 301989892
    SEAL_ERROR_RNG,                    // 301989893
    SEAL_ERROR_CORRUPT_KEY,            // 301989894
    SEAL_ERROR_NO_RECIPIENTS,          // 301989895

    /* Parsing */
    SEAL_ERROR_BAD_ARMOR = 0x13000000, // 318767104
    SEAL_ERROR_BAD_MESSAGE,            // 318767105
};

#endif

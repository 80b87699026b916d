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

#ifndef DEFAULTS_H_
#define DEFAULTS_H_

/* PBKDF2-SHA256 iterations for every password-derived key */
#define DEFAULT_PBKDF2_ITERATIONS 100000

/* Size of the derived symmetric keys */
#define SEAL_SYMM_KEY_SIZE 32

/* Salt sizes: installation salt and per-key/per-backup salt */
#define SEAL_MASTER_SALT_SIZE 32
#define SEAL_SALT_SIZE 16

/* AES block and IV size */
#define SEAL_AES_BLOCK_SIZE 16

/* Default RSA key length */
#define DEFAULT_RSA_NUMBITS 2048
#define RSA_MIN_BITS 1024
#define RSA_MAX_BITS 16384

/* Public exponent for the generated keys */
#define RSA_PUBLIC_EXPONENT 65537

/* Number of random overwrite passes on secure delete */
#define SECURE_DELETE_PASSES 3

/* Base64 line length within the armor */
#define ARMOR_LINE_LENGTH 64

/* Record and envelope format versions */
#define SEAL_FILE_VERSION "2.1"
#define SEAL_ENVELOPE_VERSION "1.0"
#define SEAL_BACKUP_VERSION "1.0"

/* Files within the data directory */
#define SEAL_SALT_FILE ".encryption_salt"
#define SEAL_LOCK_FILE ".lock"
#define SEAL_PUBRING_FILE "public_keys.json"
#define SEAL_SECRING_FILE "private_keys.json"
#define SEAL_TMP_SUFFIX ".tmp"

/* Armor types */
#define ARMOR_PUBLIC_KEY "PUBLIC KEY BLOCK"
#define ARMOR_PRIVATE_KEY "PRIVATE KEY BLOCK"
#define ARMOR_MESSAGE "MESSAGE"

/* Key metadata values */
#define SEAL_KEY_ALGO "RSA"
#define SEAL_TRUST_ULTIMATE "ultimate"
#define SEAL_TRUST_UNKNOWN "unknown"
#define SEAL_IMPORTED_UID "Imported Key"

#endif

/*
 * Copyright (c) 2018, [Ribose Inc](https://www.ribose.com).
 * All rights reserved.
 *
 * Redistribution and use in source and binary forms, with or without modification,
 * are permitted provided that the following conditions are met:
 *
 * 1.  Redistributions of source code must retain the above copyright notice,
 *     this list of conditions and the following disclaimer.
 *
 * 2.  Redistributions in binary form must reproduce the above copyright notice,
 *     this list of conditions and the following disclaimer in the documentation
 *     and/or other materials provided with the distribution.
 *
 * THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS "AS IS" AND
 * ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE IMPLIED
 * WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE ARE
 * DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT OWNER OR CONTRIBUTORS BE LIABLE
 * FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR CONSEQUENTIAL
 * DAMAGES (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR
 * SERVICES; LOSS OF USE, DATA, OR PROFITS; OR BUSINESS INTERRUPTION) HOWEVER
 * CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY,
 * OR TORT (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE OF
 * THIS SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.
 */

#include <seal/seal.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>

#define EXAMPLE_HOME "seal-home"
#define EXAMPLE_MASTER "master password"

/* encrypt message for every public key stored in the data directory */

int
ffi_encrypt()
{
    seal_ffi_t   ffi = NULL;
    char *       json = NULL;
    char *       armored = NULL;
    const char **rcpts = NULL;
    size_t       count = 0;
    FILE *       out = NULL;
    int          result = 1;
    const char * message = "ATTENTION! This is a very important secret message.";
    char *       pos = NULL;

    if (seal_ffi_create(&ffi, EXAMPLE_HOME) != SEAL_SUCCESS) {
        return result;
    }
    if (seal_unlock(ffi, EXAMPLE_MASTER, NULL) != SEAL_SUCCESS) {
        fprintf(stdout, "wrong master password\n");
        goto finish;
    }

    /* key list is JSON array of key objects, collect fingerprints from it */
    if (seal_list_keys(ffi, false, &json) != SEAL_SUCCESS) {
        goto finish;
    }
    rcpts = (const char **) calloc(strlen(json), sizeof(*rcpts));
    if (!rcpts) {
        goto finish;
    }
    pos = json;
    while ((pos = strstr(pos, "\"fingerprint\":\""))) {
        pos += strlen("\"fingerprint\":\"");
        rcpts[count++] = pos;
        pos = strchr(pos, '"');
        if (!pos) {
            goto finish;
        }
        *pos++ = '\0';
    }
    if (!count) {
        fprintf(stdout, "no keys found. Did you run ./generate sample?\n");
        goto finish;
    }

    /* session key is encrypted for each of the recipients, message itself only once */
    if (seal_encrypt_message(ffi, message, rcpts, count, &armored) != SEAL_SUCCESS) {
        fprintf(stdout, "encryption failed\n");
        goto finish;
    }

    out = fopen("encrypted.asc", "w");
    if (!out) {
        fprintf(stdout, "failed to create encrypted.asc\n");
        goto finish;
    }
    fputs(armored, out);
    fclose(out);
    fprintf(stdout, "Encrypted message for %zu recipient(s):\n%s\n", count, armored);

    result = 0;
finish:
    free(rcpts);
    seal_buffer_destroy(json);
    seal_buffer_destroy(armored);
    seal_ffi_destroy(ffi);
    return result;
}

int
main(int argc, char **argv)
{
    return ffi_encrypt();
}

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

/* data directory shared by the examples */

#define EXAMPLE_HOME "seal-home"
#define EXAMPLE_MASTER "master password"

/* generate RSA key pair, stored within the encrypted key rings of the data directory, and
 * export its public part */
int
ffi_generate_keys()
{
    seal_ffi_t ffi = NULL;
    char *     fp = NULL;
    char *     armored = NULL;
    char *     json = NULL;
    FILE *     out = NULL;
    int        result = 1;

    /* initialize FFI object, it locks the data directory for exclusive use */
    if (seal_ffi_create(&ffi, EXAMPLE_HOME) != SEAL_SUCCESS) {
        fprintf(stdout, "failed to open data directory %s\n", EXAMPLE_HOME);
        return result;
    }

    /* open session: derive storage key from the master password */
    if (seal_unlock(ffi, EXAMPLE_MASTER, NULL) != SEAL_SUCCESS) {
        fprintf(stdout, "wrong master password\n");
        goto finish;
    }

    /* generate 2048-bit key, private part is protected with the passphrase */
    if (seal_generate_key(ffi, "Alice", "alice@example.com", "password", 0, &fp) !=
        SEAL_SUCCESS) {
        fprintf(stdout, "failed to generate key\n");
        goto finish;
    }
    fprintf(stdout, "Generated key %s\n", fp);

    /* print key properties */
    if (seal_get_key_info(ffi, fp, false, &json) != SEAL_SUCCESS) {
        goto finish;
    }
    fprintf(stdout, "%s\n", json);

    /* export public key, so it may be passed to correspondents */
    if (seal_export_public_key(ffi, fp, &armored) != SEAL_SUCCESS) {
        fprintf(stdout, "failed to export public key\n");
        goto finish;
    }
    out = fopen("alice-pub.asc", "w");
    if (!out) {
        fprintf(stdout, "failed to create alice-pub.asc\n");
        goto finish;
    }
    fputs(armored, out);
    fclose(out);

    result = 0;
finish:
    seal_buffer_destroy(fp);
    seal_buffer_destroy(armored);
    seal_buffer_destroy(json);
    seal_ffi_destroy(ffi);
    return result;
}

int
main(int argc, char **argv)
{
    return ffi_generate_keys();
}

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

static char *
read_file(const char *path)
{
    FILE *fp = fopen(path, "rb");
    char *buf = NULL;
    long  len = 0;
    if (!fp) {
        return NULL;
    }
    if (fseek(fp, 0, SEEK_END) || ((len = ftell(fp)) < 0) || fseek(fp, 0, SEEK_SET)) {
        fclose(fp);
        return NULL;
    }
    buf = (char *) calloc(1, len + 1);
    if (buf && (fread(buf, 1, len, fp) != (size_t) len)) {
        free(buf);
        buf = NULL;
    }
    fclose(fp);
    return buf;
}

/* decrypt message, trying each of the private keys with the passphrase */

int
ffi_decrypt(const char *passphrase)
{
    seal_ffi_t  ffi = NULL;
    char *      armored = NULL;
    char *      plaintext = NULL;
    const char *error = NULL;
    int         result = 1;

    if (seal_ffi_create(&ffi, EXAMPLE_HOME) != SEAL_SUCCESS) {
        return result;
    }
    if (seal_unlock(ffi, EXAMPLE_MASTER, NULL) != SEAL_SUCCESS) {
        fprintf(stdout, "wrong master password\n");
        goto finish;
    }

    armored = read_file("encrypted.asc");
    if (!armored) {
        fprintf(stdout, "failed to read encrypted.asc. Did you run ./encrypt sample?\n");
        goto finish;
    }

    if (seal_decrypt_message(ffi, armored, passphrase, &plaintext) != SEAL_SUCCESS) {
        /* error details contain number of the available private keys */
        seal_ffi_last_error(ffi, &error);
        fprintf(stdout, "decryption with '%s' failed: %s\n", passphrase, error);
        goto finish;
    }
    fprintf(stdout, "Decrypted message:\n%s\n", plaintext);

    result = 0;
finish:
    free(armored);
    if (plaintext) {
        seal_buffer_clear(plaintext, strlen(plaintext));
    }
    seal_buffer_destroy(plaintext);
    seal_ffi_destroy(ffi);
    return result;
}

int
main(int argc, char **argv)
{
    /* wrong passphrase is expected to fail */
    if (!ffi_decrypt("wrong password")) {
        return 1;
    }
    return ffi_decrypt("password");
}

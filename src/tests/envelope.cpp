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

#include "seal_tests.h"
#include "support.h"
#include "librekey/secure-storage.h"
#include "librekey/key_store.h"
#include "librepgp/envelope.h"
#include "librepgp/stream-armor.h"
#include "base64.h"
#include "str-utils.h"
#include "defaults.h"

using namespace seal;

static MessageEnvelope
parse_armored(const std::string &armored)
{
    ArmorBlock  block = armor_decode(armored);
    std::string text;
    EXPECT_TRUE(b64::decode(block.body, text));
    return MessageEnvelope::parse(text);
}

TEST_F(seal_tests, test_envelope_encrypt_decrypt)
{
    SecureStorage storage(home());
    storage.set_master_password("master");
    KeyStore    store(storage);
    std::string fp = store.generate_key("Alice", "a@x.com", "pw1", TEST_RSA_BITS);

    std::string armored = encrypt_message(store, "hi bob", {fp});
    assert_true(starts_with(armored, "-----BEGIN PGP MESSAGE-----"));
    assert_true(ends_with(armored, "-----END PGP MESSAGE-----"));

    KeySearchResult search;
    secure_bytes    pt = decrypt_message(store, armored, "pw1", &search);
    assert_true(to_string(pt) == "hi bob");
    assert_true(search.found);
    assert_true(search.fp == fp);
    assert_int_equal(search.available, 1);
    assert_int_equal(search.unlocked, 1);

    /* wrong passphrase: the only key can't be unlocked, so none is available */
    try {
        decrypt_message(store, armored, "wrong", &search);
        FAIL() << "decryption should fail";
    } catch (const seal_exception &e) {
        assert_int_equal(e.code(), SEAL_ERROR_DECRYPT_FAILED);
        assert_string_equal(e.what(),
                            "No private keys available for decryption (0 available, 1 stored)");
    }
    assert_int_equal(search.available, 1);
    assert_false(search.found);
    assert_int_equal(search.tried, 1);
    assert_int_equal(search.unlocked, 0);
    assert_int_equal(search.attempts.size(), 1);
    assert_false(search.attempts[0].unlocked);
    assert_true(search.attempts[0].error == "Wrong passphrase");

    /* no secret keys at all */
    store.delete_key(fp, true);
    try {
        decrypt_message(store, armored, "pw1", &search);
        FAIL() << "decryption should fail";
    } catch (const seal_exception &e) {
        assert_int_equal(e.code(), SEAL_ERROR_DECRYPT_FAILED);
        assert_string_equal(e.what(),
                            "No private keys available for decryption (0 available, 0 stored)");
    }
    assert_int_equal(search.available, 0);
    assert_int_equal(search.tried, 0);
}

TEST_F(seal_tests, test_envelope_format)
{
    SecureStorage storage(home());
    storage.set_master_password("master");
    KeyStore    store(storage);
    std::string fp = store.generate_key("Alice", "a@x.com", "pw1", TEST_RSA_BITS);

    std::string     armored = encrypt_message(store, "0123456789abcdef", {fp});
    ArmorBlock      block = armor_decode(armored);
    std::string     text;
    assert_true(b64::decode(block.body, text));
    JSONObject      obj = json::parse(text);
    assert_true(check_json_field_str(obj.get(), "version", SEAL_ENVELOPE_VERSION));
    json_object *keys = json_get_arr(obj.get(), "encrypted_keys");
    assert_non_null(keys);
    assert_int_equal(json_object_array_length(keys), 1);

    MessageEnvelope env = MessageEnvelope::parse(text);
    assert_int_equal(env.keys.size(), 1);
    assert_int_equal(env.keys[0].size(), TEST_RSA_BITS / 8);
    assert_int_equal(env.iv.size(), SEAL_AES_BLOCK_SIZE);
    /* 16 bytes of plaintext plus full padding block */
    assert_int_equal(env.body.size(), 32);

    /* serialization keeps the fields */
    MessageEnvelope copy = MessageEnvelope::parse(env.serialize());
    assert_true(copy.keys == env.keys);
    assert_true(copy.iv == env.iv);
    assert_true(copy.body == env.body);
}

TEST_F(seal_tests, test_envelope_multiple_recipients)
{
    SecureStorage storage(home());
    storage.set_master_password("master");
    KeyStore    store(storage);
    std::string fpa = store.generate_key("Alice", "alice@example.com", "pwa", TEST_RSA_BITS);
    std::string fpb = store.generate_key("Bob", "bob@example.com", "pwb", TEST_RSA_BITS);
    std::string plaintext = "Meeting at noon.\nBring the documents.";

    std::string     armored = encrypt_message(store, plaintext, {fpa, fpb});
    MessageEnvelope env = parse_armored(armored);
    assert_int_equal(env.keys.size(), 2);
    /* body is encrypted once, the same length as for the single recipient */
    MessageEnvelope single = parse_armored(encrypt_message(store, plaintext, {fpb}));
    assert_int_equal(single.body.size(), env.body.size());

    /* Bob decrypts with his passphrase, Alice's key is tried first and fails to unlock */
    KeySearchResult search;
    secure_bytes    pt = decrypt_message(store, armored, "pwb", &search);
    assert_true(to_string(pt) == plaintext);
    assert_true(search.fp == fpb);
    assert_int_equal(search.tried, 2);
    assert_int_equal(search.attempts.size(), 2);
    assert_false(search.attempts[0].unlocked);
    assert_true(search.attempts[1].unlocked);

    /* only Bob's private key is present */
    store.delete_key(fpa, true);
    pt = decrypt_message(store, armored, "pwb");
    assert_true(to_string(pt) == plaintext);

    /* key which is not a recipient */
    std::string fpc = store.generate_key("Carol", "carol@example.com", "pwc", TEST_RSA_BITS);
    store.delete_key(fpb, true);
    try {
        decrypt_message(store, armored, "pwc", &search);
        FAIL() << "decryption should fail";
    } catch (const seal_exception &e) {
        assert_int_equal(e.code(), SEAL_ERROR_DECRYPT_FAILED);
        /* key is available, but doesn't match any of the recipients */
        assert_string_equal(
          e.what(), "Could not decrypt message with any of the 1 available private keys");
    }
    assert_int_equal(search.unlocked, 1);
    assert_true(search.attempts[0].fp == fpc);
    assert_true(search.attempts[0].error == "No matching encrypted key");
}

TEST_F(seal_tests, test_envelope_special_payloads)
{
    SecureStorage storage(home());
    storage.set_master_password("master");
    KeyStore    store(storage);
    std::string fp = store.generate_key("Alice", "a@x.com", "pw1", TEST_RSA_BITS);

    std::string empty = encrypt_message(store, "", {fp});
    assert_int_equal(decrypt_message(store, empty, "pw1").size(), 0);

    std::string utf8 = "\xD0\x9F\xD1\x80\xD0\xB8\xD0\xB2\xD0\xB5\xD1\x82 \xF0\x9F\x94\x90";
    assert_true(to_string(decrypt_message(store, encrypt_message(store, utf8, {fp}), "pw1")) ==
                utf8);

    std::string large(100000, 'z');
    assert_true(
      to_string(decrypt_message(store, encrypt_message(store, large, {fp}), "pw1")) == large);

    /* armored message surrounded by other text */
    std::string armored = "Message follows:\n" + encrypt_message(store, "text", {fp}) + "\n";
    assert_true(to_string(decrypt_message(store, armored, "pw1")) == "text");
}

TEST_F(seal_tests, test_envelope_errors)
{
    SecureStorage storage(home());
    storage.set_master_password("master");
    KeyStore    store(storage);
    std::string fp = store.generate_key("Alice", "a@x.com", "pw1", TEST_RSA_BITS);

    assert_seal_throw(encrypt_message(store, "text", {}), SEAL_ERROR_NO_RECIPIENTS);
    std::string missing = std::string(40, 'A');
    try {
        encrypt_message(store, "text", {fp, missing});
        FAIL() << "encryption should fail";
    } catch (const seal_exception &e) {
        assert_int_equal(e.code(), SEAL_ERROR_KEY_NOT_FOUND);
        assert_true(e.detail() == "Public key not found for " + missing);
    }

    /* armor errors */
    assert_seal_throw(decrypt_message(store, "plain text", "pw1"), SEAL_ERROR_BAD_ARMOR);
    std::string pubkey = store.export_public_key(fp);
    assert_seal_throw(decrypt_message(store, pubkey, "pw1"), SEAL_ERROR_BAD_MESSAGE);
    /* envelope errors */
    std::string bad = armor_encode(SEAL_ARMORED_MESSAGE, "!!!!");
    assert_seal_throw(decrypt_message(store, bad, "pw1"), SEAL_ERROR_BAD_MESSAGE);
    bad = armor_encode(SEAL_ARMORED_MESSAGE, b64::encode(std::string("not json")));
    assert_seal_throw(decrypt_message(store, bad, "pw1"), SEAL_ERROR_BAD_MESSAGE);
    bad = armor_encode(SEAL_ARMORED_MESSAGE, b64::encode(std::string("{\"iv\":\"AAAA\"}")));
    assert_seal_throw(decrypt_message(store, bad, "pw1"), SEAL_ERROR_BAD_MESSAGE);

    assert_seal_throw(MessageEnvelope::parse("[]"), SEAL_ERROR_BAD_MESSAGE);
    assert_seal_throw(
      MessageEnvelope::parse(
        "{\"encrypted_keys\":[],\"iv\":\"AAAA\",\"encrypted_message\":\"AAAA\"}"),
      SEAL_ERROR_BAD_MESSAGE);
    assert_seal_throw(
      MessageEnvelope::parse(
        "{\"encrypted_keys\":[1],\"iv\":\"AAAAAAAAAAAAAAAAAAAAAA==\",\"encrypted_message\":\"\"}"),
      SEAL_ERROR_BAD_MESSAGE);
    /* unknown version is accepted */
    MessageEnvelope env = MessageEnvelope::parse(
      "{\"version\":\"9.9\",\"encrypted_keys\":[],\"iv\":\"AAAAAAAAAAAAAAAAAAAAAA==\","
      "\"encrypted_message\":\"\"}");
    assert_int_equal(env.keys.size(), 0);
    assert_int_equal(env.iv.size(), 16);

    /* tampered body */
    MessageEnvelope good = parse_armored(encrypt_message(store, "secret text", {fp}));
    good.body[good.body.size() - 1] ^= 0xff;
    std::string tampered = armor_encode(SEAL_ARMORED_MESSAGE, b64::encode(good.serialize()));
    try {
        secure_bytes res = decrypt_message(store, tampered, "pw1");
        assert_false(to_string(res) == "secret text");
    } catch (const seal_exception &e) {
        assert_int_equal(e.code(), SEAL_ERROR_DECRYPT_FAILED);
    }
}

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

#ifndef CRYPTO_MEM_H_
#define CRYPTO_MEM_H_

#include "config.h"
#include <vector>
#include <string>
#include <cstdlib>
#include <new>
#include <type_traits>
#include <openssl/crypto.h>

namespace seal {

template <typename T> class ossl_allocator {
  public:
    static_assert(std::is_integral<T>::value, "secure_vector can hold integral types only");

    typedef T           value_type;
    typedef std::size_t size_type;

    ossl_allocator() noexcept = default;
    ossl_allocator(const ossl_allocator &) noexcept = default;
    ossl_allocator &operator=(const ossl_allocator &) noexcept = default;
    ~ossl_allocator() noexcept = default;

    template <typename U> ossl_allocator(const ossl_allocator<U> &) noexcept
    {
    }

    T *
    allocate(std::size_t n)
    {
        if (!n) {
            return nullptr;
        }

        /* attempt to use OpenSSL secure alloc */
        T *ptr = static_cast<T *>(OPENSSL_secure_zalloc(n * sizeof(T)));
        if (ptr) {
            return ptr;
        }
        /* fallback to std::alloc if failed */
        ptr = static_cast<T *>(std::calloc(n, sizeof(T)));
        if (!ptr)
            throw std::bad_alloc();
        return ptr;
    }

    void
    deallocate(T *p, std::size_t n)
    {
        if (!p) {
            return;
        }
        if (CRYPTO_secure_allocated(p)) {
            OPENSSL_secure_clear_free(p, n * sizeof(T));
            return;
        }
        OPENSSL_cleanse(p, n * sizeof(T));
        std::free(p);
    }
};

template <typename T, typename U>
bool
operator==(const ossl_allocator<T> &, const ossl_allocator<U> &) noexcept
{
    return true;
}

template <typename T, typename U>
bool
operator!=(const ossl_allocator<T> &, const ossl_allocator<U> &) noexcept
{
    return false;
}

template <typename T> using secure_vector = std::vector<T, ossl_allocator<T> >;

using secure_bytes = secure_vector<uint8_t>;

enum class HexFormat { Lowercase, Uppercase };

bool hex_encode(const uint8_t *buf,
                size_t         buf_len,
                char *         hex,
                size_t         hex_len,
                HexFormat      format = HexFormat::Uppercase);

inline std::string
bin_to_hex(const uint8_t *data, size_t len, HexFormat format = HexFormat::Uppercase)
{
    std::string res(len * 2 + 1, '\0');
    (void) hex_encode(data, len, &res.front(), res.size(), format);
    res.resize(len * 2);
    return res;
}

template <typename T>
inline std::string
bin_to_hex(const T &vec, HexFormat format = HexFormat::Uppercase)
{
    return bin_to_hex(vec.data(), vec.size(), format);
}

/**
 * @brief Decode hex string into the buffer. Whitespaces are skipped.
 *
 * @return number of decoded bytes, or 0 on error or buffer overflow.
 */
size_t hex_decode(const char *hex, uint8_t *buf, size_t buf_len);

/* Constant-time comparison of two buffers of the same length */
bool const_time_eq(const uint8_t *a, const uint8_t *b, size_t len);

/* Convert between secure and plain containers */
inline secure_bytes
to_secure(const std::string &str)
{
    return secure_bytes(str.begin(), str.end());
}

inline std::string
to_string(const secure_bytes &buf)
{
    return std::string(buf.begin(), buf.end());
}

} // namespace seal

void secure_clear(void *vp, size_t size);

#endif // CRYPTO_MEM_H_

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

#include <unistd.h>
#include <limits.h>
#include "gtest/gtest.h"
#include "seal_tests.h"
#include "support.h"
#include "file-utils.h"

static char original_dir[PATH_MAX];

seal_tests::seal_tests() : m_dir(make_temp_dir())
{
    EXPECT_NE(nullptr, m_dir);
    EXPECT_EQ(0, setenv("HOME", m_dir, 1));
    EXPECT_EQ(0, chdir(m_dir));
}

seal_tests::~seal_tests()
{
    EXPECT_EQ(0, chdir(::original_dir));
    clean_temp_dir(m_dir);
    free(m_dir);
}

const char *
seal_tests::original_dir() const
{
    return ::original_dir;
}

std::string
seal_tests::home() const
{
    return seal::path::append(m_dir, ".seal");
}

int
main(int argc, char *argv[])
{
    EXPECT_NE(nullptr, getcwd(original_dir, sizeof(original_dir)));
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}

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

#include <algorithm>
#include "seal_tests.h"
#include "support.h"
#include "file-utils.h"
#include "defaults.h"
#include "types.h"

using namespace seal;

TEST_F(seal_tests, test_path_utils)
{
    assert_true(path::append("dir", "file.json") == "dir/file.json");
    assert_true(path::append("dir/", "file.json") == "dir/file.json");
    assert_true(path::append("", "file.json") == "file.json");
    assert_true(path::extension("dir/file.json") == ".json");
    assert_true(path::extension("dir.d/file") == "");
    assert_true(path::extension("file.tar.gz") == ".gz");

    assert_true(path::mkdirs("a/b/c"));
    assert_true(path::exists("a/b/c", true));
    assert_false(path::exists("a/b/c"));
    assert_true(path::empty("a/b/c"));
    /* existing directory is fine */
    assert_true(path::mkdirs("a/b"));
    assert_false(path::empty("a/b"));
    assert_true(path::rmdirs("a"));
    assert_false(path::exists("a", true));
}

TEST_F(seal_tests, test_list_files)
{
    assert_true(path::mkdirs("home/sub"));
    str_to_file("home/one.json", "{}");
    str_to_file("home/sub/two.json", "{}");
    str_to_file("home/.hidden", "x");
    auto files = path::list_files("home", true);
    std::sort(files.begin(), files.end());
    assert_int_equal(files.size(), 2);
    assert_true(files[0] == "one.json");
    assert_true(files[1] == "sub/two.json");
    files = path::list_files("home", false);
    assert_int_equal(files.size(), 3);
    /* directory with files can't be removed */
    assert_false(path::rmdirs("home"));
    assert_true(path::exists("home/one.json"));
}

TEST_F(seal_tests, test_file_read_write)
{
    file::write_atomic("data.txt", "contents");
    assert_true(file_to_str("data.txt") == "contents");
    assert_false(path::exists(std::string("data.txt") + SEAL_TMP_SUFFIX));
    assert_true(file::read("data.txt") == "contents");
    /* overwrite */
    file::write_atomic("data.txt", "new");
    assert_true(file::read("data.txt") == "new");
    assert_int_equal(file_size("data.txt"), 3);

    std::string tmp = file::write_tmp("data.txt", "staged");
    assert_true(file::read("data.txt") == "new");
    assert_true(file::read(tmp) == "staged");
    assert_int_equal(seal_unlink(tmp.c_str()), 0);

    assert_seal_throw(file::read("missing.txt"), SEAL_ERROR_READ);
    assert_seal_throw(file::write_atomic("missing/dir/data.txt", "x"), SEAL_ERROR_WRITE);
}

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

/** File utilities
 *  @file
 */

#include "file-utils.h"
#include "config.h"
#include <unistd.h>
#include <sys/types.h>
#include <sys/stat.h>
#include <fcntl.h>
#include <errno.h>
#include <string.h>
#include <algorithm>
#include "str-utils.h"
#include "types.h"
#include "logging.h"
#include "defaults.h"

int
seal_unlink(const char *filename)
{
    return unlink(filename);
}

int
seal_rmdir(const char *path)
{
    return rmdir(path);
}

bool
seal_file_exists(const char *path)
{
    struct stat st;
    return seal_stat(path, &st) == 0 && S_ISREG(st.st_mode);
}

bool
seal_dir_exists(const char *path)
{
    struct stat st;
    return seal_stat(path, &st) == 0 && S_ISDIR(st.st_mode);
}

int64_t
seal_filesize(const char *path)
{
    struct stat st;
    if (seal_stat(path, &st) != 0) {
        return -1;
    }
    return st.st_size;
}

int
seal_open(const char *filename, int oflag, int pmode)
{
    return open(filename, oflag, pmode);
}

FILE *
seal_fopen(const char *filename, const char *mode)
{
    return fopen(filename, mode);
}

FILE *
seal_fdopen(int fildes, const char *mode)
{
    return fdopen(fildes, mode);
}

int
seal_stat(const char *filename, struct stat *statbuf)
{
    return stat(filename, statbuf);
}

int
seal_rename(const char *oldpath, const char *newpath)
{
    return rename(oldpath, newpath);
}

DIR *
seal_opendir(const char *path)
{
    return opendir(path);
}

std::string
seal_readdir_name(DIR *dir)
{
    dirent *ent;
    for (;;) {
        if ((ent = readdir(dir)) == NULL) {
            return std::string();
        }
        if (strcmp(ent->d_name, ".") && strcmp(ent->d_name, "..")) {
            break;
        }
    }
    return std::string(ent->d_name);
}

namespace seal {
namespace path {
bool
exists(const std::string &path, bool is_dir)
{
    return is_dir ? seal_dir_exists(path.c_str()) : seal_file_exists(path.c_str());
}

bool
empty(const std::string &path)
{
    auto dir = seal_opendir(path.c_str());
    if (!dir) {
        return true;
    }
    bool empty = seal_readdir_name(dir).empty();
    seal_closedir(dir);
    return empty;
}

std::string
append(const std::string &path, const std::string &name)
{
    bool no_sep = path.empty() || name.empty() || (seal::is_slash(path.back())) ||
                  (seal::is_slash(name.front()));
    if (no_sep) {
        return path + name;
    }
    return path + '/' + name;
}

bool
mkdirs(const std::string &path, mode_t mode)
{
    if (path.empty() || exists(path, true)) {
        return true;
    }
    size_t pos = path.find_last_of('/');
    if ((pos != std::string::npos) && pos && !mkdirs(path.substr(0, pos), mode)) {
        return false;
    }
    if (SEAL_MKDIR(path.c_str(), mode) && (errno != EEXIST)) {
        SEAL_LOG("mkdir(%s): %s", path.c_str(), strerror(errno));
        return false;
    }
    return true;
}

std::string
extension(const std::string &path)
{
    size_t dot = path.find_last_of('.');
    size_t slash = path.find_last_of('/');
    if ((dot == std::string::npos) || ((slash != std::string::npos) && (slash > dot))) {
        return "";
    }
    return path.substr(dot);
}

static void
list_files_impl(const std::string &       root,
                const std::string &       rel,
                bool                      skip_hidden,
                std::vector<std::string> &res)
{
    auto dir = seal_opendir(append(root, rel).c_str());
    if (!dir) {
        SEAL_LOG("Can't open directory %s: %s", append(root, rel).c_str(), strerror(errno));
        return;
    }
    std::string name;
    while (!((name = seal_readdir_name(dir)).empty())) {
        if (skip_hidden && (name[0] == '.')) {
            continue;
        }
        std::string relname = append(rel, name);
        std::string fullname = append(root, relname);
        if (seal_dir_exists(fullname.c_str())) {
            list_files_impl(root, relname, skip_hidden, res);
            continue;
        }
        if (seal_file_exists(fullname.c_str())) {
            res.push_back(relname);
        }
    }
    seal_closedir(dir);
}

std::vector<std::string>
list_files(const std::string &path, bool skip_hidden)
{
    std::vector<std::string> res;
    list_files_impl(path, "", skip_hidden, res);
    return res;
}

bool
rmdirs(const std::string &path)
{
    auto dir = seal_opendir(path.c_str());
    if (!dir) {
        SEAL_LOG("Can't open directory %s: %s", path.c_str(), strerror(errno));
        return false;
    }
    bool        res = true;
    std::string name;
    while (!((name = seal_readdir_name(dir)).empty())) {
        std::string fullname = append(path, name);
        if (seal_dir_exists(fullname.c_str())) {
            res = rmdirs(fullname) && res;
        }
    }
    seal_closedir(dir);
    if (seal_rmdir(path.c_str())) {
        SEAL_LOG("rmdir(%s): %s", path.c_str(), strerror(errno));
        return false;
    }
    return res;
}
} // namespace path

namespace file {
std::string
read(const std::string &path)
{
    FILE *fp = seal_fopen(path.c_str(), "rb");
    if (!fp) {
        SEAL_LOG("Failed to open %s: %s", path.c_str(), strerror(errno));
        throw seal_exception(SEAL_ERROR_READ, "Failed to open file " + path);
    }
    std::string res;
    char        buf[4096];
    size_t      len = 0;
    while ((len = fread(buf, 1, sizeof(buf), fp)) > 0) {
        res.append(buf, len);
    }
    bool failed = ferror(fp);
    fclose(fp);
    if (failed) {
        throw seal_exception(SEAL_ERROR_READ, "Failed to read file " + path);
    }
    return res;
}

std::string
write_tmp(const std::string &path, const std::string &contents)
{
    std::string tmp = path + SEAL_TMP_SUFFIX;
    int         fd = seal_open(tmp.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0600);
    if (fd < 0) {
        SEAL_LOG("Failed to create %s: %s", tmp.c_str(), strerror(errno));
        throw seal_exception(SEAL_ERROR_WRITE, "Failed to create file " + tmp);
    }
    size_t written = 0;
    while (written < contents.size()) {
        ssize_t res = write(fd, contents.data() + written, contents.size() - written);
        if (res < 0) {
            if (errno == EINTR) {
                continue;
            }
            SEAL_LOG("Failed to write %s: %s", tmp.c_str(), strerror(errno));
            close(fd);
            seal_unlink(tmp.c_str());
            throw seal_exception(SEAL_ERROR_WRITE, "Failed to write file " + tmp);
        }
        written += res;
    }
    bool synced = !fsync(fd);
    if (close(fd) || !synced) {
        SEAL_LOG("Failed to sync %s: %s", tmp.c_str(), strerror(errno));
        seal_unlink(tmp.c_str());
        throw seal_exception(SEAL_ERROR_WRITE, "Failed to sync file " + tmp);
    }
    return tmp;
}

void
write_atomic(const std::string &path, const std::string &contents)
{
    auto tmp = write_tmp(path, contents);
    if (seal_rename(tmp.c_str(), path.c_str())) {
        SEAL_LOG("Failed to rename %s: %s", tmp.c_str(), strerror(errno));
        seal_unlink(tmp.c_str());
        throw seal_exception(SEAL_ERROR_WRITE, "Failed to replace file " + path);
    }
}
} // namespace file
} // namespace seal

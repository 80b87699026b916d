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

#ifndef SEAL_FILE_UTILS_H_
#define SEAL_FILE_UTILS_H_

#include <stdint.h>
#include <stdio.h>
#include <dirent.h>
#include <sys/stat.h>
#include <string>
#include <vector>

bool    seal_file_exists(const char *path);
bool    seal_dir_exists(const char *path);
int64_t seal_filesize(const char *path);
int     seal_open(const char *filename, int oflag, int pmode);
FILE *  seal_fopen(const char *filename, const char *mode);
FILE *  seal_fdopen(int fildes, const char *mode);
int     seal_stat(const char *filename, struct stat *statbuf);
int     seal_rename(const char *oldpath, const char *newpath);
int     seal_unlink(const char *path);
int     seal_rmdir(const char *path);

#define seal_closedir closedir
DIR *       seal_opendir(const char *path);
std::string seal_readdir_name(DIR *dir);
#define SEAL_MKDIR(pathname, mode) mkdir(pathname, mode)

namespace seal {
namespace path {
bool        exists(const std::string &path, bool is_dir = false);
bool        empty(const std::string &path);
std::string append(const std::string &path, const std::string &name);
/* create directory with all missing parents */
bool mkdirs(const std::string &path, mode_t mode = S_IRWXU);
/* extension of the file name including dot, or empty string */
std::string extension(const std::string &path);
/**
 * @brief List regular files below the directory, recursively.
 *
 * @param path directory path
 * @param skip_hidden do not descend into and do not return entries starting with '.'
 * @return relative paths of the found files, in directory traversal order.
 */
std::vector<std::string> list_files(const std::string &path, bool skip_hidden);
/* remove directory with all of its subdirectories, which must not contain files */
bool rmdirs(const std::string &path);
} // namespace path

namespace file {
/* read whole file into the string, throws seal_exception on error */
std::string read(const std::string &path);
/**
 * @brief Write contents to the temporary file near the destination and fsync it.
 *
 * @param path destination path, temporary file is named path + ".tmp"
 * @return temporary file path
 */
std::string write_tmp(const std::string &path, const std::string &contents);
/* write contents via temporary file and rename it over the destination */
void write_atomic(const std::string &path, const std::string &contents);
} // namespace file
} // namespace seal

#endif

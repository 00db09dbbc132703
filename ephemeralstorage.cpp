// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Jussi Pakkanen

#include <ephemeralstorage.hpp>
#include <reporterror.hpp>
#include <utils.hpp>

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <cstdlib>
#include <vector>

#include <unistd.h>

ScopedTempFile::~ScopedTempFile() { remove(); }

ScopedTempFile &ScopedTempFile::operator=(ScopedTempFile &&o) noexcept {
    if(this != &o) {
        remove();
        fpath = std::move(o.fpath);
        o.fpath.clear();
    }
    return *this;
}

void ScopedTempFile::write(std::string_view contents) const {
    try {
        write_file(fpath, contents);
    } catch(const std::runtime_error &e) {
        throw StorageError(e.what());
    }
}

std::string ScopedTempFile::read() const {
    try {
        return read_file(fpath);
    } catch(const std::exception &e) {
        throw StorageError("Could not read " + fpath.string() + ": " + e.what());
    }
}

void ScopedTempFile::remove() {
    if(fpath.empty()) {
        return;
    }
    std::error_code ec;
    std::filesystem::remove(fpath, ec);
    if(ec) {
        fprintf(stderr, "Could not delete %s: %s\n", fpath.c_str(), ec.message().c_str());
    }
    fpath.clear();
}

EphemeralStorage::EphemeralStorage(const std::filesystem::path &dir_) : dir{dir_} {
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if(ec) {
        throw StorageError("Could not create storage directory " + dir.string() + ": " +
                           ec.message());
    }
}

ScopedTempFile EphemeralStorage::create(const std::string &prefix, const std::string &suffix) {
    const auto templ = (dir / (prefix + "XXXXXX" + suffix)).string();
    std::vector<char> buf(templ.begin(), templ.end());
    buf.push_back('\0');
    const int fd = mkstemps(buf.data(), (int)suffix.size());
    if(fd < 0) {
        throw StorageError("Could not create temporary file in " + dir.string() + ": " +
                           strerror(errno));
    }
    close(fd);
    return ScopedTempFile(std::filesystem::path(buf.data()));
}

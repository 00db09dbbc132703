// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Jussi Pakkanen

#pragma once

#include <filesystem>
#include <string>
#include <string_view>

// A file that is removed when this object goes out of scope, whether
// the work using it succeeded or not.
class ScopedTempFile {
public:
    ScopedTempFile() = default;
    explicit ScopedTempFile(std::filesystem::path p) : fpath{std::move(p)} {}
    ~ScopedTempFile();

    ScopedTempFile(const ScopedTempFile &) = delete;
    ScopedTempFile &operator=(const ScopedTempFile &) = delete;

    ScopedTempFile(ScopedTempFile &&o) noexcept : fpath{std::move(o.fpath)} { o.fpath.clear(); }
    ScopedTempFile &operator=(ScopedTempFile &&o) noexcept;

    const std::filesystem::path &path() const { return fpath; }

    void write(std::string_view contents) const;
    std::string read() const;

    // Removes the file now instead of at destruction.
    void remove();

private:
    std::filesystem::path fpath;
};

// Scratch directory shared by concurrent report generations. Names are
// made unique by mkstemps so no locking is needed.
class EphemeralStorage {
public:
    explicit EphemeralStorage(const std::filesystem::path &dir);

    ScopedTempFile create(const std::string &prefix, const std::string &suffix);

    const std::filesystem::path &directory() const { return dir; }

private:
    std::filesystem::path dir;
};

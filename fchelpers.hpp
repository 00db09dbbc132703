// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Jussi Pakkanen

#pragma once

#include <filesystem>
#include <optional>
#include <string>

// Asks fontconfig for the file that best matches the family name.
// Only scalable fonts are accepted since the PDF embeds the outlines.
std::optional<std::filesystem::path> find_font_file(const std::string &family);

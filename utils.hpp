/*
 * Copyright 2022 Jussi Pakkanen
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <cstdint>
#include <chrono>
#include <filesystem>

std::vector<std::string> split_to_words(std::string_view in_text);

// Unlike paragraph splitting, empty lines are kept because they carry
// vertical spacing.
std::vector<std::string> split_to_lines(const std::string &in_text);

bool is_blank(std::string_view text);

class MMapper {
public:
    explicit MMapper(const char *path);
    ~MMapper();

    MMapper(const MMapper &) = delete;
    MMapper &operator=(const MMapper &) = delete;

    const char *data() const { return buf; }
    int64_t size() const { return bufsize; }

    std::string_view view() const { return std::string_view(buf, bufsize); }

private:
    const char *buf = nullptr;
    int64_t bufsize = 0;
};

std::string read_file(const std::filesystem::path &p);

void write_file(const std::filesystem::path &p, std::string_view contents);

std::string current_date();

std::string report_filename(std::chrono::system_clock::time_point t);

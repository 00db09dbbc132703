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

#include <utils.hpp>
#include <sstream>
#include <fstream>
#include <stdexcept>

#include <sys/mman.h>
#include <unistd.h>
#include <fcntl.h>
#include <time.h>

std::vector<std::string> split_to_lines(const std::string &in_text) {
    std::vector<std::string> lines;
    std::string val;
    const char separator = '\n';
    std::stringstream sstream(in_text);
    while(std::getline(sstream, val, separator)) {
        if(!val.empty() && val.back() == '\r') {
            val.pop_back();
        }
        while(!val.empty() && val.back() == ' ') {
            val.pop_back();
        }
        lines.emplace_back(std::move(val));
    }
    return lines;
}

std::vector<std::string> split_to_words(std::string_view in_text) {
    std::string text;
    text.reserve(in_text.size());
    for(size_t i = 0; i < in_text.size(); ++i) {
        if(in_text[i] == '\n' || in_text[i] == '\t' || in_text[i] == '\r') {
            text.push_back(' ');
        } else {
            text.push_back(in_text[i]);
        }
    }
    std::string val;
    const char separator = ' ';
    std::vector<std::string> words;
    std::stringstream sstream(text);
    while(std::getline(sstream, val, separator)) {
        if(!val.empty()) {
            words.push_back(val);
        }
    }
    return words;
}

bool is_blank(std::string_view text) {
    for(const char c : text) {
        if(c != ' ' && c != '\n' && c != '\r' && c != '\t') {
            return false;
        }
    }
    return true;
}

MMapper::MMapper(const char *path) {
    bufsize = std::filesystem::file_size(path);
    if(bufsize == 0) {
        buf = "";
        return;
    }
    int fd = open(path, O_RDONLY);
    if(fd < 0) {
        throw std::runtime_error(std::string("Could not open file ") + path);
    }
    void *mapping = mmap(nullptr, bufsize, PROT_READ, MAP_PRIVATE, fd, 0);
    close(fd);
    if(mapping == MAP_FAILED) {
        throw std::runtime_error(std::string("Could not mmap file ") + path);
    }
    buf = static_cast<const char *>(mapping);
}

MMapper::~MMapper() {
    if(bufsize > 0) {
        munmap((void *)(buf), bufsize);
    }
}

std::string read_file(const std::filesystem::path &p) {
    MMapper map(p.c_str());
    return std::string(map.view());
}

void write_file(const std::filesystem::path &p, std::string_view contents) {
    std::ofstream ofile(p, std::ios::binary | std::ios::trunc);
    if(ofile.fail()) {
        throw std::runtime_error("Could not open " + p.string() + " for writing.");
    }
    ofile.write(contents.data(), contents.size());
    ofile.close();
    if(ofile.fail()) {
        throw std::runtime_error("Writing to " + p.string() + " failed.");
    }
}

std::string current_date() {
    char buf[200];
    time_t t;
    struct tm tmp;
    t = time(NULL);
    if(localtime_r(&t, &tmp) == NULL) {
        throw std::runtime_error("Could not determine local time.");
    }

    if(strftime(buf, 200, "%Y-%m-%d", &tmp) == 0) {
        throw std::runtime_error("Could not format date.");
    }
    return std::string{buf};
}

std::string report_filename(std::chrono::system_clock::time_point t) {
    const auto millis =
        std::chrono::duration_cast<std::chrono::milliseconds>(t.time_since_epoch()).count();
    std::string fname{"plant_analysis_report_"};
    fname += std::to_string(millis);
    fname += ".pdf";
    return fname;
}

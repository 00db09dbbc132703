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

#include <compare>

inline double mm2pt(const double x) { return x * 2.8346456693; }
inline double pt2mm(const double x) { return x / 2.8346456693; }

// PDF user space is in points, so that is what gets stored. Integer
// point values stay exact through addition and subtraction, which the
// page break arithmetic relies on.
class Length {
private:
    explicit Length(double d) : v_pt(d) {};

public:
    double v_pt = 0.0;

    static Length from_pt(double val) { return Length(val); }
    static Length from_mm(double val) { return Length(mm2pt(val)); }

    Length() : v_pt(0.0) {}
    Length(const Length &d) : v_pt(d.v_pt) {};

    static Length zero() { return Length{0.0}; }

    Length operator-() const { return Length{-v_pt}; }

    Length &operator=(const Length &p) {
        v_pt = p.v_pt;
        return *this;
    }

    Length &operator+=(const Length &p) {
        v_pt += p.v_pt;
        return *this;
    }

    Length operator+(const Length &o) const { return Length{v_pt + o.v_pt}; }

    Length operator-(const Length &o) const { return Length{v_pt - o.v_pt}; }

    Length operator*(const double o) const { return Length{v_pt * o}; }

    Length operator/(const double o) const { return Length{v_pt / o}; }

    double operator/(const Length &o) const { return v_pt / o.v_pt; }

    Length &operator-=(const Length &o) {
        v_pt -= o.v_pt;
        return *this;
    }

    bool operator==(const Length &o) const { return v_pt == o.v_pt; }
    std::partial_ordering operator<=>(const Length &o) const { return v_pt <=> o.v_pt; }

    double pt() const { return v_pt; }
    double mm() const { return pt2mm(v_pt); }
};

inline Length operator*(const double d, const Length l) { return l * d; }

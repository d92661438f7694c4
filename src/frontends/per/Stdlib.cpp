//===----------------------------------------------------------------------===//
//
// Part of the Perc project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Stdlib.cpp
/// @brief Embedded sources of the `math` and `string` modules.
///
/// @details Library functions cannot call their siblings by bare name, so
/// each function here is self-contained.
///
//===----------------------------------------------------------------------===//

#include "frontends/per/Stdlib.hpp"

#include <array>

namespace perc::frontends::per
{

namespace
{

constexpr std::string_view kMathSource = R"PER(package math

pub fn Abs(x: i64) -> i64 {
    if x < 0 {
        return -x
    }
    return x
}

pub fn Min(a: i64, b: i64) -> i64 {
    if a < b {
        return a
    }
    return b
}

pub fn Max(a: i64, b: i64) -> i64 {
    if a > b {
        return a
    }
    return b
}

pub fn Pow(base: i64, exp: i64) -> i64 {
    var result: i64 = 1
    for var i: i64 = 0; i < exp; i = i + 1 {
        result = result * base
    }
    return result
}

pub fn Sign(x: i64) -> i64 {
    if x < 0 {
        return -1
    }
    if x > 0 {
        return 1
    }
    return 0
}

pub fn Clamp(x: i64, lo: i64, hi: i64) -> i64 {
    if x < lo {
        return lo
    }
    if x > hi {
        return hi
    }
    return x
}

pub fn Gcd(a: i64, b: i64) -> i64 {
    var x: i64 = a
    var y: i64 = b
    if x < 0 {
        x = -x
    }
    if y < 0 {
        y = -y
    }
    for ; y != 0; {
        var t: i64 = x % y
        x = y
        y = t
    }
    return x
}
)PER";

constexpr std::string_view kStringSource = R"PER(package string

pub fn IsDigit(c: i64) -> i64 {
    return c >= 48 && c <= 57
}

pub fn IsAlpha(c: i64) -> i64 {
    return (c >= 65 && c <= 90) || (c >= 97 && c <= 122)
}

pub fn IsSpace(c: i64) -> i64 {
    return c == 32 || c == 9 || c == 10 || c == 13
}

pub fn ToUpper(c: i64) -> i64 {
    if c >= 97 && c <= 122 {
        return c - 32
    }
    return c
}

pub fn ToLower(c: i64) -> i64 {
    if c >= 65 && c <= 90 {
        return c + 32
    }
    return c
}
)PER";

constexpr std::array<StdlibModule, 2> kModules = {{
    {"math", kMathSource},
    {"string", kStringSource},
}};

} // namespace

std::span<const StdlibModule> stdlibModules()
{
    return kModules;
}

bool isBuiltinModule(std::string_view name)
{
    if (name == kStdioModule)
        return true;
    for (const auto &m : kModules)
    {
        if (m.name == name)
            return true;
    }
    return false;
}

} // namespace perc::frontends::per

#pragma once

#include <algorithm>
#include <string>
#include <string_view>

namespace Utility::Algorithm
{
    /**
     * @brief ASCII only lower casing, independent of the global locale.
     */
    constexpr char toLower(char c)
    {
        return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
    }

    inline std::string toLowerCase(std::string_view input)
    {
        std::string result(input.size(), '\0');
        std::transform(input.begin(), input.end(), result.begin(), toLower);
        return result;
    }

    constexpr bool equalsIgnoreCase(std::string_view lhs, std::string_view rhs)
    {
        return std::equal(lhs.begin(), lhs.end(), rhs.begin(), rhs.end(), [](char l, char r) {
            return toLower(l) == toLower(r);
        });
    }
}

#pragma once

#include <algorithm>
#include <cctype>
#include <string>
#include <string_view>

namespace Utility::Algorithm
{
    /**
     * @brief Converts the passed string to lower case and returns it.
     *
     * @param input The string to convert.
     * @return std::string The string in lower case.
     */
    inline std::string toLowerCase(std::string_view input)
    {
        std::string result(input.size(), '\0');
        std::transform(input.begin(), input.end(), result.begin(), [](unsigned char c) {
            return static_cast<char>(std::tolower(c));
        });
        return result;
    }

    /**
     * @brief Removes leading and trailing whitespace.
     */
    inline std::string trim(std::string_view input)
    {
        const auto isSpace = [](unsigned char c) {
            return std::isspace(c) != 0;
        };
        auto begin = std::find_if_not(input.begin(), input.end(), isSpace);
        auto end = std::find_if_not(input.rbegin(), input.rend(), isSpace).base();
        if (begin >= end)
            return {};
        return std::string{begin, end};
    }

    /**
     * @brief Compares both strings without regard to ascii case.
     */
    inline bool equalsIgnoreCase(std::string_view lhs, std::string_view rhs)
    {
        return std::equal(lhs.begin(), lhs.end(), rhs.begin(), rhs.end(), [](unsigned char l, unsigned char r) {
            return std::tolower(l) == std::tolower(r);
        });
    }
}

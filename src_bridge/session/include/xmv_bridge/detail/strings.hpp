#pragma once

#include <string>
#include <string_view>

namespace xmv::bridge::detail {

inline constexpr std::string_view kWhitespace = " \t\n\r\f\v";

/// \a input without leading and trailing whitespace; views into \a input.
[[nodiscard]] inline std::string_view trim(std::string_view input) {
    const auto begin = input.find_first_not_of(kWhitespace);
    if (begin == std::string_view::npos) {
        return {};
    }
    const auto end = input.find_last_not_of(kWhitespace);
    return input.substr(begin, end - begin + 1);
}

[[nodiscard]] inline std::string trim_copy(std::string_view input) {
    return std::string{trim(input)};
}

}  // namespace xmv::bridge::detail

#pragma once

#include <algorithm>
#include <cctype>
#include <initializer_list>
#include <string>
#include <string_view>

namespace itinera::helpers {

/**
 * Keyword matching over free text. Matchers lower-case their input once
 * and then test plain substring containment.
 */
class StringHelper {
public:
    static std::string to_lower(std::string_view str) {
        std::string result(str);
        std::transform(result.begin(), result.end(), result.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return result;
    }

    // True when an already lower-cased text contains any of the keywords
    static bool contains_any(std::string_view lowered_text, std::initializer_list<std::string_view> keywords) {
        return std::any_of(keywords.begin(), keywords.end(), [lowered_text](std::string_view keyword) {
            return lowered_text.find(keyword) != std::string_view::npos;
        });
    }
};

} // namespace itinera::helpers

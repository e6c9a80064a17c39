#ifndef JOIN_RELAY_STRING_UTILS_HPP
#define JOIN_RELAY_STRING_UTILS_HPP

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace string_utils {
    size_t write_to_string(const char* ptr, size_t size, size_t nmemb, void* userdata);

    std::string trim(std::string s);

    std::vector<std::string> split_comma_delimited_string(std::string_view sv);

    // Same escaping as encodeURIComponent: unreserved marks stay, every other byte becomes %XX.
    std::string percent_encode(std::string_view sv);

    // Drops everything from the first '?' on, so query values stay out of logs.
    std::string strip_query(std::string_view sv);

    std::optional<long> parse_long(const std::string& s);

    // Removes one leading UTF-8 byte order mark, as a UTF-8 text decoder does.
    std::string_view strip_bom(std::string_view sv);

    // Replaces every maximal invalid UTF-8 subsequence with U+FFFD.
    std::string to_valid_utf8(std::string_view sv);
}  // namespace string_utils

#endif

#include "string_utils.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <string>
#include <vector>

#include "constants.hpp"

namespace string_utils {
    size_t write_to_string(const char *ptr, size_t size, size_t nmemb, void *userdata) {
        auto *body = static_cast<std::string *>(userdata);
        const size_t total = size * nmemb;
        body->append(ptr, total);
        return total;
    }

    std::string trim(std::string s) {
        s.erase(s.begin(), std::find_if(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c) == 0; }));
        s.erase(std::find_if(s.rbegin(), s.rend(), [](unsigned char c) { return std::isspace(c) == 0; }).base(), s.end());
        return s;
    }

    std::vector<std::string> split_comma_delimited_string(std::string_view sv) {
        std::vector<std::string> out;
        size_t start = 0;
        for (;;) {
            size_t pos = sv.find(',', start);
            size_t end = (pos == std::string_view::npos) ? sv.size() : pos;

            std::string_view token = sv.substr(start, end - start);
            const auto first = token.find_first_not_of(" \t\r\n");
            if (first != std::string_view::npos) {
                const auto last = token.find_last_not_of(" \t\r\n");
                out.emplace_back(token.substr(first, last - first + 1));
            }

            if (pos == std::string_view::npos) {
                break;
            }

            start = pos + 1;
        }
        return out;
    }

    std::string percent_encode(std::string_view sv) {
        static constexpr const char *HEX_DIGITS = "0123456789ABCDEF";
        static constexpr std::string_view UNRESERVED_MARKS = "-_.!~*'()";

        std::string out;
        out.reserve(sv.size());
        for (const char ch : sv) {
            const auto c = static_cast<unsigned char>(ch);
            if (std::isalnum(c) != 0 || UNRESERVED_MARKS.find(ch) != std::string_view::npos) {
                out.push_back(ch);
                continue;
            }
            out.push_back('%');
            out.push_back(HEX_DIGITS[c / constants::HEX_RADIX]);
            out.push_back(HEX_DIGITS[c % constants::HEX_RADIX]);
        }
        return out;
    }

    std::string strip_query(std::string_view sv) {
        const auto pos = sv.find('?');
        return std::string(pos == std::string_view::npos ? sv : sv.substr(0, pos));
    }

    std::optional<long> parse_long(const std::string &s) {
        const std::string trimmed = trim(s);
        if (trimmed.empty()) {
            return std::nullopt;
        }
        char *end = nullptr;
        const long v = std::strtol(trimmed.c_str(), &end, constants::BASE_10);
        if (end == nullptr || *end != '\0') {
            return std::nullopt;
        }
        return v;
    }

    std::string_view strip_bom(std::string_view sv) {
        static constexpr std::string_view UTF8_BOM = "\xEF\xBB\xBF";
        if (sv.substr(0, UTF8_BOM.size()) == UTF8_BOM) {
            sv.remove_prefix(UTF8_BOM.size());
        }
        return sv;
    }

    std::string to_valid_utf8(std::string_view sv) {
        static constexpr std::string_view REPLACEMENT_CHARACTER = "\xEF\xBF\xBD";

        std::string out;
        out.reserve(sv.size());

        size_t i = 0;
        while (i < sv.size()) {
            const auto lead = static_cast<unsigned char>(sv[i]);
            if (lead < 0x80) {
                out.push_back(sv[i]);
                ++i;
                continue;
            }

            // Continuation count and the allowed range of the first continuation byte.
            size_t need = 0;
            unsigned char lower = 0x80;
            unsigned char upper = 0xBF;
            if (lead >= 0xC2 && lead <= 0xDF) {
                need = 1;
            } else if (lead == 0xE0) {
                need = 2;
                lower = 0xA0;
            } else if (lead == 0xED) {
                need = 2;
                upper = 0x9F;
            } else if (lead >= 0xE1 && lead <= 0xEF) {
                need = 2;
            } else if (lead == 0xF0) {
                need = 3;
                lower = 0x90;
            } else if (lead >= 0xF1 && lead <= 0xF3) {
                need = 3;
            } else if (lead == 0xF4) {
                need = 3;
                upper = 0x8F;
            } else {
                out += REPLACEMENT_CHARACTER;
                ++i;
                continue;
            }

            size_t j = i + 1;
            bool complete = true;
            for (size_t k = 0; k < need; ++k, ++j) {
                if (j >= sv.size()) {
                    complete = false;
                    break;
                }
                const auto c = static_cast<unsigned char>(sv[j]);
                if (c < lower || c > upper) {
                    complete = false;
                    break;
                }
                lower = 0x80;
                upper = 0xBF;
            }

            if (complete) {
                out.append(sv.substr(i, j - i));
            } else {
                out += REPLACEMENT_CHARACTER;
            }
            i = j;
        }
        return out;
    }
}  // namespace string_utils

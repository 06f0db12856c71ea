#include "version.hpp"

#include "exception.hpp"
#include "localization.hpp"

#include <algorithm>
#include <cctype>
#include <regex>
#include <string_view>
#include <vector>

namespace {
static const std::regex version_id_regex(R"(^[0-9A-Za-z][0-9A-Za-z._+\-]{0,127}$)");

struct Token {
    bool numeric = false;
    unsigned long long number = 0;
    std::string text;
};

// Splits "GE-Proton8-26" into {"ge", "-", "proton", 8, "-", 26}; letters compare case-insensitively.
std::vector<Token> tokenize(std::string_view v) {
    std::vector<Token> tokens;
    size_t i = 0;
    while (i < v.size()) {
        Token t;
        if (std::isdigit(static_cast<unsigned char>(v[i]))) {
            t.numeric = true;
            while (i < v.size() && std::isdigit(static_cast<unsigned char>(v[i]))) {
                if (t.number < 1000000000000ULL) {
                    t.number = t.number * 10 + static_cast<unsigned long long>(v[i] - '0');
                }
                ++i;
            }
        } else if (std::isalpha(static_cast<unsigned char>(v[i]))) {
            while (i < v.size() && std::isalpha(static_cast<unsigned char>(v[i]))) {
                t.text.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(v[i]))));
                ++i;
            }
        } else {
            t.text.push_back(v[i]);
            ++i;
        }
        tokens.push_back(std::move(t));
    }
    return tokens;
}

int compare_tokens(const Token& a, const Token& b) {
    if (a.numeric && b.numeric) {
        if (a.number < b.number) return -1;
        if (a.number > b.number) return 1;
        return 0;
    }
    if (a.numeric) return 1; // words sort before numbers
    if (b.numeric) return -1;
    int res = a.text.compare(b.text);
    return res < 0 ? -1 : (res > 0 ? 1 : 0);
}

}

bool is_valid_version_id(const std::string& id) {
    if (!std::regex_match(id, version_id_regex)) return false;
    return id.find("..") == std::string::npos;
}

void validate_version_id(const std::string& id) {
    if (!is_valid_version_id(id)) {
        throw RtmException(ErrorKind::InvalidArgument, string_format("error.invalid_version_id", id));
    }
}

bool version_compare(const std::string& v1_str, const std::string& v2_str) {
    const auto t1 = tokenize(v1_str);
    const auto t2 = tokenize(v2_str);

    size_t min_len = std::min(t1.size(), t2.size());
    for (size_t i = 0; i < min_len; ++i) {
        int res = compare_tokens(t1[i], t2[i]);
        if (res != 0) return res < 0;
    }
    if (t1.size() != t2.size()) return t1.size() < t2.size();
    return v1_str < v2_str; // equal ignoring case; keep a strict weak order
}

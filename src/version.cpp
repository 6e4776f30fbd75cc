#include "version.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <regex>
#include <vector>

namespace {

std::vector<std::string> split_any(std::string_view s, std::string_view delims) {
    std::vector<std::string> parts;
    size_t start = 0;
    while (true) {
        size_t end = s.find_first_of(delims, start);
        parts.emplace_back(s.substr(start, end == std::string_view::npos ? std::string_view::npos : end - start));
        if (end == std::string_view::npos) break;
        start = end + 1;
    }
    return parts;
}

// Leading digits of a component; "3rc" -> 3, "" -> 0.
long long numeric_value(std::string_view part) {
    long long n = 0;
    std::from_chars(part.data(), part.data() + part.size(), n);
    return n;
}

bool is_number(std::string_view part) {
    return !part.empty() && std::ranges::all_of(part, [](unsigned char c) { return std::isdigit(c) != 0; });
}

} // anonymous namespace

std::strong_ordering compare_versions(std::string_view v1_str, std::string_view v2_str) {
    if (!v1_str.empty() && (v1_str.front() == 'v' || v1_str.front() == 'V')) v1_str.remove_prefix(1);
    if (!v2_str.empty() && (v2_str.front() == 'v' || v2_str.front() == 'V')) v2_str.remove_prefix(1);

    // Split into main version and pre-release part
    std::string_view v1_main = v1_str, v1_pre, v2_main = v2_str, v2_pre;
    if (size_t h = v1_str.find('-'); h != std::string_view::npos) {
        v1_main = v1_str.substr(0, h);
        v1_pre = v1_str.substr(h + 1);
    }
    if (size_t h = v2_str.find('-'); h != std::string_view::npos) {
        v2_main = v2_str.substr(0, h);
        v2_pre = v2_str.substr(h + 1);
    }

    // Compare main versions; missing components count as zero so "6.5" == "6.5.0"
    auto p1_main = split_any(v1_main, ".");
    auto p2_main = split_any(v2_main, ".");
    size_t main_len = std::max(p1_main.size(), p2_main.size());
    for (size_t i = 0; i < main_len; ++i) {
        long long n1 = i < p1_main.size() ? numeric_value(p1_main[i]) : 0;
        long long n2 = i < p2_main.size() ? numeric_value(p2_main[i]) : 0;
        if (n1 != n2) return n1 <=> n2;
    }

    // Main versions are equal, compare pre-release
    if (v1_pre.empty() && v2_pre.empty()) return std::strong_ordering::equal;
    if (v1_pre.empty()) return std::strong_ordering::greater; // 1.0.0 > 1.0.0-alpha
    if (v2_pre.empty()) return std::strong_ordering::less;    // 1.0.0-alpha < 1.0.0

    auto p1_pre = split_any(v1_pre, ".-");
    auto p2_pre = split_any(v2_pre, ".-");
    size_t pre_len = std::max(p1_pre.size(), p2_pre.size());
    for (size_t i = 0; i < pre_len; ++i) {
        if (i >= p1_pre.size()) return std::strong_ordering::less; // 1.0.0-alpha < 1.0.0-alpha.1
        if (i >= p2_pre.size()) return std::strong_ordering::greater;

        const std::string& part1 = p1_pre[i];
        const std::string& part2 = p2_pre[i];
        const bool is_num1 = is_number(part1);
        const bool is_num2 = is_number(part2);

        if (is_num1 && is_num2) {
            long long n1 = numeric_value(part1);
            long long n2 = numeric_value(part2);
            if (n1 != n2) return n1 <=> n2;
        } else {
            if (is_num1 && !is_num2) return std::strong_ordering::less;
            if (!is_num1 && is_num2) return std::strong_ordering::greater;
            if (auto c = part1 <=> part2; c != 0) return c;
        }
    }

    return std::strong_ordering::equal;
}

bool version_compare(std::string_view v1, std::string_view v2) {
    return compare_versions(v1, v2) < 0;
}

std::string extract_version_token(std::string_view tag) {
    static const std::regex version_regex(R"(\d+(\.\d+)+)");
    std::match_results<std::string_view::const_iterator> match;
    if (std::regex_search(tag.begin(), tag.end(), match, version_regex)) {
        return match.str(0);
    }
    return "";
}

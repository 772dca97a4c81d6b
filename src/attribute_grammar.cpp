#include "codecstore/attribute_grammar.hpp"
#include <cstring>
#include <limits>
#include <utility>

namespace codecstore {
namespace grammar {

namespace {

bool ends_with(const std::string& s, const char* suffix) {
    size_t n = std::strlen(suffix);
    return s.size() >= n && s.compare(s.size() - n, n, suffix) == 0;
}

template <typename T, typename Fn>
std::optional<std::pair<T, T>> split_pair(const std::string& text, char sep, Fn parse) {
    auto pos = text.find(sep);
    if (pos == std::string::npos) return std::nullopt;
    auto a = parse(text.substr(0, pos));
    auto b = parse(text.substr(pos + 1));
    if (!a || !b) return std::nullopt;
    return std::make_pair(*a, *b);
}

} // namespace

std::optional<uint64_t> parse_num(const std::string& text) {
    if (text.empty()) return std::nullopt;
    if (text == "0") return 0;
    if (text[0] == '0') return std::nullopt;
    uint64_t value = 0;
    for (char c : text) {
        if (c < '0' || c > '9') return std::nullopt;
        uint64_t digit = static_cast<uint64_t>(c - '0');
        if (value > (std::numeric_limits<uint64_t>::max() - digit) / 10) return std::nullopt;
        value = value * 10 + digit;
    }
    return value;
}

std::optional<Size> parse_size(const std::string& text) {
    auto p = split_pair<uint64_t>(text, 'x', parse_num);
    if (!p) return std::nullopt;
    return Size{p->first, p->second};
}

std::optional<Ratio> parse_ratio(const std::string& text) {
    auto p = split_pair<uint64_t>(text, ':', parse_num);
    if (!p) return std::nullopt;
    return Ratio{p->first, p->second};
}

std::optional<Range<uint64_t>> parse_num_range(const std::string& text) {
    auto p = split_pair<uint64_t>(text, '-', parse_num);
    if (!p) return std::nullopt;
    return Range<uint64_t>{p->first, p->second};
}

std::optional<Range<Size>> parse_size_range(const std::string& text) {
    auto p = split_pair<Size>(text, '-', parse_size);
    if (!p) return std::nullopt;
    return Range<Size>{p->first, p->second};
}

std::optional<Range<Ratio>> parse_ratio_range(const std::string& text) {
    auto p = split_pair<Ratio>(text, '-', parse_ratio);
    if (!p) return std::nullopt;
    return Range<Ratio>{p->first, p->second};
}

std::optional<std::vector<std::string>> split_list(const std::string& text) {
    std::vector<std::string> items;
    size_t start = 0;
    while (true) {
        auto pos = text.find(',', start);
        if (pos == std::string::npos) pos = text.size();
        if (pos == start) return std::nullopt;
        items.push_back(text.substr(start, pos - start));
        if (pos == text.size()) break;
        start = pos + 1;
    }
    return items;
}

std::optional<std::vector<std::string>> parse_enum(const std::string& spelling) {
    static const char kOpen[] = "enum<";
    const size_t open = sizeof(kOpen) - 1;
    if (spelling.size() <= open + 1 || spelling.compare(0, open, kOpen) != 0 || spelling.back() != '>')
        return std::nullopt;
    return split_list(spelling.substr(open, spelling.size() - open - 1));
}

bool matches_enum(const std::string& text, std::initializer_list<const char*> values) {
    for (const char* v : values) {
        if (text == v) return true;
    }
    return false;
}

bool matches_enum(const std::string& text, const std::string& spelling) {
    auto values = parse_enum(spelling);
    if (!values) return false;
    for (const auto& v : *values) {
        if (text == v) return true;
    }
    return false;
}

std::optional<bool> parse_flag(const std::string& text) {
    if (text == "0") return false;
    if (text == "1") return true;
    return std::nullopt;
}

bool check_attribute(const Attribute& attr) {
    const auto& key = attr.key;
    const auto& value = attr.value;
    if (is_supports_key(key) || is_feature_key(key)) return parse_flag(value).has_value();
    if (key == "size-range") return parse_size_range(value).has_value();
    if (ends_with(key, "aspect-ratio-range")) return parse_ratio_range(value).has_value();
    if (ends_with(key, "-ranges")) {
        auto items = split_list(value);
        if (!items) return false;
        for (const auto& item : *items) {
            if (!parse_num_range(item) && !parse_num(item)) return false;
        }
        return true;
    }
    if (ends_with(key, "-range")) {
        return parse_num_range(value) || parse_size_range(value) || parse_ratio_range(value);
    }
    if (key == "alignment" || key == "block-size") return parse_size(value).has_value();
    if (key.rfind("max-", 0) == 0) return parse_num(value).has_value();
    return true;
}

} // namespace grammar
} // namespace codecstore

#pragma once
#include "types.hpp"
#include <cstdint>
#include <initializer_list>
#include <optional>
#include <string>
#include <vector>

// Helpers for callers that want to interpret attribute values. The store
// itself treats values as opaque and never validates them with these.
namespace codecstore {
namespace grammar {

struct Size {
    uint64_t width;
    uint64_t height;
};

struct Ratio {
    uint64_t num;
    uint64_t den;
};

template <typename T>
struct Range {
    T lo;
    T hi;
};

// "0" or a positive integer without leading zeros.
std::optional<uint64_t> parse_num(const std::string& text);
// "<num>x<num>"
std::optional<Size> parse_size(const std::string& text);
// "<num>:<num>"
std::optional<Ratio> parse_ratio(const std::string& text);

std::optional<Range<uint64_t>> parse_num_range(const std::string& text);
std::optional<Range<Size>> parse_size_range(const std::string& text);
std::optional<Range<Ratio>> parse_ratio_range(const std::string& text);

// Comma separated items; nullopt when any item is empty.
std::optional<std::vector<std::string>> split_list(const std::string& text);

// "enum<v1,...,vn>" -> {v1, ..., vn}
std::optional<std::vector<std::string>> parse_enum(const std::string& spelling);

bool matches_enum(const std::string& text, std::initializer_list<const char*> values);
// Membership in an "enum<...>" spelling; false when the spelling is malformed.
bool matches_enum(const std::string& text, const std::string& spelling);

inline bool is_supports_key(const std::string& key) { return key.rfind("supports-", 0) == 0; }
inline bool is_feature_key(const std::string& key) { return key.rfind("feature-", 0) == 0; }

// "0" -> false, "1" -> true. For supports-* keys this is no/yes, for
// feature-* keys optional/required.
std::optional<bool> parse_flag(const std::string& text);

// Checks the value against the convention its key implies (flags, ranges,
// sizes, max-* counts). Keys without a known convention always pass.
bool check_attribute(const Attribute& attr);

} // namespace grammar
} // namespace codecstore

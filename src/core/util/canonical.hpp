#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace sealtrail::util {

std::int64_t unix_millis_now();

std::string lowercase_copy(std::string_view value);
std::string trim_copy(std::string_view value);

std::string canonical_join(std::vector<std::pair<std::string, std::string>> fields);
std::unordered_map<std::string, std::string> parse_canonical_map(std::string_view payload);

std::string to_hex(std::string_view bytes);
// Empty on odd length or a non-hex digit.
std::string from_hex(std::string_view hex);

std::vector<std::string> split_csv(std::string_view csv);
std::unordered_map<std::string, std::string> parse_key_values(std::string_view text);

}  // namespace sealtrail::util

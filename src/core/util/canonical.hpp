#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace pawledger::util {

std::int64_t unix_timestamp_ms_now();

std::string lowercase_copy(std::string_view value);
std::string trim_copy(std::string_view value);
bool equals_ignore_case(std::string_view lhs, std::string_view rhs);

std::string canonical_join(std::vector<std::pair<std::string, std::string>> fields);
std::unordered_map<std::string, std::string> parse_canonical_map(std::string_view payload);

}  // namespace pawledger::util

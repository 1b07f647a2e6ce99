#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include "Common.h"

namespace kyc {

std::string_view trim(std::string_view s);
std::string to_upper(std::string_view s);
std::string to_lower(std::string_view s);

// Whitespace separated tokens; empty or blank input has zero words.
size_t word_count(std::string_view s);
std::vector<std::string_view> split_ws(std::string_view s);

bool parse_double(std::string_view s, double& out);
bool parse_size(std::string_view s, size_t& out);

// Fixed two-decimal rendering ("12.30"), locale independent.
std::string format_fixed2(double v);
double round2(double v);

TimeMs now_ms();

// UTC, millisecond precision: 2026-10-19T08:15:02.117Z
std::string format_iso8601(TimeMs ms);
// Accepts the format above plus variants without 'Z', without fraction,
// or with up to 9 fractional digits. Times without a zone are taken as UTC.
std::optional<TimeMs> parse_iso8601(std::string_view s);

} // namespace kyc

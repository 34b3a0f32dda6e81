#pragma once
#include <sidecar/types/basetypes.hpp>

#include <string>

namespace sidecar::types {

// 9999-12-31T23:59:59.999Z, the last time with a four digit year
constexpr uint64_t max_timestamp_ms = 253'402'300'799'999;

bool timestamp_in_range( const timestamp_type& t );

/**
 * RFC 3339 in UTC with millisecond precision, e.g. "2021-04-01T12:00:00.000Z".
 * Throws invalid_timestamp past max_timestamp_ms.
 */
std::string to_string( const timestamp_type& t );
timestamp_type timestamp_from_string( const std::string& s );

/**
 * Human readable duration made of year, month, day, h, m, s and ms components,
 * e.g. "1day 2h 30m". A month is 30.44 days and a year 365.25 days.
 * A zero duration renders as "0s".
 */
std::string to_string( const time_diff_type& d );
time_diff_type time_diff_from_string( const std::string& s );

void to_json( json& j, const timestamp_type& t );
void from_json( const json& j, timestamp_type& t );

void to_json( json& j, const time_diff_type& d );
void from_json( const json& j, time_diff_type& d );

} // sidecar::types

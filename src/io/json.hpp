#pragma once

// Minimal JSON helpers for the metadata document and engine config.
// Sufficient for our own output and for documents written by the recorder
// (pretty-printed or compact); not a general-purpose parser.

#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace cursorfx::json
{

// ─── Writing ────────────────────────────────────────────────────────────────

void write_string(std::ostringstream& ss, std::string_view s);

// Shortest representation that parses back to the same double.
void write_number(std::ostringstream& ss, double v);

// Writes `"key":` preceded by a comma unless first is set (then clears it).
void write_key(std::ostringstream& ss, std::string_view key, bool& first);

// ─── Reading ────────────────────────────────────────────────────────────────

// Strip surrounding whitespace.
std::string_view trim(std::string_view s);

// Raw text of the member `key` of a JSON object (the object's own members
// only, nested objects are skipped). nullopt if absent or malformed.
std::optional<std::string_view> find_member(std::string_view object, std::string_view key);

// Raw text of each element of a JSON array.
std::vector<std::string_view> array_elements(std::string_view array);

bool is_object(std::string_view value);
bool is_array(std::string_view value);

std::optional<double>      as_number(std::string_view value);
std::optional<std::string> as_string(std::string_view value);
std::optional<bool>        as_bool(std::string_view value);

// Convenience: find_member + as_*.
std::optional<double>      read_number(std::string_view object, std::string_view key);
std::optional<std::string> read_string(std::string_view object, std::string_view key);
std::optional<bool>        read_bool(std::string_view object, std::string_view key);

// Number clamped to [lo, hi] and truncated. nullopt if absent or not finite.
std::optional<int> read_int(std::string_view object, std::string_view key, int lo, int hi);

}   // namespace cursorfx::json

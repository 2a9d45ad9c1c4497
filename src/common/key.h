#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include "absl/strings/string_view.h"

namespace MpathPr {

// Registration key. 0x0 means "not registered".
using Key = uint64_t;

constexpr Key kNoKey = 0x0;

/**
 * Formats a key the way sg_persist / mpathpersist print it: lower-case hex,
 * "0x" prefix, no zero padding.
 */
std::string FormatKey(Key key);

/**
 * Parses "0x1f", "0X1F" or "1f". Returns nullopt on anything else.
 */
std::optional<Key> ParseKey(absl::string_view text);

} // namespace MpathPr

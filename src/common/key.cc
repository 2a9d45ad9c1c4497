#include "key.h"

#include "absl/strings/ascii.h"
#include "absl/strings/numbers.h"
#include "absl/strings/str_format.h"

namespace MpathPr {

std::string FormatKey(Key key) {
    return absl::StrFormat("0x%x", key);
}

std::optional<Key> ParseKey(absl::string_view text) {
    text = absl::StripAsciiWhitespace(text);
    if (text.size() > 2 && text[0] == '0' && (text[1] == 'x' || text[1] == 'X')) {
        text.remove_prefix(2);
    }
    if (text.empty()) {
        return std::nullopt;
    }
    for (char c : text) {
        if (!absl::ascii_isxdigit(static_cast<unsigned char>(c))) {
            return std::nullopt;
        }
    }
    uint64_t value = 0;
    if (!absl::SimpleHexAtoi(text, &value)) {
        return std::nullopt;
    }
    return value;
}

} // namespace MpathPr

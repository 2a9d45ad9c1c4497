#include "status_parser.h"

#include <vector>

#include "absl/strings/ascii.h"
#include "absl/strings/match.h"
#include "absl/strings/numbers.h"
#include "absl/strings/str_join.h"
#include "absl/strings/str_split.h"
#include "absl/strings/string_view.h"
#include "common/errors.h"

namespace MpathPr {

namespace {

constexpr absl::string_view kNoKeysSg = "there are NO registered reservation keys";
constexpr absl::string_view kKeysHeader = "registered reservation key";
constexpr absl::string_view kNoReservation = "NO reservation held";
constexpr absl::string_view kReservationFollows = "Reservation follows";

// Count announced by "... N registered reservation key(s) ...", if present
std::optional<size_t> AnnouncedCount(absl::string_view line) {
    size_t pos = line.find(kKeysHeader);
    if (pos == absl::string_view::npos) {
        return std::nullopt;
    }
    absl::string_view before = absl::StripTrailingAsciiWhitespace(line.substr(0, pos));
    size_t start = before.find_last_of(" \t,");
    absl::string_view number = start == absl::string_view::npos ? before : before.substr(start + 1);
    size_t count = 0;
    if (!absl::SimpleAtoi(number, &count)) {
        return std::nullopt;
    }
    return count;
}

bool LooksLikeKey(absl::string_view token) {
    return absl::StartsWithIgnoreCase(token, "0x") && ParseKey(token).has_value();
}

} // namespace

KeyReport ParseKeyReport(const std::string& output) {
    KeyReport report;
    if (absl::StrContains(output, kNoKeysSg)) {
        return report;
    }

    std::optional<size_t> announced;
    for (absl::string_view raw : absl::StrSplit(output, '\n')) {
        absl::string_view line = absl::StripAsciiWhitespace(raw);
        if (!announced.has_value()) {
            announced = AnnouncedCount(line);
            continue;
        }
        if (LooksLikeKey(line)) {
            report.keys.insert(*ParseKey(line));
            report.registrations++;
        }
    }

    if (!announced.has_value()) {
        throw ToolInvocationFailure("unrecognized READ KEYS output: " + output);
    }
    if (*announced != report.registrations) {
        throw ToolInvocationFailure("READ KEYS announced " + std::to_string(*announced) +
                                    " keys but listed " + std::to_string(report.registrations) +
                                    ": " + output);
    }
    return report;
}

ReservationReport ParseReservationReport(const std::string& output) {
    ReservationReport report;
    if (absl::StrContains(output, kNoReservation)) {
        return report;
    }
    if (!absl::StrContains(output, kReservationFollows)) {
        throw ToolInvocationFailure("unrecognized READ RESERVATION output: " + output);
    }

    for (absl::string_view raw : absl::StrSplit(output, '\n')) {
        absl::string_view line = absl::StripAsciiWhitespace(raw);
        if (!absl::StartsWith(line, "Key")) {
            continue;
        }
        std::vector<absl::string_view> parts = absl::StrSplit(line, absl::MaxSplits('=', 1));
        if (parts.size() != 2) {
            continue;
        }
        // "Key = 0x2" or "Key=0x2, ..." (trailing fields on some versions)
        absl::string_view value = absl::StripAsciiWhitespace(parts[1]);
        value = value.substr(0, value.find_first_of(" ,\t"));
        auto key = ParseKey(value);
        if (key.has_value()) {
            report.key = key;
            return report;
        }
    }
    throw ToolInvocationFailure("reservation reported without a key: " + output);
}

std::string DescribeKeys(const KeyReport& report) {
    if (report.Empty()) {
        return "{}";
    }
    std::vector<std::string> keys;
    for (Key key : report.keys) {
        keys.push_back(FormatKey(key));
    }
    return "{" + absl::StrJoin(keys, ",") + "}";
}

} // namespace MpathPr

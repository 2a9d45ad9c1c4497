#include "multipath_daemon.h"

#include <glog/logging.h>
#include "absl/strings/ascii.h"
#include "absl/strings/str_split.h"
#include "common/errors.h"

namespace MpathPr {

MultipathDaemon::MultipathDaemon(std::shared_ptr<ICommandRunner> runner, std::string multipathd,
		std::string multipath)
	: runner_(std::move(runner)),
	  multipathd_(std::move(multipathd)),
	  multipath_(std::move(multipath)) {}

std::string MultipathDaemon::Query(const std::vector<std::string>& args) {
	std::vector<std::string> argv = {multipathd_};
	argv.insert(argv.end(), args.begin(), args.end());
	CommandResult result = runner_->Run(argv);
	if (!result.ok()) {
		throw ToolInvocationFailure(JoinCommand(argv) + " failed with status " +
			std::to_string(result.exit_status));
	}
	VLOG(3) << JoinCommand(argv) << ": " << result.output;
	return std::string(absl::StripAsciiWhitespace(result.output));
}

std::optional<Key> MultipathDaemon::GetPrKey(const std::string& map) {
	std::string output = Query({"getprkey", "map", map});
	if (output == "none") {
		return std::nullopt;
	}
	auto key = ParseKey(output);
	if (!key.has_value()) {
		throw ToolInvocationFailure("unexpected multipathd getprkey output: " + output);
	}
	return key;
}

bool MultipathDaemon::QuerySetUnset(const std::string& command, const std::string& map) {
	std::string output = Query({command, "map", map});
	if (output == "set") {
		return true;
	}
	if (output == "unset") {
		return false;
	}
	throw ToolInvocationFailure("unexpected multipathd " + command + " output: " + output);
}

bool MultipathDaemon::GetPrStatus(const std::string& map) {
	return QuerySetUnset("getprstatus", map);
}

bool MultipathDaemon::GetPrHold(const std::string& map) {
	return QuerySetUnset("getprhold", map);
}

std::vector<std::string> MultipathDaemon::SecondColumnFor(const std::string& table,
		const std::string& map) {
	std::vector<std::string> values;
	for (absl::string_view line : absl::StrSplit(table, '\n', absl::SkipWhitespace())) {
		std::vector<absl::string_view> fields =
			absl::StrSplit(line, absl::ByAnyChar(" \t"), absl::SkipEmpty());
		if (fields.size() >= 2 && fields[0] == map) {
			values.emplace_back(fields[1]);
		}
	}
	return values;
}

std::string MultipathDaemon::MapWwid(const std::string& map) {
	auto wwids = SecondColumnFor(Query({"show", "maps", "raw", "format", "%n %w"}), map);
	if (wwids.empty()) {
		throw ToolInvocationFailure("Could not get WWID for " + map);
	}
	return wwids.front();
}

std::vector<std::string> MultipathDaemon::MapPaths(const std::string& map) {
	return SecondColumnFor(Query({"show", "paths", "raw", "format", "%m %d"}), map);
}

std::string MultipathDaemon::DumpTopology(const std::string& map) {
	CommandResult result = runner_->Run({multipath_, "-l", map});
	if (!result.ok()) {
		throw ToolInvocationFailure(multipath_ + " -l " + map + " failed with status " +
			std::to_string(result.exit_status));
	}
	return result.output;
}

std::string RawDeviceWwid(ICommandRunner& runner, const std::string& udevadm,
		const std::string& device) {
	CommandResult result = runner.Run({udevadm, "info", "-n", device, "--query=property",
		"--property=ID_SERIAL", "--value"});
	std::string wwid(absl::StripAsciiWhitespace(result.output));
	if (!result.ok() || wwid.empty()) {
		throw ToolInvocationFailure("Could not get WWID for " + device);
	}
	return wwid;
}

} // namespace MpathPr

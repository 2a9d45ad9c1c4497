#pragma once

#include <memory>
#include <string>
#include <vector>

namespace MpathPr {

struct CommandResult {
	// Exit status, or 128 + signal number when the command was killed
	int exit_status = 0;
	std::string output;

	bool ok() const { return exit_status == 0; }
};

/**
 * Runs an external program to completion and captures its stdout.
 * stderr is passed through to ours so tool diagnostics stay visible.
 */
class ICommandRunner {
public:
	virtual ~ICommandRunner() = default;

	// Throws ToolInvocationFailure when the program cannot be started at all
	virtual CommandResult Run(const std::vector<std::string>& argv) = 0;
};

struct LocalRunnerOptions {
	bool discard_stderr = false;
	// false keeps children in our process group, so a signal to the group
	// also reaches a command that is still running
	bool own_process_group = true;
};

/**
 * fork/exec implementation. Bare program names are looked up in PATH.
 * Children read stdin from /dev/null.
 */
class LocalCommandRunner : public ICommandRunner {
public:
	explicit LocalCommandRunner(LocalRunnerOptions options = LocalRunnerOptions()) : options_(options) {}

	CommandResult Run(const std::vector<std::string>& argv) override;

private:
	LocalRunnerOptions options_;
};

/**
 * Runs every command on `host` through ssh, e.g. for the peer path of the
 * two-host variant.
 */
class RemoteCommandRunner : public ICommandRunner {
public:
	RemoteCommandRunner(std::shared_ptr<ICommandRunner> transport, std::string ssh, std::string host);

	CommandResult Run(const std::vector<std::string>& argv) override;

	const std::string& host() const { return host_; }

private:
	std::shared_ptr<ICommandRunner> transport_;
	std::string ssh_;
	std::string host_;
};

// "mpathpersist --out --register ..." for logs
std::string JoinCommand(const std::vector<std::string>& argv);

// True if `program` names an executable file, directly or via PATH
bool ProgramExists(const std::string& program);

} // namespace MpathPr

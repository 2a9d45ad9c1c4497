#ifndef MPATHPR_ORACLE_CHILD_PROCESS_H_
#define MPATHPR_ORACLE_CHILD_PROCESS_H_

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <sys/types.h>

namespace MpathPr {

struct ExitStatus {
	bool exited = false;  // normal exit, `code` valid
	int code = 0;
	int signal = 0;       // valid when !exited

	bool Clean() const { return exited && code == 0; }
	std::string Describe() const;
};

/**
 * Handle on a long-running background process (I/O oracle, path-failure
 * injector). Supervision is by liveness checks and signals only.
 */
class IChildProcess {
	public:
		virtual ~IChildProcess() = default;

		virtual pid_t pid() const = 0;

		// Reaps the process if it has exited
		virtual bool IsAlive() = 0;

		/**
		 * SIGTERM, then wait up to `timeout` for the exit.
		 * On timeout the process is killed and BackgroundProcessFault thrown.
		 * Returns the exit status; judging it is up to the caller.
		 */
		virtual ExitStatus Stop(std::chrono::milliseconds timeout) = 0;

		// Set once the process has been reaped
		virtual std::optional<ExitStatus> exit_status() const = 0;
};

using ProcessLauncher =
	std::function<std::unique_ptr<IChildProcess>(const std::vector<std::string>& argv)>;

/**
 * fork/exec'd child in its own process group, so a terminal ^C reaches
 * only the driver and the signals we send reach the whole group.
 * The destructor kills and reaps a child that is still running.
 */
class ChildProcess : public IChildProcess {
	public:
		// Throws BackgroundProcessFault if the program cannot be executed
		static std::unique_ptr<ChildProcess> Start(const std::vector<std::string>& argv);

		~ChildProcess() override;

		ChildProcess(const ChildProcess&) = delete;
		ChildProcess& operator=(const ChildProcess&) = delete;

		pid_t pid() const override { return pid_; }
		bool IsAlive() override;
		ExitStatus Stop(std::chrono::milliseconds timeout) override;
		std::optional<ExitStatus> exit_status() const override { return status_; }

		const std::string& name() const { return name_; }

	private:
		ChildProcess(pid_t pid, std::string name) : pid_(pid), name_(std::move(name)) {}

		// waitpid with WNOHANG when !block; true once reaped
		bool Reap(bool block);

		pid_t pid_;
		std::string name_;
		std::optional<ExitStatus> status_;
};

ProcessLauncher DefaultLauncher();

} // namespace MpathPr

#endif // MPATHPR_ORACLE_CHILD_PROCESS_H_

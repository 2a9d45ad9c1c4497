#ifndef MPATHPR_ORACLE_IO_ORACLE_H_
#define MPATHPR_ORACLE_IO_ORACLE_H_

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "child_process.h"
#include "pr/pr_state.h"

namespace MpathPr {

struct OracleOptions {
	std::string program = "mpath_pr_io_oracle";
	// Extra arguments placed before <device> <pass|fail>
	std::vector<std::string> extra_args;
	std::chrono::milliseconds start_grace{100};
	std::chrono::milliseconds stop_timeout{30000};
};

/**
 * Supervises the background I/O oracle: a process that keeps writing to
 * the protected volume and exits non-zero as soon as a write outcome
 * contradicts its expectation.
 *
 * Protocol around an operation that changes the expectation:
 *   StopIfChanging(next)  -> stops the oracle, clean exit required
 *   <operation>
 *   Start(next)           -> restarts with the new expectation
 * Operations that keep the expectation run under the live oracle.
 */
class IoOracleController {
	public:
		using Sleeper = std::function<void(std::chrono::milliseconds)>;

		IoOracleController(std::string device, OracleOptions options,
				ProcessLauncher launcher = DefaultLauncher());
		~IoOracleController();

		// Throws BackgroundProcessFault if already running or it dies during start grace
		void Start(IoExpectation expectation);

		// SIGTERM and bounded wait; a non-clean exit is a BackgroundProcessFault
		void Stop();

		// Stops the oracle if `next` differs from the running expectation.
		// Returns true if it was stopped and must be restarted.
		bool StopIfChanging(IoExpectation next);

		// Throws BackgroundProcessFault, with the exit status, if the oracle died
		void CheckAlive();

		// Shutdown path: stop if running, never throws
		bool StopQuietly();

		bool running() const { return process_ != nullptr; }
		std::optional<IoExpectation> expectation() const { return expectation_; }

		void SetSleeper(Sleeper sleeper) { sleeper_ = std::move(sleeper); }

	private:
		std::string device_;
		OracleOptions options_;
		ProcessLauncher launcher_;
		Sleeper sleeper_;

		std::unique_ptr<IChildProcess> process_;
		std::optional<IoExpectation> expectation_;
};

} // namespace MpathPr

#endif // MPATHPR_ORACLE_IO_ORACLE_H_

#include "fault_injector.h"

#include <signal.h>

#include <glog/logging.h>
#include "common/errors.h"

namespace MpathPr {

FaultInjector::FaultInjector(std::string program, std::string map,
		std::chrono::milliseconds stop_timeout, ProcessLauncher launcher)
	: program_(std::move(program)),
	  map_(std::move(map)),
	  stop_timeout_(stop_timeout),
	  launcher_(std::move(launcher)) {}

FaultInjector::~FaultInjector() {
	StopQuietly();
}

void FaultInjector::Start() {
	if (process_) {
		return;
	}
	LOG(INFO) << "Starting background multipath test...";
	process_ = launcher_({program_, map_});
	LOG(INFO) << "Background test started with PID " << process_->pid();
}

void FaultInjector::CheckAlive() {
	if (!process_) {
		throw BackgroundProcessFault("path-failure injector is not running");
	}
	if (!process_->IsAlive()) {
		auto status = process_->exit_status();
		process_.reset();
		throw BackgroundProcessFault("path-failure injector unexpectedly stopped with " +
			(status ? status->Describe() : std::string("unknown status")));
	}
}

void FaultInjector::Stop() {
	if (!process_) {
		return;
	}
	LOG(INFO) << "Stopping background test (PID " << process_->pid() << ")...";
	std::unique_ptr<IChildProcess> process = std::move(process_);
	ExitStatus status = process->Stop(stop_timeout_);
	// Dying from the SIGTERM we sent counts as a clean stop
	if (!status.Clean() && !(!status.exited && status.signal == SIGTERM)) {
		throw BackgroundProcessFault("path-failure injector exited with " + status.Describe());
	}
}

bool FaultInjector::StopQuietly() {
	try {
		Stop();
		return true;
	} catch (const PrTestError& e) {
		LOG(ERROR) << e.what();
		return false;
	}
}

} // namespace MpathPr

#include "io_oracle.h"

#include <thread>

#include <glog/logging.h>
#include "common/errors.h"

namespace MpathPr {

IoOracleController::IoOracleController(std::string device, OracleOptions options,
		ProcessLauncher launcher)
	: device_(std::move(device)),
	  options_(std::move(options)),
	  launcher_(std::move(launcher)),
	  sleeper_([](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); }) {}

IoOracleController::~IoOracleController() {
	StopQuietly();
}

void IoOracleController::Start(IoExpectation expectation) {
	if (process_) {
		throw BackgroundProcessFault("I/O test is already running (PID: " +
			std::to_string(process_->pid()) + ")");
	}
	LOG(INFO) << "Starting background I/O test (expected: " << ExpectationName(expectation) << ")";

	std::vector<std::string> argv = {options_.program};
	argv.insert(argv.end(), options_.extra_args.begin(), options_.extra_args.end());
	argv.push_back(device_);
	argv.push_back(ExpectationName(expectation));

	auto process = launcher_(argv);
	sleeper_(options_.start_grace);
	if (!process->IsAlive()) {
		auto status = process->exit_status();
		throw BackgroundProcessFault("Failed to start I/O test process: " +
			(status ? status->Describe() : std::string("no exit status")));
	}

	LOG(INFO) << "I/O test started successfully (PID: " << process->pid() << ")";
	process_ = std::move(process);
	expectation_ = expectation;
}

void IoOracleController::Stop() {
	if (!process_) {
		throw BackgroundProcessFault("I/O test is not currently running");
	}
	LOG(INFO) << "Stopping background I/O test (PID: " << process_->pid() << ")";

	// Forget the process before anything can throw; it is reaped either way
	std::unique_ptr<IChildProcess> process = std::move(process_);
	expectation_.reset();

	ExitStatus status = process->Stop(options_.stop_timeout);
	if (!status.Clean()) {
		throw BackgroundProcessFault("I/O test failed with " + status.Describe());
	}
	LOG(INFO) << "I/O test stopped successfully";
}

bool IoOracleController::StopIfChanging(IoExpectation next) {
	if (expectation_.has_value() && *expectation_ == next) {
		return false;
	}
	LOG(INFO) << "I/O expectation will change, stopping I/O test";
	Stop();
	return true;
}

void IoOracleController::CheckAlive() {
	if (!process_) {
		throw BackgroundProcessFault("I/O test should be running but is not");
	}
	if (!process_->IsAlive()) {
		auto status = process_->exit_status();
		process_.reset();
		expectation_.reset();
		throw BackgroundProcessFault("I/O test process unexpectedly stopped with " +
			(status ? status->Describe() : std::string("unknown status")));
	}
	VLOG(1) << "I/O test is running normally";
}

bool IoOracleController::StopQuietly() {
	if (!process_) {
		return true;
	}
	try {
		Stop();
		return true;
	} catch (const PrTestError& e) {
		LOG(ERROR) << e.what();
		return false;
	}
}

} // namespace MpathPr

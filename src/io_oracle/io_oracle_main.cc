#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <string>
#include <thread>
#include <vector>
#include <sys/stat.h>

// Third-party libraries
#include <cxxopts.hpp>
#include <glog/logging.h>

// Project includes
#include "common/errors.h"
#include "tools/command_runner.h"
#include "write_checker.h"

namespace {

std::atomic<bool> g_terminated{false};

void TermHandler(int) {
	g_terminated.store(true);
}

} // end of namespace

// mpath_pr_io_oracle [options] <device> <pass|fail>
// Keeps writing to <device> until SIGTERM (exit 0) or until a write outcome
// contradicts the expectation (exit 1).
int main(int argc, char* argv[]) {
	google::InitGoogleLogging(argv[0]);
	google::InstallFailureSignalHandler();
	FLAGS_logtostderr = 1; // log only to console, no files

	cxxopts::Options options("mpath_pr_io_oracle", "Background write checker for mpath_pr_test");
	options.positional_help("<device> <pass|fail>");

	options.add_options()
		("sg_dd", "Block writer", cxxopts::value<std::string>()->default_value("sg_dd"))
		("probe", "Path reprobe utility", cxxopts::value<std::string>()->default_value("./probe"))
		("interval_ms", "Pause between writes", cxxopts::value<int>()->default_value("100"))
		("conflict_status", "Writer exit status for a reservation conflict",
		 cxxopts::value<int>()->default_value("24"))
		("block_size", "Write block size", cxxopts::value<int>()->default_value("512"))
		("block_count", "Blocks per write", cxxopts::value<int>()->default_value("8"))
		("l,log_level", "Log level", cxxopts::value<int>()->default_value("0"))
		("args", "<device> <pass|fail>", cxxopts::value<std::vector<std::string>>());
	options.parse_positional({"args"});

	auto arguments = options.parse(argc, argv);
	FLAGS_v = arguments["log_level"].as<int>();

	std::vector<std::string> args;
	if (arguments.count("args")) {
		args = arguments["args"].as<std::vector<std::string>>();
	}
	if (args.size() != 2) {
		std::cerr << options.help() << std::endl;
		return EXIT_FAILURE;
	}
	const std::string device = args[0];
	MpathPr::IoExpectation expectation;
	if (args[1] == "pass") {
		expectation = MpathPr::IoExpectation::kPass;
	} else if (args[1] == "fail") {
		expectation = MpathPr::IoExpectation::kFail;
	} else {
		LOG(ERROR) << "Expected result must be 'pass' or 'fail', got '" << args[1] << "'";
		return EXIT_FAILURE;
	}

	struct stat st;
	if (stat(device.c_str(), &st) != 0) {
		LOG(ERROR) << "Device '" << device << "' does not exist";
		return EXIT_FAILURE;
	}

	struct sigaction sa {};
	sa.sa_handler = TermHandler;
	sigemptyset(&sa.sa_mask);
	sigaction(SIGTERM, &sa, nullptr);

	MpathPr::WriteCheckerOptions checker_options;
	checker_options.sg_dd = arguments["sg_dd"].as<std::string>();
	checker_options.probe = arguments["probe"].as<std::string>();
	checker_options.conflict_status = arguments["conflict_status"].as<int>();
	checker_options.block_size = arguments["block_size"].as<int>();
	checker_options.block_count = arguments["block_count"].as<int>();
	const auto interval = std::chrono::milliseconds(arguments["interval_ms"].as<int>());

	// sg_dd complains on every rejected write; the verdict is all we need.
	// It stays in our process group so stopping the oracle stops it too.
	MpathPr::LocalRunnerOptions runner_options;
	runner_options.discard_stderr = true;
	runner_options.own_process_group = false;
	MpathPr::LocalCommandRunner runner(runner_options);
	MpathPr::WriteChecker checker(runner, device, checker_options);

	LOG(INFO) << "Starting I/O test on " << device << " (expected: "
		<< MpathPr::ExpectationName(expectation) << ")";

	while (!g_terminated.load()) {
		MpathPr::WriteChecker::Outcome outcome;
		try {
			outcome = checker.Check(expectation);
		} catch (const MpathPr::ToolInvocationFailure& e) {
			LOG(ERROR) << e.what();
			return EXIT_FAILURE;
		}
		switch (outcome) {
			case MpathPr::WriteChecker::Outcome::kWritten:
				std::cout << '.' << std::flush;
				break;
			case MpathPr::WriteChecker::Outcome::kRejected:
				std::cout << 'x' << std::flush;
				break;
			case MpathPr::WriteChecker::Outcome::kViolation:
				std::cout << std::endl;
				LOG(ERROR) << "FAILURE: " << checker.violation();
				return EXIT_FAILURE;
		}
		std::this_thread::sleep_for(interval);
	}

	std::cout << std::endl;
	LOG(INFO) << "Received TERM signal, exiting successfully";
	return EXIT_SUCCESS;
}

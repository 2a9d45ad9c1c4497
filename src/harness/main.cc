#include <atomic>
#include <climits>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <random>
#include <string>
#include <vector>
#include <unistd.h>

// Third-party libraries
#include <cxxopts.hpp>
#include <glog/logging.h>

// Project includes
#include "common/configuration.h"
#include "common/errors.h"
#include "driver.h"
#include "executor.h"
#include "oracle/fault_injector.h"
#include "oracle/io_oracle.h"
#include "preflight.h"
#include "tools/command_runner.h"
#include "tools/multipath_daemon.h"
#include "tools/pr_tool.h"
#include "verifier.h"

namespace {

std::atomic<bool> g_stop_requested{false};

void SignalHandler(int) {
	g_stop_requested.store(true);
}

void InstallStopHandlers() {
	struct sigaction sa {};
	sa.sa_handler = SignalHandler;
	sigemptyset(&sa.sa_mask);
	sa.sa_flags = 0;
	sigaction(SIGINT, &sa, nullptr);
	sigaction(SIGTERM, &sa, nullptr);
}

struct Targets {
	std::string map;          // device1, a multipath map name
	std::string peer;         // device2, raw device or remote map name
	std::string remote_host;  // empty for the single-host variant

	bool remote() const { return !remote_host.empty(); }
	std::string map_device() const { return "/dev/mapper/" + map; }
	std::string peer_device() const { return remote() ? "/dev/mapper/" + peer : "/dev/" + peer; }
};

std::vector<std::string> OracleArgs(const MpathPr::MpathPrConfig& config, int log_level) {
	return {
		"--sg_dd=" + config.tools.sg_dd.get(),
		"--probe=" + config.tools.probe.get(),
		"--interval_ms=" + std::to_string(config.oracle.write_interval_ms.get()),
		"--conflict_status=" + std::to_string(config.oracle.conflict_status.get()),
		"--block_size=" + std::to_string(config.oracle.block_size.get()),
		"--block_count=" + std::to_string(config.oracle.block_count.get()),
		"--log_level=" + std::to_string(log_level),
	};
}

// The oracle is built alongside this binary; prefer PATH, then our own directory
std::string ResolveOracle(const std::string& program) {
	if (program.find('/') != std::string::npos || MpathPr::ProgramExists(program)) {
		return program;
	}
	char self[PATH_MAX];
	ssize_t len = readlink("/proc/self/exe", self, sizeof(self) - 1);
	if (len <= 0) {
		return program;
	}
	std::string dir(self, static_cast<size_t>(len));
	std::string sibling = dir.substr(0, dir.rfind('/') + 1) + program;
	return MpathPr::ProgramExists(sibling) ? sibling : program;
}

int RunTest(const Targets& targets, const MpathPr::MpathPrConfig& config, int log_level) {
	using namespace MpathPr;

	const std::string oracle_program = ResolveOracle(config.tools.io_oracle.get());
	std::vector<std::string> required = {
		config.tools.mpathpersist.get(), config.tools.multipath.get(),
		config.tools.multipathd.get(), config.tools.sg_dd.get(),
		config.tools.probe.get(), oracle_program,
	};
	if (targets.remote()) {
		required.push_back(config.tools.ssh.get());
	} else {
		required.push_back(config.tools.sg_persist.get());
		required.push_back(config.tools.udevadm.get());
	}
	if (config.injector.enabled.get()) {
		required.push_back(config.injector.command.get());
	}
	RequirePrograms(required);

	auto local_runner = std::make_shared<LocalCommandRunner>();
	MultipathDaemon daemon(local_runner, config.tools.multipathd.get(), config.tools.multipath.get());

	RetryPolicy retry;
	retry.max_attempts = config.retry.unit_attention_retries.get();
	retry.delay = std::chrono::milliseconds(config.retry.unit_attention_delay_ms.get());
	retry.unit_attention_status = config.retry.unit_attention_status.get();

	PersistTool local_tool(local_runner, config.tools.mpathpersist.get(), targets.map_device(), retry);

	std::shared_ptr<ICommandRunner> peer_runner = local_runner;
	std::string peer_program = config.tools.sg_persist.get();
	std::string peer_wwid;
	if (targets.remote()) {
		peer_runner = std::make_shared<RemoteCommandRunner>(local_runner, config.tools.ssh.get(),
				targets.remote_host);
		peer_program = config.tools.mpathpersist.get();
		MultipathDaemon remote_daemon(peer_runner, config.tools.multipathd.get(),
				config.tools.multipath.get());
		peer_wwid = remote_daemon.MapWwid(targets.peer);
	} else {
		peer_wwid = RawDeviceWwid(*local_runner, config.tools.udevadm.get(), targets.peer_device());
	}
	PersistTool peer_tool(peer_runner, peer_program, targets.peer_device(), retry);

	std::string peer_name = targets.remote() ? targets.remote_host + ":" + targets.peer : targets.peer;
	VerifySameStorage(daemon, targets.map, peer_name, peer_wwid);

	VerifyOptions verify_options;
	verify_options.check_multipathd = config.verify.check_multipathd.get();
	verify_options.cross_check_peer_path = config.verify.cross_check_peer_path.get();

	CommandExecutor executor(local_tool, peer_tool);
	Verifier verifier(local_tool, &daemon, targets.map, &peer_tool, verify_options);

	const auto stop_timeout = std::chrono::milliseconds(config.timing.stop_timeout_ms.get());
	OracleOptions oracle_options;
	oracle_options.program = oracle_program;
	oracle_options.extra_args = OracleArgs(config, log_level);
	oracle_options.start_grace = std::chrono::milliseconds(config.timing.start_grace_ms.get());
	oracle_options.stop_timeout = stop_timeout;
	IoOracleController oracle(targets.map_device(), oracle_options);

	std::unique_ptr<FaultInjector> injector;
	if (config.injector.enabled.get()) {
		injector = std::make_unique<FaultInjector>(config.injector.command.get(), targets.map,
				stop_timeout);
	} else {
		LOG(WARNING) << "Path-failure injector disabled";
	}

	DriverOptions options;
	options.map = targets.map;
	options.peer_key = config.keys.peer_key.get();
	options.first_local_key = config.keys.first_local_key.get();
	options.seed = config.run.seed.get();
	if (options.seed == 0) {
		options.seed = std::random_device{}();
	}
	options.iterations = config.run.iterations.get();
	options.settle = std::chrono::milliseconds(config.timing.settle_ms.get());
	options.iteration_pause = std::chrono::milliseconds(config.timing.iteration_pause_ms.get());

	Driver driver(local_tool, &daemon, executor, verifier, oracle, injector.get(),
			g_stop_requested, options);
	return driver.Run();
}

} // end of namespace

int main(int argc, char* argv[]) {
	// Initialize logging
	google::InitGoogleLogging(argv[0]);
	google::InstallFailureSignalHandler();
	FLAGS_logtostderr = 1; // log only to console, no files
	FLAGS_colorlogtostderr = 1;

	cxxopts::Options options("mpath_pr_test",
			"Randomized SCSI-3 Persistent Reservation test for multipath devices");
	options.positional_help("<device1> [remote_host] <device2>");

	options.add_options()
		("config", "YAML configuration file", cxxopts::value<std::string>())
		("seed", "Random seed, 0 picks one", cxxopts::value<size_t>())
		("iterations", "Stop after this many iterations, 0 runs until interrupted",
		 cxxopts::value<size_t>())
		("settle_ms", "I/O validation time after each command", cxxopts::value<int>())
		("no_injector", "Do not run the path-failure injector")
		("l,log_level", "Log level", cxxopts::value<int>()->default_value("0"))
		("h,help", "Print usage")
		("devices", "Devices", cxxopts::value<std::vector<std::string>>());
	options.parse_positional({"devices"});

	auto arguments = options.parse(argc, argv);

	if (arguments.count("help")) {
		std::cout << options.help() << std::endl
			<< "  device1: multipath device (e.g., mpatha)" << std::endl
			<< "  device2: SCSI device pointing to same storage (e.g., sdb)," << std::endl
			<< "           or a multipath device on remote_host" << std::endl;
		return EXIT_SUCCESS;
	}

	int log_level = arguments["log_level"].as<int>();
	FLAGS_v = log_level;

	Targets targets;
	std::vector<std::string> devices;
	if (arguments.count("devices")) {
		devices = arguments["devices"].as<std::vector<std::string>>();
	}
	if (devices.size() == 2) {
		targets.map = devices[0];
		targets.peer = devices[1];
	} else if (devices.size() == 3) {
		targets.map = devices[0];
		targets.remote_host = devices[1];
		targets.peer = devices[2];
	} else {
		std::cerr << options.help() << std::endl;
		return EXIT_FAILURE;
	}

	MpathPr::Configuration& configuration = MpathPr::Configuration::getInstance();
	if (arguments.count("config") &&
			!configuration.loadFromFile(arguments["config"].as<std::string>())) {
		for (const auto& error : configuration.getValidationErrors()) {
			LOG(ERROR) << "Configuration: " << error;
		}
		return EXIT_FAILURE;
	}

	// Command line wins over file and environment
	MpathPr::MpathPrConfig& config = configuration.config();
	if (arguments.count("seed")) {
		config.run.seed = MpathPr::ConfigValue<size_t>(arguments["seed"].as<size_t>());
	}
	if (arguments.count("iterations")) {
		config.run.iterations = MpathPr::ConfigValue<size_t>(arguments["iterations"].as<size_t>());
	}
	if (arguments.count("settle_ms")) {
		config.timing.settle_ms = MpathPr::ConfigValue<int>(arguments["settle_ms"].as<int>());
	}
	if (arguments.count("no_injector")) {
		config.injector.enabled = MpathPr::ConfigValue<bool>(false);
	}
	if (!configuration.validate()) {
		for (const auto& error : configuration.getValidationErrors()) {
			LOG(ERROR) << "Configuration: " << error;
		}
		return EXIT_FAILURE;
	}

	InstallStopHandlers();

	LOG(INFO) << "Starting mpath_pr_test for devices: " << targets.map << " (multipath) and "
		<< (targets.remote() ? targets.remote_host + ":" : std::string()) << targets.peer
		<< (targets.remote() ? " (remote multipath)" : " (SCSI)");

	try {
		MpathPr::RequireRoot();
		return RunTest(targets, MpathPr::GetConfig().config(), log_level);
	} catch (const MpathPr::PrTestError& e) {
		// Failures before the test loop starts; nothing to clean up yet
		LOG(ERROR) << e.what();
		return EXIT_FAILURE;
	}
}

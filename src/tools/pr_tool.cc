#include "pr_tool.h"

#include <thread>

#include <glog/logging.h>
#include "common/errors.h"

namespace MpathPr {

namespace {

std::string Param(const char* name, Key key) {
	return std::string("--") + name + "=" + FormatKey(key);
}

std::string TypeParam(int type) {
	return "--prout-type=" + std::to_string(type);
}

} // namespace

PersistTool::PersistTool(std::shared_ptr<ICommandRunner> runner, std::string program,
		std::string device, RetryPolicy retry)
	: runner_(std::move(runner)),
	  program_(std::move(program)),
	  device_(std::move(device)),
	  retry_(retry),
	  sleeper_([](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); }) {}

CommandResult PersistTool::RunWithRetry(std::vector<std::string> args) {
	std::vector<std::string> argv;
	argv.reserve(args.size() + 2);
	argv.push_back(program_);
	for (auto& arg : args) {
		argv.push_back(std::move(arg));
	}
	argv.push_back(device_);

	auto run_once = [&]() {
		CommandResult result = runner_->Run(argv);
		if (result.exit_status == retry_.unit_attention_status) {
			throw RetryableTransient(JoinCommand(argv) + ": Unit Attention");
		}
		return result;
	};

	for (int attempt = 1; ; ++attempt) {
		try {
			return run_once();
		} catch (const RetryableTransient& e) {
			if (attempt >= retry_.max_attempts) {
				LOG(ERROR) << program_ << " failed after " << retry_.max_attempts
					<< " retries due to Unit Attention";
				throw;
			}
			LOG(INFO) << "Unit Attention occurred (attempt " << attempt << "/"
				<< retry_.max_attempts << "), retrying...";
			sleeper_(retry_.delay);
		}
	}
}

void PersistTool::RunOut(const std::string& action, std::vector<std::string> params) {
	std::vector<std::string> args = {"--out", action};
	args.insert(args.end(), params.begin(), params.end());
	const std::string command = program_ + " " + JoinCommand(args) + " " + device_;
	VLOG(1) << command;

	CommandResult result = RunWithRetry(std::move(args));
	if (!result.ok()) {
		throw ToolInvocationFailure(command + " failed with status " +
			std::to_string(result.exit_status) + (result.output.empty() ? "" : ": " + result.output));
	}
}

void PersistTool::Register(std::optional<Key> reservation_key, Key service_action_key) {
	std::vector<std::string> params;
	if (reservation_key.has_value()) {
		params.push_back(Param("param-rk", *reservation_key));
	}
	params.push_back(Param("param-sark", service_action_key));
	RunOut("--register", std::move(params));
}

void PersistTool::RegisterIgnore(Key service_action_key) {
	RunOut("--register-ignore", {Param("param-sark", service_action_key)});
}

void PersistTool::Reserve(Key reservation_key, int type) {
	RunOut("--reserve", {Param("param-rk", reservation_key), TypeParam(type)});
}

void PersistTool::Release(Key reservation_key, int type) {
	RunOut("--release", {Param("param-rk", reservation_key), TypeParam(type)});
}

void PersistTool::Clear(Key reservation_key) {
	RunOut("--clear", {Param("param-rk", reservation_key)});
}

void PersistTool::Preempt(Key reservation_key, Key service_action_key, int type) {
	RunOut("--preempt", {Param("param-rk", reservation_key),
		Param("param-sark", service_action_key), TypeParam(type)});
}

std::string PersistTool::DumpKeys() {
	CommandResult result = RunWithRetry({"-ik"});
	if (!result.ok()) {
		throw ToolInvocationFailure(program_ + " -ik " + device_ + " failed with status " +
			std::to_string(result.exit_status));
	}
	return result.output;
}

std::string PersistTool::DumpReservation() {
	CommandResult result = RunWithRetry({"-ir"});
	if (!result.ok()) {
		throw ToolInvocationFailure(program_ + " -ir " + device_ + " failed with status " +
			std::to_string(result.exit_status));
	}
	return result.output;
}

KeyReport PersistTool::ReadKeys() {
	return ParseKeyReport(DumpKeys());
}

ReservationReport PersistTool::ReadReservation() {
	return ParseReservationReport(DumpReservation());
}

} // namespace MpathPr

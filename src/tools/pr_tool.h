#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "common/key.h"
#include "pr/status_parser.h"
#include "command_runner.h"

namespace MpathPr {

/**
 * PERSISTENT RESERVE IN/OUT through one access path.
 * Every OUT call either succeeds or throws (ToolInvocationFailure, or
 * RetryableTransient once the Unit Attention retries are used up).
 */
class IPrTool {
public:
	virtual ~IPrTool() = default;

	// REGISTER; `reservation_key` omitted when the path holds no key yet
	virtual void Register(std::optional<Key> reservation_key, Key service_action_key) = 0;
	// REGISTER AND IGNORE EXISTING KEY
	virtual void RegisterIgnore(Key service_action_key) = 0;
	virtual void Reserve(Key reservation_key, int type) = 0;
	virtual void Release(Key reservation_key, int type) = 0;
	virtual void Clear(Key reservation_key) = 0;
	virtual void Preempt(Key reservation_key, Key service_action_key, int type) = 0;

	virtual KeyReport ReadKeys() = 0;
	virtual ReservationReport ReadReservation() = 0;

	// Raw READ output for the exit-state dump
	virtual std::string DumpKeys() = 0;
	virtual std::string DumpReservation() = 0;

	// Device path as given to the tool, for messages
	virtual const std::string& device() const = 0;
};

struct RetryPolicy {
	int max_attempts = 3;
	std::chrono::milliseconds delay{100};
	int unit_attention_status = 6;
};

/**
 * sg_persist / mpathpersist front end. Both tools take the same options,
 * so one implementation serves the raw path and the multipath map.
 */
class PersistTool : public IPrTool {
public:
	using Sleeper = std::function<void(std::chrono::milliseconds)>;

	PersistTool(std::shared_ptr<ICommandRunner> runner, std::string program,
			std::string device, RetryPolicy retry);

	void Register(std::optional<Key> reservation_key, Key service_action_key) override;
	void RegisterIgnore(Key service_action_key) override;
	void Reserve(Key reservation_key, int type) override;
	void Release(Key reservation_key, int type) override;
	void Clear(Key reservation_key) override;
	void Preempt(Key reservation_key, Key service_action_key, int type) override;

	KeyReport ReadKeys() override;
	ReservationReport ReadReservation() override;
	std::string DumpKeys() override;
	std::string DumpReservation() override;

	const std::string& device() const override { return device_; }

	// Tests replace the back-off sleep
	void SetSleeper(Sleeper sleeper) { sleeper_ = std::move(sleeper); }

private:
	CommandResult RunWithRetry(std::vector<std::string> args);
	void RunOut(const std::string& action, std::vector<std::string> params);

	std::shared_ptr<ICommandRunner> runner_;
	std::string program_;
	std::string device_;
	RetryPolicy retry_;
	Sleeper sleeper_;
};

} // namespace MpathPr

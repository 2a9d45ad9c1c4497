#pragma once

#include <chrono>
#include <memory>
#include <string>

#include "child_process.h"

namespace MpathPr {

/**
 * The path-failure injector: an external program that keeps taking the
 * map's paths offline and back online. It restores every path when it
 * receives SIGTERM.
 */
class FaultInjector {
	public:
		FaultInjector(std::string program, std::string map, std::chrono::milliseconds stop_timeout,
				ProcessLauncher launcher = DefaultLauncher());
		~FaultInjector();

		void Start();
		// Throws BackgroundProcessFault if the injector has died
		void CheckAlive();
		// Throws BackgroundProcessFault on timeout or unclean exit
		void Stop();
		// Shutdown path, never throws
		bool StopQuietly();

		bool running() const { return process_ != nullptr; }

	private:
		std::string program_;
		std::string map_;
		std::chrono::milliseconds stop_timeout_;
		ProcessLauncher launcher_;
		std::unique_ptr<IChildProcess> process_;
};

} // namespace MpathPr

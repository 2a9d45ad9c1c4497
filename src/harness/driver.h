#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <random>
#include <string>

#include "executor.h"
#include "oracle/fault_injector.h"
#include "oracle/io_oracle.h"
#include "pr/pr_state.h"
#include "tools/multipath_daemon.h"
#include "verifier.h"

namespace MpathPr {

struct DriverOptions {
    std::string map;
    Key peer_key = 0x1;
    Key first_local_key = 0x2;
    uint64_t seed = 0;
    // 0 runs until interrupted
    size_t iterations = 0;
    // Oracle gets this long to exercise the volume before its liveness check
    std::chrono::milliseconds settle{5000};
    std::chrono::milliseconds iteration_pause{1000};
};

/**
 * The test loop:
 *
 *   Idle -> Selecting -> Executing -> Verifying -> OracleChecking -> Selecting ...
 *
 * Idle clears and verifies the LU, then starts the I/O oracle and the
 * path-failure injector. Any PrTestError moves straight to Terminated,
 * which always runs the same idempotent cleanup. Run() returns the
 * process exit status: 0 after an interruption or the configured number
 * of iterations, 1 after a fatal error or a failed cleanup.
 */
class Driver {
public:
    enum class Phase {
        kIdle,
        kSelecting,
        kExecuting,
        kVerifying,
        kOracleChecking,
        kTerminated,
    };

    Driver(IPrTool& local, IMultipathDaemon* daemon, CommandExecutor& executor,
           Verifier& verifier, IoOracleController& oracle, FaultInjector* injector,
           const std::atomic<bool>& stop_requested, DriverOptions options);

    int Run();

    // Safe to call more than once; returns false if any step failed
    bool Shutdown();

    Phase phase() const { return phase_; }
    const PrState& state() const { return state_; }
    size_t iterations_completed() const { return iterations_completed_; }

private:
    void Startup();
    void RunIteration();
    void EnterPhase(Phase phase);
    void DumpExitState();
    // Sleeps in short slices; returns false if a stop was requested
    bool Sleep(std::chrono::milliseconds duration);

    IPrTool& local_;
    IMultipathDaemon* daemon_;
    CommandExecutor& executor_;
    Verifier& verifier_;
    IoOracleController& oracle_;
    FaultInjector* injector_;
    const std::atomic<bool>& stop_requested_;
    DriverOptions options_;

    std::mt19937_64 rng_;
    PrState state_;
    Phase phase_ = Phase::kIdle;
    size_t iterations_completed_ = 0;
    bool shutdown_done_ = false;
    bool shutdown_ok_ = true;
};

const char* PhaseName(Driver::Phase phase);

} // namespace MpathPr

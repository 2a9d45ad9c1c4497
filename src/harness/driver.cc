#include "driver.h"

#include <algorithm>
#include <thread>

#include <glog/logging.h>
#include "common/errors.h"
#include "pr/legality.h"
#include "pr/transition.h"

namespace MpathPr {

namespace {

constexpr auto kSleepSlice = std::chrono::milliseconds(50);

} // namespace

const char* PhaseName(Driver::Phase phase) {
    switch (phase) {
        case Driver::Phase::kIdle: return "Idle";
        case Driver::Phase::kSelecting: return "Selecting";
        case Driver::Phase::kExecuting: return "Executing";
        case Driver::Phase::kVerifying: return "Verifying";
        case Driver::Phase::kOracleChecking: return "OracleChecking";
        case Driver::Phase::kTerminated: return "Terminated";
    }
    return "Unknown";
}

Driver::Driver(IPrTool& local, IMultipathDaemon* daemon, CommandExecutor& executor,
               Verifier& verifier, IoOracleController& oracle, FaultInjector* injector,
               const std::atomic<bool>& stop_requested, DriverOptions options)
    : local_(local),
      daemon_(daemon),
      executor_(executor),
      verifier_(verifier),
      oracle_(oracle),
      injector_(injector),
      stop_requested_(stop_requested),
      options_(std::move(options)),
      rng_(options_.seed),
      state_(InitialState(options_.peer_key, options_.first_local_key)) {}

void Driver::EnterPhase(Phase phase) {
    VLOG(2) << "Phase " << PhaseName(phase_) << " -> " << PhaseName(phase);
    phase_ = phase;
}

bool Driver::Sleep(std::chrono::milliseconds duration) {
    auto deadline = std::chrono::steady_clock::now() + duration;
    while (!stop_requested_.load()) {
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            return true;
        }
        std::this_thread::sleep_for(std::min<std::chrono::steady_clock::duration>(kSleepSlice, deadline - now));
    }
    return false;
}

void Driver::Startup() {
    if (!executor_.ClearAllRegistrations()) {
        LOG(WARNING) << "Initial clear reported errors, checking what is left registered";
    }
    verifier_.VerifyCleared();
    state_ = InitialState(options_.peer_key, options_.first_local_key);

    // Nothing is registered or reserved, so writes must succeed
    oracle_.Start(ExpectedIo(state_));
    if (injector_ != nullptr) {
        injector_->Start();
    }
}

void Driver::RunIteration() {
    EnterPhase(Phase::kSelecting);
    const std::vector<Operation> ops = LegalOperations(state_);
    std::uniform_int_distribution<size_t> pick(0, ops.size() - 1);
    const PlannedOperation plan = PlanOperation(state_, ops[pick(rng_)], rng_);
    LOG(INFO) << "Selected command: " << OperationName(plan.op);

    EnterPhase(Phase::kExecuting);
    const IoExpectation next_expectation = ExpectedIo(Transition(state_, plan));
    const bool oracle_stopped = oracle_.StopIfChanging(next_expectation);
    state_ = executor_.Execute(state_, plan);
    if (oracle_stopped) {
        LOG(INFO) << "Restarting I/O test with new expectation: "
                  << ExpectationName(ExpectedIo(state_));
        oracle_.Start(ExpectedIo(state_));
    }

    EnterPhase(Phase::kVerifying);
    state_ = verifier_.Verify(state_);

    EnterPhase(Phase::kOracleChecking);
    LOG(INFO) << "Waiting " << options_.settle.count() << " ms for I/O test validation...";
    if (!Sleep(options_.settle)) {
        return;
    }
    oracle_.CheckAlive();
    if (injector_ != nullptr) {
        injector_->CheckAlive();
    }
    ++iterations_completed_;
}

int Driver::Run() {
    int exit_status = 0;
    EnterPhase(Phase::kIdle);
    LOG(INFO) << "Random seed: " << options_.seed;
    try {
        Startup();
        while (!stop_requested_.load()) {
            if (options_.iterations != 0 && iterations_completed_ >= options_.iterations) {
                LOG(INFO) << "Completed " << iterations_completed_ << " iterations";
                break;
            }
            LOG(INFO) << "=== Test iteration " << iterations_completed_ + 1 << " ===";
            RunIteration();
            if (stop_requested_.load()) {
                break;
            }
            LOG(INFO) << "Iteration " << iterations_completed_ << " completed successfully";
            Sleep(options_.iteration_pause);
        }
        if (stop_requested_.load()) {
            LOG(INFO) << "Interrupted after " << iterations_completed_ << " iterations";
        }
    } catch (const PrTestError& e) {
        LOG(ERROR) << "Fatal in phase " << PhaseName(phase_) << ": " << e.what();
        exit_status = 1;
    } catch (const std::exception& e) {
        LOG(ERROR) << "Unexpected error in phase " << PhaseName(phase_) << ": " << e.what();
        exit_status = 1;
    }

    if (!Shutdown()) {
        exit_status = 1;
    }
    return exit_status;
}

void Driver::DumpExitState() {
    LOG(INFO) << "Exit state. " << state_;
    try {
        LOG(INFO) << "Registered keys:\n" << local_.DumpKeys();
        LOG(INFO) << "Reservation:\n" << local_.DumpReservation();
        if (daemon_ != nullptr) {
            LOG(INFO) << "multipath state:\n" << daemon_->DumpTopology(options_.map);
        }
    } catch (const PrTestError& e) {
        LOG(WARNING) << "Could not dump exit state: " << e.what();
    }
}

bool Driver::Shutdown() {
    if (shutdown_done_) {
        return shutdown_ok_;
    }
    shutdown_done_ = true;
    EnterPhase(Phase::kTerminated);

    DumpExitState();
    LOG(INFO) << "Cleaning up...";
    bool ok = oracle_.StopQuietly();
    if (injector_ != nullptr) {
        ok = injector_->StopQuietly() && ok;
    }
    ok = executor_.ClearAllRegistrations() && ok;
    state_ = InitialState(options_.peer_key, options_.first_local_key);
    LOG(INFO) << "Cleanup complete";

    shutdown_ok_ = ok;
    return ok;
}

} // namespace MpathPr

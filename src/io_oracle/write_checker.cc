#include "write_checker.h"

#include <glog/logging.h>
#include "common/errors.h"

namespace MpathPr {

WriteChecker::WriteChecker(ICommandRunner& runner, std::string device, WriteCheckerOptions options)
    : runner_(runner), device_(std::move(device)), options_(std::move(options)) {}

std::vector<std::string> WriteChecker::WriteCommand() const {
    const std::string count = std::to_string(options_.block_count);
    return {options_.sg_dd, "if=/dev/zero", "of=" + device_,
            "bs=" + std::to_string(options_.block_size), "bpt=" + count, "count=" + count,
            "oflag=direct,sgio"};
}

bool WriteChecker::ReprobePaths() {
    CommandResult result = runner_.Run({options_.probe, device_});
    if (!result.ok()) {
        LOG(ERROR) << options_.probe << " " << device_ << " exited " << result.exit_status;
    }
    return result.ok();
}

WriteChecker::Outcome WriteChecker::Check(IoExpectation expectation) {
    const CommandResult result = runner_.Run(WriteCommand());
    if (result.ok()) {
        if (expectation == IoExpectation::kFail) {
            violation_ = "I/O succeeded but was expected to fail";
            return Outcome::kViolation;
        }
        return Outcome::kWritten;
    }

    if (expectation == IoExpectation::kPass) {
        if (result.exit_status == options_.conflict_status) {
            violation_ = "I/O failed with conflict but was expected to pass";
            return Outcome::kViolation;
        }
        // Most likely every path is down right now
        LOG(INFO) << "I/O failed with " << result.exit_status << ". checking paths";
        if (!ReprobePaths()) {
            violation_ = "probing paths failed";
            return Outcome::kViolation;
        }
    }
    return Outcome::kRejected;
}

} // namespace MpathPr

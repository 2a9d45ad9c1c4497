#pragma once

#include <string>
#include <vector>

#include "pr/pr_state.h"
#include "tools/command_runner.h"

namespace MpathPr {

struct WriteCheckerOptions {
    std::string sg_dd = "sg_dd";
    std::string probe = "./probe";
    int conflict_status = 24;
    int block_size = 512;
    int block_count = 8;
};

/**
 * One probe write against the protected volume, judged against what the
 * current reservation state says must happen to it.
 */
class WriteChecker {
public:
    enum class Outcome {
        kWritten,      // write succeeded as allowed
        kRejected,     // write failed and that is acceptable
        kViolation,    // outcome contradicts the expectation
    };

    WriteChecker(ICommandRunner& runner, std::string device, WriteCheckerOptions options);

    Outcome Check(IoExpectation expectation);

    std::vector<std::string> WriteCommand() const;

    // Set on kViolation
    const std::string& violation() const { return violation_; }

private:
    // The path reprobe utility; false if it reports a failure
    bool ReprobePaths();

    ICommandRunner& runner_;
    std::string device_;
    WriteCheckerOptions options_;
    std::string violation_;
};

} // namespace MpathPr

#pragma once

#include <gmock/gmock.h>
#include "../../src/tools/command_runner.h"

namespace MpathPr {

class MockCommandRunner : public ICommandRunner {
public:
    MOCK_METHOD(CommandResult, Run, (const std::vector<std::string>& argv), (override));
};

inline CommandResult Exited(int status, std::string output = "") {
    CommandResult result;
    result.exit_status = status;
    result.output = std::move(output);
    return result;
}

} // namespace MpathPr

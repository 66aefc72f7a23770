#ifndef NCSETUP_TESTS_FAKE_EXECUTOR_HPP
#define NCSETUP_TESTS_FAKE_EXECUTOR_HPP

#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include "executor.hpp"

namespace NetcapSetup {
namespace Testing {

// Records each step and answers with scripted exit codes (0 once exhausted).
class FakeExecutor : public Executor
{
public:
    explicit FakeExecutor(std::vector<int> exitCodes = {},
                          const std::ostringstream* out = nullptr)
        : exitCodes_(std::move(exitCodes)), out_(out)
    {
    }

    int execute(const Step& step) override
    {
        calls.push_back(step);
        if (out_) {
            outputAtCall.push_back(out_->str());
        }
        std::size_t index = calls.size() - 1;
        return index < exitCodes_.size() ? exitCodes_[index] : 0;
    }

    std::vector<Step> calls;
    std::vector<std::string> outputAtCall;

private:
    std::vector<int> exitCodes_;
    const std::ostringstream* out_;
};

} // namespace Testing
} // namespace NetcapSetup

#endif // NCSETUP_TESTS_FAKE_EXECUTOR_HPP

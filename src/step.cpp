#include "step.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace NetcapSetup {

FailurePolicy parseFailurePolicy(const std::string& value)
{
    std::string lowerVal = value;
    std::transform(lowerVal.begin(), lowerVal.end(), lowerVal.begin(),
                   [](unsigned char c)
                   {
                       return std::tolower(c);
                   });

    if (lowerVal == "abort") {
        return FailurePolicy::Abort;
    }
    if (lowerVal == "tolerate") {
        return FailurePolicy::Tolerate;
    }
    throw std::runtime_error("Unknown failure policy '" + value +
                             "' (expected 'abort' or 'tolerate')");
}

const char* failurePolicyName(FailurePolicy policy)
{
    switch (policy) {
    case FailurePolicy::Abort:
        return "abort";
    case FailurePolicy::Tolerate:
        return "tolerate";
    }
    return "abort";
}

} // namespace NetcapSetup

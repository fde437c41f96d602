#include "types.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace topicbus {

std::string to_string(ErrorStrategy strategy) {
    switch (strategy) {
        case ErrorStrategy::Raise:  return "raise";
        case ErrorStrategy::Warn:   return "warn";
        case ErrorStrategy::Ignore: return "ignore";
        case ErrorStrategy::Custom: return "custom";
    }
    return "unknown";
}

ErrorStrategy parse_error_strategy(const std::string& text) {
    std::string lowered = text;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lowered == "raise") return ErrorStrategy::Raise;
    if (lowered == "warn") return ErrorStrategy::Warn;
    if (lowered == "ignore") return ErrorStrategy::Ignore;
    if (lowered == "custom") return ErrorStrategy::Custom;

    throw std::invalid_argument("Unknown error strategy: " + text);
}

} // namespace topicbus

#include "grid/GridConfig.h"
#include "common/Errors.h"

#include <algorithm>
#include <cctype>

namespace gridlab {
namespace grid {

namespace {
std::string normalizeName(std::string name) {
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    std::replace(name.begin(), name.end(), '-', '_');
    auto not_space = [](unsigned char c) { return !std::isspace(c); };
    name.erase(name.begin(), std::find_if(name.begin(), name.end(), not_space));
    name.erase(std::find_if(name.rbegin(), name.rend(), not_space).base(), name.end());
    return name;
}
}

GridType parseGridType(const std::string& name) {
    const std::string n = normalizeName(name);
    if (n == "arithmetic") {
        return GridType::ARITHMETIC;
    }
    if (n == "geometric") {
        return GridType::GEOMETRIC;
    }
    if (n == "volatility" || n == "volatility_centered") {
        return GridType::VOLATILITY;
    }
    throw InvalidGridTypeError("Unknown grid type: '" + name + "'");
}

std::string toString(GridType type) {
    switch (type) {
        case GridType::ARITHMETIC: return "arithmetic";
        case GridType::GEOMETRIC: return "geometric";
        case GridType::VOLATILITY: return "volatility";
    }
    return "unknown";
}

AllocationWeighting parseAllocationWeighting(const std::string& name) {
    const std::string n = normalizeName(name);
    if (n == "lower_heavy") {
        return AllocationWeighting::LOWER_HEAVY;
    }
    if (n == "upper_heavy") {
        return AllocationWeighting::UPPER_HEAVY;
    }
    if (n == "uniform") {
        return AllocationWeighting::UNIFORM;
    }
    throw InvalidParameterError("Unknown allocation weighting: '" + name + "'");
}

std::string toString(AllocationWeighting weighting) {
    switch (weighting) {
        case AllocationWeighting::LOWER_HEAVY: return "lower_heavy";
        case AllocationWeighting::UPPER_HEAVY: return "upper_heavy";
        case AllocationWeighting::UNIFORM: return "uniform";
    }
    return "unknown";
}

} // namespace grid
} // namespace gridlab

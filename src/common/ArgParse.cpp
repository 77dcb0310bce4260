#include "common/ArgParse.h"
#include "common/Errors.h"

#include <stdexcept>

namespace gridlab {
namespace utils {

double parseNumberArg(const std::string& flag, const std::string& text) {
    try {
        size_t used = 0;
        const double value = std::stod(text, &used);
        if (used != text.size()) {
            throw InvalidParameterError(flag + " expects a number, got '" + text + "'");
        }
        return value;
    } catch (const std::logic_error&) {
        throw InvalidParameterError(flag + " expects a number, got '" + text + "'");
    }
}

int parseIntegerArg(const std::string& flag, const std::string& text) {
    try {
        size_t used = 0;
        const int value = std::stoi(text, &used);
        if (used != text.size()) {
            throw InvalidParameterError(flag + " expects an integer, got '" + text + "'");
        }
        return value;
    } catch (const std::out_of_range&) {
        throw InvalidParameterError(flag + " is out of range: '" + text + "'");
    } catch (const std::invalid_argument&) {
        throw InvalidParameterError(flag + " expects an integer, got '" + text + "'");
    }
}

} // namespace utils
} // namespace gridlab

#include "common/ArgParse.h"
#include "common/Errors.h"

#include <cassert>
#include <cmath>
#include <iostream>
#include <string>

using namespace gridlab;
using namespace gridlab::utils;

namespace {
bool rejectsInteger(const std::string& text) {
    try {
        parseIntegerArg("--levels", text);
    } catch (const InvalidParameterError& e) {
        return std::string(e.what()).find("--levels") != std::string::npos;
    }
    return false;
}

bool rejectsNumber(const std::string& text) {
    try {
        parseNumberArg("--capital", text);
    } catch (const InvalidParameterError&) {
        return true;
    }
    return false;
}
}

int main() {
    // Integers
    assert(parseIntegerArg("--levels", "10") == 10);
    assert(parseIntegerArg("--levels", "-4") == -4);
    assert(rejectsInteger(""));
    assert(rejectsInteger("ten"));
    assert(rejectsInteger("10x"));
    assert(rejectsInteger("7.5"));
    assert(rejectsInteger("1e9"));
    assert(rejectsInteger("inf"));
    assert(rejectsInteger("nan"));
    assert(rejectsInteger("99999999999"));
    assert(rejectsInteger("-99999999999"));

    // Numbers
    assert(std::fabs(parseNumberArg("--capital", "250000") - 250000.0) < 1e-9);
    assert(std::fabs(parseNumberArg("--capital", "0.25") - 0.25) < 1e-12);
    assert(rejectsNumber(""));
    assert(rejectsNumber("abc"));
    assert(rejectsNumber("12abc"));

    std::cout << "[TEST] ArgParse PASSED\n";
    return 0;
}

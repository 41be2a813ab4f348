#include "erlangcore/exceptions.hpp"

namespace erlangcore {

namespace {

std::string describe(const std::vector<ValidationError>& errors) {
    std::string message = "Invalid calculation inputs";
    for (auto& e : errors) {
        message += "; " + e.field + ": " + e.message;
    }
    return message;
}

} // anonymous namespace

InvalidInputException::InvalidInputException(const std::vector<ValidationError>& errors)
    : ErlangCoreException(describe(errors))
    , errors_(errors) {}

} // namespace erlangcore

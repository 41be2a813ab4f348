#pragma once

#include "erlangcore/types.hpp"
#include <stdexcept>
#include <string>
#include <vector>

namespace erlangcore {

class ErlangCoreException : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class InvalidConfigException : public ErlangCoreException {
public:
    using ErlangCoreException::ErlangCoreException;
};

class InvalidInputException : public ErlangCoreException {
public:
    explicit InvalidInputException(const std::vector<ValidationError>& errors);

    const std::vector<ValidationError>& errors() const noexcept { return errors_; }

private:
    std::vector<ValidationError> errors_;
};

} // namespace erlangcore

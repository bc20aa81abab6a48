#pragma once

#include "infra/exception.h"

namespace shipem {

// A required value could not be resolved from the configured rules,
// or the rules themselves are structurally incomplete
class ConfigurationError : public inf::RuntimeError
{
public:
    using RuntimeError::RuntimeError;
};

// A value (criterion, enum, attribute, coordinate, mode) is not acceptable
class ValidationError : public inf::RuntimeError
{
public:
    using RuntimeError::RuntimeError;
};

}

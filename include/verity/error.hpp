#pragma once
#include <stdexcept>

    namespace
verity
{
// An internally inconsistent rule: a bug in the rule set, not in the data.
    class
configuration_error
    : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

// An external document that could not be turned into a value or a node.
    class
conversion_error
    : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

} // namespace verity

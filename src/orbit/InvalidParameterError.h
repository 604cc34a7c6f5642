#pragma once

#include <stdexcept>
#include <string>

// Raised by the coverage and orbit-geometry functions when an argument would
// make the result undefined (zero satellites, non-positive field of view,
// non-finite input, ...). Nothing is clamped; callers validate user input first.
class InvalidParameterError final : public std::invalid_argument
{
public:
    explicit InvalidParameterError(const std::string& what)
        : std::invalid_argument(what)
    {
    }
};

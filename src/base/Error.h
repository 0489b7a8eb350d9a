#pragma once

#include "Base.h"

#include <stdexcept>
#include <string>

SEGMAP_BEGIN

// Asking a header for a field its entry kind does not have.
class UnknownFieldError : public std::out_of_range {
public:
    explicit UnknownFieldError(const std::string& pName) : std::out_of_range("Unknown header field: " + pName) {}
};

// Seek failure, short read or unterminated string on a ByteSource.
class IoError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

SEGMAP_END

#pragma once

#include <stdexcept>

// Raised for painter/renderer call-order bugs such as drawing outside a layer.
class InvalidStateError : public std::logic_error
{
public:
    using std::logic_error::logic_error;
};

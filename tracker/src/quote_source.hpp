#pragma once

#include "types.hpp"
#include <string>

class QuoteSource {
public:
    virtual ~QuoteSource() = default;

    // Latest price for the instrument. Throws QuoteError on transport
    // failure, malformed response or missing data.
    virtual Quote get_quote(const std::string& ticker) = 0;
};

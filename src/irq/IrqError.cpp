#include "IrqError.hpp"

#include <format>

std::string InterruptError::message() const {
    return std::format("{}: {} ({})", to_string(kind), cause.message(), cause.value());
}


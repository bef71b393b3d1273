/**
 * @file Error.cpp
 * @brief Implementation of Error::format().
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#include "aur/core/Error.hpp"

#include <sstream>

namespace aur::core {

std::string Error::format() const
{
    std::ostringstream os;
    os << '[' << errorCodeName(_code) << "] " << _message;
    if (_sampleRates)
        os << " (file " << _sampleRates->actual << " Hz, device " << _sampleRates->required << " Hz)";
    os << " (" << _location.file_name() << ':' << _location.line() << ')';
    return os.str();
}

} // namespace aur::core

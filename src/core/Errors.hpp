#pragma once

/**
 * Errors.hpp
 * 
 * Exceptions surfaced by the download manager to its callers.
 */

#include <stdexcept>
#include <string>

namespace lectern::core {

/**
 * Admission denied: no connection, or a metered connection while the
 * Wi-Fi only setting is on.
 */
class NoNetworkAccessError : public std::runtime_error {
public:
    NoNetworkAccessError()
        : std::runtime_error("No network access for downloading") {}
    
    explicit NoNetworkAccessError(const std::string& reason)
        : std::runtime_error(reason) {}
};

} // namespace lectern::core

// Lectern - String Utilities
// String manipulation, encoding and formatting

#pragma once

#include <string>
#include <vector>
#include <cstdint>

namespace lectern::utils {

/**
 * @brief String manipulation utilities
 */
class StringUtils {
public:
    /**
     * Extension of the last path segment of a URL, without the dot.
     * Query and fragment are ignored.
     * @return Extension, empty if the path has none
     */
    static std::string urlPathExtension(const std::string& url);
    
    /**
     * true when the name can be joined to a directory without leaving it:
     * non-empty, no path separator, no NUL and no ".."
     */
    static bool isPlainFileName(const std::string& name);
    
    // Formatting
    static std::string formatMegabytes(int64_t bytes, int precision = 2);
    static std::string formatPercentage(double value, int precision = 1);
    
    // Encoding
    static std::string base64Encode(const std::vector<uint8_t>& data);
    static std::vector<uint8_t> base64Decode(const std::string& encoded);
};

} // namespace lectern::utils

/**
 * StringUtils.cpp
 * 
 * String manipulation, encoding and formatting utilities.
 */

#include "StringUtils.hpp"

#include <iomanip>
#include <sstream>

namespace lectern::utils {

std::string StringUtils::urlPathExtension(const std::string& url) {
    auto end = url.find_first_of("?#");
    std::string path = url.substr(0, end);
    
    // Skip "scheme://host" so a dotted host is not taken as an extension
    auto schemeEnd = path.find("://");
    if (schemeEnd != std::string::npos) {
        auto pathStart = path.find('/', schemeEnd + 3);
        path = pathStart == std::string::npos ? "" : path.substr(pathStart);
    }
    
    auto slash = path.find_last_of('/');
    std::string segment = slash == std::string::npos ? path : path.substr(slash + 1);
    
    auto dot = segment.find_last_of('.');
    if (dot == std::string::npos || dot == 0 || dot + 1 == segment.size()) {
        return "";
    }
    return segment.substr(dot + 1);
}

bool StringUtils::isPlainFileName(const std::string& name) {
    if (name.empty() || name == ".") {
        return false;
    }
    return name.find_first_of(std::string("/\\\0", 3)) == std::string::npos
        && name.find("..") == std::string::npos;
}

// -- Formatting --

std::string StringUtils::formatMegabytes(int64_t bytes, int precision) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(precision)
        << (static_cast<double>(bytes) / 1024.0 / 1024.0) << "MB";
    return oss.str();
}

std::string StringUtils::formatPercentage(double value, int precision) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(precision) << (value * 100.0) << "%";
    return oss.str();
}

// -- Encoding --

static const std::string BASE64_CHARS = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

std::string StringUtils::base64Encode(const std::vector<uint8_t>& data) {
    std::string result;
    int val = 0, valb = -6;
    for (uint8_t c : data) {
        val = ((val << 8) + c) & 0xFFFF;
        valb += 8;
        while (valb >= 0) {
            result.push_back(BASE64_CHARS[(val >> valb) & 0x3F]);
            valb -= 6;
        }
    }
    if (valb > -6) result.push_back(BASE64_CHARS[((val << 8) >> (valb + 8)) & 0x3F]);
    while (result.size() % 4) result.push_back('=');
    return result;
}

std::vector<uint8_t> StringUtils::base64Decode(const std::string& encoded) {
    std::vector<int> T(256, -1);
    for (int i = 0; i < 64; i++) T[static_cast<unsigned char>(BASE64_CHARS[i])] = i;
    std::vector<uint8_t> out;
    int val = 0, valb = -8;
    for (unsigned char c : encoded) {
        if (T[c] == -1) break;
        val = ((val << 6) + T[c]) & 0xFFFF;
        valb += 6;
        if (valb >= 0) {
            out.push_back(static_cast<uint8_t>((val >> valb) & 0xFF));
            valb -= 8;
        }
    }
    return out;
}

} // namespace lectern::utils

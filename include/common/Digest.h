#pragma once

#include <string>

namespace rebalex {
namespace utils {

class Digest {
public:
    // Lowercase hex SHA-256 of the input bytes.
    static std::string sha256Hex(const std::string& data);
};

} // namespace utils
} // namespace rebalex

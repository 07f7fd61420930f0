#pragma once

#include <string>

namespace checksum {

// Hex SHA-256 of data. Returns false and sets error when OpenSSL fails.
bool sha256Hex(const std::string& data, std::string& hex, std::string& error);

} // namespace checksum

#pragma once
#include <string>
#include <string_view>

// Lowercase hex SHA-256 of `data`; empty string if the digest could not be computed
std::string sha256_hex(std::string_view data);

#pragma once

#include <string>
#include <string_view>

namespace shapeforge {

// BLAKE3-256 of payload, 64 lowercase hex chars.
std::string blake3_hex(std::string_view payload);

// Stream-hash a file. Throws Error(io_error) when it cannot be read.
std::string hash_file_blake3_hex(const std::string& path);

// Domain-separated digest. Used to derive stable workspace names ("ws:") and
// manifest entries ("file:") without collisions between the two.
std::string hash_domain(std::string_view domain, std::string_view payload);

}  // namespace shapeforge

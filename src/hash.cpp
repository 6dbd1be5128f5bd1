#include "shapeforge/hash.hpp"

#include <array>
#include <fstream>

#include "shapeforge/types.hpp"

extern "C" {
#include <blake3.h>
}

namespace shapeforge {
namespace {

// Incremental BLAKE3 digest rendered as lowercase hex.
class Digest {
 public:
  Digest() { blake3_hasher_init(&hasher_); }

  Digest& add(std::string_view bytes) {
    blake3_hasher_update(&hasher_, bytes.data(), bytes.size());
    return *this;
  }

  std::string hex() {
    static constexpr char kDigits[] = "0123456789abcdef";
    std::array<unsigned char, BLAKE3_OUT_LEN> raw{};
    blake3_hasher_finalize(&hasher_, raw.data(), raw.size());
    std::string out;
    out.reserve(raw.size() * 2);
    for (unsigned char b : raw) {
      out += kDigits[b >> 4];
      out += kDigits[b & 0x0f];
    }
    return out;
  }

 private:
  blake3_hasher hasher_;
};

}  // namespace

std::string blake3_hex(std::string_view payload) { return Digest().add(payload).hex(); }

std::string hash_file_blake3_hex(const std::string& path) {
  std::ifstream file(path, std::ios::binary);
  if (!file) throw Error(ErrorCode::io_error, "cannot open " + path + " for hashing");

  Digest digest;
  std::array<char, 64 * 1024> chunk{};
  while (file) {
    file.read(chunk.data(), chunk.size());
    if (file.gcount() > 0) digest.add(std::string_view(chunk.data(), static_cast<std::size_t>(file.gcount())));
  }
  if (file.bad()) throw Error(ErrorCode::io_error, "read error while hashing " + path);
  return digest.hex();
}

std::string hash_domain(std::string_view domain, std::string_view payload) {
  return Digest().add(domain).add(payload).hex();
}

}  // namespace shapeforge

#pragma once
#include <cstddef>
#include <string>
#include <string_view>

namespace gitchurn {

// Lowercase hex digests. Throw std::runtime_error if OpenSSL refuses the
// digest, which only happens on a broken installation.
std::string sha256_hex(std::string_view data);
std::string sha512_hex(std::string_view data);

std::string to_hex(const unsigned char *data, std::size_t len);

} // namespace gitchurn

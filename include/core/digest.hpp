#pragma once

#include <string>
#include <string_view>

namespace reviewgate::utils {

/// Lowercase hex SHA-256 of `input` (OpenSSL EVP). Empty string if the
/// digest context cannot be allocated.
[[nodiscard]] std::string sha256_hex(std::string_view input);

} // namespace reviewgate::utils

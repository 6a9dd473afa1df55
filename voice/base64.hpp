#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace Base64 {

// Standard alphabet, '=' padded, no line breaks.
std::string encode(const std::uint8_t* data, std::size_t len);
std::string encode(const std::vector<std::uint8_t>& data);

// Accepts padded or unpadded input and skips whitespace (services may wrap
// long payloads). Returns nullopt on any other character or a dangling
// single symbol.
std::optional<std::vector<std::uint8_t>> decode(const std::string& text);

} // namespace Base64

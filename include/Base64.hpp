#pragma once
#include <cstdint>
#include <string>
#include <vector>

// Standard alphabet with '=' padding. Whitespace in the input is ignored.
std::vector<std::uint8_t> base64Decode(const std::string& text);

#pragma once

#include <string>

// Standard alphabet, padded
std::string base64_encode(const std::string& input);

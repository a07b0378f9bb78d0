#pragma once

#include <string>

namespace vizrun::utils {

// Standard alphabet with '=' padding, no line breaks.
std::string EncodeBase64(const std::string& data);

std::string Sha256Hex(const std::string& input);

}  // namespace vizrun::utils

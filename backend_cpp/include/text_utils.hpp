#pragma once
#include <string>
#include <vector>

namespace sdp_assistant {

// Cuts at most `length` bytes without splitting a UTF-8 sequence
std::string utf8_safe_substr(const std::string& str, size_t length);

std::string trim(const std::string& s);

bool ends_with_ci(const std::string& s, const std::string& suffix);

std::string join(const std::vector<std::string>& parts, const std::string& sep);

// Throws ValidationError on characters outside the base64 alphabet or bad padding.
// Whitespace is ignored.
std::string base64_decode(const std::string& encoded);

std::string base64_encode(const std::string& raw);

} // namespace sdp_assistant

#include "text_utils.hpp"
#include "errors.hpp"
#include <algorithm>
#include <array>
#include <cctype>

namespace sdp_assistant {

std::string utf8_safe_substr(const std::string& str, size_t length) {
    if (str.length() <= length) return str;
    std::string sub = str.substr(0, length);
    if (sub.empty()) return sub;
    // Drop a trailing partial sequence: continuation bytes, then its lead byte
    size_t i = sub.size();
    while (i > 0 && (static_cast<unsigned char>(sub[i - 1]) & 0xC0) == 0x80) --i;
    if (i > 0) {
        unsigned char lead = static_cast<unsigned char>(sub[i - 1]);
        size_t expected = lead >= 0xF0 ? 4 : lead >= 0xE0 ? 3 : lead >= 0xC0 ? 2 : 1;
        if (lead >= 0xC0 && sub.size() - (i - 1) < expected) sub.resize(i - 1);
    }
    return sub;
}

std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

bool ends_with_ci(const std::string& s, const std::string& suffix) {
    if (suffix.size() > s.size()) return false;
    return std::equal(suffix.rbegin(), suffix.rend(), s.rbegin(), [](char a, char b) {
        return std::tolower(static_cast<unsigned char>(a)) == std::tolower(static_cast<unsigned char>(b));
    });
}

std::string join(const std::vector<std::string>& parts, const std::string& sep) {
    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i) out += sep;
        out += parts[i];
    }
    return out;
}

namespace {

const char* kAlphabet = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

std::array<int, 256> make_reverse_table() {
    std::array<int, 256> table;
    table.fill(-1);
    for (int i = 0; i < 64; ++i) table[static_cast<unsigned char>(kAlphabet[i])] = i;
    // URL-safe variants
    table[static_cast<unsigned char>('-')] = 62;
    table[static_cast<unsigned char>('_')] = 63;
    return table;
}

} // namespace

std::string base64_decode(const std::string& encoded) {
    static const std::array<int, 256> rev = make_reverse_table();

    std::string clean;
    clean.reserve(encoded.size());
    for (char c : encoded) {
        if (!std::isspace(static_cast<unsigned char>(c))) clean.push_back(c);
    }

    size_t padding = 0;
    while (!clean.empty() && clean.back() == '=') {
        clean.pop_back();
        ++padding;
    }
    if (padding > 2) throw ValidationError("content_b64 is not valid base64 (bad padding).");
    if (clean.size() % 4 == 1) throw ValidationError("content_b64 is not valid base64 (truncated).");

    std::string out;
    out.reserve(clean.size() * 3 / 4);
    unsigned int buffer = 0;
    int bits = 0;
    for (char c : clean) {
        int v = rev[static_cast<unsigned char>(c)];
        if (v < 0) throw ValidationError("content_b64 is not valid base64 (unexpected character).");
        buffer = (buffer << 6) | static_cast<unsigned int>(v);
        bits += 6;
        if (bits >= 8) {
            bits -= 8;
            out.push_back(static_cast<char>((buffer >> bits) & 0xFF));
        }
    }
    return out;
}

std::string base64_encode(const std::string& raw) {
    std::string out;
    out.reserve((raw.size() + 2) / 3 * 4);
    size_t i = 0;
    for (; i + 2 < raw.size(); i += 3) {
        unsigned int n = (static_cast<unsigned char>(raw[i]) << 16) |
                         (static_cast<unsigned char>(raw[i + 1]) << 8) |
                         static_cast<unsigned char>(raw[i + 2]);
        out.push_back(kAlphabet[(n >> 18) & 63]);
        out.push_back(kAlphabet[(n >> 12) & 63]);
        out.push_back(kAlphabet[(n >> 6) & 63]);
        out.push_back(kAlphabet[n & 63]);
    }
    size_t rest = raw.size() - i;
    if (rest == 1) {
        unsigned int n = static_cast<unsigned char>(raw[i]) << 16;
        out.push_back(kAlphabet[(n >> 18) & 63]);
        out.push_back(kAlphabet[(n >> 12) & 63]);
        out += "==";
    } else if (rest == 2) {
        unsigned int n = (static_cast<unsigned char>(raw[i]) << 16) |
                         (static_cast<unsigned char>(raw[i + 1]) << 8);
        out.push_back(kAlphabet[(n >> 18) & 63]);
        out.push_back(kAlphabet[(n >> 12) & 63]);
        out.push_back(kAlphabet[(n >> 6) & 63]);
        out.push_back('=');
    }
    return out;
}

} // namespace sdp_assistant

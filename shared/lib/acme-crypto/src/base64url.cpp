/**
 * @file base64url.cpp
 * @brief Base64url codec and small digest helpers
 */

#include <acme/crypto/base64url.h>

#include <openssl/rand.h>
#include <openssl/sha.h>

#include <stdexcept>
#include <vector>

namespace acme::crypto {

namespace {

const char kAlphabet[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789-_";

int decodeChar(unsigned char c) {
    if (c >= 'A' && c <= 'Z') return c - 'A';
    if (c >= 'a' && c <= 'z') return c - 'a' + 26;
    if (c >= '0' && c <= '9') return c - '0' + 52;
    if (c == '-') return 62;
    if (c == '_') return 63;
    return -1;
}

} // anonymous namespace

std::string base64UrlEncode(const unsigned char* data, size_t length) {
    std::string result;
    result.reserve(((length + 2) / 3) * 4);

    size_t i = 0;
    for (; i + 2 < length; i += 3) {
        uint32_t triple = (static_cast<uint32_t>(data[i]) << 16) |
                          (static_cast<uint32_t>(data[i + 1]) << 8) |
                          static_cast<uint32_t>(data[i + 2]);
        result += kAlphabet[(triple >> 18) & 0x3F];
        result += kAlphabet[(triple >> 12) & 0x3F];
        result += kAlphabet[(triple >> 6) & 0x3F];
        result += kAlphabet[triple & 0x3F];
    }

    size_t rest = length - i;
    if (rest == 1) {
        uint32_t v = static_cast<uint32_t>(data[i]) << 16;
        result += kAlphabet[(v >> 18) & 0x3F];
        result += kAlphabet[(v >> 12) & 0x3F];
    } else if (rest == 2) {
        uint32_t v = (static_cast<uint32_t>(data[i]) << 16) |
                     (static_cast<uint32_t>(data[i + 1]) << 8);
        result += kAlphabet[(v >> 18) & 0x3F];
        result += kAlphabet[(v >> 12) & 0x3F];
        result += kAlphabet[(v >> 6) & 0x3F];
    }

    return result;
}

std::string base64UrlEncode(const std::string& data) {
    return base64UrlEncode(reinterpret_cast<const unsigned char*>(data.data()), data.size());
}

std::optional<std::string> base64UrlDecode(const std::string& input) {
    // A single trailing sextet can never encode a whole byte
    if (input.size() % 4 == 1) {
        return std::nullopt;
    }

    std::string out;
    out.reserve(input.size() * 3 / 4);

    uint32_t buffer = 0;
    int bits = 0;
    for (unsigned char c : input) {
        int v = decodeChar(c);
        if (v < 0) {
            return std::nullopt;
        }
        buffer = (buffer << 6) | static_cast<uint32_t>(v);
        bits += 6;
        if (bits >= 8) {
            bits -= 8;
            out += static_cast<char>((buffer >> bits) & 0xFF);
        }
    }

    // Leftover bits must be zero (canonical encoding)
    if (bits > 0 && (buffer & ((1u << bits) - 1)) != 0) {
        return std::nullopt;
    }

    return out;
}

std::string randomBase64Url(size_t numBytes) {
    std::vector<unsigned char> buf(numBytes);
    if (RAND_bytes(buf.data(), static_cast<int>(buf.size())) != 1) {
        throw std::runtime_error("RAND_bytes failed");
    }
    return base64UrlEncode(buf.data(), buf.size());
}

std::string sha256(const std::string& data) {
    unsigned char digest[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(data.data()), data.size(), digest);
    return std::string(reinterpret_cast<char*>(digest), sizeof(digest));
}

std::string toHex(const std::string& bytes) {
    static const char hex[] = "0123456789abcdef";
    std::string out;
    out.reserve(bytes.size() * 2);
    for (unsigned char c : bytes) {
        out += hex[c >> 4];
        out += hex[c & 0x0F];
    }
    return out;
}

} // namespace acme::crypto

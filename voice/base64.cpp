#include "voice/base64.hpp"

#include <array>
#include <cctype>

namespace Base64 {

static const char* kB64 = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

static std::array<int, 256> buildReverseTable() {
    std::array<int, 256> table{};
    table.fill(-1);
    for (int i = 0; i < 64; i++) {
        table[static_cast<unsigned char>(kB64[i])] = i;
    }
    return table;
}

std::string encode(const std::uint8_t* data, std::size_t len) {
    std::string out;
    out.reserve(((len + 2) / 3) * 4);

    std::size_t idx = 0;
    while (idx + 2 < len) {
        std::uint32_t v = (static_cast<std::uint32_t>(data[idx]) << 16) |
                          (static_cast<std::uint32_t>(data[idx + 1]) << 8) |
                          data[idx + 2];
        out += kB64[(v >> 18) & 0x3F];
        out += kB64[(v >> 12) & 0x3F];
        out += kB64[(v >> 6) & 0x3F];
        out += kB64[v & 0x3F];
        idx += 3;
    }

    std::size_t rest = len - idx;
    if (rest == 1) {
        std::uint8_t b0 = data[idx];
        out += kB64[(b0 >> 2) & 0x3F];
        out += kB64[(b0 & 0x03) << 4];
        out += "==";
    } else if (rest == 2) {
        std::uint8_t b0 = data[idx];
        std::uint8_t b1 = data[idx + 1];
        out += kB64[(b0 >> 2) & 0x3F];
        out += kB64[((b0 & 0x03) << 4) | ((b1 >> 4) & 0x0F)];
        out += kB64[(b1 & 0x0F) << 2];
        out += '=';
    }

    return out;
}

std::string encode(const std::vector<std::uint8_t>& data) {
    return encode(data.data(), data.size());
}

std::optional<std::vector<std::uint8_t>> decode(const std::string& text) {
    static const std::array<int, 256> kReverse = buildReverseTable();

    std::vector<std::uint8_t> out;
    out.reserve((text.size() / 4) * 3);

    std::uint32_t acc = 0;
    int bits = 0;
    bool padding = false;

    for (char ch : text) {
        unsigned char c = static_cast<unsigned char>(ch);
        if (std::isspace(c)) continue;

        if (c == '=') {
            padding = true;
            continue;
        }
        if (padding) return std::nullopt; // data after padding

        int v = kReverse[c];
        if (v < 0) return std::nullopt;

        acc = (acc << 6) | static_cast<std::uint32_t>(v);
        bits += 6;
        if (bits >= 8) {
            bits -= 8;
            out.push_back(static_cast<std::uint8_t>((acc >> bits) & 0xFF));
        }
    }

    // 6 leftover bits means one orphan symbol
    if (bits >= 6) return std::nullopt;
    // the bits below the last full byte must be zero
    if (bits > 0 && (acc & ((1u << bits) - 1)) != 0) return std::nullopt;

    return out;
}

} // namespace Base64

#include "bech32.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <stdexcept>

namespace zeldwallet {

namespace {

constexpr std::array<char, 32> CHARSET = {
    'q', 'p', 'z', 'r', 'y', '9', 'x', '8', 'g', 'f', '2', 't', 'v', 'd', 'w', '0',
    's', '3', 'j', 'n', '5', '4', 'k', 'h', 'c', 'e', '6', 'm', 'u', 'a', '7', 'l'};

constexpr std::array<int8_t, 128> create_decode_map() {
    std::array<int8_t, 128> map{};
    map.fill(-1);
    for (size_t i = 0; i < CHARSET.size(); ++i) {
        map[static_cast<unsigned>(CHARSET[i])] = static_cast<int8_t>(i);
        // Upper case is accepted as long as the whole string is upper case
        char upper = CHARSET[i] >= 'a' && CHARSET[i] <= 'z'
            ? static_cast<char>(CHARSET[i] - 'a' + 'A') : CHARSET[i];
        map[static_cast<unsigned>(upper)] = static_cast<int8_t>(i);
    }
    return map;
}

constexpr auto DECODE_MAP = create_decode_map();
constexpr uint32_t BECH32_CONSTANT = 1;
constexpr uint32_t BECH32M_CONSTANT = 0x2bc830a3;

uint32_t polymod(const std::vector<uint8_t>& values) {
    uint32_t chk = 1;
    for (uint8_t v : values) {
        uint8_t top = static_cast<uint8_t>(chk >> 25);
        chk = ((chk & 0x1ffffff) << 5) ^ v;
        if (top & 0x01) chk ^= 0x3b6a57b2;
        if (top & 0x02) chk ^= 0x26508e6d;
        if (top & 0x04) chk ^= 0x1ea119fa;
        if (top & 0x08) chk ^= 0x3d4233dd;
        if (top & 0x10) chk ^= 0x2a1462b3;
    }
    return chk;
}

std::vector<uint8_t> hrp_expand(std::string_view hrp) {
    std::vector<uint8_t> ret;
    ret.reserve(hrp.size() * 2 + 1);
    for (char c : hrp) {
        ret.push_back(static_cast<uint8_t>(std::tolower(static_cast<unsigned char>(c)) >> 5));
    }
    ret.push_back(0);
    for (char c : hrp) {
        ret.push_back(static_cast<uint8_t>(std::tolower(static_cast<unsigned char>(c)) & 0x1f));
    }
    return ret;
}

bool convert_bits(std::vector<uint8_t>& out, int from_bits, int to_bits, bool pad,
                  std::span<const uint8_t> data) {
    uint32_t acc = 0;
    int bits = 0;
    const uint32_t maxv = (1u << to_bits) - 1;
    for (uint8_t value : data) {
        if (value >> from_bits) {
            return false;
        }
        acc = (acc << from_bits) | value;
        bits += from_bits;
        while (bits >= to_bits) {
            bits -= to_bits;
            out.push_back(static_cast<uint8_t>((acc >> bits) & maxv));
        }
    }
    if (pad) {
        if (bits) {
            out.push_back(static_cast<uint8_t>((acc << (to_bits - bits)) & maxv));
        }
    } else if (bits >= from_bits || ((acc << (to_bits - bits)) & maxv)) {
        return false;
    }
    return true;
}

} // namespace

std::string Bech32::encode_segwit(std::string_view hrp, uint8_t witness_version,
                                  std::span<const uint8_t> program) {
    if (hrp.empty() || witness_version > 16) {
        throw std::invalid_argument("Invalid segwit address parameters");
    }

    std::vector<uint8_t> data;
    data.push_back(witness_version);
    if (!convert_bits(data, 8, 5, true, program)) {
        throw std::invalid_argument("Invalid witness program");
    }

    std::vector<uint8_t> values = hrp_expand(hrp);
    values.insert(values.end(), data.begin(), data.end());
    values.insert(values.end(), 6, 0);
    uint32_t constant = witness_version == 0 ? BECH32_CONSTANT : BECH32M_CONSTANT;
    uint32_t checksum = polymod(values) ^ constant;

    std::string ret;
    ret.reserve(hrp.size() + 1 + data.size() + 6);
    ret.append(hrp);
    ret.push_back('1');
    for (uint8_t v : data) {
        ret.push_back(CHARSET[v]);
    }
    for (int i = 0; i < 6; ++i) {
        ret.push_back(CHARSET[(checksum >> (5 * (5 - i))) & 31]);
    }
    return ret;
}

std::optional<WitnessProgram> Bech32::decode_segwit(std::string_view hrp, std::string_view address) {
    if (address.size() < 8 || address.size() > 90) {
        return std::nullopt;
    }

    bool lower = false;
    bool upper = false;
    for (char c : address) {
        if (c < 0x21 || c > 0x7e) return std::nullopt;
        if (std::isupper(static_cast<unsigned char>(c))) upper = true;
        if (std::islower(static_cast<unsigned char>(c))) lower = true;
    }
    if (upper && lower) {
        return std::nullopt;
    }

    auto pos = address.rfind('1');
    if (pos == std::string_view::npos || pos == 0 || pos + 7 > address.size()) {
        return std::nullopt;
    }

    std::string_view addr_hrp = address.substr(0, pos);
    if (addr_hrp.size() != hrp.size() ||
        !std::equal(addr_hrp.begin(), addr_hrp.end(), hrp.begin(),
                    [](char a, char b) {
                        return std::tolower(static_cast<unsigned char>(a)) ==
                               std::tolower(static_cast<unsigned char>(b));
                    })) {
        return std::nullopt;
    }

    std::vector<uint8_t> data;
    for (char c : address.substr(pos + 1)) {
        int8_t value = DECODE_MAP[static_cast<unsigned>(c) & 0x7f];
        if (value < 0) {
            return std::nullopt;
        }
        data.push_back(static_cast<uint8_t>(value));
    }

    std::vector<uint8_t> values = hrp_expand(hrp);
    values.insert(values.end(), data.begin(), data.end());
    uint32_t check = polymod(values);

    data.resize(data.size() - 6);
    if (data.empty() || data.front() > 16) {
        return std::nullopt;
    }

    uint8_t version = data.front();
    uint32_t expected = version == 0 ? BECH32_CONSTANT : BECH32M_CONSTANT;
    if (check != expected) {
        return std::nullopt;
    }

    WitnessProgram result{version, {}};
    if (!convert_bits(result.program, 5, 8, false,
                      std::span<const uint8_t>(data.data() + 1, data.size() - 1))) {
        return std::nullopt;
    }
    if (result.program.size() < 2 || result.program.size() > 40) {
        return std::nullopt;
    }
    if (version == 0 && result.program.size() != 20 && result.program.size() != 32) {
        return std::nullopt;
    }
    return result;
}

} // namespace zeldwallet

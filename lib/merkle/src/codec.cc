#include "merkle/codec.hpp"
#include "merkle/error.hpp"

#include <cstddef>
#include <openssl/evp.h>
#include <string>

namespace Rektor::Merkle {
namespace {

    constexpr char HEX_DIGITS[] = "0123456789abcdef";

    int hex_value(char c)
    {
        if (c >= '0' && c <= '9')
            return c - '0';
        if (c >= 'a' && c <= 'f')
            return c - 'a' + 10;
        if (c >= 'A' && c <= 'F')
            return c - 'A' + 10;
        return -1;
    }

} // namespace

std::string hex_encode(BytesSpan data)
{
    std::string out;
    out.reserve(data.size() * 2);
    for (Byte b : data) {
        out.push_back(HEX_DIGITS[b >> 4]);
        out.push_back(HEX_DIGITS[b & 0x0F]);
    }
    return out;
}

auto hex_decode(std::string_view hex) -> std::expected<Bytes, std::error_code>
{
    if (hex.size() % 2 != 0) {
        return std::unexpected(make_error_code(Error::InvalidHex));
    }

    Bytes out;
    out.reserve(hex.size() / 2);
    for (size_t i = 0; i < hex.size(); i += 2) {
        const int hi = hex_value(hex[i]);
        const int lo = hex_value(hex[i + 1]);
        if (hi < 0 || lo < 0) {
            return std::unexpected(make_error_code(Error::InvalidHex));
        }
        out.push_back(static_cast<Byte>((hi << 4) | lo));
    }
    return out;
}

std::string base64_encode(BytesSpan data)
{
    if (data.empty()) {
        return {};
    }
    // 每 3 字节输出 4 个字符，外加 NUL
    std::string out(4 * ((data.size() + 2) / 3) + 1, '\0');
    const int len = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(out.data()),
        data.data(), static_cast<int>(data.size()));
    out.resize(static_cast<size_t>(len));
    return out;
}

auto base64_decode(std::string_view b64) -> std::expected<Bytes, std::error_code>
{
    if (b64.empty()) {
        return Bytes {};
    }
    if (b64.size() % 4 != 0) {
        return std::unexpected(make_error_code(Error::InvalidBase64));
    }

    // EVP_DecodeBlock 把 '=' 当作 0 解码，也不拒绝出现在中间的 '='，所以自己检查填充
    size_t padding = 0;
    for (size_t i = 0; i < b64.size(); ++i) {
        if (b64[i] != '=') {
            if (padding != 0) {
                return std::unexpected(make_error_code(Error::InvalidBase64));
            }
            continue;
        }
        if (i + 2 < b64.size()) {
            return std::unexpected(make_error_code(Error::InvalidBase64));
        }
        ++padding;
    }

    Bytes out(3 * b64.size() / 4);
    const int len = EVP_DecodeBlock(out.data(),
        reinterpret_cast<const unsigned char*>(b64.data()), static_cast<int>(b64.size()));
    if (len < 0 || static_cast<size_t>(len) != out.size()) {
        return std::unexpected(make_error_code(Error::InvalidBase64));
    }
    out.resize(out.size() - padding);
    return out;
}

} // namespace Rektor::Merkle

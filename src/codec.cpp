#include "common.h"


//==============================================================================
// base64
//==============================================================================

std::string rxcp::base64_encode(const void* const data, const size_t size)
{
    if (size == 0) {
        return { };
    }
    if (size > (size_t)INT32_MAX / 4 * 3) {
        throw std::invalid_argument("base64_encode: input of " + std::to_string(size) + " bytes is too large");
    }

    // EVP_EncodeBlock writes a trailing NUL
    std::string result;
    result.resize((size + 2) / 3 * 4 + 1);
    const int written = EVP_EncodeBlock(
        reinterpret_cast<unsigned char*>(result.data()),
        static_cast<const unsigned char*>(data),
        (int)size);
    ASSERT(written >= 0 && (size_t)written < result.size());
    result.resize((size_t)written);
    return result;
}

std::string rxcp::base64_decode(const std::string& text)
{
    if (text.empty()) {
        return { };
    }
    if (text.size() % 4 != 0 || text.size() > (size_t)INT32_MAX) {
        throw std::invalid_argument("base64_decode: invalid input length " + std::to_string(text.size()));
    }

    std::string result;
    result.resize(text.size() / 4 * 3);
    const int written = EVP_DecodeBlock(
        reinterpret_cast<unsigned char*>(result.data()),
        reinterpret_cast<const unsigned char*>(text.data()),
        (int)text.size());
    if (written < 0) {
        throw std::invalid_argument("base64_decode: malformed input");
    }

    // EVP_DecodeBlock keeps the zero bytes produced by '=' padding
    size_t padding = 0;
    if (text[text.size() - 1] == '=') ++padding;
    if (text[text.size() - 2] == '=') ++padding;

    ASSERT((size_t)written >= padding);
    result.resize((size_t)written - padding);
    return result;
}



//==============================================================================
// class sha256_accumulator
//==============================================================================

rxcp::sha256_accumulator::sha256_accumulator()
{
    _ctx = EVP_MD_CTX_new();
    if (_ctx == nullptr) {
        throw std::runtime_error("EVP_MD_CTX_new() failed");
    }

    if (EVP_DigestInit_ex(_ctx, EVP_sha256(), nullptr) != 1) {
        EVP_MD_CTX_free(_ctx);
        _ctx = nullptr;
        throw std::runtime_error("EVP_DigestInit_ex(sha256) failed");
    }
}

rxcp::sha256_accumulator::~sha256_accumulator() noexcept
{
    if (_ctx) {
        EVP_MD_CTX_free(_ctx);
        _ctx = nullptr;
    }
}

void rxcp::sha256_accumulator::update(const void* const data, const size_t size)
{
    ASSERT(!_finished);
    if (size == 0) return;

    if (EVP_DigestUpdate(_ctx, data, size) != 1) {
        throw std::runtime_error("EVP_DigestUpdate() failed");
    }
}

std::string rxcp::sha256_accumulator::finish_hex()
{
    ASSERT(!_finished);

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_size = 0;
    if (EVP_DigestFinal_ex(_ctx, digest, &digest_size) != 1) {
        throw std::runtime_error("EVP_DigestFinal_ex() failed");
    }
    _finished = true;

    static constexpr const char HEX[] = "0123456789abcdef";
    std::string result;
    result.reserve(digest_size * 2);
    for (unsigned int i = 0; i < digest_size; ++i) {
        result.push_back(HEX[digest[i] >> 4]);
        result.push_back(HEX[digest[i] & 0x0F]);
    }
    return result;
}



//==============================================================================
// Case-insensitive helpers
//==============================================================================

bool rxcp::equals_ignore_case(const std::string& a, const std::string& b) noexcept
{
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::tolower((unsigned char)a[i]) != std::tolower((unsigned char)b[i])) {
            return false;
        }
    }
    return true;
}

std::string rxcp::to_lower(std::string value)
{
    for (char& ch : value) {
        ch = (char)std::tolower((unsigned char)ch);
    }
    return value;
}

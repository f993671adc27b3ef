#include "Hasher.hpp"
#include <openssl/evp.h>
#include <fstream>
#include <memory>
#include <stdexcept>
#include <vector>

namespace {

struct DigestContextDeleter {
    void operator()(EVP_MD_CTX* ctx) const {
        EVP_MD_CTX_free(ctx);
    }
};

using DigestContext = std::unique_ptr<EVP_MD_CTX, DigestContextDeleter>;

DigestContext newSha256Context() {
    DigestContext ctx(EVP_MD_CTX_new());
    if (!ctx) {
        throw std::runtime_error("Failed to allocate digest context");
    }
    if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("Failed to initialize SHA-256");
    }
    return ctx;
}

} // namespace

std::string Hasher::toHex(const unsigned char* data, unsigned int length) {
    static const char digits[] = "0123456789abcdef";
    std::string hex;
    hex.reserve(length * 2);
    for (unsigned int i = 0; i < length; ++i) {
        hex.push_back(digits[data[i] >> 4]);
        hex.push_back(digits[data[i] & 0x0f]);
    }
    return hex;
}

std::string Hasher::digest(const std::string& path, size_t chunkSize) {
    if (chunkSize == 0) {
        chunkSize = DEFAULT_CHUNK_SIZE;
    }

    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw std::runtime_error("Error calculating hash for " + path + ": cannot open file");
    }

    DigestContext ctx = newSha256Context();

    // 分块读取，内存占用与文件大小无关
    std::vector<char> buffer(chunkSize);
    while (in) {
        in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        std::streamsize count = in.gcount();
        if (count > 0 && EVP_DigestUpdate(ctx.get(), buffer.data(), static_cast<size_t>(count)) != 1) {
            throw std::runtime_error("Error calculating hash for " + path + ": digest update failed");
        }
    }
    if (in.bad()) {
        throw std::runtime_error("Error calculating hash for " + path + ": read error");
    }

    unsigned char md[EVP_MAX_MD_SIZE];
    unsigned int length = 0;
    if (EVP_DigestFinal_ex(ctx.get(), md, &length) != 1) {
        throw std::runtime_error("Error calculating hash for " + path + ": digest final failed");
    }
    return toHex(md, length);
}

std::string Hasher::digestBytes(const std::string& data) {
    DigestContext ctx = newSha256Context();
    if (EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1) {
        throw std::runtime_error("Failed to update SHA-256 digest");
    }
    unsigned char md[EVP_MAX_MD_SIZE];
    unsigned int length = 0;
    if (EVP_DigestFinal_ex(ctx.get(), md, &length) != 1) {
        throw std::runtime_error("Failed to finalize SHA-256 digest");
    }
    return toHex(md, length);
}

#pragma once
#include <string>
#include <cstddef>

// 文件内容的SHA-256摘要，按固定大小分块流式读取
class Hasher {
public:
    static constexpr size_t DEFAULT_CHUNK_SIZE = 8192;

    // 返回小写十六进制摘要；文件不可读或OpenSSL失败时抛出std::runtime_error
    static std::string digest(const std::string& path, size_t chunkSize = DEFAULT_CHUNK_SIZE);

    // 内存数据的摘要
    static std::string digestBytes(const std::string& data);

private:
    static std::string toHex(const unsigned char* data, unsigned int length);
};

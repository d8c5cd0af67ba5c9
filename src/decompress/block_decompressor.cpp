#include "block_decompressor.hpp"
#include "block_frame.hpp"
#include "lz4_decompressor.hpp"
#include "lzjb_decompressor.hpp"
#include "../common/common.hpp"

bool PassthroughBlockDecompressor::decompress(const char *src, size_t srcSize, size_t expectedSize,
                                              std::vector<char> &output) const
{
    if (srcSize != expectedSize)
    {
        LOG("Error: Uncompressed block size mismatch. Expected: " << expectedSize
            << ", Actual: " << srcSize);
        return false;
    }

    output.assign(src, src + srcSize);
    return true;
}

std::unique_ptr<BlockDecompressor> makeBlockDecompressor(CompressionMethod method)
{
    switch (method)
    {
    case CompressionMethod::Off:
        return std::make_unique<PassthroughBlockDecompressor>();
    case CompressionMethod::Lz4:
        return std::make_unique<Lz4BlockDecompressor>();
    case CompressionMethod::Lzjb:
        return std::make_unique<LzjbBlockDecompressor>();
    }
    return nullptr;
}

bool decompressBlock(const std::vector<char> &block, CompressionMethod method,
                     size_t expectedSize, const BlockDecompressor &decompressor,
                     std::vector<char> &output)
{
    if (method != CompressionMethod::Lz4)
    {
        return decompressor.decompress(block.data(), block.size(), expectedSize, output);
    }

    std::vector<char> payload;
    if (!extractFramedPayload(block, payload))
    {
        return false;
    }

    return decompressor.decompress(payload.data(), payload.size(), expectedSize, output);
}

bool parseCompressionMethod(const std::string &name, CompressionMethod &method)
{
    if (name == "lz4")
    {
        method = CompressionMethod::Lz4;
        return true;
    }
    if (name == "lzjb")
    {
        method = CompressionMethod::Lzjb;
        return true;
    }
    if (name == "off")
    {
        method = CompressionMethod::Off;
        return true;
    }
    return false;
}

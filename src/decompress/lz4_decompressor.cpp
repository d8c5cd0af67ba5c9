#include "lz4_decompressor.hpp"
#include "../common/common.hpp"
#include <lz4.h>
#include <limits>

bool Lz4BlockDecompressor::decompress(const char *src, size_t srcSize, size_t expectedSize,
                                      std::vector<char> &output) const
{
    // LZ4_decompress_safe はint型のサイズしか扱えない
    if (srcSize > static_cast<size_t>(std::numeric_limits<int>::max()) ||
        expectedSize > static_cast<size_t>(std::numeric_limits<int>::max()))
    {
        LOG("Error: Block too large for LZ4 (" << srcSize << " -> " << expectedSize << " bytes)");
        return false;
    }

    std::vector<char> uncompressedData(expectedSize);
    int decompressedSize = LZ4_decompress_safe(
        src,
        uncompressedData.data(),
        static_cast<int>(srcSize),
        static_cast<int>(expectedSize)
    );

    if (decompressedSize < 0)
    {
        LOG("Error: LZ4 decompression failed (code " << decompressedSize << ")");
        return false;
    }

    if (static_cast<size_t>(decompressedSize) != expectedSize)
    {
        LOG("Error: Decompressed size mismatch. Expected: " << expectedSize
            << ", Actual: " << decompressedSize);
        return false;
    }

    output = std::move(uncompressedData);
    return true;
}

#include "block_file.hpp"
#include "../common/common.hpp"
#include <memory>
#include <vector>

int processBlockFile(const std::string &filePath, size_t uncompressedSize,
                     CompressionMethod method, std::ostream &out)
{
    std::vector<char> block;
    if (!readFileBytes(filePath, block))
    {
        return 1;
    }

    std::unique_ptr<BlockDecompressor> decompressor = makeBlockDecompressor(method);
    if (!decompressor)
    {
        LOG("Error: No decompressor for the requested method");
        return 1;
    }

    std::vector<char> output;
    if (!decompressBlock(block, method, uncompressedSize, *decompressor, output))
    {
        LOG("Error: Failed to decompress " << filePath << " (" << decompressor->name() << ")");
        return 1;
    }

    // 改行などは付けず、解凍結果のバイト列だけを書く
    out.write(output.data(), static_cast<std::streamsize>(output.size()));
    out.flush();
    if (!out)
    {
        LOG("Error: Failed to write decompressed data");
        return 1;
    }

    return 0;
}

#include "block_frame.hpp"
#include "../common/common.hpp"

static inline uint32_t loadBE32(const char *p)
{
    const unsigned char *u = reinterpret_cast<const unsigned char *>(p);
    return (static_cast<uint32_t>(u[0]) << 24) |
           (static_cast<uint32_t>(u[1]) << 16) |
           (static_cast<uint32_t>(u[2]) << 8) |
           static_cast<uint32_t>(u[3]);
}

bool extractFramedPayload(const char *block, size_t blockSize, std::vector<char> &payload)
{
    if (blockSize < BLOCK_FRAME_HEADER_SIZE)
    {
        LOG("Error: Block too short for length prefix (" << blockSize << " bytes)");
        return false;
    }

    const size_t compressedSize = loadBE32(block);

    // compressedSize + 4 がブロック長と等しいのは問題ない
    if (compressedSize > blockSize - BLOCK_FRAME_HEADER_SIZE)
    {
        LOG("Error: Length prefix " << compressedSize << " exceeds remaining "
            << (blockSize - BLOCK_FRAME_HEADER_SIZE) << " bytes");
        return false;
    }

    payload.assign(block + BLOCK_FRAME_HEADER_SIZE,
                   block + BLOCK_FRAME_HEADER_SIZE + compressedSize);
    return true;
}

bool extractFramedPayload(const std::vector<char> &block, std::vector<char> &payload)
{
    return extractFramedPayload(block.data(), block.size(), payload);
}

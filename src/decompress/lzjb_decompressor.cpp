#include "lzjb_decompressor.hpp"
#include "../common/common.hpp"
#include <cstdint>

bool LzjbBlockDecompressor::decompress(const char *src, size_t srcSize, size_t expectedSize,
                                       std::vector<char> &output) const
{
    const unsigned char *in = reinterpret_cast<const unsigned char *>(src);
    size_t pos = 0;

    std::vector<char> out;
    out.reserve(expectedSize);

    unsigned int copymap = 0;
    unsigned int copymask = 1 << 7;

    while (out.size() < expectedSize)
    {
        // 8要素ごとに先頭の1バイトがリテラル/一致のビットマップ
        copymask <<= 1;
        if (copymask == (1 << 8))
        {
            copymask = 1;
            if (pos >= srcSize)
            {
                LOG("Error: LZJB stream ended at " << out.size() << " of " << expectedSize << " bytes");
                return false;
            }
            copymap = in[pos++];
        }

        if (copymap & copymask)
        {
            if (pos + 2 > srcSize)
            {
                LOG("Error: LZJB stream ended inside a match at " << out.size() << " bytes");
                return false;
            }

            size_t matchLength = (in[pos] >> (8 - LZJB_MATCH_BITS)) + LZJB_MATCH_MIN;
            size_t offset = ((static_cast<size_t>(in[pos]) << 8) | in[pos + 1]) & LZJB_OFFSET_MASK;
            pos += 2;

            if (offset == 0 || offset > out.size())
            {
                LOG("Error: Invalid LZJB offset " << offset << " at " << out.size() << " bytes");
                return false;
            }

            // 一致部分は出力中の自分自身と重なってよい
            size_t copyPos = out.size() - offset;
            for (size_t i = 0; i < matchLength && out.size() < expectedSize; ++i)
            {
                out.push_back(out[copyPos++]);
            }
        }
        else
        {
            if (pos >= srcSize)
            {
                LOG("Error: LZJB stream ended at " << out.size() << " of " << expectedSize << " bytes");
                return false;
            }
            out.push_back(static_cast<char>(in[pos++]));
        }
    }

    output = std::move(out);
    return true;
}

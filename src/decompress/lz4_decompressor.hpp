#ifndef LZ4_DECOMPRESSOR_HPP
#define LZ4_DECOMPRESSOR_HPP

#include "block_decompressor.hpp"

// liblz4のブロックAPIによる解凍
// LZ4ブロック形式では出力サイズがストリームに含まれないため、呼び出し側が正しいサイズを渡す必要がある
class Lz4BlockDecompressor : public BlockDecompressor
{
public:
    bool decompress(const char *src, size_t srcSize, size_t expectedSize,
                    std::vector<char> &output) const override;

    const char *name() const override { return "lz4"; }
};

#endif // LZ4_DECOMPRESSOR_HPP

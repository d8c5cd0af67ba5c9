#ifndef LZJB_DECOMPRESSOR_HPP
#define LZJB_DECOMPRESSOR_HPP

#include "block_decompressor.hpp"

// LZJBのパラメータ（ZFS module/zfs/lzjb.c と同じ）
constexpr size_t LZJB_MATCH_BITS = 6;
constexpr size_t LZJB_MATCH_MIN = 3;
constexpr size_t LZJB_OFFSET_MASK = (1 << (16 - LZJB_MATCH_BITS)) - 1;

// LZJBブロックの解凍
// LZJBには長さプレフィックスがなく、expectedSizeバイトを出力した時点で終了する
class LzjbBlockDecompressor : public BlockDecompressor
{
public:
    bool decompress(const char *src, size_t srcSize, size_t expectedSize,
                    std::vector<char> &output) const override;

    const char *name() const override { return "lzjb"; }
};

#endif // LZJB_DECOMPRESSOR_HPP

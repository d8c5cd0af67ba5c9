#ifndef BLOCK_DECOMPRESSOR_HPP
#define BLOCK_DECOMPRESSOR_HPP

#include <memory>
#include <string>
#include <vector>
#include <cstddef>

// ブロックの圧縮方式
enum class CompressionMethod
{
    Off,
    Lz4,
    Lzjb
};

// ブロック解凍のインターフェース
// 圧縮データと期待する解凍後サイズを受け取り、サイズが一致しなければ失敗する
class BlockDecompressor
{
public:
    virtual ~BlockDecompressor() = default;

    virtual bool decompress(const char *src, size_t srcSize, size_t expectedSize,
                            std::vector<char> &output) const = 0;

    virtual const char *name() const = 0;
};

// 非圧縮ブロック（入力をそのままコピー）
class PassthroughBlockDecompressor : public BlockDecompressor
{
public:
    bool decompress(const char *src, size_t srcSize, size_t expectedSize,
                    std::vector<char> &output) const override;

    const char *name() const override { return "off"; }
};

/// 圧縮方式に対応するデコンプレッサを生成
std::unique_ptr<BlockDecompressor> makeBlockDecompressor(CompressionMethod method);

/// ディスク上のブロックを解凍する
/// LZ4は長さプレフィックスを外してから、LZJBと非圧縮はブロック全体をdecompressorに渡す
bool decompressBlock(const std::vector<char> &block, CompressionMethod method,
                     size_t expectedSize, const BlockDecompressor &decompressor,
                     std::vector<char> &output);

/// "lz4" / "lzjb" / "off" をCompressionMethodに変換
bool parseCompressionMethod(const std::string &name, CompressionMethod &method);

#endif // BLOCK_DECOMPRESSOR_HPP

#ifndef BLOCK_FRAME_HPP
#define BLOCK_FRAME_HPP

#include <vector>
#include <cstddef>
#include <cstdint>

// LZ4ブロック先頭の圧縮データ長（ビッグエンディアン32ビット）
constexpr size_t BLOCK_FRAME_HEADER_SIZE = 4;

// ZFSのデフォルトrecordsize（128 KiB）
constexpr size_t ZFS_DEFAULT_BLOCK_SIZE = 131072;

/// 長さプレフィックス付きブロックから圧縮データ部分を取り出す
/// 先頭4バイトの長さNに続くNバイトだけをpayloadにコピーし、それ以降は無視する
/// @return ヘッダーが4バイト未満、またはNが残りのバイト数を超える場合はfalse
bool extractFramedPayload(const char *block, size_t blockSize, std::vector<char> &payload);
bool extractFramedPayload(const std::vector<char> &block, std::vector<char> &payload);

#endif // BLOCK_FRAME_HPP

#ifndef BLOCK_FILE_HPP
#define BLOCK_FILE_HPP

#include "block_decompressor.hpp"
#include <ostream>
#include <string>

/// ブロックファイルを読み込み、解凍したデータをそのままoutに書き出す
/// @return 成功なら0、読み込み・解凍・書き込みのいずれかに失敗したら1（プロセスの終了コード）
int processBlockFile(const std::string &filePath, size_t uncompressedSize,
                     CompressionMethod method, std::ostream &out);

#endif // BLOCK_FILE_HPP

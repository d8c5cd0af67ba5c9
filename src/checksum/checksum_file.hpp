#ifndef CHECKSUM_FILE_HPP
#define CHECKSUM_FILE_HPP

#include "fletcher.hpp"
#include <string>

// ファイル読み込みのチャンクサイズ（ZFSのデフォルトrecordsizeの8倍）
constexpr size_t CHECKSUM_READ_CHUNK_SIZE = 1 << 20;

/// ファイル全体のチェックサムを計算する
/// Fletcher4はチャンク単位で読みながら計算し、Fletcher2はファイル全体を読み込む
/// @param filePath: 対象ファイルのパス
/// @param method: チェックサムの種類
/// @param checksum: 結果の格納先
/// @return ファイルを開けない・読めない場合はfalse
bool checksumFile(const std::string &filePath, ChecksumMethod method, ChecksumTuple &checksum);

#endif // CHECKSUM_FILE_HPP

#ifndef FLETCHER_HPP
#define FLETCHER_HPP

#include <array>
#include <string>
#include <vector>
#include <cstddef>
#include <cstdint>

// チェックサム値 (A, B, C, D)
using ChecksumTuple = std::array<uint64_t, 4>;

// ZFSで使われるチェックサムの種類
enum class ChecksumMethod
{
    Fletcher4,
    Fletcher2
};

// Fletcher4の累積値。各和は2^64でラップする
struct Fletcher4State
{
    uint64_t a;
    uint64_t b;
    uint64_t c;
    uint64_t d;

    Fletcher4State() : a(0), b(0), c(0), d(0) {}

    ChecksumTuple toTuple() const { return {a, b, c, d}; }
};

/// 完全な32ビットワード（リトルエンディアン）をすべてstateに加算する
/// 末尾の4バイトに満たない部分は読まない
/// @return 消費したバイト数（4の倍数）
size_t fletcher4Update(Fletcher4State &state, const char *data, size_t size);

/// Fletcher4チェックサム。4バイト未満の末尾は無視される
ChecksumTuple fletcher4(const char *data, size_t size);
ChecksumTuple fletcher4(const std::vector<char> &data);

/// 任意の大きさのチャンクを順に受け取るFletcher4
/// チャンク境界をまたぐワードは次のupdateまで保持する
class Fletcher4Stream
{
private:
    Fletcher4State state;
    char pending[4];
    size_t pendingSize;

public:
    Fletcher4Stream();

    void update(const char *data, size_t size);
    void update(const std::vector<char> &data) { update(data.data(), data.size()); }

    // 保持中の端数バイトは捨てる
    ChecksumTuple finish() const { return state.toTuple(); }

    void reset();
};

/// Fletcher2チェックサム（64ビットワード2つずつ、16バイト未満の末尾は無視）
ChecksumTuple fletcher2(const char *data, size_t size);
ChecksumTuple fletcher2(const std::vector<char> &data);

/// "(A, B, C, D)" 形式の文字列に変換
std::string formatChecksum(const ChecksumTuple &checksum);

/// "fletcher4" / "fletcher2" をChecksumMethodに変換
bool parseChecksumMethod(const std::string &name, ChecksumMethod &method);

#endif // FLETCHER_HPP

#include "fletcher.hpp"
#include <sstream>
#include <cstring>
#include <algorithm>

// ホストのバイトオーダーに依存しない読み込み
static inline uint32_t loadLE32(const char *p)
{
    const unsigned char *u = reinterpret_cast<const unsigned char *>(p);
    return static_cast<uint32_t>(u[0]) |
           (static_cast<uint32_t>(u[1]) << 8) |
           (static_cast<uint32_t>(u[2]) << 16) |
           (static_cast<uint32_t>(u[3]) << 24);
}

static inline uint64_t loadLE64(const char *p)
{
    return static_cast<uint64_t>(loadLE32(p)) |
           (static_cast<uint64_t>(loadLE32(p + 4)) << 32);
}

size_t fletcher4Update(Fletcher4State &state, const char *data, size_t size)
{
    // ZFSのfletcher_4_nativeと同じく、ipendは切り捨てで計算される
    const size_t words = size / sizeof(uint32_t);

    uint64_t a = state.a;
    uint64_t b = state.b;
    uint64_t c = state.c;
    uint64_t d = state.d;

    for (size_t i = 0; i < words; ++i)
    {
        a += loadLE32(data + i * sizeof(uint32_t));
        b += a;
        c += b;
        d += c;
    }

    state.a = a;
    state.b = b;
    state.c = c;
    state.d = d;

    return words * sizeof(uint32_t);
}

ChecksumTuple fletcher4(const char *data, size_t size)
{
    Fletcher4State state;
    fletcher4Update(state, data, size);
    return state.toTuple();
}

ChecksumTuple fletcher4(const std::vector<char> &data)
{
    return fletcher4(data.data(), data.size());
}

Fletcher4Stream::Fletcher4Stream() : pendingSize(0)
{
    std::memset(pending, 0, sizeof(pending));
}

void Fletcher4Stream::update(const char *data, size_t size)
{
    if (size == 0)
    {
        return;
    }

    // 前回のチャンクの端数を先に埋める
    if (pendingSize > 0)
    {
        size_t take = std::min(sizeof(pending) - pendingSize, size);
        std::memcpy(pending + pendingSize, data, take);
        pendingSize += take;
        data += take;
        size -= take;

        if (pendingSize < sizeof(pending))
        {
            return;
        }
        fletcher4Update(state, pending, sizeof(pending));
        pendingSize = 0;
    }

    size_t consumed = fletcher4Update(state, data, size);

    pendingSize = size - consumed;
    if (pendingSize > 0)
    {
        std::memcpy(pending, data + consumed, pendingSize);
    }
}

void Fletcher4Stream::reset()
{
    state = Fletcher4State();
    pendingSize = 0;
}

ChecksumTuple fletcher2(const char *data, size_t size)
{
    uint64_t a = 0, b = 0, c = 0, d = 0;

    // 2ワード（16バイト）単位。端数のペアは無視する
    const size_t pairs = size / (2 * sizeof(uint64_t));
    for (size_t i = 0; i < pairs; ++i)
    {
        const char *p = data + i * 2 * sizeof(uint64_t);
        a += loadLE64(p);
        b += loadLE64(p + sizeof(uint64_t));
        c += a;
        d += b;
    }

    return {a, b, c, d};
}

ChecksumTuple fletcher2(const std::vector<char> &data)
{
    return fletcher2(data.data(), data.size());
}

std::string formatChecksum(const ChecksumTuple &checksum)
{
    std::ostringstream oss;
    oss << "(" << checksum[0] << ", " << checksum[1] << ", "
        << checksum[2] << ", " << checksum[3] << ")";
    return oss.str();
}

bool parseChecksumMethod(const std::string &name, ChecksumMethod &method)
{
    if (name == "fletcher4")
    {
        method = ChecksumMethod::Fletcher4;
        return true;
    }
    if (name == "fletcher2")
    {
        method = ChecksumMethod::Fletcher2;
        return true;
    }
    return false;
}

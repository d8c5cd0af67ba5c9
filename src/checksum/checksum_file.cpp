#include "checksum_file.hpp"
#include "../common/common.hpp"
#include <fstream>
#include <vector>

static bool fletcher4FileStreaming(const std::string &filePath, ChecksumTuple &checksum)
{
    std::ifstream inFile(filePath, std::ios::binary);
    if (!inFile)
    {
        LOG("Error: Cannot open file: " << filePath);
        return false;
    }

    Fletcher4Stream stream;
    std::vector<char> buffer(CHECKSUM_READ_CHUNK_SIZE);
    uint64_t totalRead = 0;

    while (inFile)
    {
        inFile.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        std::streamsize bytesRead = inFile.gcount();
        if (bytesRead > 0)
        {
            stream.update(buffer.data(), static_cast<size_t>(bytesRead));
            totalRead += static_cast<uint64_t>(bytesRead);
        }
    }

    // EOF以外で止まった場合は読み込みエラー
    if (!inFile.eof())
    {
        LOG("Error: Read error on " << filePath << " after " << totalRead << " bytes");
        return false;
    }

    checksum = stream.finish();
    return true;
}

bool checksumFile(const std::string &filePath, ChecksumMethod method, ChecksumTuple &checksum)
{
    switch (method)
    {
    case ChecksumMethod::Fletcher4:
        return fletcher4FileStreaming(filePath, checksum);

    case ChecksumMethod::Fletcher2:
    {
        std::vector<char> data;
        if (!readFileBytes(filePath, data))
        {
            return false;
        }
        checksum = fletcher2(data);
        return true;
    }
    }

    LOG("Error: Unknown checksum method");
    return false;
}

#include <iostream>
#include <string>
#include <vector>

#ifdef _WIN32
#include <fcntl.h>
#include <io.h>
#endif

#include "src/common/common.hpp"
#include "src/decompress/block_decompressor.hpp"
#include "src/decompress/block_frame.hpp"
#include "src/decompress/block_file.hpp"

static void printUsage(const char *program)
{
    std::cerr << "Usage: " << program << " <file-path> <uncompressed-size> [lz4|lzjb|off]" << std::endl;
    std::cerr << "  uncompressed-size is usually the dataset recordsize ("
              << ZFS_DEFAULT_BLOCK_SIZE << " bytes by default)" << std::endl;
}

int main(int argc, char *argv[])
{
    if (argc < 3 || argc > 4)
    {
        printUsage(argv[0]);
        return 1;
    }

    const std::string filePath = argv[1];

    size_t uncompressedSize = 0;
    if (!parsePositiveSize(argv[2], uncompressedSize))
    {
        std::cerr << "Invalid uncompressed size: " << argv[2] << std::endl;
        printUsage(argv[0]);
        return 1;
    }

    CompressionMethod method = CompressionMethod::Lz4;
    if (argc == 4 && !parseCompressionMethod(argv[3], method))
    {
        std::cerr << "Unknown compression method: " << argv[3] << std::endl;
        printUsage(argv[0]);
        return 1;
    }

    initLogFileFromEnv("zfs_decompress");

    int status = 0;
    try
    {
#ifdef _WIN32
        _setmode(_fileno(stdout), _O_BINARY);
#endif
        status = processBlockFile(filePath, uncompressedSize, method, std::cout);
    }
    catch (const std::exception &e)
    {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        status = 1;
    }

    closeLogFile();
    return status;
}

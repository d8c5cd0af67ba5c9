#include "src/common/common.hpp"
#include "src/checksum/checksum_file.hpp"
#include <iostream>
#include <string>

static void printUsage(const char *program)
{
    std::cerr << "Usage: " << program << " <file-path> [fletcher4|fletcher2]" << std::endl;
}

int main(int argc, char *argv[])
{
    if (argc < 2 || argc > 3)
    {
        printUsage(argv[0]);
        return 1;
    }

    const std::string filePath = argv[1];
    ChecksumMethod method = ChecksumMethod::Fletcher4;
    if (argc == 3 && !parseChecksumMethod(argv[2], method))
    {
        std::cerr << "Unknown checksum method: " << argv[2] << std::endl;
        printUsage(argv[0]);
        return 1;
    }

    initLogFileFromEnv("zfs_checksum");

    int status = 0;
    try
    {
        ChecksumTuple checksum;
        if (checksumFile(filePath, method, checksum))
        {
            std::cout << formatChecksum(checksum) << std::endl;
        }
        else
        {
            LOG("Error: Failed to checksum " << filePath);
            status = 1;
        }
    }
    catch (const std::exception &e)
    {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        status = 1;
    }

    closeLogFile();
    return status;
}

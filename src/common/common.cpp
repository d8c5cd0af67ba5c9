#include "common.hpp"
#include <cstdlib>
#include <cctype>

std::mutex log_mutex;
std::ofstream log_file;

void initLogFile(const std::string &logDir, const std::string &programName)
{
    try
    {
        // ログディレクトリが存在しない場合は作成
        if (!fs::exists(logDir))
        {
            fs::create_directories(logDir);
        }

        // ログファイル名を生成（例: zfs_checksum_20251108_123456.log）
        std::string logFileName = logDir + "/" + programName + "_" + getTimestampForFilename() + ".log";

        log_file.open(logFileName, std::ios::out | std::ios::app);

        if (log_file.is_open())
        {
            log_file << "=== " << programName << " Log ===" << std::endl;
            log_file << "Started at: " << getTimestamp() << std::endl;
            log_file << "======================================" << std::endl;
            log_file.flush();
        }
        else
        {
            std::cerr << "Warning: Could not open log file: " << logFileName << std::endl;
        }
    }
    catch (const std::exception &e)
    {
        std::cerr << "Error initializing log file: " << e.what() << std::endl;
    }
}

void initLogFileFromEnv(const std::string &programName)
{
    const char *logDir = std::getenv(LOG_DIR_ENV);
    if (logDir != nullptr && logDir[0] != '\0')
    {
        initLogFile(logDir, programName);
    }
}

void closeLogFile()
{
    if (log_file.is_open())
    {
        log_file << "======================================" << std::endl;
        log_file << "Ended at: " << getTimestamp() << std::endl;
        log_file << "=== End of Log ===" << std::endl;
        log_file.close();
    }
}

bool readFileBytes(const std::string &path, std::vector<char> &data)
{
    // ディレクトリはifstreamで開けてしまい、tellg()が巨大な値を返す
    std::error_code ec;
    if (!fs::is_regular_file(path, ec))
    {
        LOG("Error: Not a regular file: " << path
            << (ec ? " (" + ec.message() + ")" : std::string()));
        return false;
    }

    std::ifstream file(path, std::ios::binary);
    if (!file)
    {
        LOG("Error: Cannot open file: " << path);
        return false;
    }

    // ファイルサイズを取得
    file.seekg(0, std::ios::end);
    std::streamsize fileSize = file.tellg();
    file.seekg(0, std::ios::beg);
    if (fileSize < 0)
    {
        LOG("Error: Cannot determine size of file: " << path);
        return false;
    }

    data.resize(static_cast<size_t>(fileSize));
    file.read(data.data(), fileSize);

    // 短い読み取りの検出
    std::streamsize bytesRead = file.gcount();
    if (bytesRead != fileSize)
    {
        LOG("Error: Short read on " << path
            << " - expected " << fileSize << " bytes, got " << bytesRead << " bytes");
        data.clear();
        return false;
    }

    return true;
}

bool parsePositiveSize(const std::string &text, size_t &value)
{
    if (text.empty())
    {
        return false;
    }
    for (char c : text)
    {
        if (!std::isdigit(static_cast<unsigned char>(c)))
        {
            return false;
        }
    }

    try
    {
        unsigned long long parsed = std::stoull(text);
        if (parsed == 0)
        {
            return false;
        }
        value = static_cast<size_t>(parsed);
        return true;
    }
    catch (const std::exception &e)
    {
        LOG("Error: Invalid size '" << text << "': " << e.what());
        return false;
    }
}

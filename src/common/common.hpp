#ifndef COMMON_HPP
#define COMMON_HPP

#include <iostream>
#include <fstream>
#include <mutex>
#include <filesystem>
#include <chrono>
#include <sstream>
#include <iomanip>
#include <ctime>
#include <string>
#include <vector>
#include <cstdint>

// ファイルシステム名前空間のエイリアス
namespace fs = std::filesystem;

// ログディレクトリを指定する環境変数（未設定ならログファイルは作らない）
constexpr const char *LOG_DIR_ENV = "ZFS_BLOCK_TOOLS_LOG_DIR";

// スレッドセーフなログ出力用
extern std::mutex log_mutex;

// ログファイル出力用
extern std::ofstream log_file;

// タイムスタンプを取得する関数
inline std::string getTimestamp()
{
    auto now = std::chrono::system_clock::now();
    auto now_ms = std::chrono::time_point_cast<std::chrono::milliseconds>(now);
    auto epoch = now_ms.time_since_epoch();
    auto value = std::chrono::duration_cast<std::chrono::milliseconds>(epoch);

    auto now_time_t = std::chrono::system_clock::to_time_t(now);
    auto now_tm = std::localtime(&now_time_t);
    auto ms = value.count() % 1000;

    std::ostringstream timestamp;
    timestamp << std::put_time(now_tm, "%Y-%m-%d %H:%M:%S")
              << "." << std::setfill('0') << std::setw(3) << ms;

    return timestamp.str();
}

// ファイル名用のタイムスタンプを取得する関数
inline std::string getTimestampForFilename()
{
    auto now = std::chrono::system_clock::now();
    auto now_time_t = std::chrono::system_clock::to_time_t(now);
    auto now_tm = std::localtime(&now_time_t);

    std::ostringstream timestamp;
    timestamp << std::put_time(now_tm, "%Y%m%d_%H%M%S");

    return timestamp.str();
}

// stdoutはチェックサムや解凍データの出力先なので、ログはstderrに出す
#define LOG(msg)                                                         \
    {                                                                    \
        std::lock_guard<std::mutex> lock(log_mutex);                     \
        std::string log_message = "[" + getTimestamp() + "] ";          \
        std::ostringstream oss;                                          \
        oss << msg;                                                      \
        log_message += oss.str();                                        \
        std::cerr << log_message << std::endl;                           \
        if (log_file.is_open()) {                                        \
            log_file << log_message << std::endl;                        \
            log_file.flush();                                            \
        }                                                                \
    }

// ログファイルを初期化する関数
void initLogFile(const std::string &logDir, const std::string &programName);

// 環境変数 ZFS_BLOCK_TOOLS_LOG_DIR が設定されていればログファイルを開く
void initLogFileFromEnv(const std::string &programName);

// ログファイルを閉じる関数
void closeLogFile();

/// ファイル全体をバイナリとして読み込む
/// @return 開けない・読めない場合はfalse（エラーはLOGに出力）
bool readFileBytes(const std::string &path, std::vector<char> &data);

/// 正の整数としてパースする（"131072" など）
bool parsePositiveSize(const std::string &text, size_t &value);

#endif // COMMON_HPP

// src/drive_log.cpp
#include "drive_log.hpp"
#include <chrono>
#include <ctime>
#include <fstream>
#include <iostream>
#include <mutex>
#include <stdexcept>

namespace ChunkDrive
{
    namespace Logging
    {

        namespace
        {
            std::mutex log_mutex;
            std::ofstream log_file;

            std::string timestamp()
            {
                auto now = std::chrono::system_clock::now();
                std::time_t now_c = std::chrono::system_clock::to_time_t(now);
                std::tm local_tm{};
                localtime_r(&now_c, &local_tm);
                char buf[32];
                std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &local_tm);
                return buf;
            }
        } // namespace

        std::string levelName(Level level)
        {
            switch (level)
            {
            case Level::Info:
                return "INFO";
            case Level::Warn:
                return "WARN";
            case Level::Error:
                return "ERROR";
            }
            return "INFO";
        }

        void setLogFile(const std::filesystem::path &path)
        {
            std::lock_guard<std::mutex> lock(log_mutex);
            if (log_file.is_open())
            {
                log_file.close();
            }
            if (path.empty())
            {
                return;
            }
            if (path.has_parent_path())
            {
                std::filesystem::create_directories(path.parent_path());
            }
            log_file.open(path, std::ios::app);
            if (!log_file.is_open())
            {
                throw std::runtime_error("Failed to open log file: " + path.string());
            }
        }

        void write(Level level, const std::string &func, const std::string &owner, const std::string &message)
        {
            std::string line = "[" + timestamp() + "] [" + levelName(level) + "] [" + func + "] [" + owner + "] " + message;

            std::lock_guard<std::mutex> lock(log_mutex);
            if (level == Level::Info)
            {
                std::cout << line << std::endl;
            }
            else
            {
                std::cerr << line << std::endl;
            }
            if (log_file.is_open())
            {
                log_file << line << '\n';
                log_file.flush();
            }
        }

    } // namespace Logging
} // namespace ChunkDrive

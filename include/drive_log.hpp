// include/drive_log.hpp
#pragma once

#include <string>
#include <filesystem>

namespace ChunkDrive
{
    namespace Logging
    {

        enum class Level
        {
            Info,
            Warn,
            Error
        };

        // Also append every line to the given file. An empty path disables the file sink.
        void setLogFile(const std::filesystem::path &path);

        // Writes "[YYYY-MM-DD HH:MM:SS] [LEVEL] [FUNC] [owner] message".
        // Info goes to stdout, Warn and Error to stderr.
        void write(Level level, const std::string &func, const std::string &owner, const std::string &message);

        inline void info(const std::string &func, const std::string &owner, const std::string &message)
        {
            write(Level::Info, func, owner, message);
        }

        inline void warn(const std::string &func, const std::string &owner, const std::string &message)
        {
            write(Level::Warn, func, owner, message);
        }

        inline void error(const std::string &func, const std::string &owner, const std::string &message)
        {
            write(Level::Error, func, owner, message);
        }

        std::string levelName(Level level);

    } // namespace Logging
} // namespace ChunkDrive

// include/source_resolver.hpp
#pragma once

#include <filesystem>
#include <istream>
#include <memory>
#include <string>

namespace ChunkDrive
{
    namespace Sources
    {

        struct ResolvedSource
        {
            std::string suggested_name;
            std::unique_ptr<std::istream> stream;
        };

        // Turns a user supplied link into readable bytes. Links are untrusted input.
        class SourceResolver
        {
        public:
            virtual ~SourceResolver() = default;

            // Throws std::runtime_error when the link cannot be resolved.
            virtual ResolvedSource resolve(const std::string &link) = 0;
        };

        // Resolves plain file names inside the upload directory.
        class LocalSourceResolver : public SourceResolver
        {
        public:
            explicit LocalSourceResolver(std::filesystem::path upload_dir);

            // Rejects absolute paths and anything that escapes the upload directory.
            ResolvedSource resolve(const std::string &link) override;

        private:
            std::filesystem::path upload_dir_;
        };

    } // namespace Sources
} // namespace ChunkDrive

// src/source_resolver.cpp
#include "source_resolver.hpp"
#include <fstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace ChunkDrive
{
    namespace Sources
    {

        LocalSourceResolver::LocalSourceResolver(fs::path upload_dir)
            : upload_dir_(fs::weakly_canonical(fs::absolute(upload_dir)))
        {
        }

        ResolvedSource LocalSourceResolver::resolve(const std::string &link)
        {
            fs::path requested(link);
            if (link.empty() || requested.is_absolute())
            {
                throw std::runtime_error("Source must be a file name inside the upload directory: " + link);
            }

            fs::path resolved = fs::weakly_canonical(upload_dir_ / requested);
            auto rel = resolved.lexically_relative(upload_dir_);
            if (rel.empty() || *rel.begin() == "..")
            {
                throw std::runtime_error("Source escapes the upload directory: " + link);
            }
            if (!fs::is_regular_file(resolved))
            {
                throw std::runtime_error("Input file not found: " + resolved.string());
            }

            auto stream = std::make_unique<std::ifstream>(resolved, std::ios::binary);
            if (!stream->is_open())
            {
                throw std::runtime_error("Failed to open input file: " + resolved.string());
            }

            ResolvedSource source;
            source.suggested_name = resolved.filename().string();
            source.stream = std::move(stream);
            return source;
        }

    } // namespace Sources
} // namespace ChunkDrive

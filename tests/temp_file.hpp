#pragma once

/// @file temp_file.hpp
/// @brief Scoped temporary text file for loader tests.

#include <filesystem>
#include <fstream>
#include <string>

namespace meridian::testing
{
    class TempFile
    {
    public:
        explicit TempFile(const std::string& filename, const std::string& content)
            : m_path(std::filesystem::temp_directory_path() / filename)
        {
            std::ofstream file(m_path);
            file << content;
        }

        ~TempFile()
        {
            std::filesystem::remove(m_path);
        }

        [[nodiscard]] const std::filesystem::path& path() const { return m_path; }

        TempFile(const TempFile&) = delete;
        TempFile& operator=(const TempFile&) = delete;

    private:
        std::filesystem::path m_path;
    };

} // namespace meridian::testing

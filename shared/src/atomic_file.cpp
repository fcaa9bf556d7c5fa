#include "clouddrive/atomic_file.hpp"

#include <fstream>
#include <system_error>

#include "clouddrive/error_codes.hpp"

namespace clouddrive
{

    void write_file_atomically(const std::filesystem::path &path, std::string_view content,
                               std::filesystem::perms permissions)
    {
        const auto dir = path.parent_path();
        std::error_code ec;
        if (!dir.empty())
        {
            std::filesystem::create_directories(dir, ec);
            if (ec)
            {
                throw Error(ErrorCode::StateStoreFailure,
                            "Failed to create directory " + dir.string() + ": " + ec.message());
            }
        }

        auto temp_path = path;
        temp_path += ".tmp";
        {
            std::ofstream out(temp_path, std::ios::binary | std::ios::trunc);
            if (!out.is_open())
            {
                throw Error(ErrorCode::StateStoreFailure, "Failed to open " + temp_path.string() + " for writing");
            }
            out.write(content.data(), static_cast<std::streamsize>(content.size()));
            out.flush();
            if (!out)
            {
                out.close();
                std::filesystem::remove(temp_path, ec);
                throw Error(ErrorCode::StateStoreFailure, "Failed to write " + temp_path.string());
            }
        }

        std::filesystem::permissions(temp_path, permissions, std::filesystem::perm_options::replace, ec);

        std::filesystem::rename(temp_path, path, ec);
        if (ec)
        {
            const auto message = ec.message();
            std::filesystem::remove(temp_path, ec);
            throw Error(ErrorCode::StateStoreFailure,
                        "Failed to replace " + path.string() + ": " + message);
        }
    }

} // namespace clouddrive

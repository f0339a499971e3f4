#include <utility/temporary_directory.hpp>

#include <stdlib.h>

#include <stdexcept>
#include <string>

namespace Utility
{
    TemporaryDirectory::TemporaryDirectory()
        : basePath_{std::filesystem::temp_directory_path() / "twinpane_tmpdir"}
        , path_{}
    {
        std::filesystem::create_directories(basePath_);

        std::string dirNameAsString{(basePath_ / "dirXXXXXX").string()};
        if (mkdtemp(dirNameAsString.data()) == nullptr || !std::filesystem::is_directory(dirNameAsString))
            throw std::runtime_error(std::string{"Could not setup temporary directory in: "} + basePath_.string());

        // canonical, so tests can compare against canonicalized listing directories.
        path_ = std::filesystem::canonical(dirNameAsString);
    }
    TemporaryDirectory::~TemporaryDirectory()
    {
        std::error_code error;
        std::filesystem::remove_all(path_, error);
        // Only succeeds once every other temporary directory is gone as well.
        std::filesystem::remove(basePath_, error);
    }

    std::filesystem::path const& TemporaryDirectory::path() const
    {
        return path_;
    }
}

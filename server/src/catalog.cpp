#include "mirrorsync/server/catalog.hpp"

#include <algorithm>
#include <system_error>

#include <spdlog/spdlog.h>

#include "mirrorsync/crypto.hpp"

namespace mirrorsync::server
{

    bool FileCatalog::insert(std::string path, std::string hash)
    {
        if (index_.contains(path))
        {
            return false;
        }
        index_.emplace(path, entries_.size());
        entries_.push_back(CatalogEntry{.path = std::move(path), .hash = std::move(hash)});
        return true;
    }

    std::optional<std::string> FileCatalog::find(std::string_view path) const
    {
        const auto it = index_.find(std::string(path));
        if (it == index_.end())
        {
            return std::nullopt;
        }
        return entries_[it->second].hash;
    }

    bool FileCatalog::contains(std::string_view path) const
    {
        return index_.contains(std::string(path));
    }

    FileCatalog build_catalog(const std::filesystem::path &root, const std::vector<std::string> &directories)
    {
        FileCatalog catalog;
        for (const auto &directory : directories)
        {
            const auto base = root / directory;
            std::error_code ec;
            if (!std::filesystem::is_directory(base, ec))
            {
                spdlog::warn("Managed directory {} does not exist, skipping", base.string());
                continue;
            }

            std::vector<std::filesystem::path> files;
            std::filesystem::recursive_directory_iterator it(
                base, std::filesystem::directory_options::skip_permission_denied, ec);
            for (; !ec && it != std::filesystem::recursive_directory_iterator(); it.increment(ec))
            {
                std::error_code type_ec;
                if (it->is_regular_file(type_ec))
                {
                    files.push_back(it->path());
                }
            }
            if (ec)
            {
                spdlog::warn("Stopped scanning {}: {}", base.string(), ec.message());
            }
            std::sort(files.begin(), files.end(),
                      [](const std::filesystem::path &lhs, const std::filesystem::path &rhs)
                      { return lhs.generic_string() < rhs.generic_string(); });

            for (const auto &file : files)
            {
                const auto key = file.lexically_relative(root).generic_string();
                try
                {
                    auto hash = crypto::hash_file(file);
                    if (!catalog.insert(key, std::move(hash)))
                    {
                        spdlog::debug("{} already in catalog", key);
                    }
                }
                catch (const std::exception &ex)
                {
                    spdlog::warn("Skipping {}: {}", key, ex.what());
                }
            }
        }
        return catalog;
    }

} // namespace mirrorsync::server

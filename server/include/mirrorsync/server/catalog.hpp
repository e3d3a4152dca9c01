#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace mirrorsync::server
{

    struct CatalogEntry
    {
        std::string path;
        std::string hash;
    };

    // Path -> content hash with unique keys. Iterates in insertion order, which
    // is the order files are offered to a peer.
    class FileCatalog
    {
    public:
        using const_iterator = std::vector<CatalogEntry>::const_iterator;

        // Returns false and leaves the catalog unchanged if path is already present.
        bool insert(std::string path, std::string hash);

        std::optional<std::string> find(std::string_view path) const;
        bool contains(std::string_view path) const;

        std::size_t size() const noexcept { return entries_.size(); }
        bool empty() const noexcept { return entries_.empty(); }

        const_iterator begin() const noexcept { return entries_.begin(); }
        const_iterator end() const noexcept { return entries_.end(); }

    private:
        std::vector<CatalogEntry> entries_;
        std::unordered_map<std::string, std::size_t> index_;
    };

    // Hashes every regular file below root/<directory> for each managed
    // directory, in directory order and then sorted path order. Keys are
    // generic paths relative to root.
    FileCatalog build_catalog(const std::filesystem::path &root, const std::vector<std::string> &directories);

} // namespace mirrorsync::server

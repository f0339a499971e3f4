#pragma once

#include <backend/file_system/file_system.hpp>
#include <shared_data/directory_entry.hpp>

#include <algorithm>
#include <expected>
#include <filesystem>
#include <vector>

/**
 * @brief Removes a trailing separator, so that parent_path() and filename() behave. "/" stays "/".
 */
std::filesystem::path withoutTrailingSeparator(std::filesystem::path const& path);

/**
 * @brief std::filesystem::canonical with the error converted.
 */
std::expected<std::filesystem::path, SharedData::FileSystemError>
canonicalLocalDirectory(std::filesystem::path const& path);

/**
 * @brief Lists a directory as it is shown in a pane: sorted, hidden-filtered and with a parent marker if the directory
 * has a parent. May block on the network.
 */
template <SharedData::Namespace NamespaceV>
std::expected<std::vector<SharedData::DirectoryEntry<NamespaceV>>, SharedData::FileSystemError>
fetchListing(IFileSystem& fileSystem, std::filesystem::path const& directory, bool showHidden)
{
    using Entry = SharedData::DirectoryEntry<NamespaceV>;

    const auto dir = withoutTrailingSeparator(directory);
    auto records = fileSystem.list(dir);
    if (!records.has_value())
        return std::unexpected(records.error());

    std::vector<Entry> entries;
    entries.reserve(records->size() + 1);
    if (dir.has_relative_path() && dir.has_parent_path())
        entries.push_back(Entry::parentMarker(dir.parent_path()));

    for (auto const& record : *records)
    {
        auto entry = Entry::fromFileInformation(dir, record);
        if (!entry)
            continue;
        if (!showHidden && entry->isHidden())
            continue;
        entries.push_back(std::move(*entry));
    }

    std::sort(entries.begin(), entries.end());
    return entries;
}

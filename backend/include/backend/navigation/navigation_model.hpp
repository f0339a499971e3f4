#pragma once

#include <backend/file_system/file_system.hpp>
#include <shared_data/directory_entry.hpp>

#include <cstddef>
#include <expected>
#include <filesystem>
#include <optional>
#include <variant>
#include <vector>

/**
 * @brief Two directory listings, one local and one remote, and a single cursor pointing into one of them.
 * Not synchronized, the owner guards it.
 */
class NavigationModel
{
  public:
    using Error = SharedData::FileSystemError;

    struct LocalIndex
    {
        std::size_t index;
        bool operator==(LocalIndex const&) const = default;
    };
    struct RemoteIndex
    {
        std::size_t index;
        bool operator==(RemoteIndex const&) const = default;
    };
    struct NoSelection
    {
        bool operator==(NoSelection const&) const = default;
    };
    using Cursor = std::variant<NoSelection, LocalIndex, RemoteIndex>;
    using Selection = std::variant<std::monostate, SharedData::LocalEntry, SharedData::RemoteEntry>;

    template <SharedData::Namespace NamespaceV>
    struct Listing
    {
        std::filesystem::path directory;
        std::vector<SharedData::DirectoryEntry<NamespaceV>> entries;
    };
    using LocalListing = Listing<SharedData::Namespace::Local>;
    using RemoteListing = Listing<SharedData::Namespace::Remote>;

    NavigationModel(IFileSystem& localFileSystem, IFileSystem& remoteFileSystem);

    /**
     * @brief Resolves and lists a directory without touching the model.
     * Local paths are canonicalized, remote paths are used as given minus a trailing separator.
     * Only reads the filesystems, so the owner may call this without holding its lock.
     */
    template <SharedData::Namespace NamespaceV>
    std::expected<Listing<NamespaceV>, Error> list(std::filesystem::path const& path, bool showHidden) const;

    /**
     * @brief Installs a listing and re-clamps the cursor.
     */
    void install(LocalListing listing);
    void install(RemoteListing listing);

    /**
     * @brief Installs the listing only if its directory is still the shown one.
     *
     * @return false if the pane changed directory since the listing was taken.
     */
    bool installIfCurrent(LocalListing listing);
    bool installIfCurrent(RemoteListing listing);

    /**
     * @brief Canonicalizes the path, lists it and installs the listing.
     */
    std::expected<void, Error> setLocalDir(std::filesystem::path const& path, bool showHidden);

    /**
     * @brief Lists the path as given and installs the listing.
     */
    std::expected<void, Error> setRemoteDir(std::filesystem::path const& path, bool showHidden);

    std::expected<void, Error> refreshLocal(bool showHidden);
    std::expected<void, Error> refreshRemote(bool showHidden);

    /**
     * @brief Installs a listing fetched elsewhere and re-clamps the cursor. Never touches a filesystem.
     */
    void replaceLocalListing(std::filesystem::path directory, std::vector<SharedData::LocalEntry> entries);
    void replaceRemoteListing(std::filesystem::path directory, std::vector<SharedData::RemoteEntry> entries);

    /**
     * @brief Moves the cursor by delta within its listing, wrapping around at both ends.
     */
    void moveCursor(int delta);

    /**
     * @brief Moves the cursor to the same index in the other listing.
     */
    void togglePane();

    Selection selectedEntry() const;

    Cursor cursor() const;
    std::optional<std::size_t> localSelectedIndex() const;
    std::optional<std::size_t> remoteSelectedIndex() const;

    std::filesystem::path const& localDirectory() const;
    std::filesystem::path const& remoteDirectory() const;
    std::vector<SharedData::LocalEntry> const& localEntries() const;
    std::vector<SharedData::RemoteEntry> const& remoteEntries() const;

  private:
    /// Restores the cursor invariant after a listing changed.
    void reclamp();
    void selectFirstAvailable();

  private:
    IFileSystem* localFileSystem_;
    IFileSystem* remoteFileSystem_;
    std::filesystem::path localDirectory_;
    std::filesystem::path remoteDirectory_;
    std::vector<SharedData::LocalEntry> localEntries_;
    std::vector<SharedData::RemoteEntry> remoteEntries_;
    Cursor cursor_;
};

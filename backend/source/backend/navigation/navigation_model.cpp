#include <backend/navigation/navigation_model.hpp>
#include <backend/navigation/fetch_listing.hpp>

namespace
{
    std::size_t wrapIndex(std::size_t index, int delta, std::size_t length)
    {
        const auto signedLength = static_cast<long long>(length);
        auto next = (static_cast<long long>(index) + delta) % signedLength;
        if (next < 0)
            next += signedLength;
        return static_cast<std::size_t>(next);
    }
}

NavigationModel::NavigationModel(IFileSystem& localFileSystem, IFileSystem& remoteFileSystem)
    : localFileSystem_{&localFileSystem}
    , remoteFileSystem_{&remoteFileSystem}
    , localDirectory_{}
    , remoteDirectory_{}
    , localEntries_{}
    , remoteEntries_{}
    , cursor_{NoSelection{}}
{}

template <SharedData::Namespace NamespaceV>
std::expected<NavigationModel::Listing<NamespaceV>, NavigationModel::Error>
NavigationModel::list(std::filesystem::path const& path, bool showHidden) const
{
    auto directory = [&]() -> std::expected<std::filesystem::path, Error> {
        if constexpr (NamespaceV == SharedData::Namespace::Local)
            return canonicalLocalDirectory(path);
        else
            return withoutTrailingSeparator(path);
    }();
    if (!directory.has_value())
        return std::unexpected(directory.error());

    auto& fileSystem = NamespaceV == SharedData::Namespace::Local ? *localFileSystem_ : *remoteFileSystem_;
    auto entries = fetchListing<NamespaceV>(fileSystem, *directory, showHidden);
    if (!entries.has_value())
        return std::unexpected(entries.error());

    return Listing<NamespaceV>{.directory = std::move(directory).value(), .entries = std::move(entries).value()};
}

template std::expected<NavigationModel::LocalListing, NavigationModel::Error>
NavigationModel::list<SharedData::Namespace::Local>(std::filesystem::path const&, bool) const;
template std::expected<NavigationModel::RemoteListing, NavigationModel::Error>
NavigationModel::list<SharedData::Namespace::Remote>(std::filesystem::path const&, bool) const;

void NavigationModel::install(LocalListing listing)
{
    replaceLocalListing(std::move(listing.directory), std::move(listing.entries));
}

void NavigationModel::install(RemoteListing listing)
{
    replaceRemoteListing(std::move(listing.directory), std::move(listing.entries));
}

bool NavigationModel::installIfCurrent(LocalListing listing)
{
    if (listing.directory != localDirectory_)
        return false;
    install(std::move(listing));
    return true;
}

bool NavigationModel::installIfCurrent(RemoteListing listing)
{
    if (listing.directory != remoteDirectory_)
        return false;
    install(std::move(listing));
    return true;
}

std::expected<void, NavigationModel::Error>
NavigationModel::setLocalDir(std::filesystem::path const& path, bool showHidden)
{
    return list<SharedData::Namespace::Local>(path, showHidden).transform([this](LocalListing&& listing) {
        install(std::move(listing));
    });
}

std::expected<void, NavigationModel::Error>
NavigationModel::setRemoteDir(std::filesystem::path const& path, bool showHidden)
{
    return list<SharedData::Namespace::Remote>(path, showHidden).transform([this](RemoteListing&& listing) {
        install(std::move(listing));
    });
}

std::expected<void, NavigationModel::Error> NavigationModel::refreshLocal(bool showHidden)
{
    return list<SharedData::Namespace::Local>(localDirectory_, showHidden).transform([this](LocalListing&& listing) {
        installIfCurrent(std::move(listing));
    });
}

std::expected<void, NavigationModel::Error> NavigationModel::refreshRemote(bool showHidden)
{
    return list<SharedData::Namespace::Remote>(remoteDirectory_, showHidden).transform([this](RemoteListing&& listing) {
        installIfCurrent(std::move(listing));
    });
}

void NavigationModel::replaceLocalListing(std::filesystem::path directory, std::vector<SharedData::LocalEntry> entries)
{
    localDirectory_ = std::move(directory);
    localEntries_ = std::move(entries);
    reclamp();
}

void NavigationModel::replaceRemoteListing(std::filesystem::path directory, std::vector<SharedData::RemoteEntry> entries)
{
    remoteDirectory_ = std::move(directory);
    remoteEntries_ = std::move(entries);
    reclamp();
}

void NavigationModel::selectFirstAvailable()
{
    if (!remoteEntries_.empty())
        cursor_ = RemoteIndex{0};
    else if (!localEntries_.empty())
        cursor_ = LocalIndex{0};
    else
        cursor_ = NoSelection{};
}

void NavigationModel::moveCursor(int delta)
{
    if (auto* local = std::get_if<LocalIndex>(&cursor_); local && !localEntries_.empty())
        local->index = wrapIndex(local->index, delta, localEntries_.size());
    else if (auto* remote = std::get_if<RemoteIndex>(&cursor_); remote && !remoteEntries_.empty())
        remote->index = wrapIndex(remote->index, delta, remoteEntries_.size());
    else
        selectFirstAvailable();
}

void NavigationModel::reclamp()
{
    // Same result as moving forth and back by one.
    moveCursor(0);
}

void NavigationModel::togglePane()
{
    if (auto const* local = std::get_if<LocalIndex>(&cursor_))
    {
        if (!remoteEntries_.empty())
            cursor_ = RemoteIndex{local->index};
        else
            cursor_ = NoSelection{};
    }
    else if (auto const* remote = std::get_if<RemoteIndex>(&cursor_))
    {
        if (!localEntries_.empty())
            cursor_ = LocalIndex{remote->index};
        else
            cursor_ = NoSelection{};
    }
    reclamp();
}

NavigationModel::Selection NavigationModel::selectedEntry() const
{
    if (auto const* local = std::get_if<LocalIndex>(&cursor_); local && local->index < localEntries_.size())
        return localEntries_[local->index];
    if (auto const* remote = std::get_if<RemoteIndex>(&cursor_); remote && remote->index < remoteEntries_.size())
        return remoteEntries_[remote->index];
    return std::monostate{};
}

NavigationModel::Cursor NavigationModel::cursor() const
{
    return cursor_;
}

std::optional<std::size_t> NavigationModel::localSelectedIndex() const
{
    if (auto const* local = std::get_if<LocalIndex>(&cursor_))
        return local->index;
    return std::nullopt;
}

std::optional<std::size_t> NavigationModel::remoteSelectedIndex() const
{
    if (auto const* remote = std::get_if<RemoteIndex>(&cursor_))
        return remote->index;
    return std::nullopt;
}

std::filesystem::path const& NavigationModel::localDirectory() const
{
    return localDirectory_;
}

std::filesystem::path const& NavigationModel::remoteDirectory() const
{
    return remoteDirectory_;
}

std::vector<SharedData::LocalEntry> const& NavigationModel::localEntries() const
{
    return localEntries_;
}

std::vector<SharedData::RemoteEntry> const& NavigationModel::remoteEntries() const
{
    return remoteEntries_;
}

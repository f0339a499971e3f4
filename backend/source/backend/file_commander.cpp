#include <backend/file_commander.hpp>
#include <backend/navigation/navigation_model.hpp>
#include <backend/progress/progress_registry.hpp>
#include <backend/transfer/transfer_dispatcher.hpp>
#include <backend/transfer/transfer_engine.hpp>
#include <log/log.hpp>

#include <fmt/format.h>

#include <atomic>
#include <mutex>

namespace
{
    template <typename EntryT>
    std::vector<std::string> displayTexts(std::vector<EntryT> const& entries)
    {
        std::vector<std::string> texts;
        texts.reserve(entries.size());
        for (auto const& entry : entries)
            texts.push_back(entry.displayText());
        return texts;
    }
}

struct FileCommander::Implementation
{
    std::unique_ptr<IFileSystem> localFileSystem;
    std::unique_ptr<IFileSystem> remoteFileSystem;
    std::size_t chunkSize;
    std::atomic<bool> showHiddenFiles;
    std::atomic<bool> alive;
    std::mutex navigationGuard;
    NavigationModel navigation;
    ProgressRegistry registry;
    StatusMessages statusMessages;
    // Last, so workers are joined before anything they use is destroyed.
    TransferDispatcher dispatcher;

    Implementation(
        std::unique_ptr<IFileSystem> localFileSystem,
        std::unique_ptr<IFileSystem> remoteFileSystem,
        FileCommanderOptions options)
        : localFileSystem{std::move(localFileSystem)}
        , remoteFileSystem{std::move(remoteFileSystem)}
        , chunkSize{options.chunkSize}
        , showHiddenFiles{options.showHiddenFiles}
        , alive{true}
        , navigationGuard{}
        , navigation{*this->localFileSystem, *this->remoteFileSystem}
        , registry{}
        , statusMessages{}
        , dispatcher{}
    {}
};

FileCommander::FileCommander(
    std::unique_ptr<IFileSystem> localFileSystem,
    std::unique_ptr<IFileSystem> remoteFileSystem,
    FileCommanderOptions options)
    : impl_{std::make_unique<Implementation>(std::move(localFileSystem), std::move(remoteFileSystem), options)}
{}

FileCommander::~FileCommander()
{
    if (const auto running = impl_->dispatcher.running(); running > 0)
        Log::warn("FileCommander: Shutting down while {} transfers are running, waiting for them to end.", running);
    impl_->dispatcher.joinAll();
}

IFileSystem& FileCommander::fileSystem(SharedData::Namespace ns)
{
    return ns == SharedData::Namespace::Local ? *impl_->localFileSystem : *impl_->remoteFileSystem;
}

std::expected<void, SharedData::FileSystemError>
FileCommander::open(std::filesystem::path const& localDirectory, std::filesystem::path const& remoteDirectory)
{
    return changeDirectory<SharedData::Namespace::Local>(localDirectory).and_then([&]() {
        return changeDirectory<SharedData::Namespace::Remote>(remoteDirectory);
    });
}

template <SharedData::Namespace NamespaceV>
std::expected<void, SharedData::FileSystemError> FileCommander::changeDirectory(std::filesystem::path const& directory)
{
    // Listing may block on the network, so it happens outside of the lock.
    auto listing = impl_->navigation.list<NamespaceV>(directory, impl_->showHiddenFiles.load());
    if (!listing.has_value())
        return std::unexpected(listing.error());

    std::scoped_lock lock{impl_->navigationGuard};
    impl_->navigation.install(std::move(listing).value());
    return {};
}

template <SharedData::Namespace NamespaceV>
std::expected<void, SharedData::FileSystemError> FileCommander::refreshPane()
{
    const auto directory = [this]() {
        std::scoped_lock lock{impl_->navigationGuard};
        if constexpr (NamespaceV == SharedData::Namespace::Local)
            return impl_->navigation.localDirectory();
        else
            return impl_->navigation.remoteDirectory();
    }();

    auto listing = impl_->navigation.list<NamespaceV>(directory, impl_->showHiddenFiles.load());
    if (!listing.has_value())
        return std::unexpected(listing.error());

    std::scoped_lock lock{impl_->navigationGuard};
    if (!impl_->navigation.installIfCurrent(std::move(listing).value()))
        Log::debug("FileCommander: Dropped a listing of '{}', the pane moved on.", directory.generic_string());
    return {};
}

void FileCommander::moveCursor(int delta)
{
    std::scoped_lock lock{impl_->navigationGuard};
    impl_->navigation.moveCursor(delta);
}

void FileCommander::togglePane()
{
    std::scoped_lock lock{impl_->navigationGuard};
    impl_->navigation.togglePane();
}

template <SharedData::Namespace NamespaceV>
void FileCommander::enter(SharedData::DirectoryEntry<NamespaceV> const& entry)
{
    if (!entry.isDirectory() && !entry.isParentMarker())
    {
        impl_->statusMessages.error(
            fmt::format("Error: Cannot enter \"{}\" because it is not a directory!", entry.fileName()));
        return;
    }

    if (const auto result = changeDirectory<NamespaceV>(entry.path()); !result.has_value())
    {
        impl_->statusMessages.error(
            fmt::format("Error: Unable to enter \"{}\". {}", entry.fileName(), result.error().toString()));
    }
}

void FileCommander::enterSelected()
{
    const auto selection = [this]() {
        std::scoped_lock lock{impl_->navigationGuard};
        return impl_->navigation.selectedEntry();
    }();

    if (auto const* local = std::get_if<SharedData::LocalEntry>(&selection))
        enter(*local);
    else if (auto const* remote = std::get_if<SharedData::RemoteEntry>(&selection))
        enter(*remote);
    else
        impl_->statusMessages.report("No directory selected.");
}

template <SharedData::Namespace SourceNamespaceV>
void FileCommander::spawnTransfer(SharedData::DirectoryEntry<SourceNamespaceV> source, std::filesystem::path destinationDir)
{
    constexpr auto destinationNamespace = SharedData::otherNamespace(SourceNamespaceV);
    constexpr bool isUpload = TransferEngine<SourceNamespaceV>::isUpload;

    impl_->dispatcher.dispatch([this, source = std::move(source), destinationDir = std::move(destinationDir)]() {
        const auto name = source.fileName();
        TransferEngine<SourceNamespaceV> engine{
            fileSystem(SourceNamespaceV),
            fileSystem(destinationNamespace),
            impl_->registry,
            impl_->statusMessages,
            TransferEngineOptions{.chunkSize = impl_->chunkSize},
        };
        const auto result = engine.run(source, destinationDir);
        const auto refreshed = refreshPane<destinationNamespace>();

        if (!result.has_value())
        {
            impl_->statusMessages.error(fmt::format(
                "Error: Unable to {} \"{}\". {}",
                isUpload ? "upload" : "download",
                name,
                result.error().toString()));
        }
        else if (!refreshed.has_value())
        {
            impl_->statusMessages.error(fmt::format(
                "Error: Finished {} \"{}\", but the listing could not be refreshed. {}",
                isUpload ? "uploading" : "downloading",
                name,
                refreshed.error().toString()));
        }
        else
        {
            impl_->statusMessages.report(
                fmt::format("Finished {} \"{}\".", isUpload ? "uploading" : "downloading", name));
        }
    });
}

void FileCommander::transferSelected()
{
    NavigationModel::Selection selection;
    std::filesystem::path localDirectory;
    std::filesystem::path remoteDirectory;
    {
        std::scoped_lock lock{impl_->navigationGuard};
        selection = impl_->navigation.selectedEntry();
        localDirectory = impl_->navigation.localDirectory();
        remoteDirectory = impl_->navigation.remoteDirectory();
    }

    if (auto const* local = std::get_if<SharedData::LocalEntry>(&selection))
        spawnTransfer(*local, remoteDirectory);
    else if (auto const* remote = std::get_if<SharedData::RemoteEntry>(&selection))
        spawnTransfer(*remote, localDirectory);
    else
        impl_->statusMessages.report("No file selected.");
}

void FileCommander::refresh()
{
    if (const auto result = refreshPane<SharedData::Namespace::Local>(); !result.has_value())
    {
        impl_->statusMessages.error(
            fmt::format("Error: Unable to list the local directory. {}", result.error().toString()));
    }
    if (const auto result = refreshPane<SharedData::Namespace::Remote>(); !result.has_value())
    {
        impl_->statusMessages.error(
            fmt::format("Error: Unable to list the remote directory. {}", result.error().toString()));
    }
}

void FileCommander::toggleHiddenFiles()
{
    const bool showHidden = !impl_->showHiddenFiles.load();
    impl_->showHiddenFiles.store(showHidden);
    Log::debug("FileCommander: Hidden files are now {}.", showHidden ? "shown" : "hidden");
    refresh();
}

bool FileCommander::requestQuit(bool force)
{
    impl_->registry.prune();
    // A worker may still be opening streams or refreshing a listing without a meter to show for it.
    if (!force && (!impl_->registry.empty() || impl_->dispatcher.running() > 0))
    {
        impl_->statusMessages.warn("Transfers are still running. Press Q to quit anyway.");
        return false;
    }

    if (const auto running = impl_->dispatcher.running(); running > 0)
        Log::warn("FileCommander: Quit forced while {} transfers are running.", running);
    impl_->alive.store(false);
    return true;
}

void FileCommander::tick()
{
    impl_->registry.prune();
    impl_->dispatcher.reap();
}

bool FileCommander::isAlive() const
{
    return impl_->alive.load();
}

std::size_t FileCommander::runningTransfers() const
{
    return impl_->dispatcher.running();
}

FileCommander::View FileCommander::view()
{
    View result{};
    {
        std::scoped_lock lock{impl_->navigationGuard};
        result.local = PaneView{
            .directory = impl_->navigation.localDirectory(),
            .entries = displayTexts(impl_->navigation.localEntries()),
            .selectedIndex = impl_->navigation.localSelectedIndex(),
        };
        result.remote = PaneView{
            .directory = impl_->navigation.remoteDirectory(),
            .entries = displayTexts(impl_->navigation.remoteEntries()),
            .selectedIndex = impl_->navigation.remoteSelectedIndex(),
        };
    }

    for (auto const& meter : impl_->registry.snapshot())
    {
        result.meters.push_back(MeterView{
            .title = meter->title(),
            .kind = meter->kind(),
            .ratio = meter->ratio(),
            .bytesSent = meter->bytesSent(),
            .totalBytes = meter->totalBytes(),
            .throughputBitsPerSecond = meter->throughputBitsPerSecond(),
            .eta = meter->eta(),
            .finished = meter->isFinished(),
            .filesCompleted = meter->filesCompleted(),
        });
    }
    result.messages = impl_->statusMessages.current();
    result.showHiddenFiles = impl_->showHiddenFiles.load();
    return result;
}

#pragma once

#include <backend/file_system/file_system.hpp>
#include <backend/progress/progress_meter.hpp>
#include <backend/status_messages.hpp>
#include <backend/transfer/transfer_engine.hpp>
#include <shared_data/directory_entry.hpp>

#include <chrono>
#include <cstddef>
#include <expected>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

struct FileCommanderOptions
{
    bool showHiddenFiles{false};
    std::size_t chunkSize{TransferEngineOptions::defaultChunkSize};
};

/**
 * @brief The interactive part of the program: navigates both panes and dispatches transfers to background workers.
 * All public functions are meant to be called from the one control loop.
 */
class FileCommander
{
  public:
    struct PaneView
    {
        std::filesystem::path directory;
        std::vector<std::string> entries;
        std::optional<std::size_t> selectedIndex;
    };

    struct MeterView
    {
        std::string title;
        ProgressMeter::Kind kind;
        double ratio;
        std::uint64_t bytesSent;
        std::uint64_t totalBytes;
        std::uint64_t throughputBitsPerSecond;
        std::optional<std::chrono::milliseconds> eta;
        bool finished;
        std::uint64_t filesCompleted;
    };

    struct View
    {
        PaneView local;
        PaneView remote;
        std::vector<MeterView> meters;
        std::vector<StatusMessages::Message> messages;
        bool showHiddenFiles;
    };

    FileCommander(
        std::unique_ptr<IFileSystem> localFileSystem,
        std::unique_ptr<IFileSystem> remoteFileSystem,
        FileCommanderOptions options);
    ~FileCommander();
    FileCommander(FileCommander const&) = delete;
    FileCommander& operator=(FileCommander const&) = delete;
    FileCommander(FileCommander&&) = delete;
    FileCommander& operator=(FileCommander&&) = delete;

    /**
     * @brief Lists the start directories of both panes.
     */
    std::expected<void, SharedData::FileSystemError>
    open(std::filesystem::path const& localDirectory, std::filesystem::path const& remoteDirectory);

    void moveCursor(int delta);
    void togglePane();

    /**
     * @brief Changes into the selected directory or the parent for the parent marker.
     */
    void enterSelected();

    /**
     * @brief Uploads a selected local entry into the remote directory, downloads a remote one into the local directory.
     */
    void transferSelected();

    void toggleHiddenFiles();

    /**
     * @brief Lists both directories again.
     */
    void refresh();

    /**
     * @brief Ends the control loop. Without force this is refused while meters are shown or workers still run.
     *
     * @return true if the commander is no longer alive.
     */
    bool requestQuit(bool force);

    /**
     * @brief Prunes finished meters and joins finished workers.
     */
    void tick();

    bool isAlive() const;

    View view();

    std::size_t runningTransfers() const;

  private:
    template <SharedData::Namespace NamespaceV>
    std::expected<void, SharedData::FileSystemError> refreshPane();

    template <SharedData::Namespace NamespaceV>
    std::expected<void, SharedData::FileSystemError> changeDirectory(std::filesystem::path const& directory);

    template <SharedData::Namespace SourceNamespaceV>
    void spawnTransfer(SharedData::DirectoryEntry<SourceNamespaceV> source, std::filesystem::path destinationDir);

    template <SharedData::Namespace NamespaceV>
    void enter(SharedData::DirectoryEntry<NamespaceV> const& entry);

    IFileSystem& fileSystem(SharedData::Namespace ns);

  private:
    struct Implementation;
    std::unique_ptr<Implementation> impl_;
};

#pragma once

#include <backend/file_system/file_system.hpp>
#include <backend/progress/progress_registry.hpp>
#include <backend/status_messages.hpp>
#include <shared_data/directory_entry.hpp>
#include <shared_data/transfer_error.hpp>

#include <cstddef>
#include <cstdint>
#include <deque>
#include <expected>
#include <filesystem>
#include <string>
#include <vector>

struct TransferSummary
{
    std::uint64_t filesCopied{0};
    std::uint64_t bytesCopied{0};
    std::uint64_t directoriesCreated{0};
    std::uint64_t symlinksSkipped{0};
};

struct TransferEngineOptions
{
    constexpr static std::size_t defaultChunkSize = 1024 * 1024;

    std::size_t chunkSize{defaultChunkSize};
};

/**
 * @brief Copies an entry, recursively for directories, from the source namespace into a directory of the other one.
 * Existing destinations are never overwritten.
 */
template <SharedData::Namespace SourceNamespaceV>
class TransferEngine
{
  public:
    using SourceEntry = SharedData::DirectoryEntry<SourceNamespaceV>;
    using Error = SharedData::TransferError;
    using ErrorType = SharedData::TransferErrorType;

    constexpr static bool isUpload = SourceNamespaceV == SharedData::Namespace::Local;

    TransferEngine(
        IFileSystem& source,
        IFileSystem& destination,
        ProgressRegistry& registry,
        StatusMessages& statusMessages,
        TransferEngineOptions options = {});

    /**
     * @brief Copies source into destinationDir. Stops at the first error, already copied parts stay.
     */
    std::expected<TransferSummary, Error> run(SourceEntry const& source, std::filesystem::path const& destinationDir);

    /**
     * @brief "Uploading \"name\"" or "Downloading \"name\"".
     */
    static std::string meterTitle(std::string const& name);

  private:
    struct Job
    {
        SourceEntry source;
        std::filesystem::path destinationDir;
    };

    std::expected<void, Error> transferFile(Job const& job, TransferSummary& summary, ProgressMeter* aggregate);
    std::expected<void, Error> transferDirectory(Job const& job, std::deque<Job>& queue, TransferSummary& summary);
    std::expected<void, Error> ensureAbsent(std::filesystem::path const& destination);

  private:
    IFileSystem* source_;
    IFileSystem* destination_;
    ProgressRegistry* registry_;
    StatusMessages* statusMessages_;
    std::size_t chunkSize_;
};

extern template class TransferEngine<SharedData::Namespace::Local>;
extern template class TransferEngine<SharedData::Namespace::Remote>;

using Uploader = TransferEngine<SharedData::Namespace::Local>;
using Downloader = TransferEngine<SharedData::Namespace::Remote>;

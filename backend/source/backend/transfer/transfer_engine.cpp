#include <backend/transfer/transfer_engine.hpp>
#include <log/log.hpp>

#include <fmt/format.h>

#include <memory>
#include <span>
#include <variant>

template <SharedData::Namespace SourceNamespaceV>
TransferEngine<SourceNamespaceV>::TransferEngine(
    IFileSystem& source,
    IFileSystem& destination,
    ProgressRegistry& registry,
    StatusMessages& statusMessages,
    TransferEngineOptions options)
    : source_{&source}
    , destination_{&destination}
    , registry_{&registry}
    , statusMessages_{&statusMessages}
    , chunkSize_{options.chunkSize == 0 ? TransferEngineOptions::defaultChunkSize : options.chunkSize}
{}

template <SharedData::Namespace SourceNamespaceV>
std::string TransferEngine<SourceNamespaceV>::meterTitle(std::string const& name)
{
    return fmt::format("{} \"{}\"", isUpload ? "Uploading" : "Downloading", name);
}

template <SharedData::Namespace SourceNamespaceV>
std::expected<TransferSummary, typename TransferEngine<SourceNamespaceV>::Error>
TransferEngine<SourceNamespaceV>::run(SourceEntry const& source, std::filesystem::path const& destinationDir)
{
    Log::info(
        "TransferEngine: {} '{}' into '{}'.",
        isUpload ? "Uploading" : "Downloading",
        source.path().generic_string(),
        destinationDir.generic_string());

    std::shared_ptr<ProgressMeter> aggregate{};
    if (source.isDirectory())
    {
        aggregate = ProgressMeter::directory(meterTitle(source.fileName()));
        registry_->add(aggregate);
    }

    TransferSummary summary{};
    std::deque<Job> queue{};
    queue.push_back(Job{.source = source, .destinationDir = destinationDir});

    const auto result = [&]() -> std::expected<void, Error> {
        while (!queue.empty())
        {
            auto job = std::move(queue.front());
            queue.pop_front();

            const auto& variant = job.source.variant();
            if (std::holds_alternative<SharedData::Entries::ParentMarker>(variant))
            {
                return std::unexpected(Error{
                    .type = isUpload ? ErrorType::CannotUploadParent : ErrorType::CannotDownloadParent,
                    .path = job.source.path(),
                });
            }
            else if (std::holds_alternative<SharedData::Entries::Symlink>(variant))
            {
                statusMessages_->warn(
                    fmt::format("Skipping \"{}\" because symlinks are not supported.", job.source.fileName()));
                ++summary.symlinksSkipped;
            }
            else if (std::holds_alternative<SharedData::Entries::Directory>(variant))
            {
                if (auto directoryResult = transferDirectory(job, queue, summary); !directoryResult)
                    return directoryResult;
            }
            else
            {
                if (auto fileResult = transferFile(job, summary, aggregate.get()); !fileResult)
                    return fileResult;
            }
        }
        return {};
    }();

    if (aggregate)
        aggregate->finish();

    if (!result.has_value())
    {
        Log::error("TransferEngine: Transfer of '{}' failed: {}", source.path().generic_string(), result.error().toString());
        return std::unexpected(result.error());
    }
    Log::info(
        "TransferEngine: Transfer of '{}' completed, {} files and {} bytes copied.",
        source.path().generic_string(),
        summary.filesCopied,
        summary.bytesCopied);
    return summary;
}

template <SharedData::Namespace SourceNamespaceV>
std::expected<void, typename TransferEngine<SourceNamespaceV>::Error>
TransferEngine<SourceNamespaceV>::ensureAbsent(std::filesystem::path const& destination)
{
    const auto exists = destination_->exists(destination);
    if (!exists.has_value())
        return std::unexpected(Error{.type = ErrorType::DestinationFailure, .path = destination, .cause = exists.error()});

    if (*exists)
    {
        return std::unexpected(Error{
            .type = isUpload ? ErrorType::RemoteFileExists : ErrorType::LocalFileExists,
            .path = destination,
        });
    }
    return {};
}

template <SharedData::Namespace SourceNamespaceV>
std::expected<void, typename TransferEngine<SourceNamespaceV>::Error>
TransferEngine<SourceNamespaceV>::transferFile(Job const& job, TransferSummary& summary, ProgressMeter* aggregate)
{
    const auto destination = job.destinationDir / job.source.fileName();
    if (auto absent = ensureAbsent(destination); !absent)
        return absent;

    auto reader = source_->openForRead(job.source.path());
    if (!reader.has_value())
        return std::unexpected(Error{.type = ErrorType::SourceFailure, .path = job.source.path(), .cause = reader.error()});

    auto writer = destination_->openForWrite(destination);
    if (!writer.has_value())
        return std::unexpected(Error{.type = ErrorType::DestinationFailure, .path = destination, .cause = writer.error()});

    auto meter = std::make_shared<ProgressMeter>(meterTitle(job.source.fileName()), job.source.size().value_or(0));
    registry_->add(meter);

    std::vector<char> buffer(chunkSize_);
    std::uint64_t copied = 0;
    const auto streamResult = [&]() -> std::expected<void, Error> {
        while (true)
        {
            const auto readCount = (*reader)->read(std::span<char>{buffer});
            if (!readCount.has_value())
            {
                return std::unexpected(
                    Error{.type = ErrorType::SourceFailure, .path = job.source.path(), .cause = readCount.error()});
            }
            if (*readCount == 0)
                break;

            const auto written = (*writer)->write(std::span<char const>{buffer.data(), *readCount});
            if (!written.has_value())
                return std::unexpected(Error{.type = ErrorType::DestinationFailure, .path = destination, .cause = written.error()});

            meter->record(*readCount);
            copied += *readCount;
        }

        if (const auto closed = (*writer)->close(); !closed.has_value())
            return std::unexpected(Error{.type = ErrorType::DestinationFailure, .path = destination, .cause = closed.error()});
        return {};
    }();

    meter->finish();
    if (!streamResult.has_value())
        return streamResult;

    ++summary.filesCopied;
    summary.bytesCopied += copied;
    if (aggregate)
        aggregate->addCompletedFile(copied);
    return {};
}

template <SharedData::Namespace SourceNamespaceV>
std::expected<void, typename TransferEngine<SourceNamespaceV>::Error>
TransferEngine<SourceNamespaceV>::transferDirectory(Job const& job, std::deque<Job>& queue, TransferSummary& summary)
{
    const auto destination = job.destinationDir / job.source.fileName();
    if (auto absent = ensureAbsent(destination); !absent)
        return absent;

    const auto children = source_->list(job.source.path());
    if (!children.has_value())
        return std::unexpected(Error{.type = ErrorType::SourceFailure, .path = job.source.path(), .cause = children.error()});

    if (const auto created = destination_->createDirectory(destination); !created.has_value())
        return std::unexpected(Error{.type = ErrorType::DestinationFailure, .path = destination, .cause = created.error()});
    ++summary.directoriesCreated;

    for (auto const& child : *children)
    {
        if (auto entry = SourceEntry::fromFileInformation(job.source.path(), child); entry)
            queue.push_back(Job{.source = std::move(*entry), .destinationDir = destination});
    }
    return {};
}

template class TransferEngine<SharedData::Namespace::Local>;
template class TransferEngine<SharedData::Namespace::Remote>;

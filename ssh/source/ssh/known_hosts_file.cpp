#include <ssh/known_hosts_file.hpp>
#include <log/log.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <system_error>

namespace SecureShell
{
    namespace
    {
        std::vector<std::string> splitPatterns(std::string const& field)
        {
            std::vector<std::string> patterns;
            std::stringstream stream{field};
            std::string pattern;
            while (std::getline(stream, pattern, ','))
            {
                if (!pattern.empty())
                    patterns.push_back(pattern);
            }
            return patterns;
        }
    }

    KnownHostsFile::KnownHostsFile(std::filesystem::path file)
        : file_{std::move(file)}
    {}

    std::string KnownHostsFile::location() const
    {
        return file_.string();
    }

    std::string KnownHostsFile::hostPattern(std::string const& host, std::uint16_t port)
    {
        if (port == 22)
            return host;
        return fmt::format("[{}]:{}", host, port);
    }

    std::optional<std::filesystem::path> KnownHostsFile::defaultLocation()
    {
        char const* home = std::getenv("HOME");
        if (home == nullptr || *home == '\0')
            return std::nullopt;
        return std::filesystem::path{home} / ".ssh" / "known_hosts";
    }

    std::expected<std::vector<KnownHostsFile::Record>, std::string> KnownHostsFile::readRecords() const
    {
        std::error_code ec;
        if (!std::filesystem::exists(file_, ec))
        {
            if (ec)
                return std::unexpected(fmt::format("Cannot access \"{}\": {}", file_.string(), ec.message()));
            return std::vector<Record>{};
        }
        if (!std::filesystem::is_regular_file(file_, ec))
            return std::unexpected(fmt::format("\"{}\" is not a regular file.", file_.string()));

        std::ifstream reader{file_, std::ios_base::binary};
        if (!reader.good())
            return std::unexpected(fmt::format("Cannot read \"{}\".", file_.string()));

        std::vector<Record> records;
        std::string line;
        while (std::getline(reader, line))
        {
            std::stringstream fields{line};
            std::string hosts;
            if (!(fields >> hosts) || hosts.front() == '#')
                continue;

            if (hosts.front() == '@' || hosts.starts_with("|1|"))
            {
                Log::debug("KnownHostsFile: Skipping unsupported entry in '{}'.", file_.string());
                continue;
            }

            Record record{.patterns = splitPatterns(hosts), .keyType = {}, .base64 = {}};
            if (!(fields >> record.keyType >> record.base64))
            {
                Log::warn("KnownHostsFile: Skipping malformed line in '{}'.", file_.string());
                continue;
            }
            records.push_back(std::move(record));
        }
        if (reader.bad())
            return std::unexpected(fmt::format("Failed while reading \"{}\".", file_.string()));
        return records;
    }

    std::expected<TrustCheckResult, std::string>
    KnownHostsFile::check(std::string const& host, std::uint16_t port, HostKey const& key)
    {
        auto records = readRecords();
        if (!records)
            return std::unexpected(records.error());

        const auto pattern = hostPattern(host, port);
        bool hostKnown = false;
        for (auto const& record : *records)
        {
            if (std::find(record.patterns.begin(), record.patterns.end(), pattern) == record.patterns.end())
                continue;

            hostKnown = true;
            if (record.keyType == key.type && record.base64 == key.base64)
                return TrustCheckResult::Match;
        }
        return hostKnown ? TrustCheckResult::Mismatch : TrustCheckResult::NotFound;
    }

    std::expected<void, std::string>
    KnownHostsFile::add(std::string const& host, std::uint16_t port, HostKey const& key)
    {
        std::error_code ec;
        if (file_.has_parent_path())
        {
            std::filesystem::create_directories(file_.parent_path(), ec);
            if (ec)
                return std::unexpected(
                    fmt::format("Cannot create directory \"{}\": {}", file_.parent_path().string(), ec.message()));
        }

        bool needsNewline = false;
        if (std::filesystem::exists(file_, ec) && std::filesystem::file_size(file_, ec) > 0 && !ec)
        {
            std::ifstream reader{file_, std::ios_base::binary};
            reader.seekg(-1, std::ios_base::end);
            char last = '\n';
            if (reader.get(last))
                needsNewline = last != '\n';
        }

        std::ofstream writer{file_, std::ios_base::binary | std::ios_base::app};
        if (!writer.good())
            return std::unexpected(fmt::format("Cannot write \"{}\".", file_.string()));

        if (needsNewline)
            writer << '\n';
        writer << hostPattern(host, port) << ' ' << key.type << ' ' << key.base64 << '\n';
        writer.flush();
        if (!writer.good())
            return std::unexpected(fmt::format("Failed while writing \"{}\".", file_.string()));

        Log::info("KnownHostsFile: Added host key for '{}' to '{}'.", hostPattern(host, port), file_.string());
        return {};
    }
}

#pragma once

#include <fmt/format.h>

#include <chrono>
#include <cstdint>
#include <string>

namespace Utility
{
    enum class OrderOfMagnitude
    {
        None = 0,
        Kilo,
        Mega,
        Giga
    };

    inline OrderOfMagnitude determineOrderOfMagnitude(std::uint64_t value)
    {
        if (value < 1'000)
            return OrderOfMagnitude::None;
        else if (value < 1'000'000)
            return OrderOfMagnitude::Kilo;
        else if (value < 1'000'000'000)
            return OrderOfMagnitude::Mega;
        else
            return OrderOfMagnitude::Giga;
    }

    namespace Detail
    {
        inline std::string formatDecimal(std::uint64_t value, char const* unit)
        {
            switch (determineOrderOfMagnitude(value))
            {
                case OrderOfMagnitude::None:
                    return fmt::format("{} {}", value, unit);
                case OrderOfMagnitude::Kilo:
                    return fmt::format("{:.1f} K{}", static_cast<double>(value) / 1e3, unit);
                case OrderOfMagnitude::Mega:
                    return fmt::format("{:.1f} M{}", static_cast<double>(value) / 1e6, unit);
                case OrderOfMagnitude::Giga:
                    return fmt::format("{:.1f} G{}", static_cast<double>(value) / 1e9, unit);
            }
            return std::string{};
        }
    }

    /**
     * @brief Formats a byte count with decimal units, e.g. "849 B", "3.0 KB", "6.0 MB".
     */
    inline std::string formatBytes(std::uint64_t value)
    {
        return Detail::formatDecimal(value, "B");
    }

    /**
     * @brief Formats a bitrate with decimal units, e.g. "4 bit/s", "1.0 Kbit/s".
     */
    inline std::string formatBitrate(std::uint64_t bitsPerSecond)
    {
        return Detail::formatDecimal(bitsPerSecond, "bit/s");
    }

    /**
     * @brief "MM:SS" below one hour, "H:MM:SS" from there on.
     */
    inline std::string formatDuration(std::chrono::seconds duration)
    {
        const auto total = duration.count() < 0 ? 0 : duration.count();
        const auto hours = total / 3600;
        const auto minutes = (total / 60) % 60;
        const auto seconds = total % 60;
        if (hours > 0)
            return fmt::format("{}:{:02}:{:02}", hours, minutes, seconds);
        return fmt::format("{:02}:{:02}", minutes, seconds);
    }
}

#pragma once

#include <shared_data/file_information.hpp>

#include <compare>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace SharedData
{
    /**
     * @brief The filesystem an entry lives in.
     */
    enum class Namespace
    {
        Local,
        Remote
    };

    constexpr Namespace otherNamespace(Namespace ns)
    {
        return ns == Namespace::Local ? Namespace::Remote : Namespace::Local;
    }

    namespace Entries
    {
        struct File
        {
            std::filesystem::path path{};
            std::uint64_t size{0};
            bool operator==(File const&) const = default;
        };
        struct Directory
        {
            std::filesystem::path path{};
            bool operator==(Directory const&) const = default;
        };
        /// The synthetic ".." entry of a listing.
        struct ParentMarker
        {
            std::filesystem::path path{};
            bool operator==(ParentMarker const&) const = default;
        };
        /// Listed, but never followed or transferred.
        struct Symlink
        {
            std::filesystem::path path{};
            bool operator==(Symlink const&) const = default;
        };

        using Variant = std::variant<File, Directory, ParentMarker, Symlink>;

        std::filesystem::path const& pathOf(Variant const& entry);
        std::string fileNameOf(Variant const& entry);
        bool isHidden(Variant const& entry);
        std::string displayText(Variant const& entry);

        /**
         * @brief Listing order: the parent marker first, then byte order of the generic path.
         */
        bool listingLess(Variant const& lhs, Variant const& rhs);
    }

    /**
     * @brief An entry of a directory listing in either the local or the remote filesystem.
     * The namespace is part of the type, so local and remote entries cannot be confused.
     */
    template <Namespace NamespaceV>
    class DirectoryEntry
    {
      public:
        static constexpr Namespace namespaceKind = NamespaceV;

        DirectoryEntry(Entries::Variant entry)
            : entry_{std::move(entry)}
        {}

        static DirectoryEntry file(std::filesystem::path path, std::uint64_t size)
        {
            return DirectoryEntry{Entries::File{.path = std::move(path), .size = size}};
        }
        static DirectoryEntry directory(std::filesystem::path path)
        {
            return DirectoryEntry{Entries::Directory{.path = std::move(path)}};
        }
        static DirectoryEntry parentMarker(std::filesystem::path path)
        {
            return DirectoryEntry{Entries::ParentMarker{.path = std::move(path)}};
        }
        static DirectoryEntry symlink(std::filesystem::path path)
        {
            return DirectoryEntry{Entries::Symlink{.path = std::move(path)}};
        }

        /**
         * @brief Converts a raw listing record of the directory "parent" into an entry.
         *
         * @return std::nullopt for "." and "..".
         */
        static std::optional<DirectoryEntry> fromFileInformation(
            std::filesystem::path const& parent,
            FileInformation const& information)
        {
            if (information.isDotOrDotDot())
                return std::nullopt;

            auto path = parent / information.path;
            switch (information.type)
            {
                case FileType::Directory:
                    return directory(std::move(path));
                case FileType::Symlink:
                    return symlink(std::move(path));
                default:
                    return file(std::move(path), information.size);
            }
        }

        std::filesystem::path const& path() const
        {
            return Entries::pathOf(entry_);
        }
        std::string fileName() const
        {
            return Entries::fileNameOf(entry_);
        }
        bool isHidden() const
        {
            return Entries::isHidden(entry_);
        }
        std::string displayText() const
        {
            return Entries::displayText(entry_);
        }
        std::optional<std::uint64_t> size() const
        {
            if (auto const* file = std::get_if<Entries::File>(&entry_))
                return file->size;
            return std::nullopt;
        }

        bool isFile() const
        {
            return std::holds_alternative<Entries::File>(entry_);
        }
        bool isDirectory() const
        {
            return std::holds_alternative<Entries::Directory>(entry_);
        }
        bool isParentMarker() const
        {
            return std::holds_alternative<Entries::ParentMarker>(entry_);
        }
        bool isSymlink() const
        {
            return std::holds_alternative<Entries::Symlink>(entry_);
        }

        Entries::Variant const& variant() const
        {
            return entry_;
        }

        template <typename FunctionT>
        decltype(auto) visit(FunctionT&& function) const
        {
            return std::visit(std::forward<FunctionT>(function), entry_);
        }

        friend bool operator<(DirectoryEntry const& lhs, DirectoryEntry const& rhs)
        {
            return Entries::listingLess(lhs.entry_, rhs.entry_);
        }
        friend bool operator==(DirectoryEntry const& lhs, DirectoryEntry const& rhs) = default;

      private:
        Entries::Variant entry_;
    };

    using LocalEntry = DirectoryEntry<Namespace::Local>;
    using RemoteEntry = DirectoryEntry<Namespace::Remote>;
}

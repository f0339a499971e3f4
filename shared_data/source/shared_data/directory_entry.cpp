#include <shared_data/directory_entry.hpp>

namespace SharedData::Entries
{
    std::filesystem::path const& pathOf(Variant const& entry)
    {
        return std::visit(
            [](auto const& alternative) -> std::filesystem::path const& {
                return alternative.path;
            },
            entry);
    }

    std::string fileNameOf(Variant const& entry)
    {
        if (std::holds_alternative<ParentMarker>(entry))
            return "..";
        return pathOf(entry).filename().string();
    }

    bool isHidden(Variant const& entry)
    {
        if (std::holds_alternative<ParentMarker>(entry))
            return false;
        const auto name = fileNameOf(entry);
        return !name.empty() && name.front() == '.';
    }

    std::string displayText(Variant const& entry)
    {
        struct Visitor
        {
            std::string operator()(File const& file) const
            {
                return file.path.filename().string();
            }
            std::string operator()(Directory const& directory) const
            {
                return directory.path.filename().string() + "/";
            }
            std::string operator()(ParentMarker const&) const
            {
                return "..";
            }
            std::string operator()(Symlink const& symlink) const
            {
                return symlink.path.filename().string() + "@";
            }
        };
        return std::visit(Visitor{}, entry);
    }

    bool listingLess(Variant const& lhs, Variant const& rhs)
    {
        const bool lhsIsParent = std::holds_alternative<ParentMarker>(lhs);
        const bool rhsIsParent = std::holds_alternative<ParentMarker>(rhs);
        if (lhsIsParent || rhsIsParent)
            return lhsIsParent && !rhsIsParent;

        return pathOf(lhs).generic_string() < pathOf(rhs).generic_string();
    }
}

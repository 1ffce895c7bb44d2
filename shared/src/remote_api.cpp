#include "cpan/remote_api.hpp"

#include <array>

namespace cpan
{

    namespace
    {

        struct ObjectKindMapping
        {
            ObjectKind kind;
            std::string_view label;
        };

        constexpr std::array<ObjectKindMapping, 2> kKindMappings{{
            {ObjectKind::File, "file"},
            {ObjectKind::Directory, "directory"},
        }};

    } // namespace

    std::string_view to_string(ObjectKind kind) noexcept
    {
        for (const auto &mapping : kKindMappings)
        {
            if (mapping.kind == kind)
            {
                return mapping.label;
            }
        }
        return "unknown";
    }

    std::optional<ObjectKind> object_kind_from_string(std::string_view value) noexcept
    {
        for (const auto &mapping : kKindMappings)
        {
            if (mapping.label == value)
            {
                return mapping.kind;
            }
        }
        return std::nullopt;
    }

    RemoteObjectRef root_object()
    {
        return RemoteObjectRef{
            .id = std::string(kRootObjectId),
            .kind = ObjectKind::Directory,
            .name = "",
            .path = std::string("/"),
            .size = 0,
        };
    }

} // namespace cpan

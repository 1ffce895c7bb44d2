#include "cpan/client/transfer_plan.hpp"

#include <array>

#include "cpan/client/path_resolver.hpp"
#include "cpan/error_codes.hpp"

namespace cpan::client
{

    namespace
    {

        struct DirectionMapping
        {
            TransferDirection direction;
            std::string_view label;
        };

        constexpr std::array<DirectionMapping, 2> kDirectionMappings{{
            {TransferDirection::Upload, "upload"},
            {TransferDirection::Download, "download"},
        }};

        struct StatusMapping
        {
            UnitStatus status;
            std::string_view label;
        };

        constexpr std::array<StatusMapping, 4> kStatusMappings{{
            {UnitStatus::Pending, "pending"},
            {UnitStatus::InProgress, "in_progress"},
            {UnitStatus::Done, "done"},
            {UnitStatus::Failed, "failed"},
        }};

        bool is_clean_relative(const std::string &remote_path)
        {
            if (remote_path.empty() || remote_path.front() == '/')
            {
                return false;
            }
            const auto segments = PathResolver::split_remote_path(remote_path);
            for (const auto &segment : segments)
            {
                if (segment == "." || segment == "..")
                {
                    return false;
                }
            }
            return !segments.empty();
        }

        bool is_under(const std::filesystem::path &root, const std::filesystem::path &path)
        {
            const auto relative = path.lexically_normal().lexically_relative(root.lexically_normal());
            if (relative.empty() || relative == ".")
            {
                return false;
            }
            return *relative.begin() != "..";
        }

    } // namespace

    std::string_view to_string(TransferDirection direction) noexcept
    {
        for (const auto &mapping : kDirectionMappings)
        {
            if (mapping.direction == direction)
            {
                return mapping.label;
            }
        }
        return "unknown";
    }

    std::string_view to_string(UnitStatus status) noexcept
    {
        for (const auto &mapping : kStatusMappings)
        {
            if (mapping.status == status)
            {
                return mapping.label;
            }
        }
        return "unknown";
    }

    std::string TransferUnit::remote_parent() const
    {
        const auto slash = remote_path.rfind('/');
        if (slash == std::string::npos)
        {
            return "";
        }
        return remote_path.substr(0, slash);
    }

    std::string TransferUnit::source() const
    {
        if (direction == TransferDirection::Upload)
        {
            return local_path.string();
        }
        return "remote:" + remote_path;
    }

    std::string TransferUnit::destination() const
    {
        if (direction == TransferDirection::Upload)
        {
            return "remote:" + remote_path;
        }
        return local_path.string();
    }

    TransferPlan::TransferPlan(TransferDirection direction, std::filesystem::path local_root, RemoteObjectRef remote_root,
                               std::string root_folder, std::vector<TransferUnit> units)
        : direction_(direction),
          local_root_(std::move(local_root)),
          remote_root_(std::move(remote_root)),
          root_folder_(std::move(root_folder)),
          units_(std::move(units))
    {
        validate();
    }

    void TransferPlan::validate() const
    {
        if (direction_ == TransferDirection::Upload && !remote_root_.is_directory())
        {
            throw Error(ErrorCode::PlanInvalid, "Upload target is not a folder: " + remote_root_.name);
        }
        if (!root_folder_.empty() && !is_clean_relative(root_folder_))
        {
            throw Error(ErrorCode::PlanInvalid, "Invalid root folder name: " + root_folder_);
        }

        const auto folder_prefix = root_folder_.empty() ? std::string{} : root_folder_ + "/";
        for (const auto &unit : units_)
        {
            if (unit.direction != direction_)
            {
                throw Error(ErrorCode::PlanInvalid, "Mixed transfer directions in one plan");
            }
            if (!is_clean_relative(unit.remote_path))
            {
                throw Error(ErrorCode::PlanInvalid, "Invalid remote path in plan: " + unit.remote_path);
            }
            if (direction_ == TransferDirection::Upload)
            {
                if (unit.remote_path.rfind(folder_prefix, 0) != 0)
                {
                    throw Error(ErrorCode::PlanInvalid, "Destination outside the target folder: " + unit.remote_path);
                }
            }
            else
            {
                if (!unit.remote_object || unit.remote_object->is_directory())
                {
                    throw Error(ErrorCode::PlanInvalid, "Download unit without a remote file: " + unit.remote_path);
                }
                if (!is_under(local_root_, unit.local_path))
                {
                    throw Error(ErrorCode::PlanInvalid, "Destination outside the target folder: " +
                                                            unit.local_path.string());
                }
            }
        }
    }

} // namespace cpan::client

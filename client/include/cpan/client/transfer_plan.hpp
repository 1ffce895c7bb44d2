#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "cpan/remote_api.hpp"

namespace cpan::client
{

    enum class TransferDirection : std::uint8_t
    {
        Upload,
        Download
    };

    enum class UnitStatus : std::uint8_t
    {
        Pending,
        InProgress,
        Done,
        Failed
    };

    std::string_view to_string(TransferDirection direction) noexcept;
    std::string_view to_string(UnitStatus status) noexcept;

    /**
     * One file moving between the local filesystem and the remote service.
     * `remote_path` is '/'-separated and relative to the plan's remote side:
     * the destination below the target folder for uploads, the source below
     * the downloaded folder for downloads.
     */
    struct TransferUnit
    {
        TransferDirection direction{TransferDirection::Upload};
        std::filesystem::path local_path;
        std::string remote_path;
        std::optional<RemoteObjectRef> remote_object{};
        UnitStatus status{UnitStatus::Pending};
        std::uint32_t attempt_count{};
        bool skipped{};

        // Directory part of remote_path, empty for top-level entries.
        std::string remote_parent() const;

        std::string source() const;
        std::string destination() const;
    };

    class TransferPlan
    {
    public:
        // Throws Error(PlanInvalid) when a unit does not belong under the destination root.
        TransferPlan(TransferDirection direction, std::filesystem::path local_root, RemoteObjectRef remote_root,
                     std::string root_folder, std::vector<TransferUnit> units);

        TransferDirection direction() const noexcept { return direction_; }

        // Upload: the local source root. Download: the local directory created to receive the files.
        const std::filesystem::path &local_root() const noexcept { return local_root_; }

        // Upload: the remote target folder. Download: the remote source root.
        const RemoteObjectRef &remote_root() const noexcept { return remote_root_; }

        // Upload only: folder created under remote_root to receive the files, empty when none.
        const std::string &root_folder() const noexcept { return root_folder_; }

        const std::vector<TransferUnit> &units() const noexcept { return units_; }

        std::size_t size() const noexcept { return units_.size(); }
        bool empty() const noexcept { return units_.empty(); }

    private:
        void validate() const;

        TransferDirection direction_;
        std::filesystem::path local_root_;
        RemoteObjectRef remote_root_;
        std::string root_folder_;
        std::vector<TransferUnit> units_;
    };

} // namespace cpan::client

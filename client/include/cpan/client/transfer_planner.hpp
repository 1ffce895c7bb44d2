#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "cpan/client/logger.hpp"
#include "cpan/client/path_resolver.hpp"
#include "cpan/client/token_authority.hpp"
#include "cpan/client/transfer_plan.hpp"
#include "cpan/remote_api.hpp"

namespace cpan::client
{

    struct PlanOptions
    {
        // Recreate the source folder itself under the target, not just its contents.
        bool create_root_folder{true};
        // Local name for a single downloaded file.
        std::optional<std::string> file_name;
    };

    class TransferPlanner
    {
    public:
        TransferPlanner(RemoteApi &api, TokenAuthority &tokens, Logger logger);

        TransferPlan plan_upload(const LocalEntry &local_root, const RemoteObjectRef &remote_target_dir,
                                 const PlanOptions &options = {}) const;

        TransferPlan plan_download(const RemoteObjectRef &remote_root, const std::filesystem::path &local_target_dir,
                                   const PlanOptions &options = {}) const;

    private:
        void walk_local(const std::filesystem::path &directory, const std::string &prefix,
                        std::vector<TransferUnit> &units) const;

        void walk_remote(const RemoteObjectRef &directory, const std::string &prefix,
                         const std::filesystem::path &local_directory, std::vector<TransferUnit> &units) const;

        RemoteApi &api_;
        TokenAuthority &tokens_;
        Logger logger_;
    };

} // namespace cpan::client

#include "cpan/client/transfer_planner.hpp"

#include <system_error>

#include "cpan/error_codes.hpp"

namespace cpan::client
{

    namespace
    {

        std::string join_relative(const std::string &prefix, const std::string &name)
        {
            return prefix.empty() ? name : prefix + "/" + name;
        }

        bool usable_name(const std::string &name)
        {
            return !name.empty() && name != "." && name != ".." && name.find('/') == std::string::npos;
        }

        std::filesystem::path normalize_directory(const std::filesystem::path &path)
        {
            auto normalized = std::filesystem::absolute(path).lexically_normal();
            if (!normalized.has_filename() && normalized != normalized.root_path())
            {
                normalized = normalized.parent_path();
            }
            return normalized;
        }

    } // namespace

    TransferPlanner::TransferPlanner(RemoteApi &api, TokenAuthority &tokens, Logger logger)
        : api_(api), tokens_(tokens), logger_(std::move(logger)) {}

    TransferPlan TransferPlanner::plan_upload(const LocalEntry &local_root, const RemoteObjectRef &remote_target_dir,
                                              const PlanOptions &options) const
    {
        if (!remote_target_dir.is_directory())
        {
            throw Error(ErrorCode::PlanInvalid, "Upload target is not a folder: " + remote_target_dir.id);
        }

        const auto name = local_root.path.filename().string();
        if (local_root.kind == ObjectKind::File)
        {
            std::vector<TransferUnit> units;
            units.push_back(TransferUnit{
                .direction = TransferDirection::Upload,
                .local_path = local_root.path,
                .remote_path = name,
            });
            logger_.log("plan", "upload ", local_root.path.string(), " -> ", remote_target_dir.id);
            return TransferPlan(TransferDirection::Upload, local_root.path, remote_target_dir, "", std::move(units));
        }

        if (options.create_root_folder && !usable_name(name))
        {
            throw Error(ErrorCode::PlanInvalid, "Cannot recreate a folder without a name: " + local_root.path.string());
        }
        const auto root_folder = options.create_root_folder ? name : std::string{};

        std::vector<TransferUnit> units;
        try
        {
            walk_local(local_root.path, root_folder, units);
        }
        catch (const std::filesystem::filesystem_error &ex)
        {
            throw classify_exception(ex);
        }

        logger_.log("plan", "upload ", local_root.path.string(), " -> ", remote_target_dir.id, ": ", units.size(),
                    " file(s)");
        return TransferPlan(TransferDirection::Upload, local_root.path, remote_target_dir, root_folder,
                            std::move(units));
    }

    TransferPlan TransferPlanner::plan_download(const RemoteObjectRef &remote_root,
                                                const std::filesystem::path &local_target_dir,
                                                const PlanOptions &options) const
    {
        const auto target = normalize_directory(local_target_dir);
        std::error_code ec;
        if (std::filesystem::exists(target, ec) && !std::filesystem::is_directory(target, ec))
        {
            throw Error(ErrorCode::PlanInvalid, "Download target is not a directory: " + target.string());
        }

        if (!remote_root.is_directory())
        {
            const auto name = options.file_name.value_or(remote_root.name);
            if (!usable_name(name))
            {
                throw Error(ErrorCode::PlanInvalid, "Invalid local file name: '" + name + "'");
            }
            std::vector<TransferUnit> units;
            units.push_back(TransferUnit{
                .direction = TransferDirection::Download,
                .local_path = target / name,
                .remote_path = remote_root.name,
                .remote_object = remote_root,
            });
            logger_.log("plan", "download ", remote_root.id, " -> ", (target / name).string());
            return TransferPlan(TransferDirection::Download, target, remote_root, "", std::move(units));
        }

        if (options.create_root_folder && !usable_name(remote_root.name))
        {
            throw Error(ErrorCode::PlanInvalid, "Cannot recreate a folder without a name: " + remote_root.id);
        }
        const auto prefix = options.create_root_folder ? remote_root.name : std::string{};
        const auto base = options.create_root_folder ? target / remote_root.name : target;

        std::vector<TransferUnit> units;
        walk_remote(remote_root, prefix, base, units);

        logger_.log("plan", "download ", remote_root.id, " -> ", base.string(), ": ", units.size(), " file(s)");
        return TransferPlan(TransferDirection::Download, base, remote_root, "", std::move(units));
    }

    void TransferPlanner::walk_local(const std::filesystem::path &directory, const std::string &prefix,
                                     std::vector<TransferUnit> &units) const
    {
        for (const auto &entry : std::filesystem::directory_iterator(directory))
        {
            const auto name = entry.path().filename().string();
            const auto relative = join_relative(prefix, name);
            if (entry.is_symlink() && entry.is_directory())
            {
                logger_.log("plan", "not following linked folder ", entry.path().string());
            }
            else if (entry.is_directory())
            {
                walk_local(entry.path(), relative, units);
            }
            else if (entry.is_regular_file())
            {
                units.push_back(TransferUnit{
                    .direction = TransferDirection::Upload,
                    .local_path = entry.path(),
                    .remote_path = relative,
                });
            }
            else
            {
                logger_.log("plan", "skipping special file ", entry.path().string());
            }
        }
    }

    void TransferPlanner::walk_remote(const RemoteObjectRef &directory, const std::string &prefix,
                                      const std::filesystem::path &local_directory,
                                      std::vector<TransferUnit> &units) const
    {
        const auto children = api_.list_directory(tokens_.get_valid_token(), directory.id);
        for (const auto &child : children)
        {
            if (!usable_name(child.name))
            {
                logger_.log("warn", "skipping remote entry ", child.id, " with unusable name '", child.name, "'");
                continue;
            }
            const auto relative = join_relative(prefix, child.name);
            if (child.is_directory())
            {
                walk_remote(child, relative, local_directory / child.name, units);
            }
            else
            {
                units.push_back(TransferUnit{
                    .direction = TransferDirection::Download,
                    .local_path = local_directory / child.name,
                    .remote_path = relative,
                    .remote_object = child,
                });
            }
        }
    }

} // namespace cpan::client

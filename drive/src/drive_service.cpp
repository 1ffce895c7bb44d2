#include "cpan/drive/drive_service.hpp"

#include <algorithm>
#include <array>
#include <fstream>
#include <system_error>
#include <utility>

#include <spdlog/spdlog.h>

#include "cpan/crypto.hpp"
#include "cpan/error_codes.hpp"

namespace cpan::drive
{

    namespace
    {
        constexpr auto kFilesDir = "files";
        constexpr auto kMetadataDir = ".cpan";
        constexpr std::string_view kUploadPrefix = ".cpan-upload-";
        constexpr std::size_t kChunkSize = 64 * 1024;

        bool is_upload_temporary(const std::string &name)
        {
            return name.rfind(kUploadPrefix, 0) == 0;
        }

        void copy_range(std::ifstream &in, std::ofstream &out)
        {
            std::array<char, kChunkSize> buffer{};
            while (in)
            {
                in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
                const auto count = in.gcount();
                if (count > 0)
                {
                    out.write(buffer.data(), count);
                }
                if (!out)
                {
                    throw Error(ErrorCode::IoError, "Failed writing download data");
                }
            }
            if (in.bad())
            {
                throw Error(ErrorCode::IoError, "Failed reading stored object");
            }
        }

    } // namespace

    DriveService::DriveService(std::filesystem::path root, GrantPolicy policy, GrantRegistry::Clock clock)
        : root_(std::move(root)),
          files_root_(root_ / kFilesDir),
          index_(root_ / kMetadataDir),
          grants_(root_ / kMetadataDir, policy, std::move(clock))
    {
        std::filesystem::create_directories(files_root_);
        spdlog::debug("Drive rooted at {}", root_.string());
    }

    std::string DriveService::authorize(const OAuthClient &client, const std::string &code_challenge)
    {
        return grants_.issue_code(client, code_challenge);
    }

    TokenGrant DriveService::exchange_token(const OAuthClient &client, const std::string &auth_code,
                                            const std::string &code_verifier)
    {
        return grants_.redeem_code(client, auth_code, code_verifier);
    }

    TokenGrant DriveService::refresh_token(const OAuthClient &client, const std::string &refresh_token)
    {
        return grants_.rotate(client, refresh_token);
    }

    std::vector<RemoteObjectRef> DriveService::list_directory(const std::string &access_token,
                                                              const std::string &object_id)
    {
        grants_.validate_access(access_token);
        const auto directory = directory_for(object_id);

        std::vector<std::pair<std::string, ObjectKind>> found;
        for (const auto &entry : std::filesystem::directory_iterator(path_of(directory)))
        {
            const auto name = entry.path().filename().string();
            if (is_upload_temporary(name))
            {
                continue;
            }
            if (entry.is_directory())
            {
                found.emplace_back(child_path(directory.path, name), ObjectKind::Directory);
            }
            else if (entry.is_regular_file())
            {
                found.emplace_back(child_path(directory.path, name), ObjectKind::File);
            }
        }
        std::sort(found.begin(), found.end());

        const auto ids = index_.assign(found);
        std::vector<RemoteObjectRef> children;
        children.reserve(found.size());
        for (std::size_t i = 0; i < found.size(); ++i)
        {
            children.push_back(describe(IndexEntry{.id = ids[i], .kind = found[i].second, .path = found[i].first}));
        }
        return children;
    }

    RemoteObjectRef DriveService::get_object(const std::string &access_token, const std::string &object_id)
    {
        grants_.validate_access(access_token);
        return describe(entry_for(object_id));
    }

    RemoteObjectRef DriveService::upload_primitive(const std::string &access_token,
                                                   const std::filesystem::path &local_path,
                                                   const std::string &target_dir_id)
    {
        grants_.validate_access(access_token);
        const auto directory = directory_for(target_dir_id);
        const auto name = local_path.filename().string();
        check_name(name);
        if (!std::filesystem::is_regular_file(local_path))
        {
            throw Error(ErrorCode::NotFound, "Local file does not exist: " + local_path.string());
        }

        const auto destination = path_of(directory) / name;
        if (std::filesystem::is_directory(destination))
        {
            throw Error(ErrorCode::AlreadyExists, "A folder named '" + name + "' already exists");
        }

        const auto relative = child_path(directory.path, name);
        if (std::filesystem::is_regular_file(destination) &&
            std::filesystem::file_size(destination) == std::filesystem::file_size(local_path) &&
            crypto::hash_file(destination) == crypto::hash_file(local_path))
        {
            auto stored = describe(IndexEntry{.id = index_.id_for(relative, ObjectKind::File),
                                              .kind = ObjectKind::File,
                                              .path = relative});
            spdlog::info("{} is already stored as {}, skipping the copy", relative, stored.id);
            return stored;
        }

        const auto temp_path = path_of(directory) / (std::string(kUploadPrefix) + crypto::random_token(8) + "-" + name);
        try
        {
            std::filesystem::copy_file(local_path, temp_path, std::filesystem::copy_options::overwrite_existing);
            std::filesystem::rename(temp_path, destination);
        }
        catch (const std::filesystem::filesystem_error &ex)
        {
            std::error_code ec;
            std::filesystem::remove(temp_path, ec);
            throw classify_exception(ex);
        }

        auto uploaded = describe(IndexEntry{.id = index_.id_for(relative, ObjectKind::File),
                                            .kind = ObjectKind::File,
                                            .path = relative});
        spdlog::info("Stored {} ({} bytes) as {}", relative, uploaded.size, uploaded.id);
        return uploaded;
    }

    void DriveService::download_primitive(const std::string &access_token, const std::string &object_id,
                                          const std::filesystem::path &local_path)
    {
        grants_.validate_access(access_token);
        const auto entry = entry_for(object_id);
        if (entry.kind != ObjectKind::File)
        {
            throw Error(ErrorCode::InvalidArgument, "Cannot download a folder as a file: " + object_id);
        }
        const auto source = path_of(entry);

        auto part_path = local_path;
        part_path += ".part";
        std::filesystem::create_directories(local_path.parent_path());

        const auto total = std::filesystem::file_size(source);
        std::uint64_t offset = 0;
        if (std::filesystem::exists(part_path))
        {
            offset = std::filesystem::file_size(part_path);
            if (offset > total)
            {
                std::filesystem::remove(part_path);
                offset = 0;
            }
        }
        if (offset > 0)
        {
            spdlog::debug("Resuming download of {} at byte {}", entry.path, offset);
        }

        {
            std::ifstream in(source, std::ios::binary);
            if (!in)
            {
                throw Error(ErrorCode::IoError, "Cannot open stored object: " + entry.path);
            }
            in.seekg(static_cast<std::streamoff>(offset));
            std::ofstream out(part_path, std::ios::binary | std::ios::app);
            if (!out)
            {
                throw Error(ErrorCode::IoError, "Cannot write " + part_path.string());
            }
            copy_range(in, out);
        }

        if (crypto::hash_file(part_path) != crypto::hash_file(source))
        {
            std::filesystem::remove(part_path);
            throw Error(ErrorCode::Transient, "Downloaded content of " + entry.path + " did not verify");
        }
        std::filesystem::rename(part_path, local_path);
    }

    RemoteObjectRef DriveService::create_directory(const std::string &access_token, const std::string &parent_id,
                                                   const std::string &name)
    {
        grants_.validate_access(access_token);
        check_name(name);
        const auto parent = directory_for(parent_id);
        const auto target = path_of(parent) / name;
        if (std::filesystem::exists(target) || !std::filesystem::create_directory(target))
        {
            throw Error(ErrorCode::AlreadyExists, "'" + name + "' already exists");
        }

        const auto relative = child_path(parent.path, name);
        spdlog::info("Created folder {}", relative);
        return describe(IndexEntry{.id = index_.id_for(relative, ObjectKind::Directory),
                                   .kind = ObjectKind::Directory,
                                   .path = relative});
    }

    void DriveService::delete_object(const std::string &access_token, const std::string &object_id)
    {
        grants_.validate_access(access_token);
        const auto entry = movable_entry(object_id);
        try
        {
            std::filesystem::remove_all(path_of(entry));
        }
        catch (const std::filesystem::filesystem_error &ex)
        {
            throw classify_exception(ex);
        }
        index_.forget_tree(entry.path);
        spdlog::info("Deleted {} ({})", entry.path, entry.id);
    }

    RemoteObjectRef DriveService::move_object(const std::string &access_token, const std::string &object_id,
                                              const std::string &target_dir_id)
    {
        grants_.validate_access(access_token);
        const auto entry = movable_entry(object_id);
        const auto target = directory_for(target_dir_id);
        if (target.path == entry.path || target.path.rfind(entry.path + "/", 0) == 0)
        {
            throw Error(ErrorCode::InvalidArgument, "Cannot move '" + entry.path + "' into itself");
        }
        const auto name = std::filesystem::path(entry.path).filename().string();
        return relocate(entry, child_path(target.path, name));
    }

    RemoteObjectRef DriveService::rename_object(const std::string &access_token, const std::string &object_id,
                                                const std::string &new_name)
    {
        grants_.validate_access(access_token);
        check_name(new_name);
        const auto entry = movable_entry(object_id);
        const auto parent = std::filesystem::path(entry.path).parent_path().generic_string();
        return relocate(entry, child_path(parent, new_name));
    }

    IndexEntry DriveService::entry_for(const std::string &object_id)
    {
        auto entry = index_.find(object_id);
        if (!entry)
        {
            throw Error(ErrorCode::NotFound, "No object with id " + object_id);
        }
        std::error_code ec;
        const auto status = std::filesystem::status(path_of(*entry), ec);
        const auto present = entry->kind == ObjectKind::Directory ? std::filesystem::is_directory(status)
                                                                  : std::filesystem::is_regular_file(status);
        if (!present)
        {
            index_.forget(object_id);
            throw Error(ErrorCode::NotFound, "Object " + object_id + " no longer exists");
        }
        return *entry;
    }

    IndexEntry DriveService::directory_for(const std::string &object_id)
    {
        auto entry = entry_for(object_id);
        if (entry.kind != ObjectKind::Directory)
        {
            throw Error(ErrorCode::InvalidArgument, "Object " + object_id + " is not a folder");
        }
        return entry;
    }

    IndexEntry DriveService::movable_entry(const std::string &object_id)
    {
        auto entry = entry_for(object_id);
        if (entry.id == kRootObjectId)
        {
            throw Error(ErrorCode::InvalidArgument, "The root folder cannot be changed");
        }
        return entry;
    }

    RemoteObjectRef DriveService::relocate(const IndexEntry &entry, const std::string &destination)
    {
        if (destination == entry.path)
        {
            return describe(entry);
        }
        const auto target = files_root_ / std::filesystem::path(destination);
        if (std::filesystem::exists(target))
        {
            throw Error(ErrorCode::AlreadyExists, "'" + destination + "' already exists");
        }
        try
        {
            std::filesystem::rename(path_of(entry), target);
        }
        catch (const std::filesystem::filesystem_error &ex)
        {
            throw classify_exception(ex);
        }
        index_.relocate(entry.path, destination);
        spdlog::info("Moved {} to {}", entry.path, destination);
        return describe(IndexEntry{.id = entry.id, .kind = entry.kind, .path = destination});
    }

    std::filesystem::path DriveService::path_of(const IndexEntry &entry) const
    {
        return entry.path.empty() ? files_root_ : files_root_ / std::filesystem::path(entry.path);
    }

    RemoteObjectRef DriveService::describe(const IndexEntry &entry) const
    {
        if (entry.id == kRootObjectId)
        {
            return root_object();
        }
        const auto location = path_of(entry);
        return RemoteObjectRef{
            .id = entry.id,
            .kind = entry.kind,
            .name = location.filename().string(),
            .path = "/" + entry.path,
            .size = entry.kind == ObjectKind::File ? std::filesystem::file_size(location) : 0,
        };
    }

    void DriveService::check_name(const std::string &name)
    {
        if (name.empty() || name == "." || name == ".." || name.find('/') != std::string::npos)
        {
            throw Error(ErrorCode::InvalidArgument, "Invalid object name: '" + name + "'");
        }
        if (is_upload_temporary(name))
        {
            throw Error(ErrorCode::InvalidArgument, "Reserved object name: '" + name + "'");
        }
    }

    std::string DriveService::child_path(const std::string &parent, const std::string &name)
    {
        return parent.empty() ? name : parent + "/" + name;
    }

} // namespace cpan::drive

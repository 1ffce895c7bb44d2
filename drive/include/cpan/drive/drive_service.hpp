#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "cpan/drive/grant_registry.hpp"
#include "cpan/drive/object_index.hpp"
#include "cpan/remote_api.hpp"

namespace cpan::drive
{

    /**
     * Self-hosted storage backend rooted at a local directory. Content lives in
     * `<root>/files`, ids and grants in `<root>/.cpan`. Uploading content that
     * is already stored under the same name skips the copy. Safe to call from
     * several threads.
     */
    class DriveService final : public RemoteApi
    {
    public:
        explicit DriveService(std::filesystem::path root, GrantPolicy policy = {}, GrantRegistry::Clock clock = {});

        const std::filesystem::path &root() const noexcept { return root_; }
        const std::filesystem::path &files_root() const noexcept { return files_root_; }

        std::string authorize(const OAuthClient &client, const std::string &code_challenge) override;

        TokenGrant exchange_token(const OAuthClient &client, const std::string &auth_code,
                                  const std::string &code_verifier) override;

        TokenGrant refresh_token(const OAuthClient &client, const std::string &refresh_token) override;

        std::vector<RemoteObjectRef> list_directory(const std::string &access_token,
                                                    const std::string &object_id) override;

        RemoteObjectRef get_object(const std::string &access_token, const std::string &object_id) override;

        RemoteObjectRef upload_primitive(const std::string &access_token, const std::filesystem::path &local_path,
                                         const std::string &target_dir_id) override;

        void download_primitive(const std::string &access_token, const std::string &object_id,
                                const std::filesystem::path &local_path) override;

        RemoteObjectRef create_directory(const std::string &access_token, const std::string &parent_id,
                                         const std::string &name) override;

        void delete_object(const std::string &access_token, const std::string &object_id) override;

        RemoteObjectRef move_object(const std::string &access_token, const std::string &object_id,
                                    const std::string &target_dir_id) override;

        RemoteObjectRef rename_object(const std::string &access_token, const std::string &object_id,
                                      const std::string &new_name) override;

    private:
        IndexEntry entry_for(const std::string &object_id);
        IndexEntry directory_for(const std::string &object_id);
        IndexEntry movable_entry(const std::string &object_id);
        RemoteObjectRef relocate(const IndexEntry &entry, const std::string &destination);
        std::filesystem::path path_of(const IndexEntry &entry) const;
        RemoteObjectRef describe(const IndexEntry &entry) const;

        static void check_name(const std::string &name);
        static std::string child_path(const std::string &parent, const std::string &name);

        std::filesystem::path root_;
        std::filesystem::path files_root_;
        ObjectIndex index_;
        GrantRegistry grants_;
    };

} // namespace cpan::drive

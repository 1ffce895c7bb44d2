#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iterator>
#include <map>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <system_error>
#include <thread>
#include <vector>

#include "cpan/error_codes.hpp"
#include "cpan/remote_api.hpp"

namespace cpan::testing
{

    // In-memory RemoteApi with call counters and failure injection.
    class FakeRemote : public RemoteApi
    {
    public:
        struct Node
        {
            RemoteObjectRef ref;
            std::string parent;
            std::string content;
        };

        FakeRemote()
        {
            nodes_[std::string(kRootObjectId)] = Node{.ref = root_object()};
        }

        std::string add_directory(const std::string &parent_id, const std::string &name)
        {
            std::lock_guard lock(mutex_);
            return insert_locked(parent_id, name, ObjectKind::Directory, "");
        }

        std::string add_file(const std::string &parent_id, const std::string &name, const std::string &content,
                             const std::string &id = {})
        {
            std::lock_guard lock(mutex_);
            return insert_locked(parent_id, name, ObjectKind::File, content, id);
        }

        // Ids of the children of `parent_id` called `name`.
        std::vector<std::string> find_children(const std::string &parent_id, const std::string &name) const
        {
            std::lock_guard lock(mutex_);
            std::vector<std::string> ids;
            for (const auto &id : order_)
            {
                const auto &node = nodes_.at(id);
                if (node.parent == parent_id && node.ref.name == name)
                {
                    ids.push_back(id);
                }
            }
            return ids;
        }

        // Id of the object at a '/'-separated path below the root, if any.
        std::optional<std::string> lookup(const std::string &path) const
        {
            std::string current(kRootObjectId);
            std::istringstream segments(path);
            std::string segment;
            while (std::getline(segments, segment, '/'))
            {
                if (segment.empty())
                {
                    continue;
                }
                const auto matches = find_children(current, segment);
                if (matches.empty())
                {
                    return std::nullopt;
                }
                current = matches.front();
            }
            return current;
        }

        std::string content_of(const std::string &id) const
        {
            std::lock_guard lock(mutex_);
            return nodes_.at(id).content;
        }

        std::size_t node_count() const
        {
            std::lock_guard lock(mutex_);
            return nodes_.size();
        }

        std::string authorize(const OAuthClient &client, const std::string &code_challenge) override
        {
            ++authorize_calls;
            last_client_id = client.client_id;
            last_challenge = code_challenge;
            return "code-" + std::to_string(authorize_calls.load());
        }

        TokenGrant exchange_token(const OAuthClient &, const std::string &auth_code,
                                  const std::string &code_verifier) override
        {
            ++exchange_calls;
            last_code = auth_code;
            last_verifier = code_verifier;
            return issue(exchange_expires_in.load());
        }

        TokenGrant refresh_token(const OAuthClient &, const std::string &refresh_token) override
        {
            ++refresh_calls;
            if (refresh_delay.count() > 0)
            {
                std::this_thread::sleep_for(refresh_delay);
            }
            if (refresh_error)
            {
                throw Error(*refresh_error, "refresh refused");
            }
            last_refresh_token = refresh_token;
            return issue(refresh_expires_in.load());
        }

        std::vector<RemoteObjectRef> list_directory(const std::string &access_token,
                                                    const std::string &object_id) override
        {
            ++list_calls;
            check_token(access_token);
            std::lock_guard lock(mutex_);
            const auto it = nodes_.find(object_id);
            if (it == nodes_.end())
            {
                throw Error(ErrorCode::NotFound, "no such folder " + object_id);
            }
            if (!it->second.ref.is_directory())
            {
                throw Error(ErrorCode::InvalidArgument, "not a folder " + object_id);
            }
            std::vector<RemoteObjectRef> children;
            for (const auto &id : order_)
            {
                if (nodes_.at(id).parent == object_id)
                {
                    children.push_back(nodes_.at(id).ref);
                }
            }
            return children;
        }

        RemoteObjectRef get_object(const std::string &access_token, const std::string &object_id) override
        {
            ++get_calls;
            check_token(access_token);
            std::lock_guard lock(mutex_);
            const auto it = nodes_.find(object_id);
            if (it == nodes_.end())
            {
                throw Error(ErrorCode::NotFound, "no such object " + object_id);
            }
            return it->second.ref;
        }

        RemoteObjectRef upload_primitive(const std::string &access_token, const std::filesystem::path &local_path,
                                         const std::string &target_dir_id) override
        {
            const auto call = ++upload_calls;
            check_token(access_token);
            if (before_upload)
            {
                before_upload(call);
            }
            if (upload_error)
            {
                throw Error(*upload_error, "upload refused");
            }
            if (transient_upload_failures.load() > 0 && transient_upload_failures.fetch_sub(1) > 0)
            {
                throw Error(ErrorCode::Transient, "service unavailable");
            }

            std::ifstream in(local_path, std::ios::binary);
            if (!in)
            {
                throw std::filesystem::filesystem_error("open", local_path,
                                                        std::make_error_code(std::errc::no_such_file_or_directory));
            }
            const std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
            const auto name = local_path.filename().string();

            std::lock_guard lock(mutex_);
            for (const auto &id : order_)
            {
                auto &node = nodes_.at(id);
                if (node.parent == target_dir_id && node.ref.name == name && !node.ref.is_directory())
                {
                    node.content = content;
                    node.ref.size = content.size();
                    return node.ref;
                }
            }
            const auto id = insert_locked(target_dir_id, name, ObjectKind::File, content);
            return nodes_.at(id).ref;
        }

        void download_primitive(const std::string &access_token, const std::string &object_id,
                                const std::filesystem::path &local_path) override
        {
            ++download_calls;
            check_token(access_token);
            if (transient_download_failures.load() > 0 && transient_download_failures.fetch_sub(1) > 0)
            {
                throw Error(ErrorCode::Transient, "connection reset");
            }
            std::string content;
            {
                std::lock_guard lock(mutex_);
                const auto it = nodes_.find(object_id);
                if (it == nodes_.end())
                {
                    throw Error(ErrorCode::NotFound, "no such object " + object_id);
                }
                content = it->second.content;
            }
            std::ofstream out(local_path, std::ios::binary | std::ios::trunc);
            out << content;
        }

        RemoteObjectRef create_directory(const std::string &access_token, const std::string &parent_id,
                                         const std::string &name) override
        {
            ++create_calls;
            check_token(access_token);
            if (create_error)
            {
                throw Error(*create_error, "folder creation refused");
            }
            std::lock_guard lock(mutex_);
            for (const auto &id : order_)
            {
                const auto &node = nodes_.at(id);
                if (node.parent == parent_id && node.ref.name == name)
                {
                    throw Error(ErrorCode::AlreadyExists, name + " exists");
                }
            }
            const auto id = insert_locked(parent_id, name, ObjectKind::Directory, "");
            return nodes_.at(id).ref;
        }

        void delete_object(const std::string &access_token, const std::string &object_id) override
        {
            ++delete_calls;
            check_token(access_token);
            std::lock_guard lock(mutex_);
            node_locked(object_id);
            if (object_id == kRootObjectId)
            {
                throw Error(ErrorCode::InvalidArgument, "root cannot be deleted");
            }
            std::vector<std::string> doomed{object_id};
            for (std::size_t i = 0; i < doomed.size(); ++i)
            {
                for (const auto &id : order_)
                {
                    if (nodes_.at(id).parent == doomed[i])
                    {
                        doomed.push_back(id);
                    }
                }
            }
            for (const auto &id : doomed)
            {
                nodes_.erase(id);
                std::erase(order_, id);
            }
        }

        RemoteObjectRef move_object(const std::string &access_token, const std::string &object_id,
                                    const std::string &target_dir_id) override
        {
            ++move_calls;
            check_token(access_token);
            std::lock_guard lock(mutex_);
            auto &node = node_locked(object_id);
            const auto &target = node_locked(target_dir_id);
            if (!target.ref.is_directory())
            {
                throw Error(ErrorCode::InvalidArgument, "not a folder " + target_dir_id);
            }
            for (auto ancestor = target_dir_id; !ancestor.empty(); ancestor = nodes_.at(ancestor).parent)
            {
                if (ancestor == object_id)
                {
                    throw Error(ErrorCode::InvalidArgument, "cannot move a folder into itself");
                }
            }
            check_free_locked(target_dir_id, node.ref.name, object_id);
            node.parent = target_dir_id;
            return node.ref;
        }

        RemoteObjectRef rename_object(const std::string &access_token, const std::string &object_id,
                                      const std::string &new_name) override
        {
            ++rename_calls;
            check_token(access_token);
            std::lock_guard lock(mutex_);
            auto &node = node_locked(object_id);
            check_free_locked(node.parent, new_name, object_id);
            node.ref.name = new_name;
            return node.ref;
        }

        std::atomic<int> authorize_calls{0};
        std::atomic<int> exchange_calls{0};
        std::atomic<int> refresh_calls{0};
        std::atomic<int> list_calls{0};
        std::atomic<int> get_calls{0};
        std::atomic<int> upload_calls{0};
        std::atomic<int> download_calls{0};
        std::atomic<int> create_calls{0};
        std::atomic<int> delete_calls{0};
        std::atomic<int> move_calls{0};
        std::atomic<int> rename_calls{0};

        std::atomic<std::int64_t> exchange_expires_in{3600};
        std::atomic<std::int64_t> refresh_expires_in{3600};
        std::atomic<int> transient_upload_failures{0};
        std::atomic<int> transient_download_failures{0};
        std::atomic<bool> reject_access{false};
        std::optional<ErrorCode> upload_error;
        std::optional<ErrorCode> create_error;
        std::optional<ErrorCode> refresh_error;
        std::chrono::milliseconds refresh_delay{0};
        // Runs inside upload_primitive with the 1-based call number.
        std::function<void(int)> before_upload;

        std::string last_client_id;
        std::string last_challenge;
        std::string last_code;
        std::string last_verifier;
        std::string last_refresh_token;

    private:
        TokenGrant issue(std::int64_t expires_in)
        {
            const auto serial = ++issued_;
            return TokenGrant{
                .access_token = "access-" + std::to_string(serial),
                .refresh_token = "refresh-" + std::to_string(serial),
                .expires_in = expires_in,
            };
        }

        void check_token(const std::string &access_token) const
        {
            if (access_token.empty() || reject_access.load())
            {
                throw Error(ErrorCode::AuthExpired, "access token rejected");
            }
        }

        Node &node_locked(const std::string &id)
        {
            const auto it = nodes_.find(id);
            if (it == nodes_.end())
            {
                throw Error(ErrorCode::NotFound, "no such object " + id);
            }
            return it->second;
        }

        void check_free_locked(const std::string &parent_id, const std::string &name, const std::string &self) const
        {
            for (const auto &id : order_)
            {
                const auto &node = nodes_.at(id);
                if (id != self && node.parent == parent_id && node.ref.name == name)
                {
                    throw Error(ErrorCode::AlreadyExists, name + " exists");
                }
            }
        }

        std::string insert_locked(const std::string &parent_id, const std::string &name, ObjectKind kind,
                                  const std::string &content, const std::string &explicit_id = {})
        {
            auto id = explicit_id.empty() ? std::to_string(next_id_++) : explicit_id;
            nodes_[id] = Node{
                .ref = RemoteObjectRef{.id = id, .kind = kind, .name = name, .size = content.size()},
                .parent = parent_id,
                .content = content,
            };
            order_.push_back(id);
            return id;
        }

        mutable std::mutex mutex_;
        std::map<std::string, Node> nodes_;
        std::vector<std::string> order_;
        std::uint64_t next_id_{1000};
        std::atomic<int> issued_{0};
    };

} // namespace cpan::testing

#include "cpan/drive/object_index.hpp"

#include <fstream>
#include <unordered_map>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "cpan/crypto.hpp"
#include "cpan/error_codes.hpp"

namespace cpan::drive
{

    namespace
    {
        constexpr auto kIndexFile = "index.json";
        constexpr std::size_t kIdDigits = 19;

        bool within(const std::string &path, const std::string &root)
        {
            return path == root || (path.size() > root.size() && path.compare(0, root.size(), root) == 0 &&
                                    path[root.size()] == '/');
        }
    } // namespace

    ObjectIndex::ObjectIndex(std::filesystem::path metadata_dir)
        : index_path_(metadata_dir / kIndexFile)
    {
        std::filesystem::create_directories(metadata_dir);
    }

    std::vector<std::string> ObjectIndex::assign(const std::vector<std::pair<std::string, ObjectKind>> &entries)
    {
        std::lock_guard lock(mutex_);
        load_locked();

        std::vector<std::string> ids;
        ids.reserve(entries.size());
        bool changed = false;
        for (const auto &[path, kind] : entries)
        {
            if (path.empty())
            {
                ids.emplace_back(kRootObjectId);
                continue;
            }
            if (const auto it = by_path_.find(path); it != by_path_.end())
            {
                auto &entry = by_id_.at(it->second);
                if (entry.kind == kind)
                {
                    ids.push_back(entry.id);
                    continue;
                }
                // Replaced by an object of the other kind: it is a new object.
                by_id_.erase(it->second);
                by_path_.erase(it);
            }
            auto id = generate_id_locked();
            by_id_[id] = IndexEntry{.id = id, .kind = kind, .path = path};
            by_path_[path] = id;
            ids.push_back(std::move(id));
            changed = true;
        }
        if (changed)
        {
            persist_locked();
        }
        return ids;
    }

    std::string ObjectIndex::id_for(const std::string &path, ObjectKind kind)
    {
        return assign({{path, kind}}).front();
    }

    std::optional<IndexEntry> ObjectIndex::find(const std::string &id) const
    {
        if (id == kRootObjectId)
        {
            return IndexEntry{.id = std::string(kRootObjectId), .kind = ObjectKind::Directory, .path = ""};
        }
        std::lock_guard lock(mutex_);
        load_locked();
        const auto it = by_id_.find(id);
        if (it == by_id_.end())
        {
            return std::nullopt;
        }
        return it->second;
    }

    void ObjectIndex::forget(const std::string &id)
    {
        std::lock_guard lock(mutex_);
        load_locked();
        const auto it = by_id_.find(id);
        if (it == by_id_.end())
        {
            return;
        }
        by_path_.erase(it->second.path);
        by_id_.erase(it);
        persist_locked();
    }

    void ObjectIndex::forget_tree(const std::string &path)
    {
        std::lock_guard lock(mutex_);
        load_locked();
        const auto removed = std::erase_if(by_id_, [&path](const auto &item)
                                           { return within(item.second.path, path); });
        std::erase_if(by_path_, [&path](const auto &item)
                      { return within(item.first, path); });
        if (removed > 0)
        {
            persist_locked();
        }
    }

    void ObjectIndex::relocate(const std::string &from, const std::string &to)
    {
        std::lock_guard lock(mutex_);
        load_locked();
        // Entries left behind at the destination belong to objects that no longer exist.
        std::erase_if(by_id_, [&to](const auto &item)
                      { return within(item.second.path, to); });
        by_path_.clear();
        for (auto &[id, entry] : by_id_)
        {
            if (within(entry.path, from))
            {
                entry.path = to + entry.path.substr(from.size());
            }
            by_path_[entry.path] = id;
        }
        persist_locked();
    }

    std::size_t ObjectIndex::size() const
    {
        std::lock_guard lock(mutex_);
        load_locked();
        return by_id_.size();
    }

    void ObjectIndex::load_locked() const
    {
        if (loaded_)
        {
            return;
        }
        by_id_.clear();
        by_path_.clear();
        if (std::filesystem::exists(index_path_))
        {
            std::ifstream in(index_path_);
            const auto json = nlohmann::json::parse(in, nullptr, false);
            if (json.is_discarded() || !json.is_object())
            {
                throw Error(ErrorCode::InternalError, "Corrupt object index: " + index_path_.string());
            }
            for (const auto &[id, value] : json.items())
            {
                const auto kind = object_kind_from_string(value.value("kind", std::string{}));
                const auto path = value.value("path", std::string{});
                if (!kind || path.empty())
                {
                    spdlog::warn("Ignoring malformed index entry {}", id);
                    continue;
                }
                by_id_[id] = IndexEntry{.id = id, .kind = *kind, .path = path};
                by_path_[path] = id;
            }
        }
        loaded_ = true;
    }

    void ObjectIndex::persist_locked() const
    {
        nlohmann::json json = nlohmann::json::object();
        for (const auto &[id, entry] : by_id_)
        {
            json[id] = {
                {"kind", std::string(to_string(entry.kind))},
                {"path", entry.path},
            };
        }
        auto temp_path = index_path_;
        temp_path += ".tmp";
        {
            std::ofstream out(temp_path, std::ios::trunc);
            out << json.dump(2);
            if (!out)
            {
                throw Error(ErrorCode::IoError, "Cannot write object index: " + temp_path.string());
            }
        }
        std::filesystem::rename(temp_path, index_path_);
    }

    std::string ObjectIndex::generate_id_locked() const
    {
        for (;;)
        {
            auto id = crypto::random_digits(kIdDigits);
            if (!by_id_.contains(id))
            {
                return id;
            }
        }
    }

} // namespace cpan::drive

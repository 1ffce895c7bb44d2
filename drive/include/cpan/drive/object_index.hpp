#pragma once

#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "cpan/remote_api.hpp"

namespace cpan::drive
{

    struct IndexEntry
    {
        std::string id;
        ObjectKind kind{ObjectKind::File};
        // Generic path relative to the drive's files directory, empty for the root.
        std::string path;
    };

    /**
     * Persistent mapping between stable object ids and drive paths. Ids are
     * assigned on first sight and survive restarts; the root is always id 0.
     */
    class ObjectIndex
    {
    public:
        explicit ObjectIndex(std::filesystem::path metadata_dir);

        // Ids for every (path, kind) pair, in order, persisting the index once if any were new.
        std::vector<std::string> assign(const std::vector<std::pair<std::string, ObjectKind>> &entries);

        std::string id_for(const std::string &path, ObjectKind kind);

        std::optional<IndexEntry> find(const std::string &id) const;

        void forget(const std::string &id);

        // Drops `path` and every entry below it.
        void forget_tree(const std::string &path);

        // Points `from` and every entry below it at `to`, keeping their ids.
        void relocate(const std::string &from, const std::string &to);

        std::size_t size() const;

    private:
        void load_locked() const;
        void persist_locked() const;
        std::string generate_id_locked() const;

        std::filesystem::path index_path_;

        mutable std::mutex mutex_;
        mutable bool loaded_{false};
        mutable std::unordered_map<std::string, IndexEntry> by_id_;
        mutable std::unordered_map<std::string, std::string> by_path_;
    };

} // namespace cpan::drive

/**
 * @file session_registry.hpp
 * @brief Per-user execution statistics, safe under concurrent completions.
 * @author Dimitris Kafetzis
 *
 * A shared_mutex guards the user map; each user entry has its own mutex,
 * so completions for one user serialize without blocking other users.
 * The map holds at most `capacity` sessions; opening one more evicts the
 * session whose last completion is oldest.
 */

#pragma once

#include "core/types.hpp"

#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace codelab {

class SessionRegistry {
public:
    static constexpr size_t kDefaultCapacity = 10000;

    explicit SessionRegistry(size_t capacity = kDefaultCapacity);

    SessionRegistry(const SessionRegistry&) = delete;
    SessionRegistry& operator=(const SessionRegistry&) = delete;

    /**
     * @brief Fold one terminal result into the user's session.
     *
     * Creates the session on first use. `language` is the wire identifier
     * the result is counted under. Returns the updated snapshot.
     */
    SessionStats record(const UserId& user, std::string_view language,
                        const ExecutionResult& result);

    [[nodiscard]] std::optional<SessionStats> get(const UserId& user) const;
    [[nodiscard]] std::vector<SessionStats> all() const;
    [[nodiscard]] size_t size() const;
    [[nodiscard]] size_t capacity() const noexcept { return capacity_; }

    /// `session_<user>_<YYYYMMDD>` for the UTC date of `when`.
    [[nodiscard]] static std::string make_session_id(const UserId& user, Timestamp when);

private:
    struct Entry {
        mutable std::mutex mutex;
        SessionStats stats;
        Timestamp last_activity;
    };

    std::shared_ptr<Entry> find_or_create(const UserId& user);
    void evict_least_recent();      ///< Caller holds map_mutex_ exclusively

    size_t capacity_;

    mutable std::shared_mutex map_mutex_;
    std::unordered_map<UserId, std::shared_ptr<Entry>> entries_;
};

}  // namespace codelab

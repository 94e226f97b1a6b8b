/**
 * @file session_registry.cpp
 * @brief SessionRegistry implementation.
 * @author Dimitris Kafetzis
 */

#include "orchestrator/session_registry.hpp"

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <ctime>

namespace codelab {

SessionRegistry::SessionRegistry(size_t capacity) : capacity_(std::max<size_t>(capacity, 1)) {}

std::string SessionRegistry::make_session_id(const UserId& user, Timestamp when) {
    auto t = std::chrono::system_clock::to_time_t(when);
    std::tm utc{};
    gmtime_r(&t, &utc);
    char date[16];
    std::snprintf(date, sizeof(date), "%04d%02d%02d",
                  utc.tm_year + 1900, utc.tm_mon + 1, utc.tm_mday);
    return "session_" + user + "_" + date;
}

std::shared_ptr<SessionRegistry::Entry> SessionRegistry::find_or_create(const UserId& user) {
    {
        std::shared_lock lock(map_mutex_);
        auto it = entries_.find(user);
        if (it != entries_.end()) return it->second;
    }

    std::unique_lock lock(map_mutex_);
    if (auto it = entries_.find(user); it != entries_.end()) return it->second;
    if (entries_.size() >= capacity_) evict_least_recent();

    auto entry = std::make_shared<Entry>();
    entry->stats.user_id = user;
    entry->stats.started_at = std::chrono::system_clock::now();
    entry->stats.session_id = make_session_id(user, entry->stats.started_at);
    entry->last_activity = entry->stats.started_at;
    entries_.emplace(user, entry);
    return entry;
}

void SessionRegistry::evict_least_recent() {
    auto oldest = entries_.end();
    Timestamp oldest_activity = Timestamp::max();
    for (auto it = entries_.begin(); it != entries_.end(); ++it) {
        std::lock_guard entry_lock(it->second->mutex);
        if (it->second->last_activity < oldest_activity) {
            oldest_activity = it->second->last_activity;
            oldest = it;
        }
    }
    if (oldest != entries_.end()) entries_.erase(oldest);
}

SessionStats SessionRegistry::record(const UserId& user, std::string_view language,
                                     const ExecutionResult& result) {
    auto entry = find_or_create(user);

    std::lock_guard lock(entry->mutex);
    entry->last_activity = std::chrono::system_clock::now();
    auto& stats = entry->stats;
    ++stats.total_executions;
    if (result.succeeded()) {
        ++stats.successful_executions;
    } else {
        ++stats.failed_executions;
    }
    stats.total_execution_time_seconds += result.execution_time_seconds;
    ++stats.language_counts[std::string(language)];
    return stats;
}

std::optional<SessionStats> SessionRegistry::get(const UserId& user) const {
    std::shared_ptr<Entry> entry;
    {
        std::shared_lock lock(map_mutex_);
        auto it = entries_.find(user);
        if (it == entries_.end()) return std::nullopt;
        entry = it->second;
    }
    std::lock_guard lock(entry->mutex);
    return entry->stats;
}

std::vector<SessionStats> SessionRegistry::all() const {
    std::vector<std::shared_ptr<Entry>> snapshot;
    {
        std::shared_lock lock(map_mutex_);
        snapshot.reserve(entries_.size());
        for (const auto& [user, entry] : entries_) snapshot.push_back(entry);
    }

    std::vector<SessionStats> out;
    out.reserve(snapshot.size());
    for (const auto& entry : snapshot) {
        std::lock_guard lock(entry->mutex);
        out.push_back(entry->stats);
    }
    std::sort(out.begin(), out.end(), [](const SessionStats& a, const SessionStats& b) {
        return a.user_id < b.user_id;
    });
    return out;
}

size_t SessionRegistry::size() const {
    std::shared_lock lock(map_mutex_);
    return entries_.size();
}

}  // namespace codelab

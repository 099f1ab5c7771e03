//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: LogStore.cpp
// Purpose: Bounded log storage and logs:// listing/reading
//==========================================================================================================

#include "toolhost/builtin/LogStore.h"

#include <format>
#include <stdexcept>

#include "logging/Logger.h"
#include "toolhost/errors/Errors.h"

namespace toolhost {

namespace {
constexpr const char* kPrefix = "logs://";

std::string joinEntries(const std::vector<std::string>& entries) {
    std::string out;
    for (std::size_t i = 0; i < entries.size(); ++i) {
        if (i != 0) out.push_back('\n');
        out += entries[i];
    }
    return out;
}
} // namespace

void LogStore::Append(const std::string& kind, const std::string& id, const std::string& line) {
    const std::string key = kind + "/" + id;
    std::lock_guard<std::mutex> lock(mutex);
    auto [it, created] = logs.try_emplace(key);
    if (created) {
        creationOrder.push_back(key);
        while (creationOrder.size() > MaxLogs) {
            LOG_DEBUG("Logs: evicting {}", creationOrder.front());
            logs.erase(creationOrder.front());
            creationOrder.pop_front();
        }
    }
    Log& log = it->second;
    log.entries.push_back(line);
    log.bytes += line.size();
    while (!log.entries.empty() && (log.entries.size() > MaxEntries || log.bytes > MaxBytes)) {
        log.bytes -= log.entries.front().size();
        log.entries.pop_front();
    }
}

std::optional<LogStore::Snapshot> LogStore::Get(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex);
    auto it = logs.find(key);
    if (it == logs.end()) {
        return std::nullopt;
    }
    Snapshot s;
    s.key = it->first;
    s.entries.assign(it->second.entries.begin(), it->second.entries.end());
    s.bytes = it->second.bytes;
    return s;
}

std::vector<LogStore::Snapshot> LogStore::List(const std::string& prefix) const {
    std::lock_guard<std::mutex> lock(mutex);
    std::vector<Snapshot> out;
    for (auto it = logs.lower_bound(prefix); it != logs.end() && it->first.compare(0, prefix.size(), prefix) == 0; ++it) {
        Snapshot s;
        s.key = it->first;
        s.entries.assign(it->second.entries.begin(), it->second.entries.end());
        s.bytes = it->second.bytes;
        out.push_back(std::move(s));
    }
    return out;
}

void LogStore::Clear() {
    std::lock_guard<std::mutex> lock(mutex);
    logs.clear();
    creationOrder.clear();
}

LogResourceStrategy::LogResourceStrategy(std::shared_ptr<LogStore> s) : store(std::move(s)) {
    if (!store) {
        throw std::invalid_argument("LogResourceStrategy requires a log store");
    }
}

std::string LogResourceStrategy::UriPrefix() const {
    return kPrefix;
}

std::string LogResourceStrategy::Description() const {
    return "Bounded run and build logs";
}

ResourcePage LogResourceStrategy::List(const ListResourcesParams& params) const {
    std::string filter = params.prefix.value_or("");
    if (filter.rfind(kPrefix, 0) == 0) {
        filter.erase(0, std::char_traits<char>::length(kPrefix));
    }
    std::vector<ResourceEntry> entries;
    for (auto& snap : store->List(filter)) {
        ResourceEntry e;
        e.uri = std::string(kPrefix) + snap.key;
        e.name = snap.key;
        e.entries = static_cast<int64_t>(snap.entries.size());
        // Joined size: entry bytes plus separators
        e.size = static_cast<int64_t>(snap.bytes + (snap.entries.empty() ? 0 : snap.entries.size() - 1));
        e.mimeType = "text/plain";
        entries.push_back(std::move(e));
    }
    return MakePage(std::move(entries), params.page, params.pageSize);
}

ResourceContent LogResourceStrategy::Read(const ReadResourceParams& params) const {
    const std::string key = params.uri.rfind(kPrefix, 0) == 0
        ? params.uri.substr(std::char_traits<char>::length(kPrefix))
        : std::string();
    auto snap = key.empty() ? std::nullopt : store->Get(key);
    if (!snap.has_value()) {
        LOG_DEBUG("Logs: no log for {}", params.uri);
        throw errors::McpException(JSONRPCErrorCodes::ResourceNotFound,
                                   std::format("Resource not found: {}", params.uri));
    }
    const std::string text = joinEntries(snap->entries);
    auto [start, length] = ClampRange(static_cast<int64_t>(text.size()), params.start, params.length);

    ResourceContent out;
    out.uri = params.uri;
    out.mimeType = "text/plain";
    out.content = SanitizeUtf8(text.substr(static_cast<std::size_t>(start), static_cast<std::size_t>(length)));
    out.total = static_cast<int64_t>(text.size());
    out.start = start;
    out.length = length;
    return out;
}

} // namespace toolhost

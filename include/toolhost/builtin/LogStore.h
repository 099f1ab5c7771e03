//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: LogStore.h
// Purpose: Bounded in-memory run/build logs and the logs:// resource strategy that exposes them
//==========================================================================================================
#pragma once

#include <cstddef>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "toolhost/registry/ResourceRegistry.h"

namespace toolhost {

//==========================================================================================================
// LogStore
// Purpose: Thread-safe map of log key ("run/<id>", "build/<id>") -> bounded entry list.
// Notes:
//   Each log keeps at most MaxEntries entries and MaxBytes bytes of entry text; the oldest entries
//   are dropped first. At most MaxLogs keys are kept; creating one more evicts the least recently
//   created log.
//==========================================================================================================
class LogStore {
public:
    static constexpr std::size_t MaxEntries = 1000;
    static constexpr std::size_t MaxBytes = 100 * 1024;
    static constexpr std::size_t MaxLogs = 256;

    struct Snapshot {
        std::string key;
        std::vector<std::string> entries;
        std::size_t bytes = 0;
    };

    void Append(const std::string& kind, const std::string& id, const std::string& line);

    std::optional<Snapshot> Get(const std::string& key) const;

    // Keys starting with 'prefix', in lexicographic order.
    std::vector<Snapshot> List(const std::string& prefix) const;

    void Clear();

private:
    struct Log {
        std::deque<std::string> entries;
        std::size_t bytes = 0;
    };

    mutable std::mutex mutex;
    std::map<std::string, Log> logs;
    std::deque<std::string> creationOrder;
};

//==========================================================================================================
// LogResourceStrategy
// Purpose: logs:// resources. List accepts an optional key prefix filter ("run/", "build/42");
//          Read joins entries with '\n' and honours start/length like file reads.
//==========================================================================================================
class LogResourceStrategy : public IResourceStrategy {
public:
    explicit LogResourceStrategy(std::shared_ptr<LogStore> store);

    std::string UriPrefix() const override;
    std::string Description() const override;

    ResourcePage List(const ListResourcesParams& params) const override;
    ResourceContent Read(const ReadResourceParams& params) const override;

private:
    std::shared_ptr<LogStore> store;
};

} // namespace toolhost

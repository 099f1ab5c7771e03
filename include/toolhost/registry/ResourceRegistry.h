//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ResourceRegistry.h
// Purpose: Resource strategy interface and the URI-prefix lookup table
//==========================================================================================================
#pragma once

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "toolhost/Protocol.h"

namespace toolhost {

//==========================================================================================================
// IResourceStrategy
// Purpose: One resource kind addressed by a URI scheme prefix (e.g. "workspace://").
// Notes:
//   - List returns entries ordered lexicographically by URI, paged by (page, pageSize).
//   - Failures are reported by throwing errors::McpException (ResourceNotFound, SandboxViolation,
//     InvalidParams).
//   - Implementations are called concurrently and must not mutate shared state without locking.
//==========================================================================================================
class IResourceStrategy {
public:
    virtual ~IResourceStrategy() = default;

    virtual std::string UriPrefix() const = 0;
    virtual std::string Description() const = 0;
    virtual bool ReadOnly() const { return true; }

    virtual ResourcePage List(const ListResourcesParams& params) const = 0;
    virtual ResourceContent Read(const ReadResourceParams& params) const = 0;
};

//==========================================================================================================
// ResourceRegistry
// Purpose: Immutable prefix -> strategy table; lookups pick the longest registered prefix.
//==========================================================================================================
class ResourceRegistry {
public:
    // Throws std::invalid_argument on null strategies, empty or duplicate prefixes.
    explicit ResourceRegistry(std::vector<std::shared_ptr<IResourceStrategy>> strategies);

    // Strategy whose prefix is the longest prefix of 'uri', or nullptr.
    std::shared_ptr<IResourceStrategy> Find(const std::string& uri) const;

    // Registered prefixes in lexicographic order.
    std::vector<std::string> Prefixes() const;

    bool Empty() const { return strategies.empty(); }

private:
    std::map<std::string, std::shared_ptr<IResourceStrategy>> strategies;
};

// Applies page/pageSize to a fully sorted entry list.
ResourcePage MakePage(std::vector<ResourceEntry> sortedEntries, int64_t page, int64_t pageSize);

// Clamps [start, start+length) to 'total' and returns the effective (start, length).
std::pair<int64_t, int64_t> ClampRange(int64_t total, std::optional<int64_t> start, std::optional<int64_t> length);

// Replaces each invalid UTF-8 sequence (including one cut by a byte range) with U+FFFD.
std::string SanitizeUtf8(const std::string& bytes);

// MIME type from the extension of a URI or file name; text/plain when unknown.
std::string GuessMimeType(const std::string& uri);

} // namespace toolhost

//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: WorkspaceResourceStrategy.cpp
// Purpose: Sandboxed file listing and byte-range reads
//==========================================================================================================

#include "toolhost/builtin/WorkspaceResourceStrategy.h"

#include <algorithm>
#include <filesystem>
#include <format>
#include <fstream>
#include <stdexcept>
#include <system_error>
#include <vector>

#include "logging/Logger.h"
#include "toolhost/errors/Errors.h"

namespace fs = std::filesystem;

namespace toolhost {

namespace {
constexpr const char* kPrefix = "workspace://";

[[noreturn]] void throwSandbox(const std::string& what) {
    LOG_WARN("Workspace: sandbox violation for '{}'", what);
    throw errors::McpException(JSONRPCErrorCodes::SandboxViolation,
                               std::format("Access denied: {}", what));
}
} // namespace

WorkspaceResourceStrategy::WorkspaceResourceStrategy(std::shared_ptr<const PathSandbox> sb, std::size_t maxBytes)
    : sandbox(std::move(sb)), maxResourceBytes(maxBytes) {
    if (!sandbox) {
        throw std::invalid_argument("WorkspaceResourceStrategy requires a sandbox");
    }
}

std::string WorkspaceResourceStrategy::UriPrefix() const {
    return kPrefix;
}

std::string WorkspaceResourceStrategy::Description() const {
    return "Files under the workspace root";
}

ResourcePage WorkspaceResourceStrategy::List(const ListResourcesParams& params) const {
    FUNC_SCOPE();
    const std::string dir = params.directory.value_or("");
    auto base = sandbox->ResolvePath(dir);
    if (!base.has_value() || sandbox->IsDenied(base.value())) {
        throwSandbox(dir.empty() ? std::string(".") : dir);
    }
    std::error_code ec;
    if (!fs::is_directory(base.value(), ec)) {
        throw errors::McpException(JSONRPCErrorCodes::ResourceNotFound,
                                   std::format("Directory not found: {}", dir));
    }

    std::vector<ResourceEntry> entries;
    fs::recursive_directory_iterator it(base.value(), fs::directory_options::skip_permission_denied, ec);
    const fs::recursive_directory_iterator end;
    for (; !ec && it != end; it.increment(ec)) {
        const fs::directory_entry& entry = *it;
        std::error_code sec;
        if (entry.is_directory(sec) && !entry.is_symlink(sec)) {
            if (sandbox->IsDenied(entry.path())) {
                it.disable_recursion_pending();
            }
            continue;
        }
        if (!entry.is_regular_file(sec)) {
            continue;
        }
        // Symlinked files must still resolve inside the root
        auto resolved = sandbox->ResolvePath(entry.path().string());
        if (!resolved.has_value() || !sandbox->IsAllowedRead(resolved.value()) || sandbox->IsDenied(entry.path())) {
            continue;
        }
        ResourceEntry e;
        e.uri = std::string(kPrefix) + sandbox->RelativeTo(entry.path());
        e.name = entry.path().filename().string();
        e.size = static_cast<int64_t>(entry.file_size(sec));
        if (sec) {
            continue;
        }
        e.mimeType = GuessMimeType(e.uri);
        entries.push_back(std::move(e));
    }
    if (ec) {
        LOG_WARN("Workspace: listing '{}' stopped early: {}", base->string(), ec.message());
    }

    std::sort(entries.begin(), entries.end(), [](const ResourceEntry& a, const ResourceEntry& b) { return a.uri < b.uri; });
    LOG_DEBUG("Workspace: {} entries under '{}'", entries.size(), dir);
    return MakePage(std::move(entries), params.page, params.pageSize);
}

ResourceContent WorkspaceResourceStrategy::Read(const ReadResourceParams& params) const {
    FUNC_SCOPE();
    if (params.uri.rfind(kPrefix, 0) != 0) {
        throw errors::McpException(JSONRPCErrorCodes::ResourceNotFound,
                                   std::format("Resource not found: {}", params.uri));
    }
    const std::string rel = params.uri.substr(std::char_traits<char>::length(kPrefix));
    auto path = sandbox->ResolvePath(rel);
    if (!path.has_value() || !sandbox->IsAllowedRead(path.value())) {
        throwSandbox(params.uri);
    }

    std::error_code ec;
    const auto status = fs::status(path.value(), ec);
    if (ec || !fs::exists(status)) {
        throw errors::McpException(JSONRPCErrorCodes::ResourceNotFound,
                                   std::format("Resource not found: {}", params.uri));
    }
    if (!fs::is_regular_file(status)) {
        throw errors::McpException(JSONRPCErrorCodes::InvalidParams,
                                   std::format("Not a regular file: {}", params.uri));
    }
    const auto fileSize = static_cast<int64_t>(fs::file_size(path.value(), ec));
    if (ec) {
        throw errors::McpException(JSONRPCErrorCodes::InternalError,
                                   std::format("Cannot stat {}: {}", params.uri, ec.message()));
    }

    auto [start, length] = ClampRange(fileSize, params.start, params.length);
    if (static_cast<std::size_t>(length) > maxResourceBytes) {
        throw errors::McpException(JSONRPCErrorCodes::InvalidParams,
                                   std::format("Read of {} bytes exceeds the {} byte limit; use start/length",
                                               length, maxResourceBytes));
    }

    std::ifstream in(path.value(), std::ios::binary);
    if (!in) {
        throw errors::McpException(JSONRPCErrorCodes::InternalError,
                                   std::format("Cannot open {}", params.uri));
    }
    std::string bytes(static_cast<std::size_t>(length), '\0');
    in.seekg(start);
    in.read(bytes.data(), length);
    bytes.resize(static_cast<std::size_t>(in.gcount()));

    ResourceContent out;
    out.uri = params.uri;
    out.mimeType = GuessMimeType(params.uri);
    out.content = SanitizeUtf8(bytes);
    out.total = fileSize;
    out.start = start;
    out.length = static_cast<int64_t>(bytes.size());
    LOG_DEBUG("Workspace: read {} [{}, +{}) of {}", params.uri, out.start, out.length, out.total);
    return out;
}

} // namespace toolhost

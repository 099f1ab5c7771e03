//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: PathSandbox.cpp
// Purpose: Path canonicalization, containment and allow/deny checks
//==========================================================================================================

#include "toolhost/sandbox/PathSandbox.h"

#include <algorithm>
#include <format>
#include <iterator>
#include <stdexcept>
#include <system_error>

#include "logging/Logger.h"

namespace fs = std::filesystem;

namespace toolhost {

PathSandbox::PathSandbox(const fs::path& rootPath, config::SecurityConfig securityConfig)
    : security(std::move(securityConfig)) {
    std::error_code ec;
    root = fs::canonical(rootPath, ec);
    if (ec || !fs::is_directory(root, ec)) {
        throw std::invalid_argument(std::format("sandbox root '{}' is not an existing directory", rootPath.string()));
    }
    LOG_INFO("PathSandbox: root={} denied={}", root.string(), security.deniedDirectories.size());
}

std::optional<fs::path> PathSandbox::ResolvePath(const std::string& input) const {
    FUNC_SCOPE();
    if (input.find('\0') != std::string::npos) {
        return std::nullopt;
    }
    fs::path p(input);
    if (p.is_relative()) {
        p = root / p;
    }
    std::error_code ec;
    fs::path canon = fs::weakly_canonical(p, ec);
    if (ec) {
        LOG_DEBUG("PathSandbox: cannot resolve '{}': {}", input, ec.message());
        return std::nullopt;
    }
    // A lexically normalized tail can name an existing symlink; resolve it fully.
    if (fs::exists(fs::symlink_status(canon, ec))) {
        fs::path full = fs::canonical(canon, ec);
        if (ec) {
            LOG_DEBUG("PathSandbox: cannot canonicalize '{}': {}", canon.string(), ec.message());
            return std::nullopt;
        }
        canon = std::move(full);
    }
    if (!IsWithinRoot(canon)) {
        LOG_DEBUG("PathSandbox: '{}' resolves outside root ({})", input, canon.string());
        return std::nullopt;
    }
    return canon;
}

bool PathSandbox::IsWithinRoot(const fs::path& canonical) const {
    auto rootIt = root.begin();
    auto pathIt = canonical.begin();
    for (; rootIt != root.end(); ++rootIt, ++pathIt) {
        if (pathIt == canonical.end() || *pathIt != *rootIt) {
            // A trailing empty component (root ends with a separator) is not a mismatch
            if (rootIt->empty() && std::next(rootIt) == root.end()) return true;
            return false;
        }
    }
    return true;
}

bool PathSandbox::IsDenied(const fs::path& canonical) const {
    const fs::path rel = canonical.lexically_relative(root);
    for (const auto& part : rel) {
        const std::string name = part.string();
        if (std::find(security.deniedDirectories.begin(), security.deniedDirectories.end(), name) != security.deniedDirectories.end()) {
            return true;
        }
    }
    return false;
}

bool PathSandbox::IsAllowedRead(const fs::path& canonical) const {
    if (!IsWithinRoot(canonical) || IsDenied(canonical)) {
        return false;
    }
    if (!security.allowedFileNames.has_value() && !security.allowedFileSuffixes.has_value()) {
        return true;
    }
    const std::string name = canonical.filename().string();
    if (security.allowedFileNames.has_value()) {
        const auto& names = security.allowedFileNames.value();
        if (std::find(names.begin(), names.end(), name) != names.end()) {
            return true;
        }
    }
    if (security.allowedFileSuffixes.has_value()) {
        for (const auto& suffix : security.allowedFileSuffixes.value()) {
            if (name.size() >= suffix.size() && name.compare(name.size() - suffix.size(), suffix.size(), suffix) == 0) {
                return true;
            }
        }
    }
    return false;
}

std::string PathSandbox::RelativeTo(const fs::path& canonical) const {
    fs::path rel = canonical.lexically_relative(root);
    std::string s = rel.generic_string();
    return (s == ".") ? std::string() : s;
}

} // namespace toolhost

//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: PathSandbox.h
// Purpose: Canonicalizes caller-supplied paths and authorizes them against the sandbox root and the
//          configured allow/deny rules
//==========================================================================================================
#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "toolhost/config/ServerConfig.h"

namespace toolhost {

//==========================================================================================================
// PathSandbox
// Purpose: Immutable after construction; safe to share across threads without locking.
// Notes:
//   - ResolvePath resolves '..' and symbolic links before checking containment, and compares path
//     components (never string prefixes), so "/work2" is not inside "/work".
//   - IsAllowedRead is independent of containment and applies the deny/allow rules.
//==========================================================================================================
class PathSandbox {
public:
    //==========================================================================================================
    // Args:
    //   root: Sandbox root directory; canonicalized here.
    //   security: Deny/allow rules.
    // Throws:
    //   std::invalid_argument when root does not exist or is not a directory.
    //==========================================================================================================
    PathSandbox(const std::filesystem::path& root, config::SecurityConfig security = {});

    const std::filesystem::path& Root() const { return root; }

    //==========================================================================================================
    // ResolvePath
    // Purpose: Canonical absolute path for 'input' when it lies within the root.
    // Args:
    //   input: Absolute path, or path relative to the root. Empty means the root itself.
    // Returns:
    //   The canonical path, or std::nullopt when it resolves outside the root or cannot be resolved.
    //==========================================================================================================
    std::optional<std::filesystem::path> ResolvePath(const std::string& input) const;

    // True when 'canonical' is the root or lies beneath it (component-wise).
    bool IsWithinRoot(const std::filesystem::path& canonical) const;

    // True when any component below the root names a denied directory.
    bool IsDenied(const std::filesystem::path& canonical) const;

    //==========================================================================================================
    // IsAllowedRead
    // Purpose: Whether a canonical file path may be read under the deny/allow rules.
    // Returns:
    //   false when a denied directory appears in the path, or when allowlists are configured and the
    //   file name matches neither an allowed name nor an allowed suffix.
    //==========================================================================================================
    bool IsAllowedRead(const std::filesystem::path& canonical) const;

    // Root-relative generic form ("sub/file.txt"); empty for the root itself.
    std::string RelativeTo(const std::filesystem::path& canonical) const;

private:
    std::filesystem::path root;
    config::SecurityConfig security;
};

} // namespace toolhost

//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: WorkspaceResourceStrategy.h
// Purpose: workspace:// resources backed by files under the sandbox root
//==========================================================================================================
#pragma once

#include <cstddef>
#include <memory>
#include <string>

#include "toolhost/registry/ResourceRegistry.h"
#include "toolhost/sandbox/PathSandbox.h"

namespace toolhost {

//==========================================================================================================
// WorkspaceResourceStrategy
// Purpose: Lists and reads files beneath the sandbox root.
// Notes:
//   - URIs are root-relative: workspace://lib/main.dart.
//   - List walks recursively from params.directory (root-relative, default the root), skips denied
//     directories and does not follow directory symlinks. Files that fail IsAllowedRead are omitted.
//   - Read returns the byte range [start, start+length) decoded as UTF-8 (invalid bytes -> U+FFFD).
//     Whole-file reads of files larger than maxResourceBytes are rejected with InvalidParams.
//==========================================================================================================
class WorkspaceResourceStrategy : public IResourceStrategy {
public:
    WorkspaceResourceStrategy(std::shared_ptr<const PathSandbox> sandbox, std::size_t maxResourceBytes);

    std::string UriPrefix() const override;
    std::string Description() const override;

    ResourcePage List(const ListResourcesParams& params) const override;
    ResourceContent Read(const ReadResourceParams& params) const override;

private:
    std::shared_ptr<const PathSandbox> sandbox;
    std::size_t maxResourceBytes;
};

} // namespace toolhost

//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Builtins.h
// Purpose: Built-in tool and prompt definitions registered by the default server context
//==========================================================================================================
#pragma once

#include "toolhost/registry/PromptRegistry.h"
#include "toolhost/registry/ToolRegistry.h"

namespace toolhost {
namespace builtin {

// "echo": returns {message} as text and structured content. Read-only, idempotent.
ToolDefinition MakeEchoTool();

// "scaffold.page": page scaffolding instructions; 'name' required, 'stateManagement' defaults to riverpod.
PromptDefinition MakeScaffoldPagePrompt();

} // namespace builtin
} // namespace toolhost

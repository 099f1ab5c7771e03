//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ProgressReporter.h
// Purpose: Per-call notifications/progress sender handed to tool handlers
//==========================================================================================================
#pragma once

#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "toolhost/JSONRPCTypes.h"

namespace toolhost {

//==========================================================================================================
// ProgressReporter
// Purpose: Sends notifications/progress for one tool call when the request carried
//          params._meta.progressToken. A default-constructed reporter is disabled and Report() is a no-op.
// Notes:
//   - Copies share state; handlers may keep a copy on another thread.
//   - Values that do not increase are dropped.
//   - After Close() (the call reached its terminal state) nothing more is sent.
//==========================================================================================================
class ProgressReporter {
public:
    using Sink = std::function<void(const std::string& payload)>;

    ProgressReporter() = default;
    ProgressReporter(JSONValue token, Sink sink);

    bool Enabled() const { return state != nullptr; }

    //==========================================================================================================
    // Report
    // Args:
    //   progress: Work done so far; must exceed the previous value.
    //   total: Optional total, in the same unit as progress.
    //   message: Optional human-readable status; omitted when empty.
    // Returns:
    //   true when a notification was sent.
    //==========================================================================================================
    bool Report(double progress, std::optional<double> total = std::nullopt, const std::string& message = {}) const;

    void Close() const;

private:
    struct State {
        std::mutex mutex;
        JSONValue token;
        Sink sink;
        std::optional<double> last;
        bool closed = false;
    };
    std::shared_ptr<State> state;
};

// Builds the notifications/progress message body.
std::string MakeProgressNotification(const JSONValue& token, double progress,
                                     std::optional<double> total, const std::string& message);

} // namespace toolhost

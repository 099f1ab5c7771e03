//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ProgressReporter.cpp
// Purpose: notifications/progress encoding and per-call ordering
//==========================================================================================================

#include "toolhost/execution/ProgressReporter.h"

#include <stdexcept>

#include "logging/Logger.h"
#include "toolhost/Protocol.h"

namespace toolhost {

std::string MakeProgressNotification(const JSONValue& token, double progress,
                                     std::optional<double> total, const std::string& message) {
    JSONValue::Object params;
    params["progressToken"] = std::make_shared<JSONValue>(token);
    params["progress"] = std::make_shared<JSONValue>(progress);
    if (total.has_value()) {
        params["total"] = std::make_shared<JSONValue>(total.value());
    }
    if (!message.empty()) {
        params["message"] = std::make_shared<JSONValue>(message);
    }
    JSONRPCNotification n(Methods::Progress, JSONValue{std::move(params)});
    return n.Serialize();
}

ProgressReporter::ProgressReporter(JSONValue token, Sink sink) : state(std::make_shared<State>()) {
    if (!sink) {
        throw std::invalid_argument("ProgressReporter requires a sink");
    }
    state->token = std::move(token);
    state->sink = std::move(sink);
}

bool ProgressReporter::Report(double progress, std::optional<double> total, const std::string& message) const {
    if (!state) {
        return false;
    }
    // Held while sending so Close() cannot return with a notification still in flight
    std::lock_guard<std::mutex> lock(state->mutex);
    if (state->closed) {
        LOG_DEBUG("Progress {} after completion dropped", SerializeJSONValue(state->token));
        return false;
    }
    if (state->last.has_value() && progress <= state->last.value()) {
        LOG_DEBUG("Progress {} not increasing ({} after {}); dropped",
                  SerializeJSONValue(state->token), progress, state->last.value());
        return false;
    }
    state->last = progress;
    state->sink(MakeProgressNotification(state->token, progress, total, message));
    return true;
}

void ProgressReporter::Close() const {
    if (!state) {
        return;
    }
    std::lock_guard<std::mutex> lock(state->mutex);
    state->closed = true;
}

} // namespace toolhost

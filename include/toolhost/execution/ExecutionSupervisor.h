//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ExecutionSupervisor.h
// Purpose: Admission control, deadlines and cancellation for tool calls
//==========================================================================================================
#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "toolhost/JSONRPCTypes.h"
#include "toolhost/Protocol.h"
#include "toolhost/config/ServerConfig.h"
#include "toolhost/errors/Errors.h"
#include "toolhost/execution/ProgressReporter.h"
#include "toolhost/registry/ToolRegistry.h"

namespace toolhost {

class LogStore;

//==========================================================================================================
// CallOutcome
// Purpose: Terminal outcome of one accepted call: a result, or an error (Timeout, Cancelled,
//          InternalError).
//==========================================================================================================
struct CallOutcome {
    std::optional<ToolResult> result;
    std::optional<errors::McpError> error;
    std::chrono::milliseconds elapsed{0};

    bool IsError() const { return error.has_value(); }
};

// Invoked exactly once per accepted call, on whichever thread reached the terminal state first.
using CallCompletion = std::function<void(CallOutcome outcome)>;

struct SupervisorStats {
    std::size_t running = 0;
    std::size_t queued = 0;
    std::size_t inFlight = 0;
    std::size_t completed = 0;
    std::size_t timedOut = 0;
    std::size_t cancelled = 0;
    std::size_t failed = 0;
    std::size_t rejected = 0;
};

//==========================================================================================================
// SlotCounter
// Purpose: Counting limit for one admission level (global or per tool). Not synchronized; the
//          supervisor guards it with its state mutex.
//==========================================================================================================
class SlotCounter {
public:
    explicit SlotCounter(std::size_t capacity) : capacity(capacity) {}

    bool HasFree() const { return used < capacity; }
    void Acquire() { ++used; }
    void Release() { if (used > 0) --used; }
    std::size_t Used() const { return used; }
    std::size_t Capacity() const { return capacity; }

private:
    std::size_t capacity;
    std::size_t used = 0;
};

//==========================================================================================================
// SlotLease
// Purpose: Holds one global slot and optionally one per-tool slot; both are returned exactly once,
//          on Release() or destruction, whichever comes first.
//==========================================================================================================
class SlotLease {
public:
    SlotLease(SlotCounter& global, SlotCounter* tool);
    ~SlotLease();
    SlotLease(const SlotLease&) = delete;
    SlotLease& operator=(const SlotLease&) = delete;

    void Release();

private:
    SlotCounter* global;
    SlotCounter* tool;
};

//==========================================================================================================
// ExecutionSupervisor
// Purpose: Runs tool handlers under a global concurrency cap, optional per-tool caps, a deadline and
//          cooperative cancellation.
// Notes:
//   - Calls that cannot start immediately wait in a bounded FIFO queue. The queue is scanned in order
//     and any waiter whose slots are free starts.
//   - The deadline counts from acceptance. Timeout and cancellation signal the handler's stop_token
//     and resolve the call at once; a handler that ignores the signal keeps running detached.
//   - A worker waits on a handler's future only while the call is live. A result still pending when
//     the call ends is handed to its own waiter thread and discarded on arrival, so the worker is free.
//   - Deadlines run on a dedicated io_context thread; handlers run on a thread_pool.
//   - Each terminal outcome is appended to the run log under the request id.
//==========================================================================================================
class ExecutionSupervisor {
public:
    ExecutionSupervisor(const config::ServerConfig& config, std::shared_ptr<LogStore> runLog);
    ~ExecutionSupervisor();

    ExecutionSupervisor(const ExecutionSupervisor&) = delete;
    ExecutionSupervisor& operator=(const ExecutionSupervisor&) = delete;

    //==========================================================================================================
    // Submit
    // Purpose: Accepts a call for execution.
    // Args:
    //   id: Request id; must not already be in flight.
    //   tool: Registered definition (non-null).
    //   arguments: Validated tool arguments.
    //   done: Completion callback, invoked once when the call reaches a terminal state.
    //   progress: Passed to the handler; closed when the call reaches its terminal state.
    // Returns:
    //   std::nullopt when accepted. Otherwise the rejection (InvalidRequestId for an id already in
    //   flight, ServerBusy when the wait queue is full, Cancelled after Shutdown); 'done' is not called.
    //==========================================================================================================
    std::optional<errors::McpError> Submit(const JSONRPCId& id,
                                           std::shared_ptr<const ToolDefinition> tool,
                                           JSONValue arguments,
                                           CallCompletion done,
                                           ProgressReporter progress = {});

    // Signals and resolves the call with Cancelled. Returns false when 'id' is not in flight.
    bool Cancel(const JSONRPCId& id);

    //==========================================================================================================
    // Shutdown
    // Purpose: Rejects new calls, cancels every in-flight call, stops the deadline thread and waits up to
    //          the shutdown grace period for running handlers to return. Idempotent.
    //==========================================================================================================
    void Shutdown();

    // Grace period Shutdown waits for handlers that are still running (default 2s).
    void SetShutdownGrace(std::chrono::milliseconds grace);

    SupervisorStats GetStats() const;

private:
    class Impl;
    std::shared_ptr<Impl> pImpl;
};

} // namespace toolhost

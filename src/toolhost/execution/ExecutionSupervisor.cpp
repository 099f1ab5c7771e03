//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ExecutionSupervisor.cpp
// Purpose: Tool call admission, deadline timers, cancellation and first-wins completion
//==========================================================================================================

#include "toolhost/execution/ExecutionSupervisor.h"

#include <algorithm>
#include <condition_variable>
#include <deque>
#include <format>
#include <future>
#include <map>
#include <mutex>
#include <stdexcept>
#include <stop_token>
#include <thread>
#include <vector>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/thread_pool.hpp>

#include "logging/Logger.h"
#include "toolhost/builtin/LogStore.h"

namespace net = boost::asio;

namespace toolhost {

SlotLease::SlotLease(SlotCounter& g, SlotCounter* t) : global(&g), tool(t) {
    global->Acquire();
    if (tool) tool->Acquire();
}

SlotLease::~SlotLease() {
    Release();
}

void SlotLease::Release() {
    if (tool) {
        tool->Release();
        tool = nullptr;
    }
    if (global) {
        global->Release();
        global = nullptr;
    }
}

namespace {

using Clock = std::chrono::steady_clock;

constexpr std::chrono::milliseconds kResultPoll{10};

enum class CallState { Queued, Running, Done };

struct Call {
    JSONRPCId id;
    std::string key;
    std::shared_ptr<const ToolDefinition> tool;
    JSONValue arguments;
    CallCompletion done;
    ProgressReporter progress;
    std::stop_source stop;
    Clock::time_point accepted;
    Clock::time_point deadline;
    CallState state = CallState::Queued;
    std::unique_ptr<SlotLease> lease;
    std::unique_ptr<net::steady_timer> timer;
};

// "7" and 7 are different ids
std::string idKey(const JSONRPCId& id) {
    return SerializeJSONValue(IdToValue(id));
}

CallOutcome errorOutcome(int code, std::string message) {
    CallOutcome o;
    o.error = errors::makeError(code, std::move(message));
    return o;
}

const char* outcomeName(const CallOutcome& o) {
    if (!o.error.has_value()) return "completed";
    switch (o.error->category) {
        case errors::ErrorCategory::Timeout: return "timed-out";
        case errors::ErrorCategory::Cancelled: return "cancelled";
        default: return "failed";
    }
}

// Deleter for the handler pool. Workers still inside abandoned handlers hold references, so the
// last owner can be one of the pool's own threads, which cannot join itself.
void releasePool(net::thread_pool* workers) {
    if (workers->get_executor().running_in_this_thread()) {
        std::thread([workers]() {
            workers->join();
            delete workers;
        }).detach();
        return;
    }
    workers->join();
    delete workers;
}

} // namespace

class ExecutionSupervisor::Impl : public std::enable_shared_from_this<Impl> {
public:
    net::io_context ioc;
    net::executor_work_guard<net::io_context::executor_type> workGuard;
    std::thread ioThread;
    std::shared_ptr<net::thread_pool> pool;

    mutable std::mutex mutex;
    std::condition_variable handlersIdle;
    SlotCounter global;
    std::map<std::string, SlotCounter> toolSlots;
    std::deque<std::shared_ptr<Call>> waiting;
    std::map<std::string, std::shared_ptr<Call>> inFlight;
    std::size_t activeHandlers = 0;
    bool stopping = false;
    bool shutdownDone = false;
    SupervisorStats counters;

    const std::size_t maxQueued;
    const std::chrono::milliseconds defaultTimeout;
    std::chrono::milliseconds shutdownGrace{2000};
    std::shared_ptr<LogStore> runLog;

    Impl(const config::ServerConfig& cfg, std::shared_ptr<LogStore> log)
        : workGuard(net::make_work_guard(ioc)),
          pool(new net::thread_pool(cfg.EffectiveWorkerThreads()), releasePool),
          global(cfg.maxConcurrency),
          maxQueued(cfg.maxQueuedCalls),
          defaultTimeout(cfg.defaultTimeout),
          runLog(std::move(log)) {
        ioThread = std::thread([this]() {
            try {
                ioc.run();
            } catch (const std::exception& e) {
                LOG_ERROR("ExecutionSupervisor: deadline loop failed: {}", e.what());
            }
        });
        LOG_INFO("ExecutionSupervisor: maxConcurrency={} maxQueued={} workers={}",
                 cfg.maxConcurrency, cfg.maxQueuedCalls, cfg.EffectiveWorkerThreads());
    }

    ~Impl() {
        Shutdown();
    }

    ///////////////////////////////////////// Admission ///////////////////////////////////////////
    SlotCounter* toolSlotsLocked(const ToolDefinition& def) {
        if (!def.maxConcurrency.has_value()) {
            return nullptr;
        }
        auto it = toolSlots.try_emplace(def.name, def.maxConcurrency.value()).first;
        return &it->second;
    }

    bool canStartLocked(const Call& call) {
        if (!global.HasFree()) return false;
        SlotCounter* t = toolSlotsLocked(*call.tool);
        return t == nullptr || t->HasFree();
    }

    void startLocked(const std::shared_ptr<Call>& call) {
        call->lease = std::make_unique<SlotLease>(global, toolSlotsLocked(*call->tool));
        call->state = CallState::Running;
    }

    // FIFO scan: start every waiter whose slots are free.
    std::vector<std::shared_ptr<Call>> admitLocked() {
        std::vector<std::shared_ptr<Call>> started;
        if (stopping) {
            return started;
        }
        for (auto it = waiting.begin(); it != waiting.end() && global.HasFree();) {
            if (canStartLocked(**it)) {
                startLocked(*it);
                started.push_back(*it);
                it = waiting.erase(it);
            } else {
                ++it;
            }
        }
        return started;
    }

    ///////////////////////////////////////// Execution ///////////////////////////////////////////
    void armDeadline(const std::shared_ptr<Call>& call) {
        net::post(ioc, [this, call]() {
            {
                std::lock_guard<std::mutex> lock(mutex);
                if (call->state == CallState::Done) return;
            }
            call->timer->expires_at(call->deadline);
            call->timer->async_wait([this, call](const boost::system::error_code& ec) {
                if (ec) return;
                const auto budget = call->tool->timeout.value_or(defaultTimeout);
                if (finish(call, errorOutcome(JSONRPCErrorCodes::Timeout,
                                              std::format("Tool '{}' timed out after {}ms", call->tool->name, budget.count())))) {
                    LOG_WARN("Call {} ({}) timed out after {}ms", IdToString(call->id), call->tool->name, budget.count());
                }
            });
        });
    }

    void launch(const std::shared_ptr<Call>& call) {
        std::shared_ptr<net::thread_pool> workers;
        {
            std::lock_guard<std::mutex> lock(mutex);
            workers = pool;
        }
        if (!workers) {
            finish(call, errorOutcome(JSONRPCErrorCodes::Cancelled, "Server shutting down"));
            return;
        }
        auto self = shared_from_this();
        net::post(*workers, [self, call, workers]() mutable {
            self->run(call);
            // The call's timer belongs to our io_context; drop it before 'self'
            call.reset();
        });
    }

    // Waits for a handler's result while the call is live. Returns false when the call ended elsewhere
    // (timeout, cancel or shutdown all request stop) with the result still pending.
    static bool awaitResult(const std::future<ToolResult>& fut, const std::stop_token& st) {
        while (fut.wait_for(kResultPoll) == std::future_status::timeout) {
            if (st.stop_requested()) {
                return false;
            }
        }
        return true;
    }

    // Moves a pending result to a waiter thread of its own so the worker can take the next call.
    // The handler stays counted in activeHandlers until the result arrives.
    void abandon(const std::shared_ptr<Call>& call, std::future<ToolResult> fut) {
        LOG_WARN("Call {} ({}) ended before its handler; the late result will be discarded",
                 IdToString(call->id), call->tool->name);
        std::thread([self = shared_from_this(), fut = std::move(fut), id = IdToString(call->id),
                     name = call->tool->name]() mutable {
            try {
                fut.get();
                LOG_DEBUG("Call {} ({}): late result discarded", id, name);
            } catch (const std::exception& e) {
                LOG_DEBUG("Call {} ({}): late failure discarded: {}", id, name, e.what());
            } catch (...) {
                LOG_DEBUG("Call {} ({}): late non-standard failure discarded", id, name);
            }
            {
                std::lock_guard<std::mutex> lock(self->mutex);
                --self->activeHandlers;
            }
            self->handlersIdle.notify_all();
        }).detach();
    }

    void run(const std::shared_ptr<Call>& call) {
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (call->state == CallState::Done) return;
            ++activeHandlers;
        }
        LOG_DEBUG("Call {} ({}) running", IdToString(call->id), call->tool->name);
        CallOutcome outcome;
        try {
            std::future<ToolResult> fut = call->tool->handler(call->arguments, call->stop.get_token(), call->progress);
            if (!fut.valid()) {
                throw std::runtime_error("handler returned no result");
            }
            if (!awaitResult(fut, call->stop.get_token())) {
                abandon(call, std::move(fut));
                return;
            }
            outcome.result = fut.get();
        } catch (const std::exception& e) {
            outcome = errorOutcome(JSONRPCErrorCodes::InternalError,
                                   std::format("Tool '{}' failed: {}", call->tool->name, e.what()));
        } catch (...) {
            outcome = errorOutcome(JSONRPCErrorCodes::InternalError,
                                   std::format("Tool '{}' failed with a non-standard exception", call->tool->name));
        }
        {
            std::lock_guard<std::mutex> lock(mutex);
            --activeHandlers;
        }
        handlersIdle.notify_all();
        if (outcome.error.has_value()) {
            LOG_ERROR("Call {} ({}): {}", IdToString(call->id), call->tool->name, outcome.error->message);
        }
        finish(call, std::move(outcome));
    }

    //==========================================================================================================
    // finish
    // Purpose: Moves a call to its terminal state. Only the first caller wins; later outcomes for the same
    //          call are dropped and false is returned.
    //==========================================================================================================
    bool finish(const std::shared_ptr<Call>& call, CallOutcome outcome) {
        CallCompletion done;
        std::vector<std::shared_ptr<Call>> started;
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (call->state == CallState::Done) {
                return false;
            }
            if (call->state == CallState::Queued) {
                waiting.erase(std::remove(waiting.begin(), waiting.end(), call), waiting.end());
            }
            call->state = CallState::Done;
            if (call->lease) {
                call->lease->Release();
            }
            inFlight.erase(call->key);
            outcome.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - call->accepted);
            if (!outcome.error.has_value()) {
                ++counters.completed;
            } else if (outcome.error->category == errors::ErrorCategory::Timeout) {
                ++counters.timedOut;
            } else if (outcome.error->category == errors::ErrorCategory::Cancelled) {
                ++counters.cancelled;
            } else {
                ++counters.failed;
            }
            done = std::move(call->done);
            started = admitLocked();
        }
        if (outcome.error.has_value()) {
            call->stop.request_stop();
        }
        call->progress.Close();
        net::post(ioc, [call]() { call->timer->cancel(); });
        record(*call, outcome);
        for (auto& c : started) {
            launch(c);
        }
        if (done) {
            done(std::move(outcome));
        }
        return true;
    }

    void record(const Call& call, const CallOutcome& o) {
        if (!runLog) return;
        std::string line = std::format("tool={} outcome={} elapsedMs={}", call.tool->name, outcomeName(o), o.elapsed.count());
        if (o.error.has_value()) {
            line += std::format(" code={} message={}", o.error->code, o.error->message);
        }
        runLog->Append("run", IdToString(call.id), line);
    }

    ///////////////////////////////////////// Public operations ///////////////////////////////////////////
    std::optional<errors::McpError> Submit(const JSONRPCId& id, std::shared_ptr<const ToolDefinition> tool,
                                           JSONValue arguments, CallCompletion done, ProgressReporter progress) {
        FUNC_SCOPE();
        if (!tool || !tool->handler) {
            return errors::makeError(JSONRPCErrorCodes::InternalError, "Tool definition has no handler");
        }
        auto call = std::make_shared<Call>();
        call->id = id;
        call->key = idKey(id);
        call->tool = std::move(tool);
        call->arguments = std::move(arguments);
        call->done = std::move(done);
        call->progress = std::move(progress);
        call->accepted = Clock::now();
        call->deadline = call->accepted + call->tool->timeout.value_or(defaultTimeout);
        call->timer = std::make_unique<net::steady_timer>(ioc);

        bool startNow = false;
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (stopping) {
                ++counters.rejected;
                return errors::makeError(JSONRPCErrorCodes::Cancelled, "Server is shutting down");
            }
            if (inFlight.count(call->key) != 0) {
                ++counters.rejected;
                LOG_WARN("Rejecting call {}: id already in flight", IdToString(id));
                return errors::makeError(JSONRPCErrorCodes::InvalidRequestId,
                                         std::format("Request id {} is already in flight", IdToString(id)));
            }
            if (canStartLocked(*call)) {
                startLocked(call);
                startNow = true;
            } else if (waiting.size() >= maxQueued) {
                ++counters.rejected;
                LOG_WARN("Rejecting call {} ({}): {} call(s) already waiting", IdToString(id), call->tool->name, waiting.size());
                return errors::makeError(JSONRPCErrorCodes::ServerBusy,
                                         std::format("Server busy: {} call(s) already waiting", waiting.size()));
            } else {
                waiting.push_back(call);
                LOG_DEBUG("Call {} ({}) queued at position {}", IdToString(id), call->tool->name, waiting.size());
            }
            inFlight.emplace(call->key, call);
        }
        armDeadline(call);
        if (startNow) {
            launch(call);
        }
        return std::nullopt;
    }

    bool Cancel(const JSONRPCId& id) {
        std::shared_ptr<Call> call;
        {
            std::lock_guard<std::mutex> lock(mutex);
            auto it = inFlight.find(idKey(id));
            if (it == inFlight.end()) {
                return false;
            }
            call = it->second;
        }
        if (!finish(call, errorOutcome(JSONRPCErrorCodes::Cancelled, "Request cancelled"))) {
            return false;
        }
        LOG_INFO("Call {} ({}) cancelled", IdToString(id), call->tool->name);
        return true;
    }

    void Shutdown() {
        std::vector<std::shared_ptr<Call>> calls;
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (shutdownDone) return;
            shutdownDone = true;
            stopping = true;
            for (auto& [key, call] : inFlight) {
                calls.push_back(call);
            }
        }
        if (!calls.empty()) {
            LOG_INFO("ExecutionSupervisor: cancelling {} in-flight call(s)", calls.size());
        }
        for (auto& call : calls) {
            finish(call, errorOutcome(JSONRPCErrorCodes::Cancelled, "Server shutting down"));
        }

        workGuard.reset();
        if (ioThread.joinable()) {
            if (ioThread.get_id() == std::this_thread::get_id()) {
                ioc.stop();
                ioThread.detach();
            } else {
                ioThread.join();
            }
        }

        std::unique_lock<std::mutex> lock(mutex);
        const bool idle = handlersIdle.wait_for(lock, shutdownGrace, [this]() { return activeHandlers == 0; });
        const std::size_t stuck = activeHandlers;
        std::shared_ptr<net::thread_pool> workers = std::move(pool);
        lock.unlock();
        if (!workers) return;
        if (idle) {
            workers->join();
        } else {
            // Tasks still inside those handlers keep the pool alive; the last one releases it
            LOG_WARN("ExecutionSupervisor: {} handler(s) ignored cancellation; leaving them running", stuck);
        }
    }

    SupervisorStats GetStats() const {
        std::lock_guard<std::mutex> lock(mutex);
        SupervisorStats s = counters;
        s.running = global.Used();
        s.queued = waiting.size();
        s.inFlight = inFlight.size();
        return s;
    }
};

ExecutionSupervisor::ExecutionSupervisor(const config::ServerConfig& config, std::shared_ptr<LogStore> runLog)
    : pImpl(std::make_shared<Impl>(config, std::move(runLog))) {}

ExecutionSupervisor::~ExecutionSupervisor() {
    pImpl->Shutdown();
}

std::optional<errors::McpError> ExecutionSupervisor::Submit(const JSONRPCId& id,
                                                            std::shared_ptr<const ToolDefinition> tool,
                                                            JSONValue arguments,
                                                            CallCompletion done,
                                                            ProgressReporter progress) {
    return pImpl->Submit(id, std::move(tool), std::move(arguments), std::move(done), std::move(progress));
}

bool ExecutionSupervisor::Cancel(const JSONRPCId& id) {
    return pImpl->Cancel(id);
}

void ExecutionSupervisor::Shutdown() {
    pImpl->Shutdown();
}

void ExecutionSupervisor::SetShutdownGrace(std::chrono::milliseconds grace) {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    pImpl->shutdownGrace = grace;
}

SupervisorStats ExecutionSupervisor::GetStats() const {
    return pImpl->GetStats();
}

} // namespace toolhost

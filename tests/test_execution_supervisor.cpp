//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_execution_supervisor.cpp
// Purpose: Concurrency caps, queueing, deadlines, cancellation and shutdown of tool calls
//==========================================================================================================

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <future>
#include <map>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "toolhost/builtin/LogStore.h"
#include "toolhost/execution/ExecutionSupervisor.h"

using namespace toolhost;
using namespace std::chrono_literals;

namespace {

std::future<ToolResult> ready(ToolResult r) {
    std::promise<ToolResult> p;
    p.set_value(std::move(r));
    return p.get_future();
}

// Collects completion outcomes keyed by id.
class Outcomes {
public:
    CallCompletion For(const std::string& id) {
        return [this, id](CallOutcome o) {
            std::lock_guard<std::mutex> lock(mutex);
            calls[id]++;
            outcomes[id] = std::move(o);
            cv.notify_all();
        };
    }
    std::optional<CallOutcome> Wait(const std::string& id, std::chrono::milliseconds timeout = 5s) {
        std::unique_lock<std::mutex> lock(mutex);
        if (!cv.wait_for(lock, timeout, [&]() { return outcomes.count(id) != 0; })) return std::nullopt;
        return outcomes.at(id);
    }
    bool Has(const std::string& id) {
        std::lock_guard<std::mutex> lock(mutex);
        return outcomes.count(id) != 0;
    }
    int Calls(const std::string& id) {
        std::lock_guard<std::mutex> lock(mutex);
        return calls[id];
    }
private:
    std::mutex mutex;
    std::condition_variable cv;
    std::map<std::string, CallOutcome> outcomes;
    std::map<std::string, int> calls;
};

// Gate that blocking handlers wait on; also opens when the handler's stop_token fires.
class Gate {
public:
    void Open() {
        { std::lock_guard<std::mutex> lock(mutex); open = true; }
        cv.notify_all();
    }
    void Wait(std::stop_token st) {
        std::unique_lock<std::mutex> lock(mutex);
        while (!open && !st.stop_requested()) {
            cv.wait_for(lock, 5ms);
        }
    }
private:
    std::mutex mutex;
    std::condition_variable cv;
    bool open = false;
};

// Tracks the highest number of simultaneously running handlers.
struct Peak {
    std::atomic<int> now{0};
    std::atomic<int> max{0};
    void Enter() {
        int n = ++now;
        int m = max.load();
        while (n > m && !max.compare_exchange_weak(m, n)) {}
    }
    void Leave() { --now; }
};

config::ServerConfig makeConfig(std::size_t maxConcurrency, std::size_t maxQueued) {
    config::ServerConfig cfg;
    cfg.maxConcurrency = maxConcurrency;
    cfg.maxQueuedCalls = maxQueued;
    cfg.defaultTimeout = 10s;
    return cfg;
}

std::shared_ptr<const ToolDefinition> makeTool(const std::string& name, ToolHandler handler,
                                               std::optional<std::chrono::milliseconds> timeout = std::nullopt,
                                               std::optional<std::size_t> cap = std::nullopt) {
    ToolDefinition def;
    def.name = name;
    def.inputSchema = JSONValue{JSONValue::Object{}};
    def.handler = std::move(handler);
    def.timeout = timeout;
    def.maxConcurrency = cap;
    return std::make_shared<const ToolDefinition>(std::move(def));
}

JSONRPCId id(int64_t n) { return JSONRPCId{n}; }

ToolHandler gated(Gate& gate, std::atomic<bool>* sawStop = nullptr) {
    return [&gate, sawStop](const JSONValue&, std::stop_token st, ProgressReporter) {
        gate.Wait(st);
        if (sawStop && st.stop_requested()) *sawStop = true;
        return ready(MakeTextResult("released"));
    };
}

} // namespace

TEST(ExecutionSupervisor, CompletesAndRecordsRunLog) {
    auto logs = std::make_shared<LogStore>();
    Outcomes out;
    ExecutionSupervisor sup(makeConfig(2, 4), logs);
    auto tool = makeTool("quick", [](const JSONValue&, std::stop_token, ProgressReporter) { return ready(MakeTextResult("done")); });

    ASSERT_FALSE(sup.Submit(id(1), tool, JSONValue{JSONValue::Object{}}, out.For("1")).has_value());
    auto o = out.Wait("1");
    ASSERT_TRUE(o.has_value());
    ASSERT_FALSE(o->IsError());
    EXPECT_EQ(std::get<std::string>(FindMember(o->result->content[0], "text")->value), "done");

    auto snap = logs->Get("run/1");
    ASSERT_TRUE(snap.has_value());
    ASSERT_EQ(snap->entries.size(), 1u);
    EXPECT_NE(snap->entries[0].find("tool=quick outcome=completed"), std::string::npos);
    EXPECT_EQ(sup.GetStats().completed, 1u);
    EXPECT_EQ(sup.GetStats().inFlight, 0u);
}

TEST(ExecutionSupervisor, GlobalCapHoldsUnderBurst) {
    Outcomes out;
    Peak peak;
    ExecutionSupervisor sup(makeConfig(2, 16), nullptr);
    auto tool = makeTool("work", [&peak](const JSONValue&, std::stop_token, ProgressReporter) {
        peak.Enter();
        std::this_thread::sleep_for(30ms);
        peak.Leave();
        return ready(MakeTextResult("ok"));
    });
    for (int64_t i = 0; i < 8; ++i) {
        ASSERT_FALSE(sup.Submit(id(i), tool, JSONValue{JSONValue::Object{}}, out.For(std::to_string(i))).has_value());
    }
    for (int i = 0; i < 8; ++i) {
        auto o = out.Wait(std::to_string(i));
        ASSERT_TRUE(o.has_value());
        EXPECT_FALSE(o->IsError());
    }
    EXPECT_LE(peak.max.load(), 2);
    EXPECT_GE(peak.max.load(), 1);
    EXPECT_EQ(sup.GetStats().completed, 8u);
    EXPECT_EQ(sup.GetStats().running, 0u);
}

TEST(ExecutionSupervisor, PerToolCapDoesNotBlockOtherTools) {
    Outcomes out;
    Gate gate;
    Peak peak;
    ExecutionSupervisor sup(makeConfig(3, 8), nullptr);
    auto capped = makeTool("capped", [&](const JSONValue&, std::stop_token st, ProgressReporter) {
        peak.Enter();
        gate.Wait(st);
        peak.Leave();
        return ready(MakeTextResult("capped"));
    }, std::nullopt, 1);
    auto other = makeTool("free", [](const JSONValue&, std::stop_token, ProgressReporter) { return ready(MakeTextResult("free")); });

    ASSERT_FALSE(sup.Submit(id(1), capped, JSONValue{JSONValue::Object{}}, out.For("1")).has_value());
    ASSERT_FALSE(sup.Submit(id(2), capped, JSONValue{JSONValue::Object{}}, out.For("2")).has_value());
    ASSERT_FALSE(sup.Submit(id(3), other, JSONValue{JSONValue::Object{}}, out.For("3")).has_value());

    // The queued capped call does not hold back the other tool
    ASSERT_TRUE(out.Wait("3").has_value());
    EXPECT_FALSE(out.Has("1"));
    EXPECT_FALSE(out.Has("2"));
    EXPECT_EQ(sup.GetStats().queued, 1u);

    gate.Open();
    ASSERT_TRUE(out.Wait("1").has_value());
    ASSERT_TRUE(out.Wait("2").has_value());
    EXPECT_EQ(peak.max.load(), 1);
}

TEST(ExecutionSupervisor, FullQueueRejectsWithServerBusy) {
    Outcomes out;
    Gate gate;
    ExecutionSupervisor sup(makeConfig(1, 1), nullptr);
    auto tool = makeTool("block", gated(gate));

    ASSERT_FALSE(sup.Submit(id(1), tool, JSONValue{JSONValue::Object{}}, out.For("1")).has_value());
    ASSERT_FALSE(sup.Submit(id(2), tool, JSONValue{JSONValue::Object{}}, out.For("2")).has_value());
    auto rejected = sup.Submit(id(3), tool, JSONValue{JSONValue::Object{}}, out.For("3"));
    ASSERT_TRUE(rejected.has_value());
    EXPECT_EQ(rejected->code, JSONRPCErrorCodes::ServerBusy);
    EXPECT_EQ(sup.GetStats().rejected, 1u);

    gate.Open();
    ASSERT_TRUE(out.Wait("1").has_value());
    ASSERT_TRUE(out.Wait("2").has_value());
    EXPECT_FALSE(out.Has("3"));
}

TEST(ExecutionSupervisor, DuplicateInFlightIdIsRejected) {
    Outcomes out;
    Gate gate;
    ExecutionSupervisor sup(makeConfig(2, 4), nullptr);
    auto tool = makeTool("block", gated(gate));

    ASSERT_FALSE(sup.Submit(id(7), tool, JSONValue{JSONValue::Object{}}, out.For("7")).has_value());
    auto dup = sup.Submit(id(7), tool, JSONValue{JSONValue::Object{}}, out.For("dup"));
    ASSERT_TRUE(dup.has_value());
    EXPECT_EQ(dup->code, JSONRPCErrorCodes::InvalidRequestId);

    // The string "7" is a different id
    ASSERT_FALSE(sup.Submit(JSONRPCId{std::string("7")}, tool, JSONValue{JSONValue::Object{}}, out.For("s7")).has_value());

    gate.Open();
    ASSERT_TRUE(out.Wait("7").has_value());
    ASSERT_TRUE(out.Wait("s7").has_value());
    // Once finished the id may be reused
    EXPECT_FALSE(sup.Submit(id(7), tool, JSONValue{JSONValue::Object{}}, out.For("again")).has_value());
    ASSERT_TRUE(out.Wait("again").has_value());
}

TEST(ExecutionSupervisor, DeadlineResolvesWithTimeoutAndSignalsHandler) {
    auto logs = std::make_shared<LogStore>();
    Outcomes out;
    Gate never;
    std::atomic<bool> sawStop{false};
    ExecutionSupervisor sup(makeConfig(2, 4), logs);
    auto tool = makeTool("slow", gated(never, &sawStop), 50ms);

    ASSERT_FALSE(sup.Submit(id(1), tool, JSONValue{JSONValue::Object{}}, out.For("1")).has_value());
    auto o = out.Wait("1");
    ASSERT_TRUE(o.has_value());
    ASSERT_TRUE(o->IsError());
    EXPECT_EQ(o->error->code, JSONRPCErrorCodes::Timeout);
    EXPECT_EQ(o->error->message, "Tool 'slow' timed out after 50ms");
    EXPECT_GE(o->elapsed.count(), 45);

    // The handler observes the stop request; its late result is dropped
    for (int i = 0; i < 200 && !sawStop.load(); ++i) std::this_thread::sleep_for(5ms);
    EXPECT_TRUE(sawStop.load());
    std::this_thread::sleep_for(20ms);
    EXPECT_EQ(out.Calls("1"), 1);
    EXPECT_EQ(sup.GetStats().timedOut, 1u);
    EXPECT_EQ(sup.GetStats().running, 0u);

    auto snap = logs->Get("run/1");
    ASSERT_TRUE(snap.has_value());
    EXPECT_NE(snap->entries.back().find("outcome=timed-out"), std::string::npos);
}

TEST(ExecutionSupervisor, QueuedCallTimesOutWithoutRunning) {
    Outcomes out;
    Gate gate;
    std::atomic<bool> queuedRan{false};
    ExecutionSupervisor sup(makeConfig(1, 4), nullptr);
    auto blocker = makeTool("block", gated(gate));
    auto quick = makeTool("quick", [&queuedRan](const JSONValue&, std::stop_token, ProgressReporter) {
        queuedRan = true;
        return ready(MakeTextResult("ran"));
    }, 40ms);

    ASSERT_FALSE(sup.Submit(id(1), blocker, JSONValue{JSONValue::Object{}}, out.For("1")).has_value());
    ASSERT_FALSE(sup.Submit(id(2), quick, JSONValue{JSONValue::Object{}}, out.For("2")).has_value());
    auto o = out.Wait("2");
    ASSERT_TRUE(o.has_value());
    EXPECT_EQ(o->error->code, JSONRPCErrorCodes::Timeout);
    EXPECT_EQ(sup.GetStats().queued, 0u);

    gate.Open();
    ASSERT_TRUE(out.Wait("1").has_value());
    EXPECT_FALSE(queuedRan.load());
}

TEST(ExecutionSupervisor, CancelResolvesImmediatelyAndFreesSlot) {
    Outcomes out;
    Gate never;
    Gate later;
    std::atomic<bool> sawStop{false};
    ExecutionSupervisor sup(makeConfig(1, 4), nullptr);
    auto stuck = makeTool("stuck", gated(never, &sawStop));
    auto next = makeTool("next", gated(later));

    ASSERT_FALSE(sup.Submit(id(1), stuck, JSONValue{JSONValue::Object{}}, out.For("1")).has_value());
    ASSERT_FALSE(sup.Submit(id(2), next, JSONValue{JSONValue::Object{}}, out.For("2")).has_value());
    EXPECT_TRUE(sup.Cancel(id(1)));

    auto o = out.Wait("1");
    ASSERT_TRUE(o.has_value());
    EXPECT_EQ(o->error->code, JSONRPCErrorCodes::Cancelled);
    EXPECT_FALSE(sup.Cancel(id(1)));

    // The released slot admitted the queued call
    for (int i = 0; i < 200 && sup.GetStats().queued != 0; ++i) std::this_thread::sleep_for(5ms);
    EXPECT_EQ(sup.GetStats().queued, 0u);
    later.Open();
    ASSERT_TRUE(out.Wait("2").has_value());
    EXPECT_FALSE(out.Wait("2")->IsError());
    for (int i = 0; i < 200 && !sawStop.load(); ++i) std::this_thread::sleep_for(5ms);
    EXPECT_TRUE(sawStop.load());
    EXPECT_EQ(out.Calls("1"), 1);
}

TEST(ExecutionSupervisor, CancelQueuedCall) {
    Outcomes out;
    Gate gate;
    std::atomic<bool> queuedRan{false};
    ExecutionSupervisor sup(makeConfig(1, 4), nullptr);
    auto blocker = makeTool("block", gated(gate));
    auto other = makeTool("other", [&queuedRan](const JSONValue&, std::stop_token, ProgressReporter) {
        queuedRan = true;
        return ready(MakeTextResult("ran"));
    });
    ASSERT_FALSE(sup.Submit(id(1), blocker, JSONValue{JSONValue::Object{}}, out.For("1")).has_value());
    ASSERT_FALSE(sup.Submit(id(2), other, JSONValue{JSONValue::Object{}}, out.For("2")).has_value());
    EXPECT_TRUE(sup.Cancel(id(2)));
    EXPECT_EQ(out.Wait("2")->error->code, JSONRPCErrorCodes::Cancelled);
    gate.Open();
    ASSERT_TRUE(out.Wait("1").has_value());
    EXPECT_FALSE(queuedRan.load());
}

TEST(ExecutionSupervisor, CancelAfterCompletionIsNoOp) {
    Outcomes out;
    ExecutionSupervisor sup(makeConfig(2, 4), nullptr);
    auto tool = makeTool("quick", [](const JSONValue&, std::stop_token, ProgressReporter) { return ready(MakeTextResult("x")); });
    ASSERT_FALSE(sup.Submit(id(1), tool, JSONValue{JSONValue::Object{}}, out.For("1")).has_value());
    ASSERT_TRUE(out.Wait("1").has_value());
    EXPECT_FALSE(sup.Cancel(id(1)));
    EXPECT_FALSE(sup.Cancel(id(99)));
    EXPECT_EQ(out.Calls("1"), 1);
    EXPECT_FALSE(out.Wait("1")->IsError());
}

TEST(ExecutionSupervisor, HandlerExceptionsBecomeInternalError) {
    Outcomes out;
    ExecutionSupervisor sup(makeConfig(2, 4), nullptr);
    auto throwing = makeTool("throws", [](const JSONValue&, std::stop_token, ProgressReporter) -> std::future<ToolResult> {
        throw std::runtime_error("boom");
    });
    auto storing = makeTool("stores", [](const JSONValue&, std::stop_token, ProgressReporter) {
        return std::async(std::launch::async, []() -> ToolResult { throw std::logic_error("late boom"); });
    });
    ASSERT_FALSE(sup.Submit(id(1), throwing, JSONValue{JSONValue::Object{}}, out.For("1")).has_value());
    ASSERT_FALSE(sup.Submit(id(2), storing, JSONValue{JSONValue::Object{}}, out.For("2")).has_value());

    auto a = out.Wait("1");
    ASSERT_TRUE(a.has_value());
    EXPECT_EQ(a->error->code, JSONRPCErrorCodes::InternalError);
    EXPECT_NE(a->error->message.find("boom"), std::string::npos);
    auto b = out.Wait("2");
    ASSERT_TRUE(b.has_value());
    EXPECT_EQ(b->error->code, JSONRPCErrorCodes::InternalError);
    EXPECT_EQ(sup.GetStats().failed, 2u);
    EXPECT_EQ(sup.GetStats().running, 0u);
}

TEST(ExecutionSupervisor, ShutdownCancelsInFlightAndRejectsNewCalls) {
    Outcomes out;
    Gate never;
    ExecutionSupervisor sup(makeConfig(1, 4), nullptr);
    auto tool = makeTool("stuck", gated(never));
    ASSERT_FALSE(sup.Submit(id(1), tool, JSONValue{JSONValue::Object{}}, out.For("1")).has_value());
    ASSERT_FALSE(sup.Submit(id(2), tool, JSONValue{JSONValue::Object{}}, out.For("2")).has_value());

    sup.Shutdown();
    EXPECT_EQ(out.Wait("1", 0ms)->error->code, JSONRPCErrorCodes::Cancelled);
    EXPECT_EQ(out.Wait("2", 0ms)->error->code, JSONRPCErrorCodes::Cancelled);

    auto late = sup.Submit(id(3), tool, JSONValue{JSONValue::Object{}}, out.For("3"));
    ASSERT_TRUE(late.has_value());
    EXPECT_EQ(late->code, JSONRPCErrorCodes::Cancelled);
    sup.Shutdown();
}

TEST(ExecutionSupervisor, ShutdownLeavesUncooperativeHandlerBehind) {
    Outcomes out;
    std::atomic<bool> finished{false};
    {
        ExecutionSupervisor sup(makeConfig(1, 4), nullptr);
        sup.SetShutdownGrace(20ms);
        auto stubborn = makeTool("stubborn", [&finished](const JSONValue&, std::stop_token, ProgressReporter) {
            std::this_thread::sleep_for(200ms);
            finished = true;
            return ready(MakeTextResult("late"));
        });
        ASSERT_FALSE(sup.Submit(id(1), stubborn, JSONValue{JSONValue::Object{}}, out.For("1")).has_value());
        std::this_thread::sleep_for(20ms);
        const auto before = std::chrono::steady_clock::now();
        sup.Shutdown();
        EXPECT_LT(std::chrono::steady_clock::now() - before, 150ms);
    }
    EXPECT_EQ(out.Wait("1", 0ms)->error->code, JSONRPCErrorCodes::Cancelled);
    for (int i = 0; i < 100 && !finished.load(); ++i) std::this_thread::sleep_for(5ms);
    EXPECT_TRUE(finished.load());
    EXPECT_EQ(out.Calls("1"), 1);
}

TEST(ExecutionSupervisor, HungHandlersDoNotHoldWorkers) {
    Outcomes out;
    std::mutex pendingMutex;
    std::vector<std::promise<ToolResult>> pending;
    ExecutionSupervisor sup(makeConfig(1, 4), nullptr);
    auto hang = makeTool("hang", [&pendingMutex, &pending](const JSONValue&, std::stop_token, ProgressReporter) {
        std::lock_guard<std::mutex> lock(pendingMutex);
        pending.emplace_back();
        return pending.back().get_future();
    }, 30ms);
    auto fast = makeTool("fast", [](const JSONValue&, std::stop_token, ProgressReporter) {
        return ready(MakeTextResult("done"));
    });

    // Two workers by default; each hung call would otherwise keep one
    ASSERT_FALSE(sup.Submit(id(1), hang, JSONValue{JSONValue::Object{}}, out.For("1")).has_value());
    ASSERT_EQ(out.Wait("1")->error->code, JSONRPCErrorCodes::Timeout);
    ASSERT_FALSE(sup.Submit(id(2), hang, JSONValue{JSONValue::Object{}}, out.For("2")).has_value());
    ASSERT_EQ(out.Wait("2")->error->code, JSONRPCErrorCodes::Timeout);
    ASSERT_FALSE(sup.Submit(id(3), hang, JSONValue{JSONValue::Object{}}, out.For("3")).has_value());
    ASSERT_TRUE(sup.Cancel(id(3)));

    ASSERT_FALSE(sup.Submit(id(4), fast, JSONValue{JSONValue::Object{}}, out.For("4")).has_value());
    auto o = out.Wait("4", 2s);
    ASSERT_TRUE(o.has_value());
    EXPECT_FALSE(o->IsError());
    EXPECT_EQ(sup.GetStats().completed, 1u);

    // Late results are dropped
    {
        std::lock_guard<std::mutex> lock(pendingMutex);
        for (auto& p : pending) p.set_value(MakeTextResult("late"));
    }
    std::this_thread::sleep_for(50ms);
    EXPECT_EQ(out.Calls("1"), 1);
    EXPECT_EQ(out.Calls("2"), 1);
    EXPECT_EQ(out.Calls("3"), 1);
    EXPECT_EQ(sup.GetStats().completed, 1u);
}

TEST(ExecutionSupervisor, ShutdownWaitsForAbandonedResultsWithinGrace) {
    Outcomes out;
    std::promise<ToolResult> gate;
    std::future<ToolResult> gateFuture = gate.get_future();
    ExecutionSupervisor sup(makeConfig(1, 4), nullptr);
    sup.SetShutdownGrace(2s);
    auto hang = makeTool("hang", [&gateFuture](const JSONValue&, std::stop_token, ProgressReporter) {
        return std::move(gateFuture);
    }, 100ms);
    ASSERT_FALSE(sup.Submit(id(1), hang, JSONValue{JSONValue::Object{}}, out.For("1")).has_value());
    ASSERT_EQ(out.Wait("1")->error->code, JSONRPCErrorCodes::Timeout);

    std::thread release([&gate]() {
        std::this_thread::sleep_for(50ms);
        gate.set_value(MakeTextResult("late"));
    });
    const auto before = std::chrono::steady_clock::now();
    sup.Shutdown();
    const auto waited = std::chrono::steady_clock::now() - before;
    release.join();
    EXPECT_GE(waited, 30ms);
    EXPECT_LT(waited, 1500ms);
    EXPECT_EQ(out.Calls("1"), 1);
}

TEST(SlotLease, ReleasesExactlyOnce) {
    SlotCounter global(2);
    SlotCounter tool(1);
    {
        SlotLease lease(global, &tool);
        EXPECT_EQ(global.Used(), 1u);
        EXPECT_FALSE(tool.HasFree());
        lease.Release();
        lease.Release();
        EXPECT_EQ(global.Used(), 0u);
        EXPECT_TRUE(tool.HasFree());
    }
    EXPECT_EQ(global.Used(), 0u);
    {
        SlotLease lease(global, nullptr);
        EXPECT_EQ(global.Used(), 1u);
    }
    EXPECT_EQ(global.Used(), 0u);
}

TEST(ProgressReporter, DisabledReporterSendsNothing) {
    ProgressReporter progress;
    EXPECT_FALSE(progress.Enabled());
    EXPECT_FALSE(progress.Report(50, 100.0, "half"));
    progress.Close();
}

TEST(ProgressReporter, SendsIncreasingValuesUntilClosed) {
    std::vector<std::string> sent;
    ProgressReporter progress(JSONValue{std::string("abc")}, [&sent](const std::string& p) { sent.push_back(p); });
    ProgressReporter copy = progress;
    EXPECT_TRUE(progress.Enabled());

    EXPECT_TRUE(progress.Report(1));
    EXPECT_FALSE(copy.Report(0.5));
    EXPECT_TRUE(copy.Report(2, 4.0, "half"));
    progress.Close();
    EXPECT_FALSE(copy.Report(3));

    ASSERT_EQ(sent.size(), 2u);
    EXPECT_EQ(sent[0], R"({"jsonrpc":"2.0","method":"notifications/progress","params":{"progress":1,"progressToken":"abc"}})");
    EXPECT_EQ(sent[1], MakeProgressNotification(JSONValue{std::string("abc")}, 2, 4.0, "half"));
}

TEST(ExecutionSupervisor, ProgressStopsAtTerminalOutcome) {
    Outcomes out;
    std::mutex sentMutex;
    std::vector<std::string> sent;
    std::promise<ProgressReporter> handed;
    auto handedFuture = handed.get_future();
    ExecutionSupervisor sup(makeConfig(1, 4), nullptr);
    auto tool = makeTool("report", [&handed](const JSONValue&, std::stop_token, ProgressReporter progress) {
        progress.Report(1, std::nullopt, "started");
        handed.set_value(progress);
        return ready(MakeTextResult("ok"));
    });
    ProgressReporter progress(JSONValue{int64_t{9}}, [&sentMutex, &sent](const std::string& p) {
        std::lock_guard<std::mutex> lock(sentMutex);
        sent.push_back(p);
    });

    ASSERT_FALSE(sup.Submit(id(1), tool, JSONValue{JSONValue::Object{}}, out.For("1"), progress).has_value());
    ASSERT_TRUE(out.Wait("1").has_value());
    ProgressReporter kept = handedFuture.get();
    EXPECT_FALSE(kept.Report(2));

    std::lock_guard<std::mutex> lock(sentMutex);
    ASSERT_EQ(sent.size(), 1u);
    EXPECT_NE(sent[0].find(R"("progressToken":9)"), std::string::npos);
    EXPECT_NE(sent[0].find(R"("message":"started")"), std::string::npos);
}

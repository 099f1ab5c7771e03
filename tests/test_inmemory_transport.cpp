//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_inmemory_transport.cpp
// Purpose: InMemoryTransport basic tests
//==========================================================================================================

#include <gtest/gtest.h>
#include "toolhost/InMemoryTransport.hpp"
#include <chrono>
#include <condition_variable>
#include <future>
#include <mutex>
#include <string>
#include <vector>

using namespace toolhost;

TEST(InMemoryTransport, DeliversInOrder) {
    auto pair = InMemoryTransport::CreatePair();
    auto left = std::move(pair.first);
    auto right = std::move(pair.second);

    std::mutex m;
    std::condition_variable cv;
    std::vector<std::string> got;
    right->SetMessageHandler([&](const std::string& payload) {
        std::lock_guard<std::mutex> lk(m);
        got.push_back(payload);
        cv.notify_all();
    });

    left->Start().get();
    right->Start().get();
    for (int i = 0; i < 50; ++i) {
        ASSERT_TRUE(left->SendMessage(std::to_string(i)));
    }
    {
        std::unique_lock<std::mutex> lk(m);
        ASSERT_TRUE(cv.wait_for(lk, std::chrono::seconds(2), [&]() { return got.size() == 50; }));
    }
    for (int i = 0; i < 50; ++i) {
        EXPECT_EQ(got[i], std::to_string(i));
    }
    left->Close().get();
    right->Close().get();
}

TEST(InMemoryTransport, SendFailsWhenPeerNotStarted) {
    auto pair = InMemoryTransport::CreatePair();
    pair.first->Start().get();
    EXPECT_FALSE(pair.first->SendMessage("{}"));
    pair.first->Close().get();
}

TEST(InMemoryTransport, SendFailsAfterClose) {
    auto pair = InMemoryTransport::CreatePair();
    pair.first->Start().get();
    pair.second->Start().get();
    pair.first->Close().get();
    EXPECT_FALSE(pair.first->IsConnected());
    EXPECT_FALSE(pair.first->SendMessage("{}"));
    pair.second->Close().get();
}

TEST(InMemoryTransport, CloseReportsPeerClosedAfterPendingMessages) {
    auto pair = InMemoryTransport::CreatePair();
    auto left = std::move(pair.first);
    auto right = std::move(pair.second);

    std::mutex m;
    std::vector<std::string> events;
    std::promise<void> closed;
    right->SetMessageHandler([&](const std::string& payload) {
        std::lock_guard<std::mutex> lk(m);
        events.push_back(payload);
    });
    right->SetErrorHandler([&](const std::string& err) {
        {
            std::lock_guard<std::mutex> lk(m);
            events.push_back("error:" + err);
        }
        closed.set_value();
    });

    left->Start().get();
    right->Start().get();
    ASSERT_TRUE(left->SendMessage("a"));
    ASSERT_TRUE(left->SendMessage("b"));
    left->Close().get();

    auto fut = closed.get_future();
    ASSERT_EQ(fut.wait_for(std::chrono::seconds(2)), std::future_status::ready);
    std::lock_guard<std::mutex> lk(m);
    ASSERT_EQ(events.size(), 3u);
    EXPECT_EQ(events[0], "a");
    EXPECT_EQ(events[1], "b");
    EXPECT_EQ(events[2], "error:InMemoryTransport: peer closed");
    right->Close().get();
}

TEST(InMemoryTransport, SessionIdsArePrefixed) {
    auto pair = InMemoryTransport::CreatePair();
    EXPECT_EQ(pair.first->GetSessionId().rfind("memory-", 0), 0u);
}

//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: InMemoryTransport.cpp
// Purpose: In-memory transport implementation
//==========================================================================================================

#include <atomic>
#include <condition_variable>
#include <future>
#include <mutex>
#include <optional>
#include <queue>
#include <random>
#include <stop_token>
#include <string>
#include <thread>

#include "logging/Logger.h"
#include "toolhost/InMemoryTransport.hpp"

namespace toolhost {

namespace {
// Shared by both ends of a pair so either side can outlive the other.
struct PairLink {
    std::mutex mutex;
    InMemoryTransport* ends[2]{nullptr, nullptr};
};
} // namespace

class InMemoryTransport::Impl {
public:
    std::atomic<bool> connected{false};
    std::string sessionId;
    ITransport::MessageHandler messageHandler;
    ITransport::ErrorHandler errorHandler;
    std::shared_ptr<PairLink> link;
    int side{0};
    // nullopt marks "peer closed"
    std::queue<std::optional<std::string>> messageQueue;
    std::mutex queueMutex;
    std::condition_variable queueCondition;
    std::jthread processingThread;

    Impl() {
        std::random_device rd;
        std::mt19937 gen(rd());
        std::uniform_int_distribution<> dis(1000, 9999);
        sessionId = "memory-" + std::to_string(dis(gen));
    }

    ~Impl() {
        connected = false;
        if (processingThread.joinable()) {
            processingThread.request_stop();
            queueCondition.notify_all();
            processingThread.join();
        }
    }

    void startProcessing() {
        processingThread = std::jthread([this](std::stop_token st) {
            while (!st.stop_requested()) {
                std::unique_lock<std::mutex> lock(queueMutex);
                queueCondition.wait(lock, [this, &st]() { return !messageQueue.empty() || !connected || st.stop_requested(); });
                if (st.stop_requested() || !connected) {
                    break;
                }
                while (!messageQueue.empty() && connected) {
                    std::optional<std::string> message = std::move(messageQueue.front());
                    messageQueue.pop();
                    lock.unlock();
                    if (message.has_value()) {
                        LOG_DEBUG("Processing in-memory message ({} bytes)", message->size());
                        if (messageHandler) {
                            messageHandler(*message);
                        }
                    } else {
                        LOG_INFO("InMemoryTransport: peer closed");
                        if (errorHandler) {
                            errorHandler("InMemoryTransport: peer closed");
                        }
                    }
                    lock.lock();
                }
            }
        });
    }

    void enqueue(std::optional<std::string> message) {
        {
            std::lock_guard<std::mutex> lock(queueMutex);
            messageQueue.push(std::move(message));
        }
        queueCondition.notify_one();
    }

    bool sendToPeer(std::optional<std::string> message) {
        if (!link) {
            return false;
        }
        std::lock_guard<std::mutex> lock(link->mutex);
        InMemoryTransport* peer = link->ends[1 - side];
        if (!peer || !peer->pImpl->connected.load()) {
            LOG_WARN("InMemoryTransport: peer not connected; dropping message");
            return false;
        }
        peer->pImpl->enqueue(std::move(message));
        return true;
    }
};

InMemoryTransport::InMemoryTransport() : pImpl(std::make_unique<Impl>()) { FUNC_SCOPE(); }

InMemoryTransport::~InMemoryTransport() {
    FUNC_SCOPE();
    if (pImpl->link) {
        std::lock_guard<std::mutex> lock(pImpl->link->mutex);
        pImpl->link->ends[pImpl->side] = nullptr;
    }
}

std::pair<std::unique_ptr<InMemoryTransport>, std::unique_ptr<InMemoryTransport>> InMemoryTransport::CreatePair() {
    FUNC_SCOPE();
    auto transport1 = std::make_unique<InMemoryTransport>();
    auto transport2 = std::make_unique<InMemoryTransport>();
    auto link = std::make_shared<PairLink>();
    link->ends[0] = transport1.get();
    link->ends[1] = transport2.get();
    transport1->pImpl->link = link;
    transport1->pImpl->side = 0;
    transport2->pImpl->link = link;
    transport2->pImpl->side = 1;
    return std::make_pair(std::move(transport1), std::move(transport2));
}

std::future<void> InMemoryTransport::Start() {
    FUNC_SCOPE();
    LOG_INFO("Starting InMemoryTransport (session={})", pImpl->sessionId);
    pImpl->connected = true;
    pImpl->startProcessing();
    std::promise<void> promise; promise.set_value(); return promise.get_future();
}

std::future<void> InMemoryTransport::Close() {
    FUNC_SCOPE();
    if (pImpl->connected.load()) {
        LOG_INFO("Closing InMemoryTransport (session={})", pImpl->sessionId);
        (void)pImpl->sendToPeer(std::nullopt);
    }
    pImpl->connected = false;
    pImpl->queueCondition.notify_all();
    std::promise<void> promise; promise.set_value(); return promise.get_future();
}

bool InMemoryTransport::IsConnected() const { FUNC_SCOPE(); return pImpl->connected; }
std::string InMemoryTransport::GetSessionId() const { FUNC_SCOPE(); return pImpl->sessionId; }

bool InMemoryTransport::SendMessage(const std::string& payload) {
    FUNC_SCOPE();
    if (!pImpl->connected.load()) {
        LOG_DEBUG("InMemoryTransport: SendMessage while closed; dropping");
        return false;
    }
    return pImpl->sendToPeer(payload);
}

void InMemoryTransport::SetMessageHandler(MessageHandler handler) {
    FUNC_SCOPE();
    pImpl->messageHandler = std::move(handler);
}

void InMemoryTransport::SetFramingErrorHandler(FramingErrorHandler /*handler*/) {
    // Bodies are handed over whole; there is no framing to fail.
}

void InMemoryTransport::SetErrorHandler(ErrorHandler handler) {
    FUNC_SCOPE();
    pImpl->errorHandler = std::move(handler);
}

} // namespace toolhost

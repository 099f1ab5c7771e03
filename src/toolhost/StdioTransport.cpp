//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: StdioTransport.cpp
// Purpose: stdio-based transport implementation (Linux epoll reader, queued writer)
//==========================================================================================================

#include <unistd.h>
#include <fcntl.h>
#include <errno.h>
#include <cstring>
#include <sys/epoll.h>
#include <sys/eventfd.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <future>
#include <mutex>
#include <random>
#include <string>
#include <thread>
#include <vector>

#include "logging/Logger.h"
#include "toolhost/ContentFramer.h"
#include "toolhost/StdioTransport.hpp"

namespace toolhost {

class StdioTransport::Impl {
public:
    const int inFd;
    const int outFd;
    std::atomic<bool> running{false};
    std::atomic<bool> failed{false};
    std::atomic<bool> errorReported{false};
    std::string sessionId;
    ITransport::MessageHandler messageHandler;
    ITransport::FramingErrorHandler framingErrorHandler;
    ITransport::ErrorHandler errorHandler;
    std::thread readerThread;
    std::thread writerThread;
    std::mutex writeMutex; // protects writeQueue and queuedBytes
    std::condition_variable cvWrite;
    int wakeEventFd{-1};

    std::size_t maxContentLength{2 * 1024 * 1024};

    // Write queue/backpressure
    std::deque<std::string> writeQueue;
    std::size_t queuedBytes{0};
    std::size_t writeQueueMaxBytes{4 * 1024 * 1024}; // 4 MiB default cap
    static constexpr std::chrono::milliseconds CloseFlushTimeout{2000};

    Impl(int in, int out) : inFd(in), outFd(out) {
        std::random_device rd;
        std::mt19937 gen(rd());
        std::uniform_int_distribution<> dis(1000, 9999);
        sessionId = "stdio-" + std::to_string(dis(gen));

        wakeEventFd = ::eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
        if (wakeEventFd < 0) {
            LOG_ERROR("StdioTransport: failed to create eventfd (errno={} msg={})", errno, ::strerror(errno));
        }
    }

    ~Impl() {
        running = false;
        wake();
        cvWrite.notify_all();
        if (readerThread.joinable()) { readerThread.join(); }
        if (writerThread.joinable()) { writerThread.join(); }
        if (wakeEventFd >= 0) { ::close(wakeEventFd); wakeEventFd = -1; }
    }

    void wake() {
        if (wakeEventFd < 0) return;
        uint64_t one = 1;
        ssize_t wr;
        do {
            wr = ::write(wakeEventFd, &one, sizeof(one));
        } while (wr < 0 && errno == EINTR);
        if (wr < 0 && errno != EAGAIN && errno != EWOULDBLOCK) {
            LOG_WARN("StdioTransport: eventfd write failed (errno={} msg={})", errno, ::strerror(errno));
        }
    }

    // Reports a terminal condition once.
    void reportError(const std::string& msg) {
        if (errorReported.exchange(true)) return;
        if (errorHandler) {
            errorHandler(msg);
        }
    }

    static void setNonBlocking(int fd) {
        int flags = ::fcntl(fd, F_GETFL, 0);
        if (flags >= 0) { (void)::fcntl(fd, F_SETFL, flags | O_NONBLOCK); }
    }

    bool enqueueFrame(std::string frame) {
        {
            std::unique_lock<std::mutex> lk(writeMutex);
            if (queuedBytes + frame.size() > writeQueueMaxBytes) {
                LOG_ERROR("StdioTransport: write queue overflow (queued={} add={} max={})", queuedBytes, frame.size(), writeQueueMaxBytes);
                failed = true;
                writeQueue.clear();
                queuedBytes = 0;
                lk.unlock();
                cvWrite.notify_all();
                wake();
                reportError("StdioTransport: write queue overflow");
                return false;
            }
            queuedBytes += frame.size();
            writeQueue.emplace_back(std::move(frame));
        }
        cvWrite.notify_one();
        return true;
    }

    void deliver(FrameReader& reader) {
        while (running) {
            auto ev = reader.Next();
            if (!ev.has_value()) break;
            if (ev->kind == FrameReader::FrameEvent::Kind::Message) {
                LOG_DEBUG("StdioTransport: received message ({} bytes)", ev->data.size());
                if (messageHandler) {
                    messageHandler(ev->data);
                }
            } else {
                LOG_WARN("StdioTransport: framing error: {}", ev->data);
                if (framingErrorHandler) {
                    framingErrorHandler(ev->data);
                }
            }
        }
    }

    void startReader() {
        readerThread = std::thread([this]() {
            FrameReader reader(maxContentLength);
            constexpr int waitTimeoutMs = 100;
            setNonBlocking(inFd);

            int ep = ::epoll_create1(EPOLL_CLOEXEC);
            if (ep < 0) {
                LOG_ERROR("StdioTransport: epoll_create1 failed (errno={} msg={})", errno, ::strerror(errno));
                reportError("StdioTransport: epoll_create1 failed");
                return;
            }
            bool pollable = true;
            epoll_event evIn{}; evIn.events = EPOLLIN | EPOLLRDHUP; evIn.data.fd = inFd;
            if (::epoll_ctl(ep, EPOLL_CTL_ADD, inFd, &evIn) != 0) {
                if (errno != EPERM) {
                    LOG_ERROR("StdioTransport: epoll_ctl(input) failed (errno={} msg={})", errno, ::strerror(errno));
                    ::close(ep);
                    reportError("StdioTransport: input not pollable");
                    return;
                }
                LOG_DEBUG("StdioTransport: input is a regular file; reading without epoll");
                errno = 0;
                pollable = false;
            }
            if (wakeEventFd >= 0) {
                epoll_event evWake{}; evWake.events = EPOLLIN; evWake.data.fd = wakeEventFd;
                (void)::epoll_ctl(ep, EPOLL_CTL_ADD, wakeEventFd, &evWake);
            }

            std::vector<char> tmp(64 * 1024);
            bool eof = false;
            // Reads everything currently available. Returns false on a terminal read error.
            auto drain = [&]() -> bool {
                while (running) {
                    ssize_t n = ::read(inFd, tmp.data(), tmp.size());
                    if (n > 0) {
                        reader.Feed(tmp.data(), static_cast<std::size_t>(n));
                        deliver(reader);
                        continue;
                    }
                    if (n == 0) {
                        eof = true;
                        return true;
                    }
                    if (errno == EINTR) {
                        continue;
                    }
                    if (errno == EAGAIN || errno == EWOULDBLOCK) {
                        return true;
                    }
                    LOG_ERROR("StdioTransport: read error (errno={} msg={})", errno, ::strerror(errno));
                    reportError("StdioTransport: read error");
                    return false;
                }
                return true;
            };

            if (!pollable) {
                // Regular files are always readable; epoll refuses them
                (void)drain();
            }
            while (pollable && running && !failed && !eof) {
                epoll_event events[2];
                int rc = ::epoll_wait(ep, events, 2, waitTimeoutMs);
                if (rc < 0) {
                    if (errno == EINTR) {
                        continue;
                    }
                    LOG_ERROR("StdioTransport: epoll_wait failed (errno={} msg={})", errno, ::strerror(errno));
                    reportError("StdioTransport: epoll_wait failed");
                    break;
                }
                bool readable = false;
                for (int i = 0; i < rc; ++i) {
                    if (events[i].data.fd == inFd) {
                        readable = true;
                    } else {
                        uint64_t v = 0;
                        ssize_t r;
                        do {
                            r = ::read(wakeEventFd, &v, sizeof(v));
                        } while (r < 0 && errno == EINTR);
                    }
                }
                // HUP with buffered data still yields the data before EOF
                if (readable && !drain()) {
                    break;
                }
            }
            ::close(ep);
            if (eof) {
                if (reader.BufferedBytes() > 0) {
                    LOG_WARN("StdioTransport: {} bytes of incomplete frame at EOF", reader.BufferedBytes());
                }
                LOG_INFO("StdioTransport: EOF on input");
                reportError("StdioTransport: EOF on stdin");
            }
        });
    }

    // Writes one frame fully; returns false on a terminal write failure.
    bool writeFrame(const std::string& frame) {
        std::size_t total = 0;
        auto start = std::chrono::steady_clock::now();
        while (total < frame.size()) {
            ssize_t w = ::write(outFd, frame.data() + total, frame.size() - total);
            if (w > 0) {
                total += static_cast<std::size_t>(w);
                continue;
            }
            if (w < 0 && errno == EINTR) {
                continue;
            }
            if (w < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
                auto elapsed = std::chrono::steady_clock::now() - start;
                if (!running && elapsed >= CloseFlushTimeout) {
                    LOG_WARN("StdioTransport: output not draining during close; dropping pending frames");
                    return false;
                }
                std::this_thread::sleep_for(std::chrono::milliseconds(5));
                continue;
            }
            LOG_ERROR("StdioTransport: write error (errno={} msg={})", errno, ::strerror(errno));
            reportError("StdioTransport: write error");
            return false;
        }
        return true;
    }

    void startWriter() {
        writerThread = std::thread([this]() {
            setNonBlocking(outFd);
            while (true) {
                std::string frame;
                {
                    std::unique_lock<std::mutex> lk(writeMutex);
                    cvWrite.wait(lk, [&]{ return !running || failed || !writeQueue.empty(); });
                    if (failed || writeQueue.empty()) {
                        // Either a terminal failure or closing with nothing left to flush
                        if (failed || !running) break;
                        continue;
                    }
                    frame = std::move(writeQueue.front());
                    writeQueue.pop_front();
                }
                bool ok = writeFrame(frame);
                std::lock_guard<std::mutex> lk(writeMutex);
                queuedBytes = (queuedBytes >= frame.size()) ? queuedBytes - frame.size() : 0;
                if (!ok) {
                    failed = true;
                    writeQueue.clear();
                    queuedBytes = 0;
                    break;
                }
            }
        });
    }
};

StdioTransport::StdioTransport(int inFd, int outFd) : pImpl(std::make_unique<Impl>(inFd, outFd)) { FUNC_SCOPE(); }
StdioTransport::~StdioTransport() { FUNC_SCOPE(); }

std::future<void> StdioTransport::Start() {
    FUNC_SCOPE();
    LOG_INFO("Starting StdioTransport (session={})", pImpl->sessionId);
    pImpl->running = true;
    pImpl->startReader();
    pImpl->startWriter();
    std::promise<void> promise; promise.set_value(); return promise.get_future();
}

std::future<void> StdioTransport::Close() {
    FUNC_SCOPE();
    if (pImpl->running.exchange(false)) {
        LOG_INFO("Closing StdioTransport (session={})", pImpl->sessionId);
    }
    pImpl->wake();
    if (pImpl->readerThread.joinable() && pImpl->readerThread.get_id() != std::this_thread::get_id()) {
        pImpl->readerThread.join();
    }
    pImpl->cvWrite.notify_all();
    if (pImpl->writerThread.joinable() && pImpl->writerThread.get_id() != std::this_thread::get_id()) {
        pImpl->writerThread.join();
    }
    std::promise<void> promise; promise.set_value(); return promise.get_future();
}

bool StdioTransport::IsConnected() const { FUNC_SCOPE(); return pImpl->running && !pImpl->failed; }
std::string StdioTransport::GetSessionId() const { FUNC_SCOPE(); return pImpl->sessionId; }

bool StdioTransport::SendMessage(const std::string& payload) {
    FUNC_SCOPE();
    if (!pImpl->running.load() || pImpl->failed.load()) {
        LOG_DEBUG("StdioTransport: SendMessage called while disconnected; dropping {} bytes", payload.size());
        return false;
    }
    std::string frame = "Content-Length: " + std::to_string(payload.size()) + "\r\n\r\n";
    frame.append(payload);
    return pImpl->enqueueFrame(std::move(frame));
}

void StdioTransport::SetMessageHandler(MessageHandler handler) { FUNC_SCOPE(); pImpl->messageHandler = std::move(handler); }
void StdioTransport::SetFramingErrorHandler(FramingErrorHandler handler) { FUNC_SCOPE(); pImpl->framingErrorHandler = std::move(handler); }
void StdioTransport::SetErrorHandler(ErrorHandler handler) { FUNC_SCOPE(); pImpl->errorHandler = std::move(handler); }

void StdioTransport::SetMaxContentLength(std::size_t maxBytes) {
    FUNC_SCOPE();
    pImpl->maxContentLength = (maxBytes == 0) ? 1 : maxBytes;
}

void StdioTransport::SetWriteQueueMaxBytes(std::size_t maxBytes) {
    FUNC_SCOPE();
    if (maxBytes == 0) { maxBytes = 1; }
    std::lock_guard<std::mutex> lk(pImpl->writeMutex);
    pImpl->writeQueueMaxBytes = maxBytes;
}

} // namespace toolhost

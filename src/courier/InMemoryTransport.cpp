//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: InMemoryTransport.cpp
// Purpose: In-memory transport implementation
//==========================================================================================================

#include <atomic>
#include <condition_variable>
#include <deque>
#include <future>
#include <mutex>
#include <optional>
#include <random>
#include <stop_token>
#include <string>
#include <thread>

#include "logging/Logger.h"
#include "courier/InMemoryTransport.hpp"
#include "courier/cache/CachePolicy.h"
#include "ConfigString.h"

namespace courier {

class InMemoryTransport::Impl {
public:
    struct Pending {
        TransportRequest request;
        std::stop_token stop;
        std::promise<TransportResponse> promise;
    };

    std::atomic<bool> connected{false};
    std::string sessionId;
    ITransport::ErrorHandler errorHandler;
    std::mutex handlerMutex;
    InMemoryTransport::Handler handler;
    std::deque<Pending> queue;
    std::mutex queueMutex;
    std::condition_variable_any queueCondition;
    std::jthread processingThread;
    mutable std::mutex recordMutex;
    std::vector<TransportRequest> received;

    Impl() {
        std::random_device rd;
        std::mt19937 gen(rd());
        std::uniform_int_distribution<> dis(1000, 9999);
        sessionId = "memory-" + std::to_string(dis(gen));
    }

    ~Impl() {
        stopWorker();
        failPending("Transport destroyed");
    }

    void setError(const std::string& msg) {
        if (errorHandler) {
            errorHandler(msg);
        }
    }

    void startProcessing() {
        processingThread = std::jthread([this](std::stop_token st) {
            while (!st.stop_requested()) {
                Pending item;
                {
                    std::unique_lock<std::mutex> lock(queueMutex);
                    if (!queueCondition.wait(lock, st, [this]() { return !queue.empty(); })) {
                        break;
                    }
                    item = std::move(queue.front());
                    queue.pop_front();
                }
                process(item);
            }
        });
    }

    void stopWorker() {
        if (processingThread.joinable()) {
            processingThread.request_stop();
            processingThread.join();
        }
    }

    void failPending(const std::string& reason) {
        std::deque<Pending> drained;
        {
            std::lock_guard<std::mutex> lock(queueMutex);
            drained.swap(queue);
        }
        for (auto& p : drained) {
            p.promise.set_exception(std::make_exception_ptr(TransportError(reason)));
        }
    }

    void process(Pending& item) {
        if (item.stop.stop_requested()) {
            item.promise.set_exception(std::make_exception_ptr(TransportError("Request cancelled")));
            return;
        }
        try {
            if (auto cached = cache::ServeFromCache(item.request)) {
                item.promise.set_value(std::move(*cached));
                return;
            }
            InMemoryTransport::Handler h;
            {
                std::lock_guard<std::mutex> lk(handlerMutex);
                h = handler;
            }
            {
                std::lock_guard<std::mutex> lk(recordMutex);
                received.push_back(item.request);
            }
            LOG_DEBUG("InMemoryTransport: {} {}", ToString(item.request.method), item.request.url);
            TransportResponse response;
            if (h) {
                response = h(item.request, item.stop);
            } else {
                response.statusCode = 404;
            }
            cache::StoreInCache(item.request, response);
            item.promise.set_value(std::move(response));
        } catch (const std::exception& e) {
            setError(std::string("InMemoryTransport: handler failed: ") + e.what());
            item.promise.set_exception(std::current_exception());
        } catch (...) {
            setError("InMemoryTransport: handler failed with a non-standard exception");
            item.promise.set_exception(std::current_exception());
        }
    }
};

InMemoryTransport::InMemoryTransport() : pImpl(std::make_unique<Impl>()) { FUNC_SCOPE(); }

InMemoryTransport::InMemoryTransport(Handler handler) : pImpl(std::make_unique<Impl>()) {
    FUNC_SCOPE();
    pImpl->handler = std::move(handler);
}

InMemoryTransport::~InMemoryTransport() { FUNC_SCOPE(); }

void InMemoryTransport::SetHandler(Handler handler) {
    std::lock_guard<std::mutex> lk(pImpl->handlerMutex);
    pImpl->handler = std::move(handler);
}

std::vector<TransportRequest> InMemoryTransport::ReceivedRequests() const {
    std::lock_guard<std::mutex> lk(pImpl->recordMutex);
    return pImpl->received;
}

std::size_t InMemoryTransport::RequestCount() const {
    std::lock_guard<std::mutex> lk(pImpl->recordMutex);
    return pImpl->received.size();
}

std::future<void> InMemoryTransport::Start() {
    FUNC_SCOPE();
    LOG_DEBUG("Starting InMemoryTransport {}", pImpl->sessionId);
    if (!pImpl->connected.exchange(true)) {
        pImpl->startProcessing();
    }
    std::promise<void> promise; promise.set_value(); return promise.get_future();
}

std::future<void> InMemoryTransport::Close() {
    FUNC_SCOPE();
    LOG_DEBUG("Closing InMemoryTransport {}", pImpl->sessionId);
    {
        std::lock_guard<std::mutex> lock(pImpl->queueMutex);
        pImpl->connected = false;
    }
    pImpl->stopWorker();
    pImpl->failPending("Transport closed");
    std::promise<void> promise; promise.set_value(); return promise.get_future();
}

bool InMemoryTransport::IsConnected() const { FUNC_SCOPE(); return pImpl->connected; }
std::string InMemoryTransport::GetSessionId() const { FUNC_SCOPE(); return pImpl->sessionId; }

std::future<TransportResponse> InMemoryTransport::Send(TransportRequest request, std::stop_token stop) {
    FUNC_SCOPE();
    std::promise<TransportResponse> promise;
    auto future = promise.get_future();
    {
        // Checked under the queue lock; Close() clears the flag and drains under the same lock
        std::lock_guard<std::mutex> lock(pImpl->queueMutex);
        if (!pImpl->connected.load()) {
            promise.set_exception(std::make_exception_ptr(TransportError("Transport not connected")));
            return future;
        }
        pImpl->queue.push_back(Impl::Pending{std::move(request), std::move(stop), std::move(promise)});
    }
    pImpl->queueCondition.notify_one();
    return future;
}

void InMemoryTransport::SetErrorHandler(ErrorHandler handler) {
    FUNC_SCOPE();
    pImpl->errorHandler = std::move(handler);
}

std::unique_ptr<ITransport> InMemoryTransportFactory::CreateTransport(const std::string& config) {
    int status = 404;
    std::string body;
    std::optional<Method> only;
    detail::ForEachConfigEntry(config, [&](const std::string& key, const std::string& val) {
        if (key == "status") {
            detail::ParseUnsigned(val, status);
        } else if (key == "body") {
            body = val;
        } else if (key == "method") {
            only = MethodFromString(val);
            if (!only) {
                LOG_DEBUG("InMemoryTransportFactory: ignoring unknown method '{}'", val);
            }
        }
    });
    return std::make_unique<InMemoryTransport>(
        [status, body, only](const TransportRequest& request, std::stop_token) {
            TransportResponse r;
            if (only && request.method != *only) {
                r.statusCode = 405;
                r.headers["Allow"] = ToString(*only);
                return r;
            }
            r.statusCode = status;
            r.body = body;
            return r;
        });
}

} // namespace courier

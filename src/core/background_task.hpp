#pragma once

#include "core/cancellation.hpp"

#include <QMutex>

#include <functional>
#include <memory>

class QThread;

namespace relayscout {

/**
 * BackgroundTask - one cancellable worker thread.
 *
 * The body receives a CancelToken and must return once it is cancelled.
 * stop() cancels the token and joins the thread; it is safe to call
 * repeatedly and from the destructor.
 */
class BackgroundTask {
public:
    using Body = std::function<void(const CancelToken&)>;

    BackgroundTask() = default;
    ~BackgroundTask();

    BackgroundTask(const BackgroundTask&) = delete;
    BackgroundTask& operator=(const BackgroundTask&) = delete;

    /**
     * Start the worker. Returns false when a worker is already running.
     */
    bool start(Body body);

    void stop();

    [[nodiscard]] bool is_running() const;

private:
    mutable QMutex mu_;
    CancelToken token_;
    std::unique_ptr<QThread> thread_;
    bool running_ = false;
};

} // namespace relayscout

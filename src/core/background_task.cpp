#include "core/background_task.hpp"

#include <QThread>

namespace relayscout {

BackgroundTask::~BackgroundTask() {
    stop();
}

bool BackgroundTask::start(Body body) {
    QMutexLocker lock(&mu_);
    if (running_) return false;

    token_ = CancelToken{};
    running_ = true;
    thread_.reset(QThread::create([token = token_, body = std::move(body)] { body(token); }));
    thread_->start();
    return true;
}

void BackgroundTask::stop() {
    std::unique_ptr<QThread> worker;
    {
        QMutexLocker lock(&mu_);
        if (!running_) return;
        running_ = false;
        token_.cancel();
        worker = std::move(thread_);
    }
    if (!worker) return;
    // Joined outside the lock: the body may still be finishing a blocking read.
    if (QThread::currentThread() != worker.get()) {
        worker->wait();
        return;
    }
    // Stopped from inside the body; the thread object outlives this call.
    auto* self = worker.release();
    QObject::connect(self, &QThread::finished, self, &QObject::deleteLater);
}

bool BackgroundTask::is_running() const {
    QMutexLocker lock(&mu_);
    return running_;
}

} // namespace relayscout

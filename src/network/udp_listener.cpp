#include "network/udp_listener.hpp"

#include "core/logging.hpp"

#include <QThread>
#include <QUdpSocket>

namespace relayscout::network {

UdpListener::UdpListener(UdpListenerOptions options)
    : options_(std::move(options))
    , queue_(std::make_shared<DatagramQueue>(options_.queue_capacity))
{
}

UdpListener::~UdpListener() {
    stop();
}

Result<void, Error> UdpListener::start() {
    if (thread_) {
        return Result<void, Error>::ok();
    }

    stop_requested_.storeRelaxed(0);
    bind_result_.reset();

    thread_.reset(QThread::create([this] { run(); }));
    thread_->setObjectName(QStringLiteral("relayscout-%1").arg(options_.name));
    thread_->start();

    bound_.acquire();
    auto result = std::move(*bind_result_);
    if (result.is_err()) {
        thread_->wait();
        thread_.reset();
        queue_->close();
    }
    return result;
}

void UdpListener::stop() {
    stop_requested_.storeRelaxed(1);
    if (thread_) {
        thread_->wait();
        thread_.reset();
    }
    queue_->close();
}

void UdpListener::report_bound(Result<void, Error> result) {
    bind_result_ = std::move(result);
    bound_.release();
}

void UdpListener::run() {
    QUdpSocket socket;

    if (!socket.bind(QHostAddress::AnyIPv4, options_.port,
                     QUdpSocket::ShareAddress | QUdpSocket::ReuseAddressHint)) {
        const auto msg = QStringLiteral("%1: bind to port %2 failed: %3")
                             .arg(options_.name)
                             .arg(options_.port)
                             .arg(socket.errorString());
        report_bound(Result<void, Error>::err(Error{msg.toStdString(), ErrorKind::Transport}));
        return;
    }
    local_port_.storeRelaxed(socket.localPort());

    if (options_.multicast_group) {
        if (socket.joinMulticastGroup(*options_.multicast_group)) {
            joined_multicast_.storeRelaxed(1);
        } else {
            qCDebug(rsUdpLog) << options_.name << "multicast join failed, listening unicast only:"
                              << socket.errorString();
        }
    }

    if (!options_.initial_datagram.isEmpty()) {
        const auto sent = socket.writeDatagram(options_.initial_datagram,
                                               options_.initial_target,
                                               options_.initial_target_port);
        if (sent < 0) {
            const auto msg = QStringLiteral("%1: send to %2:%3 failed: %4")
                                 .arg(options_.name, options_.initial_target.toString())
                                 .arg(options_.initial_target_port)
                                 .arg(socket.errorString());
            report_bound(Result<void, Error>::err(Error{msg.toStdString(), ErrorKind::Transport}));
            return;
        }
    }

    report_bound(Result<void, Error>::ok());

    const int wait_ms = static_cast<int>(options_.read_wait.count());
    while (stop_requested_.loadRelaxed() == 0) {
        if (!socket.waitForReadyRead(wait_ms)) {
            if (socket.error() != QAbstractSocket::SocketTimeoutError) {
                // Transient read errors are retried after one wait period.
                qCDebug(rsUdpLog) << options_.name << "read error:" << socket.errorString();
                QThread::msleep(static_cast<unsigned long>(wait_ms));
            }
            continue;
        }

        while (socket.hasPendingDatagrams()) {
            Datagram d;
            d.data.resize(static_cast<int>(socket.pendingDatagramSize()));
            const auto n = socket.readDatagram(d.data.data(), d.data.size(), &d.sender, &d.sender_port);
            if (n < 0) break;
            d.data.resize(static_cast<int>(n));

            if (!queue_->try_push(std::move(d))) {
                qCDebug(rsUdpLog) << options_.name << "queue full, datagram dropped";
            }
        }
    }

    if (joined_multicast_.loadRelaxed() != 0) {
        socket.leaveMulticastGroup(*options_.multicast_group);
    }
    socket.close();
}

} // namespace relayscout::network

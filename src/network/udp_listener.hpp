#pragma once

#include "core/bounded_queue.hpp"
#include "core/result.hpp"
#include "core/types.hpp"

#include <QByteArray>
#include <QHostAddress>
#include <QAtomicInt>
#include <QSemaphore>
#include <QString>
#include <memory>
#include <optional>

class QThread;

namespace relayscout::network {

/**
 * Datagram - one received UDP payload and its origin.
 */
struct Datagram {
    QByteArray data;
    QHostAddress sender;
    quint16 sender_port = 0;
};

using DatagramQueue = BoundedQueue<Datagram>;

struct UdpListenerOptions {
    QString name = QStringLiteral("udp");   // used in log lines
    quint16 port = 0;                       // 0 picks an ephemeral port

    // Multicast group to join after binding. When the join fails the socket
    // stays bound and only receives unicast traffic.
    std::optional<QHostAddress> multicast_group;

    // Datagram sent once from the bound socket before reading starts.
    QByteArray initial_datagram;
    QHostAddress initial_target;
    quint16 initial_target_port = 0;

    Millis read_wait{100};
    size_t queue_capacity = 100;
};

/**
 * UdpListener - owns one UDP socket on a dedicated reader thread.
 *
 * The reader thread blocks on the socket and pushes every datagram into a
 * bounded queue; it never parses. When the queue is full the datagram is
 * dropped. stop() (or destruction) ends the thread and closes the queue,
 * so consumers waiting on datagrams() wake up. A listener is single-use:
 * once stopped, create a new one.
 */
class UdpListener {
public:
    explicit UdpListener(UdpListenerOptions options);
    ~UdpListener();

    UdpListener(const UdpListener&) = delete;
    UdpListener& operator=(const UdpListener&) = delete;

    /**
     * Bind the socket and start the reader thread. Returns once the socket
     * is bound (and the initial datagram sent), or with the bind/send error.
     */
    Result<void, Error> start();

    void stop();

    [[nodiscard]] std::shared_ptr<DatagramQueue> datagrams() const { return queue_; }

    /**
     * Local port the socket is bound to, 0 before start() succeeds.
     */
    [[nodiscard]] quint16 local_port() const { return static_cast<quint16>(local_port_.loadRelaxed()); }

    [[nodiscard]] bool joined_multicast() const { return joined_multicast_.loadRelaxed() != 0; }

private:
    void run();
    void report_bound(Result<void, Error> result);

    UdpListenerOptions options_;
    std::shared_ptr<DatagramQueue> queue_;
    std::unique_ptr<QThread> thread_;
    QAtomicInt stop_requested_{0};
    QAtomicInt local_port_{0};
    QAtomicInt joined_multicast_{0};

    // Written by the reader thread before bound_ is released.
    QSemaphore bound_;
    std::optional<Result<void, Error>> bind_result_;
};

} // namespace relayscout::network

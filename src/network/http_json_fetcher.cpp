#include "network/http_json_fetcher.hpp"

#include "core/logging.hpp"

#include <QEventLoop>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QTimer>

#include <memory>

namespace relayscout::network {
namespace {

constexpr int kCancelPollMs = 50;

} // namespace

Result<QJsonObject, Error> HttpJsonFetcher::get_json(const QUrl& url,
                                                     Millis timeout,
                                                     const CancelToken& token) {
    using R = Result<QJsonObject, Error>;

    if (token.is_cancelled()) {
        return R::err(Error{"request cancelled", ErrorKind::Cancelled});
    }

    // The manager must live in the thread that runs the event loop.
    QNetworkAccessManager nam;
    QNetworkRequest request(url);
    request.setTransferTimeout(static_cast<int>(timeout.count()));
    request.setAttribute(QNetworkRequest::RedirectPolicyAttribute,
                         QNetworkRequest::NoLessSafeRedirectPolicy);

    std::unique_ptr<QNetworkReply> reply(nam.get(request));

    QEventLoop loop;
    QObject::connect(reply.get(), &QNetworkReply::finished, &loop, &QEventLoop::quit);

    QTimer deadline;
    deadline.setSingleShot(true);
    deadline.setInterval(static_cast<int>(timeout.count()));
    QObject::connect(&deadline, &QTimer::timeout, &loop, [&reply]() { reply->abort(); });

    bool cancelled = false;
    QTimer poll;
    poll.setInterval(kCancelPollMs);
    QObject::connect(&poll, &QTimer::timeout, &loop, [&]() {
        if (token.is_cancelled()) {
            cancelled = true;
            reply->abort();
        }
    });

    deadline.start();
    poll.start();
    if (!reply->isFinished()) {
        loop.exec();
    }

    if (cancelled) {
        return R::err(Error{"request cancelled", ErrorKind::Cancelled});
    }

    if (reply->error() != QNetworkReply::NoError) {
        const auto msg = QStringLiteral("GET %1: %2").arg(url.toString(), reply->errorString());
        qCDebug(rsProbeLog) << msg;
        return R::err(Error{msg.toStdString(), ErrorKind::Probe});
    }

    const int status = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
    if (status < 200 || status >= 300) {
        const auto msg = QStringLiteral("GET %1: unexpected status %2").arg(url.toString()).arg(status);
        return R::err(Error{msg.toStdString(), ErrorKind::Probe});
    }

    QJsonParseError err{};
    const auto doc = QJsonDocument::fromJson(reply->readAll(), &err);
    if (err.error != QJsonParseError::NoError || !doc.isObject()) {
        const auto msg = QStringLiteral("GET %1: invalid JSON body").arg(url.toString());
        return R::err(Error{msg.toStdString(), ErrorKind::Probe});
    }

    return R::ok(doc.object());
}

} // namespace relayscout::network

#pragma once

#include "core/cancellation.hpp"
#include "core/result.hpp"

#include <QJsonObject>
#include <QUrl>

namespace relayscout::network {

/**
 * JsonFetcher - GET a URL and decode a JSON object body.
 *
 * Non-2xx statuses, transport failures, timeouts and non-object bodies are
 * all reported as errors of kind Probe (Cancelled when `token` ended first).
 */
class JsonFetcher {
public:
    virtual ~JsonFetcher() = default;

    virtual Result<QJsonObject, Error> get_json(const QUrl& url,
                                                Millis timeout,
                                                const CancelToken& token) = 0;
};

/**
 * HttpJsonFetcher - JsonFetcher on QNetworkAccessManager.
 *
 * Each call runs a private event loop in the calling thread, so it may be
 * used from worker threads that have no event loop of their own.
 */
class HttpJsonFetcher final : public JsonFetcher {
public:
    Result<QJsonObject, Error> get_json(const QUrl& url,
                                        Millis timeout,
                                        const CancelToken& token) override;
};

} // namespace relayscout::network

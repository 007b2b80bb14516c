#pragma once

#include <QLoggingCategory>
#include <QString>

Q_DECLARE_LOGGING_CATEGORY(rsMdnsLog)
Q_DECLARE_LOGGING_CATEGORY(rsCoiotLog)
Q_DECLARE_LOGGING_CATEGORY(rsBleLog)
Q_DECLARE_LOGGING_CATEGORY(rsWifiLog)
Q_DECLARE_LOGGING_CATEGORY(rsScannerLog)
Q_DECLARE_LOGGING_CATEGORY(rsUdpLog)
Q_DECLARE_LOGGING_CATEGORY(rsProbeLog)

namespace relayscout {

// Installs a Qt message handler that appends "time level category message"
// lines to `path`. Messages are still written to stderr.
void install_file_logging(const QString& path);

// Turns on debug output for every relayscout.* category.
void enable_debug_logging();

} // namespace relayscout

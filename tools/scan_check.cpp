#include <QCoreApplication>
#include <QSettings>

#include "core/logging.hpp"
#include "discovery/scanner.hpp"

int main(int argc, char **argv) {
    QCoreApplication app(argc, argv);
    QCoreApplication::setOrganizationName(QStringLiteral("relayscout"));
    QCoreApplication::setApplicationName(QStringLiteral("scan_check"));

    if (qEnvironmentVariableIsSet("RELAYSCOUT_DEBUG")) {
        relayscout::enable_debug_logging();
    }
    const auto logPath = qEnvironmentVariable("RELAYSCOUT_LOG_FILE");
    if (!logPath.isEmpty()) {
        relayscout::install_file_logging(logPath);
    }

    QSettings settings;
    auto config = relayscout::discovery::load_scanner_config(settings);
    relayscout::discovery::apply_environment_overrides(config);

    // No platform BLE or WiFi scanner here; only the UDP protocols run.
    relayscout::discovery::Scanner scanner(config);
    auto result = scanner.scan();
    if (result.is_err()) {
        qCCritical(rsScannerLog).noquote() << "scan failed:" << result.unwrap_err().message.c_str();
        return 1;
    }

    for (const auto& device : result.unwrap()) {
        qCInfo(rsScannerLog).noquote()
            << relayscout::discovery::protocol_name(device.protocol)
            << device.id << device.model
            << relayscout::discovery::generation_name(device.generation)
            << device.url();
    }
    return 0;
}

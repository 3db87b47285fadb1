#include <QCoreApplication>
#include <QCommandLineParser>
#include <QDir>
#include <QFileInfo>
#include <QTextStream>
#include <iostream>
#include <string>
#include "converter_settings.h"
#include "log_manager.h"
#include "session_controller.h"
#include "tui/tui_app.h"
#include "tui/tui_dialogs.h"

namespace {

bool parseBounded(const QCommandLineParser& parser, const QString& name, int minValue, int maxValue, int& value)
{
    if (!parser.isSet(name)) return true;
    bool ok = false;
    const int v = parser.value(name).toInt(&ok);
    if (!ok || v < minValue || v > maxValue) {
        QTextStream(stderr) << QString("Error: --%1 must be between %2 and %3.\n").arg(name).arg(minValue).arg(maxValue);
        return false;
    }
    value = v;
    return true;
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName("jxlbatch");
    QCoreApplication::setApplicationVersion("1.0.0");

    // Qt diagnostics go to the log, never to the curses screen
    qInstallMessageHandler(customMessageHandler);

    QCommandLineParser parser;
    parser.setApplicationDescription("Batch converter from common image formats to JPEG XL.");
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument("directory", "Directory to scan for images (default: current directory).", "[directory]");
    parser.addOption({{"q", "quality"}, "Encode quality, 1-100 (default 90).", "quality"});
    parser.addOption({{"e", "effort"}, "Encode effort, 1-9 (default 7).", "effort"});
    parser.addOption({{"r", "recursive"}, "Scan sub-directories."});
    parser.addOption({{"o", "output"}, "Output directory (default: ./converted).", "dir"});
    parser.addOption({"same-dir", "Write each output next to its source file."});
    parser.addOption({"delete-originals", "Delete each source after a successful conversion."});
    parser.addOption({"debug-log", "Start with debug logging enabled."});
    parser.addOption({"log-file", "Debug log path (default: jxl_converter_debug.txt).", "path"});
    parser.process(app);

    ConverterSettings settings;
    if (!parseBounded(parser, "quality", ConverterSettings::kMinQuality, ConverterSettings::kMaxQuality, settings.quality)) return 2;
    if (!parseBounded(parser, "effort", ConverterSettings::kMinEffort, ConverterSettings::kMaxEffort, settings.effort)) return 2;
    settings.recursive = parser.isSet("recursive");
    settings.deleteOriginals = parser.isSet("delete-originals");
    settings.debugLogging = parser.isSet("debug-log");
    if (parser.isSet("same-dir")) settings.outputDir.clear();
    else if (parser.isSet("output")) settings.outputDir = ConverterSettings::normalizeDir(parser.value("output"));
    else settings.outputDir = ConverterSettings::defaultOutputDir();

    const QStringList positional = parser.positionalArguments();
    const QString directory = positional.isEmpty() ? QStringLiteral(".") : positional.first();
    if (!QFileInfo(directory).isDir()) {
        QTextStream(stderr) << QString("Error: Directory not found at '%1'\n").arg(directory);
        return 1;
    }

    if (parser.isSet("log-file")) LogManager::instance().setLogFilePath(parser.value("log-file"));
    LogManager::instance().setFileLoggingEnabled(settings.debugLogging);
    LogManager::instance().addLog("[MAIN] Starting in " + QFileInfo(directory).absoluteFilePath());

    const ToolPaths tools = ToolPaths::locate();
    if (!tools.hasEncoder()) {
        std::cerr << "\033[93mWarning: 'cjxl' not found in PATH. Install libjxl-tools (e.g. apt install libjxl-tools).\033[0m\n"
                  << "Press Enter to continue anyway..." << std::endl;
        std::string line;
        std::getline(std::cin, line);
    }
    if (!tools.hasSanitizer()) LogManager::instance().addLog("[MAIN] ImageMagick not found; sanitize/retry unavailable", "WARN");

    {
        CursesSession screen;
        CursesPrompter prompter;
        SessionController controller(directory, settings, tools, nullptr, &prompter);
        if (!tools.hasEncoder())
            controller.postMessage("FATAL: cjxl not found in PATH. Install libjxl-tools.", SessionController::MessageLevel::Error);

        TuiApp tui(controller);
        tui.run();
        controller.shutdown(5000);
    }

    LogManager::instance().addLog("[MAIN] Exiting");
    return 0;
}

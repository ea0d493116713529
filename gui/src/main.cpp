// gui/src/main.cpp: CfLoader demo: logger, option file, main window
#include <QApplication>
#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QDebug>
#include <QString>

#include <iostream>
#include <memory>
#include <sstream>

#include "../view/mainwindow.hpp"
#include "../controller/app_controller.hpp"
#include "../model/diag.hpp"
#include "../model/loader_options.hpp"

#include "build_info.hpp"
#include "logger.hpp"

namespace {

simplelog::Logger* g_logger = nullptr;

// Loader core -> file logger (line-oriented)
void loaderLogToApp(const char* line, void* user)
{
    auto* lg = static_cast<simplelog::Logger*>(user);
    if (!line) return;
    std::cerr << line << "\n";
    if (lg) lg->append(line);
}

void log_and_print(simplelog::Logger& log, const std::string& line)
{
    std::cerr << line << std::endl;
    log.append(line);
}

void qt_to_logger_handler(QtMsgType type, const QMessageLogContext& ctx, const QString& msg)
{
    const QByteArray local = msg.toLocal8Bit();
    simplelog::Level lv = simplelog::Level::Debug;
    switch (type) {
    case QtDebugMsg:    lv = simplelog::Level::Debug; break;
    case QtInfoMsg:     lv = simplelog::Level::Info;  break;
    case QtWarningMsg:  lv = simplelog::Level::Warn;  break;
    case QtCriticalMsg:
    case QtFatalMsg:    lv = simplelog::Level::Error; break;
    }
    std::cerr << "[QT][" << simplelog::level_tag(lv) << "] " << local.constData() << "\n";
    if (g_logger) {
        std::ostringstream line;
        line << "[QT]";
        if (ctx.function) line << "[" << ctx.function << "]";
        line << " " << local.constData();
        g_logger->append(lv, line.str());
    }
    if (type == QtFatalMsg) std::abort();
}

simplelog::Logger createLogger()
{
    simplelog::Logger log("CfLoader", "cfloader.log");
    simplelog::write_banner(log, {
                                     "CfLoader demo: startup",
                                     std::string("Version: ") + CFL_VERSION_STR + " (" + CFL_BUILD_TYPE_STR + ")",
                                     std::string("Started at (UTC): ") + simplelog::now_utc_iso8601()
                                 }, '=');
    log_and_print(log, "[DBG][Main] Log file: " + log.path().string());
    return log;
}

void installLogBridges(simplelog::Logger& log)
{
    g_logger = &log;
    qInstallMessageHandler(qt_to_logger_handler);
    cfl::set_log_cb(&loaderLogToApp, &log);
    log_and_print(log, "[DBG][Main] Qt and loader log bridges installed.");
}

void removeLogBridges()
{
    cfl::set_log_cb(nullptr, nullptr);
    qInstallMessageHandler(nullptr);
    g_logger = nullptr;
}

struct CmdLine {
    QString optionsPath;
    QString imagePath;
};

CmdLine parseArgs(const QApplication& app)
{
    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Circular image loader demo"));
    parser.addHelpOption();
    parser.addVersionOption();
    const QCommandLineOption optionsOpt(QStringList{QStringLiteral("o"), QStringLiteral("options")},
                                        QStringLiteral("Loader options XML file."),
                                        QStringLiteral("file.xml"));
    const QCommandLineOption imageOpt(QStringList{QStringLiteral("i"), QStringLiteral("image")},
                                      QStringLiteral("Image shown inside the circle."),
                                      QStringLiteral("image"));
    parser.addOption(optionsOpt);
    parser.addOption(imageOpt);
    parser.process(app);

    CmdLine cl;
    cl.optionsPath = parser.value(optionsOpt);
    cl.imagePath   = parser.value(imageOpt);
    return cl;
}

cfl::LoaderOptions loadOptions(simplelog::Logger& log, const QString& path, float density)
{
    cfl::LoaderOptions opts;
    if (path.isEmpty()) return opts;

    std::string why;
    if (!cfl::loadOptionsXml(path, &opts, &why, density)) {
        log_and_print(log, "[WRN][Main] options file ignored: " + why);
        return cfl::LoaderOptions();
    }
    log_and_print(log, "[DBG][Main] options loaded from " + path.toStdString());
    return opts;
}

} // namespace

int main(int argc, char** argv)
{
    auto log = createLogger();
    installLogBridges(log);

    try {
        QApplication app(argc, argv);
        QApplication::setApplicationName(QStringLiteral("CfLoader"));
        QApplication::setApplicationVersion(QStringLiteral(CFL_VERSION_STR));

        {
            std::ostringstream qtver;
            qtver << "[DBG][Main] Qt compile-time: " << QT_VERSION_STR
                  << " | runtime: " << qVersion();
            log_and_print(log, qtver.str());
        }

        const CmdLine cl = parseArgs(app);

        // widget coordinates are already device independent: 1dp == 1 unit
        const cfl::LoaderOptions opts = loadOptions(log, cl.optionsPath, 1.0f);

        MainWindow w(opts);
        AppController controller(&w);
        w.setWindowTitle(QStringLiteral("CfLoader"));

        if (!cl.imagePath.isEmpty()) controller.loadImage(cl.imagePath);

        controller.show();
        w.show();
        log_and_print(log, "[DBG][Main] MainWindow shown; entering app.exec()");

        const int rc = app.exec();
        log_and_print(log, "[DBG][Main] app.exec() returned rc=" + std::to_string(rc));
        removeLogBridges();
        return rc;

    } catch (const std::exception& e) {
        removeLogBridges();
        log_and_print(log, std::string("[FATAL] Unhandled std::exception: ") + e.what());
        return 1;
    }
}

#include "cli/RewindCli.hpp"

#include <exception>
#include <iostream>

#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QFile>
#include <QStringList>
#include <QUuid>

#include <nlohmann/json.hpp>

#include "common/errors.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "core/reconciler.hpp"

namespace hashprint {

namespace {

QString usageText()
{
    return QStringLiteral(
        "Usage:\n"
        "  hashprint [--dry] [--format text|json] [--trace] <root>\n");
}

} // namespace

int RewindCli::run(int argc, char *argv[])
{
    QStringList args;
    args.reserve(argc);
    for (int i = 0; i < argc; ++i) {
        args.push_back(QString::fromLocal8Bit(argv[i]));
    }

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral(
        "Rewind the mtime of files whose mtime advanced since the last "
        "execution without a content change."));
    const QCommandLineOption helpOption = parser.addHelpOption();
    const QCommandLineOption versionOption = parser.addVersionOption();
    QCommandLineOption dryOption(QStringList() << "dry",
                                 "Do not edit any mtime, only list the changes that would be made.");
    QCommandLineOption formatOption(QStringList() << "format",
                                    "Summary format: text or json.",
                                    "format",
                                    QStringLiteral("text"));
    QCommandLineOption traceOption(QStringList() << "trace",
                                   "Enable per-file trace logging.");
    parser.addOption(dryOption);
    parser.addOption(formatOption);
    parser.addOption(traceOption);
    parser.addPositionalArgument("root", "Directory whose files are reconciled.");

    if (!parser.parse(args)) {
        std::cerr << parser.errorText().toStdString() << "\n"
                  << usageText().toStdString();
        return 1;
    }

    if (parser.isSet(helpOption)) {
        std::cout << parser.helpText().toStdString();
        return 0;
    }
    if (parser.isSet(versionOption)) {
        std::cout << QCoreApplication::applicationName().toStdString() << " "
                  << QCoreApplication::applicationVersion().toStdString() << std::endl;
        return 0;
    }

    const QStringList positional = parser.positionalArguments();
    if (positional.size() != 1) {
        std::cerr << usageText().toStdString();
        return 1;
    }

    const QString format = parser.value(formatOption).toLower();
    if (format != QStringLiteral("text") && format != QStringLiteral("json")) {
        std::cerr << "Invalid format. Use text or json." << std::endl;
        return 1;
    }

    if (parser.isSet(traceOption)) {
        logging::setTraceEnabled(true);
    }

    return runReconcile(positional.first(), parser.isSet(dryOption), format);
}

int RewindCli::runReconcile(const QString &root, bool dryRun, const QString &format)
{
    logging::RunScope runScope(QUuid::createUuid().toString(QUuid::WithoutBraces));

    HLOG_INFO("RewindCli", "reconcile_start",
              {{"root", root.toStdString()},
               {"dryRun", dryRun}});

    try {
        Reconciler reconciler;
        const ReconcileSummary summary =
            reconciler.reconcile(QFile::encodeName(root).toStdString(), dryRun);

        HLOG_INFO("RewindCli", "reconcile_done",
                  {{"rewound", summary.rewoundCount()},
                   {"firstRun", summary.firstRun},
                   {"stateSaved", summary.stateSaved}});

        if (format == QStringLiteral("json")) {
            renderJson(summary);
        } else {
            renderText(summary);
        }
        return 0;
    } catch (const HashprintError &error) {
        HLOG_ERROR("RewindCli", "reconcile_failed",
                   {{"kind", toKindString(error.kind())},
                    {"error", error.what()}});
        std::cerr << "hashprint: " << toKindString(error.kind()) << ": "
                  << error.what() << std::endl;
        return 2;
    } catch (const std::exception &error) {
        HLOG_ERROR("RewindCli", "reconcile_failed",
                   {{"kind", "unexpected"},
                    {"error", error.what()}});
        std::cerr << "hashprint: " << error.what() << std::endl;
        return 2;
    }
}

void RewindCli::renderText(const ReconcileSummary &summary) const
{
    std::cout << "Root: " << summary.root.string() << "\n";
    std::cout << "Files hashed: " << summary.filesHashed << "\n";

    if (summary.firstRun) {
        std::cout << "No previous state; baseline written for "
                  << summary.filesHashed << " files.\n";
        return;
    }

    if (summary.dryRun) {
        std::cout << "Dry run: " << summary.rewoundCount()
                  << " files would be rewound.\n";
    } else {
        std::cout << summary.rewoundCount() << " files rewound.\n";
    }
    for (const auto &file : summary.rewound) {
        std::cout << "  " << file.path.string() << ": "
                  << formatFileTime(file.from) << " -> "
                  << formatFileTime(file.to) << "\n";
    }

    if (!summary.modified.empty()) {
        std::cout << summary.modified.size() << " files actually modified.\n";
    }
    std::cout << "Added: " << summary.added << ", removed: " << summary.removed << "\n";
    if (!summary.stateSaved) {
        std::cout << "State file left unchanged.\n";
    }
}

void RewindCli::renderJson(const ReconcileSummary &summary) const
{
    const nlohmann::json payload = summary;
    std::cout << payload.dump(2, ' ', false, nlohmann::json::error_handler_t::replace)
              << std::endl;
}

} // namespace hashprint

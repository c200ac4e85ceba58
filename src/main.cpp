#include <QCoreApplication>
#include <QCommandLineParser>
#include <QDir>
#include <QElapsedTimer>
#include <QFileInfo>
#include <QTextStream>
#include <cstdio>
#include <exception>
#include <memory>

#include "ImageBuffer.h"
#include "analysis/ResultRanker.h"
#include "cipher/IteratedDecoder.h"
#include "console/ArgumentParameterSource.h"
#include "console/ConsoleParameterSource.h"
#include "console/ConsoleReporter.h"
#include "core/AppSettings.h"
#include "core/ErrorHandling.h"
#include "core/GlobalExceptionHandler.h"
#include "core/Logger.h"
#include "core/ResourceManager.h"
#include "core/Version.h"
#include "sweep/SweepEngine.h"

namespace {

enum ExitCode {
    ExitOk = 0,
    ExitFatal = 1,
    ExitUsage = 2
};

struct CommandLine {
    QString imagePath;
    QString iterations;
    QString coefA;
    QString coefB;
    QString output;
    QString rankOnlyDir;
    bool scramble = false;

    // Nothing will be prompted, so there is nobody to wait for at exit
    bool isNonInteractive() const {
        return scramble || !rankOnlyDir.isEmpty()
               || Console::ArgumentParameterSource::isComplete(imagePath, iterations, coefA, coefB);
    }
};

bool parsePositive(const QString& name, const QString& text, int& out, QString* errorMsg)
{
    bool ok = false;
    const int v = text.toInt(&ok);
    if (!ok || v <= 0) {
        if (errorMsg) *errorMsg = QString("Invalid value for %1: '%2' (expected a positive integer)").arg(name, text);
        return false;
    }
    out = v;
    return true;
}

int rankDirectory(const QString& directory, const AppSettings& settings, Console::ConsoleReporter& reporter)
{
    Analysis::RankerParams params;
    params.nameFilters = QStringList{QString("*.%1").arg(settings.outputFormat)};
    params.topCount = settings.topCount;
    params.threads = settings.maxThreads;

    Analysis::ResultRanker ranker(params);
    reporter.rankingStarting(directory);

    QString errorMsg;
    const bool ok = ranker.rank(directory, [&reporter](int done, int total) {
        reporter.progress("scoring", done, total);
    }, &errorMsg);

    if (!ok) {
        reportUserError("Ranking Failed", errorMsg);
        return ExitFatal;
    }
    if (ranker.lastReport().ranked.isEmpty()) {
        reporter.noCandidates(directory);
        return ExitOk;
    }
    reporter.ranking(ranker.lastReport(), ranker.top());
    return ExitOk;
}

bool loadSquareImage(const QString& path, ImageBuffer& image)
{
    QString errorMsg;
    if (!image.loadStandard(path, &errorMsg)) {
        reportUserError("Image Load Failed", errorMsg);
        return false;
    }
    if (!validateSquare(image, &errorMsg)) {
        reportUserError("Invalid Image", errorMsg);
        return false;
    }
    Logger::info(QString("Loaded %1 (%2x%3)").arg(path).arg(image.width()).arg(image.height()), "Main");
    return true;
}

int runScramble(const CommandLine& cli, const AppSettings& settings, Console::ConsoleReporter& reporter)
{
    if (cli.imagePath.isEmpty() || cli.iterations.isEmpty() || cli.coefA.isEmpty() || cli.coefB.isEmpty()) {
        reportUserError("Usage", "--scramble needs --image, --iterations, --coef-a and --coef-b");
        return ExitUsage;
    }

    Console::ArgumentParameterSource source(cli.imagePath, cli.iterations, cli.coefA, cli.coefB);
    QString imagePath;
    Sweep::SearchRanges ranges;
    QString errorMsg;
    if (!source.imagePath(imagePath, &errorMsg) || !source.searchRanges(ranges, &errorMsg)) {
        reportUserError("Usage", errorMsg);
        return ExitUsage;
    }
    if (ranges.combinationCount() != 1) {
        reportUserError("Usage", "--scramble takes single values for k, a and b, not ranges");
        return ExitUsage;
    }

    ImageBuffer image;
    if (!loadSquareImage(imagePath, image)) return ExitFatal;
    reporter.imageLoaded(image.width(), image.height());

    Cipher::TransformParams params;
    params.iterations = static_cast<int>(ranges.iterations.lower);
    params.a = ranges.a.lower;
    params.b = ranges.b.lower;

    QString outPath = cli.output;
    if (outPath.isEmpty()) {
        const QFileInfo fi(imagePath);
        outPath = QDir(fi.absolutePath()).filePath(QString("%1_scrambled_%2")
                      .arg(fi.completeBaseName(), params.fileName(settings.outputFormat)));
    }

    QElapsedTimer timer;
    timer.start();
    const ImageBuffer scrambled = Cipher::encode(image, params, settings.maxThreads);
    if (!scrambled.save(outPath, QString(), &errorMsg)) {
        reportUserError("Save Failed", errorMsg);
        return ExitFatal;
    }
    Logger::info(QString("Scrambled %1 with %2 -> %3").arg(imagePath, params.toString(), outPath), "Main");
    reporter.scrambled(outPath, timer.elapsed());
    return ExitOk;
}

int runSweep(const CommandLine& cli, const AppSettings& settings, Console::ConsoleReporter& reporter,
             QTextStream& in, QTextStream& out)
{
    const bool fromArguments = Console::ArgumentParameterSource::isComplete(cli.imagePath, cli.iterations,
                                                                            cli.coefA, cli.coefB);

    std::unique_ptr<Console::ParameterSource> source;
    if (fromArguments) {
        source = std::make_unique<Console::ArgumentParameterSource>(cli.imagePath, cli.iterations, cli.coefA, cli.coefB);
    } else {
        auto interactive = std::make_unique<Console::ConsoleParameterSource>(in, out);
        interactive->presetImagePath(cli.imagePath);

        // Ranges given on the command line skip their prompt but must be valid
        const struct { const char* name; QString text; void (Console::ConsoleParameterSource::*set)(const Sweep::ParameterRange&); } presets[] = {
            {"--iterations", cli.iterations, &Console::ConsoleParameterSource::presetIterations},
            {"--coef-a", cli.coefA, &Console::ConsoleParameterSource::presetA},
            {"--coef-b", cli.coefB, &Console::ConsoleParameterSource::presetB},
        };
        for (const auto& p : presets) {
            if (p.text.isEmpty()) continue;
            const Result<Sweep::ParameterRange> r = Sweep::ParameterRange::parse(p.text);
            if (r.isError()) {
                reportUserError("Usage", QString("Invalid value for %1: %2").arg(p.name, r.error()));
                return ExitUsage;
            }
            QString rangeError;
            if (p.set == &Console::ConsoleParameterSource::presetIterations
                && !Sweep::SearchRanges::validateIterations(r.value(), &rangeError)) {
                reportUserError("Usage", QString("Invalid value for %1: %2").arg(p.name, rangeError));
                return ExitUsage;
            }
            (interactive.get()->*p.set)(r.value());
        }
        source = std::move(interactive);
    }
    const ExitCode inputError = fromArguments ? ExitUsage : ExitFatal;

    QString errorMsg;
    QString imagePath;
    if (!source->imagePath(imagePath, &errorMsg)) {
        reportUserError(fromArguments ? "Usage" : "Input Error", errorMsg);
        return inputError;
    }

    ImageBuffer image;
    if (!loadSquareImage(imagePath, image)) return ExitFatal;
    reporter.imageLoaded(image.width(), image.height());

    Sweep::SearchRanges ranges;
    if (!source->searchRanges(ranges, &errorMsg)) {
        reportUserError(fromArguments ? "Usage" : "Input Error", errorMsg);
        return inputError;
    }

    Sweep::SweepParams params;
    params.ranges = ranges;
    params.outputDir = cli.output.isEmpty()
        ? Sweep::SweepEngine::defaultOutputDir(imagePath, settings.outputDirName)
        : QDir(cli.output).absolutePath();
    params.format = settings.outputFormat;
    params.threads = settings.maxThreads;
    params.maxCombinations = settings.maxCombinations;

    const qint64 total = ranges.combinationCount();
    if (total == 0) {
        reporter.noCombinations();
        return ExitOk;
    }
    reporter.sweepStarting(ranges, total, params.outputDir);

    Sweep::SweepEngine engine(params);
    if (!engine.run(image, [&reporter](int done, int count) { reporter.progress("decoding", done, count); },
                    &errorMsg)) {
        reportUserError("Sweep Failed", errorMsg);
        return ExitFatal;
    }
    reporter.sweepFinished(engine.lastStats());

    if (settings.rankingEnabled) {
        // The candidates stay on disk even when ranking fails
        if (rankDirectory(params.outputDir, settings, reporter) != ExitOk) {
            reportWarning("Ranking", QString("Candidates are still available in %1").arg(params.outputDir));
        }
    }
    reporter.done();
    return ExitOk;
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName("ArnoldSweep");
    QCoreApplication::setApplicationVersion(ArnoldSweep::getVersion());

    QCommandLineParser parser;
    parser.setApplicationDescription("Brute-force inversion of the generalized Arnold cat map");
    parser.addHelpOption();
    parser.addVersionOption();

    const QCommandLineOption imageOpt({"i", "image"}, "Source image.", "path");
    const QCommandLineOption iterOpt({"k", "iterations"}, "Iteration count or range, e.g. 8 or 0-10.", "range");
    const QCommandLineOption aOpt({"a", "coef-a"}, "Coefficient a or range.", "range");
    const QCommandLineOption bOpt({"b", "coef-b"}, "Coefficient b or range.", "range");
    const QCommandLineOption outputOpt({"o", "output"}, "Output directory (sweep) or file (scramble).", "path");
    const QCommandLineOption threadsOpt({"t", "threads"}, "Worker threads (default: 90% of cores).", "n");
    const QCommandLineOption topOpt("top", "Number of ranked candidates to show.", "n");
    const QCommandLineOption formatOpt("format", "Candidate image format (png, bmp, ...).", "ext");
    const QCommandLineOption configOpt("config", "INI configuration file.", "file");
    const QCommandLineOption noRankOpt("no-rank", "Skip the ranking pass.");
    const QCommandLineOption noPauseOpt("no-pause", "Do not wait for Enter before exiting.");
    const QCommandLineOption scrambleOpt("scramble", "Apply the forward map once per iteration and save the result.");
    const QCommandLineOption rankOnlyOpt("rank-only", "Score and rank an existing candidate directory.", "dir");
    parser.addOptions({imageOpt, iterOpt, aOpt, bOpt, outputOpt, threadsOpt, topOpt, formatOpt, configOpt,
                       noRankOpt, noPauseOpt, scrambleOpt, rankOnlyOpt});

    if (!parser.parse(app.arguments())) {
        std::fprintf(stderr, "%s\n\n%s", qPrintable(parser.errorText()), qPrintable(parser.helpText()));
        return ExitUsage;
    }
    if (parser.isSet("help")) parser.showHelp(ExitOk);
    if (parser.isSet("version")) parser.showVersion();
    if (!parser.positionalArguments().isEmpty()) {
        std::fprintf(stderr, "Unexpected argument: %s\n", qPrintable(parser.positionalArguments().first()));
        return ExitUsage;
    }

    AppSettings settings;
    QString errorMsg;
    if (!AppSettings::load(parser.value(configOpt), settings, &errorMsg)) {
        reportUserError("Configuration Error", errorMsg);
        return ExitFatal;
    }

    if (parser.isSet(threadsOpt) && !parsePositive("--threads", parser.value(threadsOpt), settings.maxThreads, &errorMsg)) {
        reportUserError("Usage", errorMsg);
        return ExitUsage;
    }
    if (parser.isSet(topOpt) && !parsePositive("--top", parser.value(topOpt), settings.topCount, &errorMsg)) {
        reportUserError("Usage", errorMsg);
        return ExitUsage;
    }
    if (parser.isSet(formatOpt)) settings.outputFormat = parser.value(formatOpt).trimmed().toLower();
    if (parser.isSet(noRankOpt)) settings.rankingEnabled = false;
    if (parser.isSet(noPauseOpt)) settings.pauseOnExit = false;

    CommandLine cli;
    cli.imagePath = parser.value(imageOpt);
    cli.iterations = parser.value(iterOpt);
    cli.coefA = parser.value(aOpt);
    cli.coefB = parser.value(bOpt);
    cli.output = parser.value(outputOpt);
    cli.rankOnlyDir = parser.value(rankOnlyOpt);
    cli.scramble = parser.isSet(scrambleOpt);

    if (cli.scramble && !cli.rankOnlyDir.isEmpty()) {
        reportUserError("Usage", "--scramble and --rank-only cannot be combined");
        return ExitUsage;
    }

    Logger::init(settings.logDir, settings.maxLogFiles);
    ScopeGuard closeLog([] { Logger::shutdown(); });
    GlobalExceptionHandler::init();
    ResourceManager::instance().init(settings.maxThreads);
    Logger::info(QString("ArnoldSweep %1 started").arg(ArnoldSweep::getVersion()), "Main");

    QTextStream in(stdin);
    QTextStream out(stdout);
    Console::ConsoleReporter reporter(out);
    reporter.banner(ArnoldSweep::getVersion());

    int code = ExitFatal;
    try {
        if (cli.scramble) {
            code = runScramble(cli, settings, reporter);
        } else if (!cli.rankOnlyDir.isEmpty()) {
            code = rankDirectory(QDir(cli.rankOnlyDir).absolutePath(), settings, reporter);
        } else {
            code = runSweep(cli, settings, reporter, in, out);
        }
    } catch (const std::exception& e) {
        GlobalExceptionHandler::handle(e);
        code = ExitFatal;
    }

    Logger::info(QString("Exiting with code %1").arg(code), "Main");
    if (settings.pauseOnExit && !cli.isNonInteractive()) {
        reporter.pause(in);
    }
    return code;
}

#include <iostream>
#include <vector>
#include <string>
#include <memory>
#include <QCoreApplication>
#include <QMutex>
#include <QFile>
#include <QDebug>
#include "DebugLogger.hpp"
#include "InstallConfiguration.hpp"
#include "Settings.hpp"
#include "PipelineConfig.hpp"
#include "ComponentCollection.hpp"
#include "RateLimiter.hpp"
#include "CircuitBreaker.hpp"
#include "MetricsTracker.hpp"
#include "LookupCache.hpp"
#include "TagLibTagWriter.hpp"
#include "Enricher.hpp"
#include "Stopwatch.hpp"
#include "Utils.hpp"
#include "Sources/MusicBrainzSource.hpp"





using namespace std;





/** Specifies whether the selected genres should be written into the files.
Settable through the "-w" cmdline param. */
static bool g_ShouldWriteTags = false;

/** Specifies whether the per-source metrics should be output after the run.
Settable through the "-s" cmdline param. */
static bool g_ShouldPrintMetrics = false;

/** Specifies whether the debug messages should be output to the console.
Settable through the "-v" cmdline param. */
static bool g_IsVerbose = false;

/** The confidence threshold override, negative if not overridden.
Settable through the "-c" cmdline param. */
static double g_Confidence = -1;

/** The max genres override, non-positive if not overridden.
Settable through the "-m" cmdline param. */
static int g_MaxGenres = 0;

/** The file into which the log is appended, empty if none.
Settable through the "-l" cmdline param. */
static QString g_LogFileName;

/** FileNames to process. */
static vector<QString> g_FileNames;

/** The mutex protecting the console output against multithreaded access. */
static QMutex g_OutputMtx;





/** Outputs the specified value to the stream, in utf-8. */
static std::ostream & operator <<(std::ostream & aStream, const QString & aValue)
{
	aStream << aValue.toStdString();
	return aStream;
}





static void printUsage()
{
	cerr << "GenreEnricher" << endl;
	cerr << "-------------" << endl;
	cerr << "Looks up the genres of audio files in online music databases and writes them into the files' tags." << endl;
	cerr << endl;
	cerr << "Usage:" << endl;
	cerr << "GenreEnricher [options] [filename] [filename] ..." << endl;
	cerr << endl;
	cerr << "Available options:" << endl;
	cerr << "  -w        ... Write the selected genres into the files (default: only report them)" << endl;
	cerr << "  -c <val>  ... Confidence threshold for the genres, 0 - 1 (overrides the settings)" << endl;
	cerr << "  -m <num>  ... Maximum number of genres per file (overrides the settings)" << endl;
	cerr << "  -s        ... Print the per-source call metrics after the run" << endl;
	cerr << "  -l <file> ... Append the log into the specified file" << endl;
	cerr << "  -f <file> ... Process the files listed in the specified list file (one per line)" << endl;
	cerr << "  -v        ... Verbose: output the debug messages to the console" << endl;
}





/** Adds the contents of the list file into the file list to be processed.
Returns false if the file cannot be read. */
static bool addListFile(const QString & aFileName)
{
	QFile f(aFileName);
	if (!f.open(QFile::ReadOnly | QFile::Text))
	{
		cerr << "Cannot open list file " << aFileName << ": " << f.errorString() << endl;
		return false;
	}
	auto contents = QString::fromUtf8(f.readAll());
	auto files = contents.split('\n');
	for (const auto & file: files)
	{
		auto fileName = file.trimmed();
		if (!fileName.isEmpty())
		{
			g_FileNames.push_back(fileName);
		}
	}
	return true;
}





#define NEED_ARGS(N) \
	if (i + N >= argc) \
	{ \
		cerr << "Bad argument " << i << " (" << aArgs[i] << "): needs " << N << " parameters" << endl; \
		return false; \
	} \





/** Processes all command-line arguments.
Returns false if the arguments are invalid. */
static bool processArgs(const vector<string> & aArgs)
{
	size_t argc = aArgs.size();
	for (size_t i = 0; i < argc; ++i)
	{
		if ((aArgs[i].size() > 1) && (aArgs[i][0] == '-'))
		{
			switch (aArgs[i][1])
			{
				case '?':
				case 'h':
				case 'H':
				{
					printUsage();
					return false;
				}
				case 'w':
				case 'W':
				{
					g_ShouldWriteTags = true;
					break;
				}
				case 's':
				case 'S':
				{
					g_ShouldPrintMetrics = true;
					break;
				}
				case 'v':
				case 'V':
				{
					g_IsVerbose = true;
					break;
				}
				case 'c':
				case 'C':
				{
					NEED_ARGS(1);
					bool isOK;
					g_Confidence = QString::fromStdString(aArgs[i + 1]).toDouble(&isOK);
					if (!isOK || !Utils::isInRange(g_Confidence, 0.0, 1.0))
					{
						cerr << "Invalid confidence value: " << aArgs[i + 1] << endl;
						return false;
					}
					i += 1;
					break;
				}
				case 'm':
				case 'M':
				{
					NEED_ARGS(1);
					bool isOK;
					g_MaxGenres = QString::fromStdString(aArgs[i + 1]).toInt(&isOK);
					if (!isOK || (g_MaxGenres < 1))
					{
						cerr << "Invalid max genres value: " << aArgs[i + 1] << endl;
						return false;
					}
					i += 1;
					break;
				}
				case 'l':
				case 'L':
				{
					NEED_ARGS(1);
					g_LogFileName = QString::fromStdString(aArgs[i + 1]);
					i += 1;
					break;
				}
				case 'f':
				case 'F':
				{
					NEED_ARGS(1);
					if (!addListFile(QString::fromStdString(aArgs[i + 1])))
					{
						return false;
					}
					i += 1;
					break;
				}
				default:
				{
					cerr << "Unknown option: " << aArgs[i] << endl;
					return false;
				}
			}  // switch (arg)
			continue;
		}  // if ('-')
		g_FileNames.push_back(QString::fromStdString(aArgs[i]));
	}
	return true;
}





/** Outputs a single line describing the result of processing a single file. */
static void outputResult(const EnrichmentResult & aResult)
{
	QMutexLocker lock(&g_OutputMtx);
	if (!aResult.isSuccess())
	{
		cout << "FAILED  " << aResult.mFileName << ": " << aResult.mError << endl;
		return;
	}
	if (aResult.mGenres.isEmpty())
	{
		cout << "NONE    " << aResult.mFileName << ": " << aResult.mNoGenresReason << endl;
		return;
	}
	cout << (aResult.mIsWritten ? "WRITTEN " : "OK      ") << aResult.mFileName << ": "
		<< aResult.mGenres.join("; ")
		<< " (confidence " << aResult.mConfidenceUsed << (aResult.mWasRelaxed ? ", relaxed" : "") << ")";
	if (!aResult.mYear.isEmpty())
	{
		cout << " [" << aResult.mYear << "]";
	}
	cout << endl;
	if (!aResult.mWriteError.isEmpty())
	{
		cout << "        " << aResult.mWriteError << endl;
	}
}





/** Outputs a line announcing that the circuit breaker has opened. */
static void outputBreakerOpened(int aFailureCount)
{
	QMutexLocker lock(&g_OutputMtx);
	cout << "PAUSED  Circuit breaker opened after " << aFailureCount << " consecutive failures, backing off." << endl;
}





/** Outputs a line announcing that the circuit breaker has closed. */
static void outputBreakerClosed()
{
	QMutexLocker lock(&g_OutputMtx);
	cout << "RESUMED Circuit breaker closed." << endl;
}





/** Outputs the per-source metrics. */
static void outputMetrics(const MetricsTracker & aMetrics)
{
	cout << endl << "Source metrics:" << endl;
	for (const auto & source: aMetrics.sources())
	{
		auto m = aMetrics.metrics(source);
		cout << "  " << source << ": "
			<< m.mTotalCalls << " calls, "
			<< m.mSuccessRate * 100 << " % success, "
			<< "avg latency " << Utils::formatDuration(m.mAvgLatency) << ", "
			<< m.mRateLimitRatio * 100 << " % rate-limited" << endl;
	}
}





/** Reads the track identification from each file, creates the work items.
Files that cannot be identified are reported and counted as failed. */
static vector<EnrichmentItem> createItems(TagWriter & aTagWriter, int & aNumUnidentified)
{
	vector<EnrichmentItem> res;
	aNumUnidentified = 0;
	for (const auto & fileName: g_FileNames)
	{
		if (!QFile::exists(fileName))
		{
			cout << "FAILED  " << fileName << ": File doesn't exist" << endl;
			aNumUnidentified += 1;
			continue;
		}
		auto track = aTagWriter.readTrack(fileName);
		if (!track.first)
		{
			cout << "FAILED  " << fileName << ": Cannot identify the track (no artist / title)" << endl;
			aNumUnidentified += 1;
			continue;
		}
		res.emplace_back(fileName, track.second.mArtist, track.second.mTitle);
	}
	return res;
}





int main(int argc, char * argv[])
{
	QCoreApplication app(argc, argv);
	DebugLogger::get().setConsoleMinType(QtWarningMsg);

	// Process the commandline args:
	vector<string> args;
	for (int i = 1; i < argc; ++i)
	{
		args.push_back(argv[i]);
	}
	if (!processArgs(args))
	{
		return 2;
	}
	if (g_FileNames.empty())
	{
		printUsage();
		return 2;
	}
	if (g_IsVerbose)
	{
		DebugLogger::get().setConsoleMinType(QtDebugMsg);
	}
	if (!g_LogFileName.isEmpty() && !DebugLogger::get().setLogFile(g_LogFileName))
	{
		cerr << "Cannot open the log file " << g_LogFileName << endl;
		return 2;
	}

	try
	{
		// Load the configuration:
		auto instConf = std::make_shared<InstallConfiguration>();
		Settings::init(instConf->iniFileName());
		auto config = PipelineConfig::load();
		if (g_Confidence >= 0)
		{
			config.mConfidence = g_Confidence;
		}
		if (g_MaxGenres > 0)
		{
			config.mMaxGenres = g_MaxGenres;
		}

		// Create the components:
		ComponentCollection cc;
		cc.addComponent(instConf);
		auto limiter = cc.addNew<RateLimiter>();
		cc.addNew<CircuitBreaker>(config.mFailureThreshold, config.mResetTimeoutSec);
		auto metrics = cc.addNew<MetricsTracker>(instConf->metricsFileName());
		auto tagWriter = cc.addNew<TagLibTagWriter>();
		if (config.mIsCacheEnabled)
		{
			auto cache = cc.addNew<LookupCache>(instConf->cacheFolder(), config.mCacheTtlSec);
			cache->removeExpired();
		}

		// Create the sources, with their rate limits:
		vector<MusicSourcePtr> sources;
		if (config.mIsMusicBrainzEnabled)
		{
			sources.push_back(std::make_shared<MusicBrainzSource>(config.mMusicBrainzUserAgent, config.mMusicBrainzTimeoutMsec));
		}
		if (sources.empty())
		{
			cerr << "No source is enabled in the settings (" << instConf->iniFileName() << ")." << endl;
			return 2;
		}
		for (const auto & source: sources)
		{
			auto limit = config.rateLimitFor(source->name());
			limiter->createLimit(source->name(), limit.mCapacity, limit.mFillRate);
		}

		// Process the files:
		Stopwatch sw(__FILE__, __LINE__, "Processing all files");
		int numUnidentified = 0;
		auto items = createItems(*tagWriter, numUnidentified);
		Enricher enricher(cc, sources, config);
		enricher.setShouldWriteTags(g_ShouldWriteTags);
		QObject::connect(&enricher, &Enricher::itemFinished, &enricher, &outputResult, Qt::DirectConnection);
		QObject::connect(&enricher, &Enricher::breakerOpened, &enricher, &outputBreakerOpened, Qt::DirectConnection);
		QObject::connect(&enricher, &Enricher::breakerClosed, &enricher, &outputBreakerClosed, Qt::DirectConnection);
		auto summary = enricher.processAll(items);

		// Output the summary:
		auto numFailed = summary.mFailed + numUnidentified;
		cout << endl << "Processed " << summary.mTotal + numUnidentified << " files in "
			<< Utils::formatDuration(sw.elapsedSec()) << ": "
			<< summary.mSucceeded << " succeeded, "
			<< numFailed << " failed, "
			<< summary.mCancelled << " not processed." << endl;
		if (summary.mWasStopped)
		{
			cout << "The run was stopped early, the sources kept failing." << endl;
		}
		if (g_ShouldPrintMetrics)
		{
			outputMetrics(*metrics);
		}
		return ((numFailed > 0) || (summary.mCancelled > 0)) ? 1 : 0;
	}
	catch (const std::exception & exc)
	{
		cerr << "Fatal error: " << exc.what() << endl;
		return 2;
	}
}

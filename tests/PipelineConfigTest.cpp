// PipelineConfigTest.cpp

// Tests loading the pipeline configuration from the settings file, and logging into a file





#include <iostream>
#include <QFile>
#include <QDebug>
#include <QTemporaryDir>
#include "../src/InstallConfiguration.hpp"
#include "../src/Settings.hpp"
#include "../src/PipelineConfig.hpp"
#include "../src/DebugLogger.hpp"





/** Global failure flag, any failing test sets this to true.
The program's exit status is set according to this value. */
static bool g_HasFailed = false;





/** Reports the failure if the condition doesn't hold. */
static void expect(bool aCondition, const char * aDescription)
{
	if (!aCondition)
	{
		std::cerr << "FAILED: " << aDescription << std::endl;
		g_HasFailed = true;
	}
}





/** Without any stored values, the defaults are used. */
static void testDefaults()
{
	auto config = PipelineConfig::load();
	PipelineConfig defaults;
	expect(config.mNumWorkers == defaults.mNumWorkers, "Default worker count");
	expect(config.mFailureThreshold == 5, "Default failure threshold");
	expect(config.mResetTimeoutSec == 60, "Default reset timeout");
	expect(config.mConfidence == 0.5, "Default confidence");
	expect(config.mMaxGenres == 3, "Default max genres");
	expect(config.mMaxTags == 100, "Default max tags");
	expect(config.mMinConfidence == 0.2, "Default min confidence");
	expect(config.mIsCacheEnabled, "The cache is enabled by default");
	expect(config.mCacheTtlSec == 86400, "Default cache TTL");
	expect(config.mIsMusicBrainzEnabled, "MusicBrainz is enabled by default");

	auto mb = config.rateLimitFor("MusicBrainz");
	expect((mb.mCapacity == 1) && (mb.mFillRate == 1.0), "MusicBrainz is limited to a request per second by default");
	auto other = config.rateLimitFor("Other");
	expect((other.mCapacity == 10) && (other.mFillRate == 1.0), "Unconfigured sources get the default limit");
}





/** Stored values override the defaults; out-of-range values are clamped, invalid rate limits ignored. */
static void testStoredValues()
{
	Settings::saveValue("Workers", "count", 1000);
	Settings::saveValue("CircuitBreaker", "failureThreshold", 2);
	Settings::saveValue("CircuitBreaker", "resetTimeout", 5);
	Settings::saveValue("CircuitBreaker", "maxOpenRetries", -3);
	Settings::saveValue("Aggregator", "confidence", 1.5);
	Settings::saveValue("Aggregator", "maxGenres", 5);
	Settings::saveValue("Cache", "enabled", false);
	Settings::saveValue("Cache", "ttl", 60);
	Settings::saveValue("MusicBrainz", "userAgent", "Test/0.1 ( test@example.com )");
	Settings::saveValue(QString("RateLimits/MusicBrainz"), QString("capacity"), 5);
	Settings::saveValue(QString("RateLimits/MusicBrainz"), QString("fillRate"), 0.5);
	Settings::saveValue(QString("RateLimits/Broken"), QString("capacity"), 0);
	Settings::saveValue(QString("RateLimits/Broken"), QString("fillRate"), 3);

	auto config = PipelineConfig::load();
	expect(config.mNumWorkers == 64, "Too many workers are clamped");
	expect(config.mFailureThreshold == 2, "Stored failure threshold is used");
	expect(config.mResetTimeoutSec == 5, "Stored reset timeout is used");
	expect(config.mMaxOpenRetries == 0, "Negative open retries are clamped");
	expect(config.mConfidence == 1.0, "Too high confidence is clamped");
	expect(config.mMaxGenres == 5, "Stored max genres is used");
	expect(!config.mIsCacheEnabled, "Stored cache flag is used");
	expect(config.mCacheTtlSec == 60, "Stored cache TTL is used");
	expect(config.mMusicBrainzUserAgent == "Test/0.1 ( test@example.com )", "Stored user agent is used");

	auto mb = config.rateLimitFor("MusicBrainz");
	expect((mb.mCapacity == 5) && (mb.mFillRate == 0.5), "Stored rate limit is used");
	auto broken = config.rateLimitFor("Broken");
	expect((broken.mCapacity == 10) && (broken.mFillRate == 1.0), "Invalid rate limit is replaced by the default");
}





/** The messages are kept in memory and appended to the log file. */
static void testLogging(const InstallConfiguration & aInstallConfig)
{
	auto & logger = DebugLogger::get();
	logger.setConsoleMinType(QtCriticalMsg);
	expect(logger.setLogFile(aInstallConfig.logFileName()), "The log file can be opened");
	qDebug() << "Debug message for the test";
	qWarning() << "Warning message for the test";

	auto warnings = logger.lastMessages(QtWarningMsg);
	expect(!warnings.empty(), "The warning is kept in memory");
	expect(warnings.back().mMessage.contains("Warning message for the test"), "The last kept warning is the test's one");
	for (const auto & msg: warnings)
	{
		if (msg.mMessage.contains("Debug message for the test"))
		{
			expect(false, "Debug messages are filtered out of the warnings");
		}
	}

	QFile f(aInstallConfig.logFileName());
	expect(f.open(QIODevice::ReadOnly | QIODevice::Text), "The log file can be read");
	auto contents = QString::fromUtf8(f.readAll());
	expect(contents.contains("DEBUG") && contents.contains("Debug message for the test"), "Debug messages are logged into the file");
	expect(contents.contains("WARNING") && contents.contains("Warning message for the test"), "Warnings are logged into the file");

	expect(!logger.setLogFile(aInstallConfig.dataLocation("nonexistent/folder/file.log")), "An unwritable log file is refused");
}





int main()
{
	QTemporaryDir tmp;
	if (!tmp.isValid())
	{
		std::cerr << "Cannot create a temporary folder" << std::endl;
		return 2;
	}
	InstallConfiguration installConfig(tmp.path());
	expect(installConfig.iniFileName() == tmp.path() + "/GenreEnricher.ini", "The settings file is in the data folder");
	expect(installConfig.cacheFolder() == tmp.path() + "/cache/", "The cache folder is in the data folder");
	Settings::init(installConfig.iniFileName());
	expect(Settings::isInitialized(), "Settings are initialized");

	testDefaults();
	testStoredValues();
	testLogging(installConfig);

	if (!g_HasFailed)
	{
		std::cerr << "All tests passed" << std::endl;
	}
	return g_HasFailed ? 1 : 0;
}

#pragma once

#include <map>
#include <QString>





/** All the tunables of the enrichment pipeline, in one place.
Defaults are set in the member initializers; load() overrides them from Settings. */
struct PipelineConfig
{
	/** Token bucket parameters for a single source. */
	struct RateLimit
	{
		double mCapacity;
		double mFillRate;

		RateLimit(double aCapacity = 10, double aFillRate = 1.0):
			mCapacity(aCapacity),
			mFillRate(aFillRate)
		{
		}
	};


	/** Number of worker threads pulling tasks from the queue. */
	int mNumWorkers = 1;

	/** Consecutive failures that open the circuit breaker. */
	int mFailureThreshold = 5;

	/** The circuit breaker's back-off: seconds a worker waits before probing an open breaker again
	(multiplied by the attempt number). */
	int mResetTimeoutSec = 60;

	/** How many times in a row a worker may find the breaker open before the run is stopped. */
	int mMaxOpenRetries = 3;

	/** Confidence a genre needs in order to be selected. */
	double mConfidence = 0.5;

	/** Maximum number of genres written to a file. */
	int mMaxGenres = 3;

	/** Maximum number of raw source tags considered per item. */
	int mMaxTags = 100;

	/** The floor used when no genre clears mConfidence. */
	double mMinConfidence = 0.2;

	/** Whether the lookup cache is used. */
	bool mIsCacheEnabled = true;

	/** Lifetime of a lookup cache entry, in seconds. */
	qint64 mCacheTtlSec = 86400;

	/** Whether the bundled MusicBrainz source is used. */
	bool mIsMusicBrainzEnabled = true;

	/** The User-Agent header sent to MusicBrainz, as required by its usage policy. */
	QString mMusicBrainzUserAgent = "GenreEnricher/1.0 ( https://github.com/genreenricher )";

	/** Timeout for a single MusicBrainz request. */
	int mMusicBrainzTimeoutMsec = 10000;

	/** Per-source rate limits, source name -> bucket parameters. */
	std::map<QString, RateLimit> mRateLimits;


	/** Creates the default configuration. */
	PipelineConfig();

	/** Returns the configuration stored in Settings, with defaults for all values not present.
	Out-of-range values are clamped and logged. */
	static PipelineConfig load();

	/** Returns the rate limit for the specified source, the default one if not configured explicitly. */
	RateLimit rateLimitFor(const QString & aSourceName) const;
};

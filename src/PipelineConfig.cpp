#include "PipelineConfig.hpp"
#include <algorithm>
#include <cmath>
#include <QThread>
#include <QDebug>
#include "Settings.hpp"
#include "Utils.hpp"





/** Returns the value, clamped into the range; logs a warning if clamping was needed. */
template <typename T>
static T clampLogged(const char * aValueName, T aValue, T aMin, T aMax)
{
	auto res = Utils::clamp(aValue, aMin, aMax);
	if (res != aValue)
	{
		qWarning() << "Configuration value " << aValueName << " = " << aValue
			<< " is out of range, using " << res << " instead.";
	}
	return res;
}





PipelineConfig::PipelineConfig():
	mNumWorkers(std::max(1, QThread::idealThreadCount()))
{
	// MusicBrainz allows a single request per second per client:
	mRateLimits["MusicBrainz"] = RateLimit(1, 1.0);
}





PipelineConfig PipelineConfig::load()
{
	PipelineConfig res;
	res.mNumWorkers = clampLogged("Workers/count",
		Settings::loadValue("Workers", "count", res.mNumWorkers).toInt(), 1, 64
	);

	res.mFailureThreshold = clampLogged("CircuitBreaker/failureThreshold",
		Settings::loadValue("CircuitBreaker", "failureThreshold", res.mFailureThreshold).toInt(), 1, 1000
	);
	res.mResetTimeoutSec = clampLogged("CircuitBreaker/resetTimeout",
		Settings::loadValue("CircuitBreaker", "resetTimeout", res.mResetTimeoutSec).toInt(), 0, 3600
	);
	res.mMaxOpenRetries = clampLogged("CircuitBreaker/maxOpenRetries",
		Settings::loadValue("CircuitBreaker", "maxOpenRetries", res.mMaxOpenRetries).toInt(), 0, 100
	);

	res.mConfidence = clampLogged("Aggregator/confidence",
		Settings::loadValue("Aggregator", "confidence", res.mConfidence).toDouble(), 0.0, 1.0
	);
	res.mMaxGenres = clampLogged("Aggregator/maxGenres",
		Settings::loadValue("Aggregator", "maxGenres", res.mMaxGenres).toInt(), 1, 100
	);
	res.mMaxTags = clampLogged("Aggregator/maxTags",
		Settings::loadValue("Aggregator", "maxTags", res.mMaxTags).toInt(), 1, 10000
	);
	res.mMinConfidence = clampLogged("Aggregator/minConfidence",
		Settings::loadValue("Aggregator", "minConfidence", res.mMinConfidence).toDouble(), 0.0, 1.0
	);

	res.mIsCacheEnabled = Settings::loadValue("Cache", "enabled", res.mIsCacheEnabled).toBool();
	res.mCacheTtlSec = clampLogged<qint64>("Cache/ttl",
		Settings::loadValue("Cache", "ttl", res.mCacheTtlSec).toLongLong(), 1, 365 * 86400
	);

	res.mIsMusicBrainzEnabled = Settings::loadValue("MusicBrainz", "enabled", res.mIsMusicBrainzEnabled).toBool();
	res.mMusicBrainzUserAgent = Settings::loadValue("MusicBrainz", "userAgent", res.mMusicBrainzUserAgent).toString();
	res.mMusicBrainzTimeoutMsec = clampLogged("MusicBrainz/timeout",
		Settings::loadValue("MusicBrainz", "timeout", res.mMusicBrainzTimeoutMsec).toInt(), 100, 600000
	);

	for (const auto & source: Settings::childGroups("RateLimits"))
	{
		auto group = QString("RateLimits/%1").arg(source);
		auto def = res.rateLimitFor(source);
		auto capacity = Settings::loadValue(group, "capacity", def.mCapacity).toDouble();
		auto fillRate = Settings::loadValue(group, "fillRate", def.mFillRate).toDouble();
		if (!std::isfinite(capacity) || !std::isfinite(fillRate) || (capacity <= 0) || (fillRate <= 0))
		{
			qWarning() << "Ignoring invalid rate limit for source " << source
				<< ": capacity " << capacity << ", fill rate " << fillRate;
			continue;
		}
		res.mRateLimits[source] = RateLimit(capacity, fillRate);
	}
	return res;
}





PipelineConfig::RateLimit PipelineConfig::rateLimitFor(const QString & aSourceName) const
{
	auto itr = mRateLimits.find(aSourceName);
	if (itr != mRateLimits.end())
	{
		return itr->second;
	}
	return RateLimit();
}

#include "RateLimiter.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <QThread>
#include <QDebug>
#include "Stopwatch.hpp"
#include "Utils.hpp"
#include "Exception.hpp"





/** Number of nanoseconds in a second. */
static const qint64 NSEC_PER_SEC = 1000000000;

/** Limits for the bucket parameters, so that the fixed-point arithmetic cannot overflow. */
static const double MAX_CAPACITY = 1e9;
static const double MAX_FILL_RATE = 1000;

const qint64 RateLimiter::SCALE;
const unsigned long RateLimiter::WAIT_MARGIN_USEC;





RateLimiter::RateLimiter()
{
}





void RateLimiter::createLimit(const QString & aKey, double aCapacity, double aFillRate)
{
	if (!std::isfinite(aCapacity) || !std::isfinite(aFillRate))
	{
		throw LogicError("Invalid rate limit for %1 (capacity %2, fill rate %3)", aKey, aCapacity, aFillRate);
	}
	if ((aCapacity > MAX_CAPACITY) || (aFillRate > MAX_FILL_RATE))
	{
		qWarning() << "Rate limit for " << aKey << " is too large, clamping (capacity "
			<< aCapacity << ", fill rate " << aFillRate << ")";
	}
	Bucket bucket;
	bucket.mCapacity = toFixed(std::min(std::max(aCapacity, 0.0), MAX_CAPACITY));
	bucket.mFillRate = toFixed(std::min(std::max(aFillRate, 0.0), MAX_FILL_RATE));
	bucket.mTokens = bucket.mCapacity;
	bucket.mLastUpdateNsec = TimeSinceStart::nsecElapsed();
	bucket.mRefillRemainder = 0;

	QMutexLocker lock(&mMtx);
	mBuckets[aKey] = bucket;
}





bool RateLimiter::acquire(const QString & aKey, double aTokens, bool aShouldWait)
{
	if (!std::isfinite(aTokens) || (aTokens < 0))
	{
		throw LogicError("Cannot acquire an invalid number of tokens (%1) from %2", aTokens, aKey);
	}

	// No bucket can ever hold more than MAX_CAPACITY, larger requests are refused before converting to fixed-point:
	if (aTokens > MAX_CAPACITY)
	{
		if (!hasLimit(aKey))
		{
			qDebug() << "No rate limit configured for " << aKey << ", allowing the call.";
			return true;
		}
		if (!aShouldWait)
		{
			return false;
		}
		throw LogicError("Waiting for %1 tokens of %2 would never finish, no bucket can hold that many", aTokens, aKey);
	}
	auto needed = toFixed(aTokens);

	QMutexLocker lock(&mMtx);
	while (true)
	{
		// The bucket needs to be looked up again on each iteration, the map may have changed while sleeping:
		auto itr = mBuckets.find(aKey);
		if (itr == mBuckets.end())
		{
			qDebug() << "No rate limit configured for " << aKey << ", allowing the call.";
			return true;
		}
		auto & bucket = itr->second;
		refill(bucket, TimeSinceStart::nsecElapsed());
		if (bucket.mTokens >= needed)
		{
			bucket.mTokens -= needed;
			return true;
		}
		if (!aShouldWait)
		{
			return false;
		}
		if ((needed > bucket.mCapacity) || (bucket.mFillRate <= 0))
		{
			throw LogicError("Waiting for %1 tokens of %2 would never finish (capacity %3, fill rate %4)",
				aTokens, aKey, fromFixed(bucket.mCapacity), fromFixed(bucket.mFillRate)
			);
		}

		// Sleep until the deficit is refilled, without holding the lock:
		auto deficit = needed - bucket.mTokens;
		auto waitUsec = Utils::ceil<unsigned long>(
			static_cast<double>(deficit) * 1e6 / static_cast<double>(bucket.mFillRate)
		);
		lock.unlock();
		QThread::usleep(waitUsec + WAIT_MARGIN_USEC);
		lock.relock();
	}
}





std::pair<bool, double> RateLimiter::tokenCount(const QString & aKey)
{
	QMutexLocker lock(&mMtx);
	auto itr = mBuckets.find(aKey);
	if (itr == mBuckets.end())
	{
		return std::make_pair(false, 0.0);
	}
	refill(itr->second, TimeSinceStart::nsecElapsed());
	return std::make_pair(true, fromFixed(itr->second.mTokens));
}





bool RateLimiter::hasLimit(const QString & aKey) const
{
	QMutexLocker lock(&mMtx);
	return (mBuckets.find(aKey) != mBuckets.end());
}





qint64 RateLimiter::toFixed(double aValue)
{
	// Saturate, the conversion of an out-of-range value is undefined:
	static const double maxFixed = static_cast<double>(std::numeric_limits<qint64>::max() / 2);
	if (std::isnan(aValue))
	{
		return 0;
	}
	auto scaled = aValue * SCALE;
	if (scaled >= maxFixed)
	{
		return std::numeric_limits<qint64>::max() / 2;
	}
	if (scaled <= -maxFixed)
	{
		return -(std::numeric_limits<qint64>::max() / 2);
	}
	return static_cast<qint64>(std::llround(scaled));
}





double RateLimiter::fromFixed(qint64 aValue)
{
	return static_cast<double>(aValue) / SCALE;
}





void RateLimiter::refill(Bucket & aBucket, qint64 aNowNsec)
{
	auto elapsed = aNowNsec - aBucket.mLastUpdateNsec;
	if (elapsed <= 0)
	{
		return;
	}
	aBucket.mLastUpdateNsec = aNowNsec;
	auto missing = aBucket.mCapacity - aBucket.mTokens;
	if ((missing <= 0) || (aBucket.mFillRate <= 0))
	{
		aBucket.mRefillRemainder = 0;
		return;
	}

	// Whole seconds first, so that the products below stay within 64 bits:
	auto wholeSec = elapsed / NSEC_PER_SEC;
	if (wholeSec >= missing / aBucket.mFillRate + 1)
	{
		aBucket.mTokens = aBucket.mCapacity;
		aBucket.mRefillRemainder = 0;
		return;
	}
	auto partial = (elapsed % NSEC_PER_SEC) * aBucket.mFillRate + aBucket.mRefillRemainder;
	auto added = wholeSec * aBucket.mFillRate + partial / NSEC_PER_SEC;
	aBucket.mRefillRemainder = partial % NSEC_PER_SEC;
	if (added >= missing)
	{
		aBucket.mTokens = aBucket.mCapacity;
		aBucket.mRefillRemainder = 0;
	}
	else
	{
		aBucket.mTokens += added;
	}
}

#pragma once

#include <map>
#include <utility>
#include <QMutex>
#include <QString>
#include "ComponentCollection.hpp"





/** Per-key token-bucket rate limiting of the calls to the external sources.
Each key (typically a source name, or "source/operation") has its own bucket that holds up to
capacity tokens and is refilled continuously at fillRate tokens per second.
Token amounts are stored as fixed-point integers (SCALE units per token), so that the many small
refills of a long-running process don't accumulate floating-point drift; the public interface uses doubles.
Keys with no configured bucket are not limited at all (fail-open), so that a missing configuration
cannot deadlock the pipeline.
Thread-safe; a waiting acquire() sleeps without holding the internal lock. */
class RateLimiter:
	public ComponentCollection::Component<ComponentCollection::ckRateLimiter>
{
public:

	/** Number of fixed-point units per token (6 decimal digits of precision). */
	static const qint64 SCALE = 1000000;

	/** Extra time added to each computed wait, so that the waiter doesn't wake up just before the tokens are there. */
	static const unsigned long WAIT_MARGIN_USEC = 100;


	RateLimiter();

	/** Creates the bucket for the specified key, full.
	If a bucket with the same key already exists, it is replaced (and thus reset to full). */
	void createLimit(const QString & aKey, double aCapacity, double aFillRate);

	/** Takes the specified number of tokens from the bucket for the specified key.
	Returns true if the tokens were taken.
	If there are not enough tokens and aShouldWait is false, returns false immediately.
	If aShouldWait is true, sleeps until enough tokens have been refilled (possibly several times,
	if other threads take the tokens first), then returns true.
	Returns true immediately for keys that have no bucket.
	Throws a LogicError if waiting is requested for more tokens than the bucket can ever hold,
	or if aTokens is negative or not finite. */
	bool acquire(const QString & aKey, double aTokens = 1.0, bool aShouldWait = true);

	/** Returns the current (refilled) number of tokens in the specified bucket.
	The first value is false if there's no bucket for the key. */
	std::pair<bool, double> tokenCount(const QString & aKey);

	/** Returns true if there is a bucket for the specified key. */
	bool hasLimit(const QString & aKey) const;

	/** Converts the token amount into the fixed-point representation. */
	static qint64 toFixed(double aValue);

	/** Converts the fixed-point representation back into the token amount. */
	static double fromFixed(qint64 aValue);


protected:

	/** A single token bucket. All token amounts are in fixed-point units. */
	struct Bucket
	{
		qint64 mCapacity;
		qint64 mFillRate;   ///< Fixed-point units per second
		qint64 mTokens;

		/** The TimeSinceStart::nsecElapsed() timestamp of the last refill. */
		qint64 mLastUpdateNsec;

		/** The part of the refill that didn't add up to a whole fixed-point unit yet, in units * nsec.
		Carried over to the next refill so that no fractions are lost. Always less than 1e9. */
		qint64 mRefillRemainder;
	};


	/** The mutex protecting mBuckets against multithreaded access. */
	mutable QMutex mMtx;

	/** The buckets, key -> bucket.
	Protected against multithreaded access by mMtx. */
	std::map<QString, Bucket> mBuckets;


	/** Adds the tokens accumulated since the last refill, up to the bucket capacity. */
	static void refill(Bucket & aBucket, qint64 aNowNsec);
};

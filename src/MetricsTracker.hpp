#pragma once

#include <map>
#include <vector>
#include <QMutex>
#include <QString>
#include "ComponentCollection.hpp"





// fwd:
class QJsonObject;





/** Keeps the per-source counters of the external calls (volume, success, latency, rate-limit pressure),
and persists them into a JSON file after each update, so that they survive program restarts.
Thread-safe. */
class MetricsTracker:
	public ComponentCollection::Component<ComponentCollection::ckMetricsTracker>
{
public:

	/** The raw counters for a single source. All of them only ever grow (until reset). */
	struct ApiMetrics
	{
		qint64 mTotalCalls = 0;
		qint64 mSuccessfulCalls = 0;
		qint64 mFailedCalls = 0;

		/** Sum of the latencies of all the calls, in seconds. */
		double mTotalLatency = 0;

		/** Number of calls that had to wait for the rate limiter. */
		qint64 mRateLimitHits = 0;

		QJsonObject toJson() const;

		/** Adds the counters from the JSON object to this object's counters.
		Missing or invalid values are ignored. */
		void mergeJson(const QJsonObject & aJson);
	};


	/** The values derived from the counters of a single source.
	All values are zero for a source that has no calls recorded. */
	struct Summary
	{
		qint64 mTotalCalls = 0;
		double mSuccessRate = 0;
		double mAvgLatency = 0;
		double mRateLimitRatio = 0;
	};


	/** Creates a new tracker persisting into the specified file.
	The counters already present in the file are loaded.
	If the file name is empty, the metrics are only kept in memory. */
	explicit MetricsTracker(const QString & aFileName);

	/** Records a single call to the specified source, and saves all the metrics to the file.
	aLatency is in seconds. aWasRateLimited signals that the call had to wait for the rate limiter. */
	void recordApiCall(const QString & aSource, bool aSuccess, double aLatency, bool aWasRateLimited = false);

	/** Returns the summary for the specified source. */
	Summary metrics(const QString & aSource) const;

	/** Returns the raw counters for the specified source (all zero for an unknown source). */
	ApiMetrics rawMetrics(const QString & aSource) const;

	/** Returns the names of all sources that have any metrics recorded, sorted. */
	std::vector<QString> sources() const;

	/** Clears the metrics for the specified source, or for all sources if aSource is empty,
	and saves the change to the file. */
	void resetMetrics(const QString & aSource = QString());


protected:

	/** The file where the metrics are persisted. Empty if not persisted. */
	const QString mFileName;

	/** The mutex protecting mMetrics against multithreaded access. */
	mutable QMutex mMtx;

	/** The counters, source name -> counters.
	Protected against multithreaded access by mMtx. */
	std::map<QString, ApiMetrics> mMetrics;


	/** Merges the counters stored in mFileName into mMetrics.
	An unreadable or corrupt file is treated as empty (a warning is logged). */
	void loadFromFile();

	/** Writes the entire mMetrics into mFileName.
	Expects mMtx to be locked by the caller.
	Failures are logged, but not propagated, so that a full disk doesn't fail the tasks. */
	void saveLocked() const;
};

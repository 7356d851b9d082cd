#pragma once

#include <memory>
#include <vector>
#include <map>
#include <atomic>
#include <QObject>
#include <QThread>
#include <QMutex>
#include <QWaitCondition>
#include <QStringList>
#include "PipelineConfig.hpp"
#include "SignalAggregator.hpp"
#include "Task.hpp"
#include "Sources/MusicSource.hpp"





// fwd:
class ComponentCollection;
class TaskQueue;





/** A single work item: an audio file and the track it contains. */
struct EnrichmentItem
{
	QString mFileName;
	QString mArtist;
	QString mTitle;

	EnrichmentItem() {}

	EnrichmentItem(const QString & aFileName, const QString & aArtist, const QString & aTitle):
		mFileName(aFileName),
		mArtist(aArtist),
		mTitle(aTitle)
	{
	}
};





/** The outcome of processing a single work item. */
struct EnrichmentResult
{
	QString mFileName;
	QString mArtist;
	QString mTitle;

	/** The selected genres, best first. Empty if none could be selected. */
	QStringList mGenres;

	/** The confidence threshold that was actually used for the genre selection. */
	double mConfidenceUsed = 0;

	/** True if the configured confidence threshold had to be relaxed. */
	bool mWasRelaxed = false;

	/** If no genres were selected, the reason. */
	QString mNoGenresReason;

	QString mYear;
	QString mAlbum;

	/** The errors reported by the individual sources (the item may still succeed through the other sources). */
	QStringList mSourceErrors;

	/** True if the genres were written into the file. */
	bool mIsWritten = false;

	/** The reason the genres were not written, if writing was requested and failed. */
	QString mWriteError;

	/** The error that has failed the entire item; empty on success. */
	QString mError;


	bool isSuccess() const { return mError.isEmpty(); }
};

Q_DECLARE_METATYPE(EnrichmentResult);





/** The totals of a single run of the pipeline. */
struct RunSummary
{
	int mTotal = 0;
	int mSucceeded = 0;
	int mFailed = 0;

	/** The items that were never dispatched (the run has been stopped). */
	int mCancelled = 0;

	/** True if the run was stopped before all items were processed. */
	bool mWasStopped = false;

	/** The results of the processed items, in the order of the input items. */
	std::vector<EnrichmentResult> mResults;
};





/** The enrichment pipeline: looks up each work item in all the configured sources,
aggregates the genre signals and writes the selected genres back to the file.
The items are processed as tasks in a TaskQueue, by a pool of worker threads.
Before each external call the source's rate limit is applied, and the call's outcome is recorded in the metrics;
previously seen queries are served from the lookup cache.
The components used (from the ComponentCollection given in the constructor):
	- CircuitBreaker (required), shared by all runs
	- RateLimiter, MetricsTracker, LookupCache, TagWriter (optional) */
class Enricher:
	public QObject
{
	using Super = QObject;

	Q_OBJECT


public:

	/** Creates a new pipeline over the specified sources.
	Throws a LogicError if there are no sources or the CircuitBreaker component is missing. */
	Enricher(
		const ComponentCollection & aComponents,
		std::vector<MusicSourcePtr> aSources,
		const PipelineConfig & aConfig,
		QObject * aParent = nullptr
	);

	virtual ~Enricher();

	/** Processes all the specified items, blocks until done (or stopped).
	A failing item never aborts the run; its failure is reported in the summary. */
	RunSummary processAll(const std::vector<EnrichmentItem> & aItems);

	/** Stops the current run: the items that haven't been dispatched yet are cancelled,
	the ones already being processed are finished normally.
	Can be called from any thread. */
	void stop();

	/** Returns true while a run is in progress and hasn't been stopped. */
	bool isRunning() const { return mIsRunning.load(); }

	/** Sets whether the selected genres should be written into the files. */
	void setShouldWriteTags(bool aShouldWriteTags) { mShouldWriteTags = aShouldWriteTags; }

	/** Processes a single item: the body of the item's task.
	Throws a RuntimeError if all the sources have failed. */
	EnrichmentResult processItem(const EnrichmentItem & aItem);


signals:

	/** Emitted after each item has been processed, from the worker thread that processed it. */
	void itemFinished(const EnrichmentResult & aResult);

	/** Emitted when the circuit breaker opens, from the worker thread whose failure opened it. */
	void breakerOpened(int aFailureCount);

	/** Emitted when a success closes the open circuit breaker. */
	void breakerClosed();


protected:

	/** A single thread processing the tasks from the queue, until there are no more tasks or the run is stopped. */
	class Worker:
		public QThread
	{
	public:

		Worker(Enricher & aParent);

		virtual void run() override;


	protected:

		Enricher & mParent;
	};

	using WorkerPtr = std::unique_ptr<Worker>;


	/** The components used by the pipeline. */
	const ComponentCollection & mComponents;

	/** The sources, queried in this order for each item. */
	std::vector<MusicSourcePtr> mSources;

	PipelineConfig mConfig;

	SignalAggregator mAggregator;

	/** Set while a run is in progress; cleared by stop(). */
	std::atomic<bool> mIsRunning;

	/** Set when the current run has been stopped before finishing. */
	std::atomic<bool> mWasStopped;

	std::atomic<bool> mShouldWriteTags;

	/** The mutex protecting mQueue and mItemsByTaskId against multithreaded access;
	also used for the interruptible waits while the circuit breaker is open. */
	QMutex mMtx;

	/** Signalled by stop(), so that the workers waiting for the breaker wake up. */
	QWaitCondition mStopRequested;

	/** The queue of the current run. */
	std::shared_ptr<TaskQueue> mQueue;

	/** The items of the current run, task ID -> item. */
	std::map<QString, EnrichmentItem> mItemsByTaskId;


	/** The loop of a single worker thread. */
	void runWorker();

	/** Returns the result stored in the finished task.
	For a failed task, constructs the result from the task's item and error. */
	EnrichmentResult resultFromTask(const Task & aTask);

	/** Returns the info about the item from the specified source: from the cache if possible,
	otherwise from the source itself, under the source's rate limit.
	Throws whatever the source throws. */
	TrackInfo lookupSource(MusicSource & aSource, const EnrichmentItem & aItem);
};

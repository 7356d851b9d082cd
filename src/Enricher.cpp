#include "Enricher.hpp"
#include <algorithm>
#include <QDebug>
#include "ComponentCollection.hpp"
#include "CircuitBreaker.hpp"
#include "TaskQueue.hpp"
#include "RateLimiter.hpp"
#include "MetricsTracker.hpp"
#include "LookupCache.hpp"
#include "TagWriter.hpp"
#include "Stopwatch.hpp"
#include "Exception.hpp"





/** The longest time a worker waits for the open circuit breaker between two dispatch attempts. */
static const int MAX_BREAKER_WAIT_MSEC = 30000;





////////////////////////////////////////////////////////////////////////////////
// Enricher:

Enricher::Enricher(
	const ComponentCollection & aComponents,
	std::vector<MusicSourcePtr> aSources,
	const PipelineConfig & aConfig,
	QObject * aParent
):
	Super(aParent),
	mComponents(aComponents),
	mSources(std::move(aSources)),
	mConfig(aConfig),
	mAggregator(aConfig.mConfidence, aConfig.mMaxGenres, aConfig.mMaxTags, aConfig.mMinConfidence),
	mIsRunning(false),
	mWasStopped(false),
	mShouldWriteTags(false)
{
	qRegisterMetaType<EnrichmentResult>();
	if (mSources.empty())
	{
		throw LogicError("The enrichment pipeline needs at least one source");
	}
	for (const auto & src: mSources)
	{
		if (src == nullptr)
		{
			throw LogicError("Invalid (null) source given to the enrichment pipeline");
		}
	}
	auto breaker = mComponents.require<CircuitBreaker>();
	connect(breaker.get(), &CircuitBreaker::opened, this, &Enricher::breakerOpened, Qt::DirectConnection);
	connect(breaker.get(), &CircuitBreaker::closed, this, &Enricher::breakerClosed, Qt::DirectConnection);
}





Enricher::~Enricher()
{
	// processAll() always joins its workers, nothing can be running by now
}





RunSummary Enricher::processAll(const std::vector<EnrichmentItem> & aItems)
{
	STOPWATCH("Enrichment run");
	RunSummary res;
	res.mTotal = static_cast<int>(aItems.size());
	if (aItems.empty())
	{
		return res;
	}

	// Create the tasks:
	auto queue = std::make_shared<TaskQueue>(mComponents.require<CircuitBreaker>());
	std::vector<QString> taskIds;
	taskIds.reserve(aItems.size());
	{
		QMutexLocker lock(&mMtx);
		mItemsByTaskId.clear();
		for (size_t i = 0; i < aItems.size(); ++i)
		{
			const auto & item = aItems[i];
			auto taskId = QString("%1:%2").arg(i).arg(item.mFileName);
			queue->addTask(taskId, [this, item]()
				{
					return QVariant::fromValue(processItem(item));
				}
			);
			mItemsByTaskId[taskId] = item;
			taskIds.push_back(taskId);
		}
		mQueue = queue;
		mWasStopped = false;
		mIsRunning = true;
	}

	// Run the workers and wait for them to finish:
	auto numWorkers = std::max(1, std::min(mConfig.mNumWorkers, res.mTotal));
	auto breaker = queue->circuitBreaker();
	qDebug() << "Processing " << res.mTotal << " items using " << numWorkers << " workers; the circuit breaker opens after "
		<< breaker->failureThreshold() << " failures, back-off " << breaker->resetTimeoutSec() << " sec.";
	std::vector<WorkerPtr> workers;
	for (int i = 0; i < numWorkers; ++i)
	{
		auto worker = std::make_unique<Worker>(*this);
		worker->setObjectName(QString("Enricher::Worker::%1").arg(i));
		worker->start();
		workers.push_back(std::move(worker));
	}
	for (auto & w: workers)
	{
		w->wait();
	}
	mIsRunning = false;

	// Collect the results, in the order of the items:
	queue->cancelAllPending();
	std::map<QString, TaskPtr> tasksById;
	for (const auto & task: queue->tasks())
	{
		tasksById[task->id()] = task;
	}
	for (const auto & taskId: taskIds)
	{
		const auto & task = tasksById[taskId];
		switch (task->state())
		{
			case Task::State::Completed:
			{
				res.mSucceeded += 1;
				res.mResults.push_back(resultFromTask(*task));
				break;
			}
			case Task::State::Failed:
			{
				res.mFailed += 1;
				res.mResults.push_back(resultFromTask(*task));
				break;
			}
			case Task::State::Cancelled:
			{
				res.mCancelled += 1;
				break;
			}
			case Task::State::Pending:
			case Task::State::Running:
			{
				throw LogicError("Task %1 is still %2 after all workers have finished",
					taskId, Task::stateName(task->state())
				);
			}
		}
	}
	res.mWasStopped = mWasStopped.load();

	{
		QMutexLocker lock(&mMtx);
		mQueue.reset();
		mItemsByTaskId.clear();
	}
	qDebug() << "Enrichment run finished: " << res.mSucceeded << " succeeded, "
		<< res.mFailed << " failed, " << res.mCancelled << " cancelled.";
	return res;
}





void Enricher::stop()
{
	QMutexLocker lock(&mMtx);
	if (mIsRunning)
	{
		mWasStopped = true;
	}
	mIsRunning = false;
	if (mQueue != nullptr)
	{
		auto numCancelled = mQueue->cancelAllPending();
		qDebug() << "Enrichment stopped, " << numCancelled << " pending items cancelled.";
	}
	mStopRequested.wakeAll();
}





EnrichmentResult Enricher::processItem(const EnrichmentItem & aItem)
{
	EnrichmentResult res;
	res.mFileName = aItem.mFileName;
	res.mArtist = aItem.mArtist;
	res.mTitle = aItem.mTitle;

	// Query all the sources:
	std::vector<GenreSignal> genreSignals;
	size_t numFailedSources = 0;
	for (const auto & source: mSources)
	{
		try
		{
			auto info = lookupSource(*source, aItem);
			for (const auto & g: info.mGenres)
			{
				genreSignals.emplace_back(g.first, source->name(), g.second);
			}
			if (res.mYear.isEmpty())
			{
				res.mYear = info.mYear;
			}
			if (res.mAlbum.isEmpty())
			{
				res.mAlbum = info.mAlbum;
			}
		}
		catch (const std::exception & exc)
		{
			numFailedSources += 1;
			auto msg = QString::fromUtf8(exc.what());
			qWarning() << "Source " << source->name() << " failed for " << aItem.mFileName << ": " << msg;
			res.mSourceErrors.append(msg);
		}
	}
	if (numFailedSources == mSources.size())
	{
		throw RuntimeError("All sources failed for %1: %2", aItem.mFileName, res.mSourceErrors.join("; "));
	}

	// Aggregate the signals:
	auto selection = mAggregator.process(SignalAggregator::collectSignals(genreSignals));
	res.mGenres = selection.mGenres;
	res.mConfidenceUsed = selection.mConfidenceUsed;
	res.mWasRelaxed = selection.mWasRelaxed;
	res.mNoGenresReason = selection.mNoGenresReason;
	if (selection.isEmpty() || !mShouldWriteTags)
	{
		return res;
	}

	// Write the genres:
	auto tagWriter = mComponents.get<TagWriter>();
	if (tagWriter == nullptr)
	{
		res.mWriteError = "No tag writer available";
	}
	else if (tagWriter->writeGenres(aItem.mFileName, res.mGenres))
	{
		res.mIsWritten = true;
	}
	else
	{
		res.mWriteError = QString("Failed to write the genres into %1").arg(aItem.mFileName);
	}
	return res;
}





void Enricher::runWorker()
{
	std::shared_ptr<TaskQueue> queue;
	{
		QMutexLocker lock(&mMtx);
		queue = mQueue;
	}
	if (queue == nullptr)
	{
		return;
	}
	auto breaker = queue->circuitBreaker();

	int numOpenWaits = 0;
	while (mIsRunning)
	{
		auto task = queue->getNextTask();
		if (task == nullptr)
		{
			if (!breaker->isOpen())
			{
				if (queue->pendingCount() == 0)
				{
					// Nothing more to do (all tasks were added before the workers started)
					return;
				}
				// The breaker has closed meanwhile, try again
				continue;
			}

			// The breaker is open, back off before trying again:
			if (numOpenWaits >= mConfig.mMaxOpenRetries)
			{
				qWarning() << "The circuit breaker stayed open after " << numOpenWaits << " waits, stopping the run.";
				stop();
				return;
			}
			numOpenWaits += 1;
			auto waitMsec = std::min(
				static_cast<qint64>(breaker->resetTimeoutSec()) * 1000 * numOpenWaits,
				static_cast<qint64>(MAX_BREAKER_WAIT_MSEC)
			);
			qDebug() << "The circuit breaker is open, waiting " << waitMsec << " msec (attempt " << numOpenWaits << ")";
			QMutexLocker lock(&mMtx);
			if (mIsRunning && (waitMsec > 0))
			{
				mStopRequested.wait(&mMtx, static_cast<unsigned long>(waitMsec));
			}
			continue;
		}
		numOpenWaits = 0;

		// Execute the task, no exception may escape:
		QVariant result;
		QString error;
		try
		{
			result = task->execute();
		}
		catch (const std::exception & exc)
		{
			error = QString::fromUtf8(exc.what());
			if (error.isEmpty())
			{
				error = "Unknown error";
			}
		}
		queue->completeTask(task, result, error);
		emit itemFinished(resultFromTask(*task));
	}
}





EnrichmentResult Enricher::resultFromTask(const Task & aTask)
{
	if (aTask.state() == Task::State::Completed)
	{
		return aTask.result().value<EnrichmentResult>();
	}

	EnrichmentResult res;
	{
		QMutexLocker lock(&mMtx);
		auto itr = mItemsByTaskId.find(aTask.id());
		if (itr != mItemsByTaskId.end())
		{
			res.mFileName = itr->second.mFileName;
			res.mArtist = itr->second.mArtist;
			res.mTitle = itr->second.mTitle;
		}
	}
	res.mError = aTask.error();
	if (res.mError.isEmpty())
	{
		res.mError = QString("The item was %1").arg(Task::stateName(aTask.state()));
	}
	return res;
}





TrackInfo Enricher::lookupSource(MusicSource & aSource, const EnrichmentItem & aItem)
{
	auto sourceName = aSource.name();

	// Try the cache first:
	std::shared_ptr<LookupCache> cache;
	if (mConfig.mIsCacheEnabled)
	{
		cache = mComponents.get<LookupCache>();
	}
	if (cache != nullptr)
	{
		auto cached = cache->get(sourceName, aItem.mArtist, aItem.mTitle);
		if (cached.first)
		{
			return cached.second;
		}
	}

	// Apply the rate limit; if the call would have to wait, remember the pressure for the metrics:
	bool wasRateLimited = false;
	auto limiter = mComponents.get<RateLimiter>();
	if ((limiter != nullptr) && !limiter->acquire(sourceName, 1.0, false))
	{
		wasRateLimited = true;
		limiter->acquire(sourceName, 1.0, true);
	}

	// Call the source, record the outcome:
	auto metrics = mComponents.get<MetricsTracker>();
	auto startNsec = TimeSinceStart::nsecElapsed();
	TrackInfo info;
	try
	{
		info = aSource.lookup(aItem.mArtist, aItem.mTitle);
	}
	catch (const std::exception &)
	{
		if (metrics != nullptr)
		{
			auto latency = TimeSinceStart::secondsSince(startNsec);
			metrics->recordApiCall(sourceName, false, latency, wasRateLimited);
		}
		throw;
	}
	if (metrics != nullptr)
	{
		auto latency = TimeSinceStart::secondsSince(startNsec);
		metrics->recordApiCall(sourceName, true, latency, wasRateLimited);
	}
	if (info.mSourceName.isEmpty())
	{
		info.mSourceName = sourceName;
	}
	if (cache != nullptr)
	{
		cache->set(sourceName, aItem.mArtist, aItem.mTitle, info);
	}
	return info;
}





////////////////////////////////////////////////////////////////////////////////
// Enricher::Worker:

Enricher::Worker::Worker(Enricher & aParent):
	mParent(aParent)
{
}





void Enricher::Worker::run()
{
	mParent.runWorker();
}

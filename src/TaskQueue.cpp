#include "TaskQueue.hpp"
#include <QDebug>
#include "CircuitBreaker.hpp"
#include "Exception.hpp"





TaskQueue::TaskQueue(std::shared_ptr<CircuitBreaker> aCircuitBreaker):
	mCircuitBreaker(aCircuitBreaker)
{
	if (mCircuitBreaker == nullptr)
	{
		throw LogicError("TaskQueue needs a circuit breaker");
	}
}





TaskPtr TaskQueue::addTask(const QString & aId, Task::Work aWork)
{
	auto task = std::make_shared<Task>(aId, std::move(aWork));
	QMutexLocker lock(&mMtx);
	if (findTaskLocked(aId) != nullptr)
	{
		throw LogicError("Duplicate task ID: %1", aId);
	}
	mTasks.push_back(task);
	mQueue.push_back(task);
	qDebug() << "Task " << aId << " added to the queue.";
	return task;
}





TaskPtr TaskQueue::getNextTask()
{
	if (!mCircuitBreaker->allowRequest())
	{
		qDebug() << "Circuit breaker is open, not dispatching any task.";
		return nullptr;
	}

	QMutexLocker lock(&mMtx);
	while (!mQueue.empty())
	{
		auto task = mQueue.front();
		mQueue.pop_front();
		auto expected = Task::State::Pending;
		if (task->mState.compare_exchange_strong(expected, Task::State::Running))
		{
			return task;
		}
		// The task has been cancelled while waiting in the queue, skip it
	}
	return nullptr;
}





bool TaskQueue::completeTask(TaskPtr aTask, const QVariant & aResult, const QString & aError)
{
	if (aTask == nullptr)
	{
		qWarning() << "Attempting to complete a null task.";
		return false;
	}
	auto isFailure = !aError.isEmpty();
	{
		QMutexLocker lock(&mMtx);
		if (aTask->mState.load() != Task::State::Running)
		{
			qWarning() << "Task " << aTask->id() << " cannot be completed, it is "
				<< Task::stateName(aTask->mState.load());
			return false;
		}
		{
			QMutexLocker taskLock(&aTask->mMtx);
			aTask->mResult = aResult;
			aTask->mError = aError;
		}
		aTask->mState = isFailure ? Task::State::Failed : Task::State::Completed;
	}

	if (isFailure)
	{
		if (mCircuitBreaker->recordFailure())
		{
			qWarning() << "Circuit breaker opened by the failure of task " << aTask->id() << ": " << aError;
		}
	}
	else
	{
		mCircuitBreaker->recordSuccess();
	}
	return true;
}





bool TaskQueue::cancelTask(const QString & aId)
{
	QMutexLocker lock(&mMtx);
	auto task = findTaskLocked(aId);
	if (task == nullptr)
	{
		return false;
	}
	auto expected = Task::State::Pending;
	if (!task->mState.compare_exchange_strong(expected, Task::State::Cancelled))
	{
		return false;
	}
	qDebug() << "Task " << aId << " cancelled.";
	return true;
}





int TaskQueue::cancelAllPending()
{
	QMutexLocker lock(&mMtx);
	int res = 0;
	for (const auto & task: mQueue)
	{
		auto expected = Task::State::Pending;
		if (task->mState.compare_exchange_strong(expected, Task::State::Cancelled))
		{
			res += 1;
		}
	}
	mQueue.clear();
	return res;
}





std::pair<bool, Task::State> TaskQueue::taskState(const QString & aId) const
{
	QMutexLocker lock(&mMtx);
	auto task = findTaskLocked(aId);
	if (task == nullptr)
	{
		return std::make_pair(false, Task::State::Pending);
	}
	return std::make_pair(true, task->state());
}





int TaskQueue::pendingCount() const
{
	QMutexLocker lock(&mMtx);
	int res = 0;
	for (const auto & task: mQueue)
	{
		if (task->state() == Task::State::Pending)
		{
			res += 1;
		}
	}
	return res;
}





std::list<TaskPtr> TaskQueue::tasks() const
{
	QMutexLocker lock(&mMtx);
	std::list<TaskPtr> res(mTasks);
	return res;
}





int TaskQueue::removeFinishedTasks()
{
	QMutexLocker lock(&mMtx);
	auto before = mTasks.size();
	mTasks.remove_if([](const TaskPtr & aTask)
		{
			return aTask->isFinished();
		}
	);
	return static_cast<int>(before - mTasks.size());
}





TaskPtr TaskQueue::findTaskLocked(const QString & aId) const
{
	for (const auto & task: mTasks)
	{
		if (task->id() == aId)
		{
			return task;
		}
	}
	return nullptr;
}

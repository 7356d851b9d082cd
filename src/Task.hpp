#pragma once

#include <memory>
#include <atomic>
#include <functional>
#include <QMutex>
#include <QString>
#include <QVariant>





// fwd:
class TaskQueue;





/** A single unit of work processed through a TaskQueue.
The task moves through the states Pending -> Running -> Completed / Failed, or Pending -> Cancelled.
The state only ever moves forward; only the TaskQueue changes it.
Once a task is in a terminal state, its result and error are read-only. */
class Task
{
	friend class TaskQueue;

public:

	enum class State
	{
		Pending,
		Running,
		Completed,
		Failed,
		Cancelled,
	};

	/** The deferred work. Returns the task's result; any exception it throws is the task's error. */
	using Work = std::function<QVariant()>;


	Task(const QString & aId, Work aWork);

	/** Runs the actual work. Called by a worker thread while the task is Running.
	Exceptions thrown by the work are propagated to the caller. */
	QVariant execute();

	const QString & id() const { return mId; }
	State state() const { return mState.load(); }

	/** Returns the result set by TaskQueue::completeTask(). */
	QVariant result() const;

	/** Returns the error set by TaskQueue::completeTask(); empty if the task hasn't failed. */
	QString error() const;

	/** Returns true if the state is one of the terminal ones (Completed, Failed, Cancelled). */
	bool isFinished() const;

	/** Returns the user-visible name of the specified state. */
	static QString stateName(State aState);


protected:

	/** The unique identifier of the task within its queue. */
	const QString mId;

	Work mWork;

	std::atomic<State> mState;

	/** The mutex protecting mResult and mError against multithreaded access. */
	mutable QMutex mMtx;

	QVariant mResult;
	QString mError;
};

using TaskPtr = std::shared_ptr<Task>;

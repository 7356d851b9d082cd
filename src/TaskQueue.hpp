#pragma once

#include <memory>
#include <list>
#include <deque>
#include <utility>
#include <QMutex>
#include "Task.hpp"





// fwd:
class CircuitBreaker;





/** A thread-safe FIFO queue of tasks, gated by a circuit breaker.
Workers pull tasks using getNextTask() and report the outcome through completeTask();
the outcome is fed into the circuit breaker. While the breaker is open, no task is dispatched at all.
The queue keeps a list of all its tasks (the active list), so that their state can be queried
even after they have been dispatched. */
class TaskQueue
{
public:

	/** Creates a new queue that is gated by the specified breaker.
	The breaker may be shared between several queues (one isolation domain). */
	explicit TaskQueue(std::shared_ptr<CircuitBreaker> aCircuitBreaker);

	/** Creates a new Pending task with the specified ID and work, and appends it to the queue.
	Throws a LogicError if a task with the same ID is already in the active list. */
	TaskPtr addTask(const QString & aId, Task::Work aWork);

	/** Returns the next Pending task from the queue, switched into the Running state.
	Returns nullptr if the circuit breaker is open, or if there's no Pending task in the queue.
	Never blocks. */
	TaskPtr getNextTask();

	/** Moves the specified Running task into its terminal state:
	Failed if aError is non-empty (and records a failure in the breaker),
	Completed otherwise (and records a success in the breaker).
	Returns false (and changes nothing) if the task is not Running. */
	bool completeTask(TaskPtr aTask, const QVariant & aResult, const QString & aError = QString());

	/** Cancels the Pending task with the specified ID.
	Returns false if no such task exists, or it is not Pending anymore. */
	bool cancelTask(const QString & aId);

	/** Cancels all tasks that are still Pending.
	Returns the number of tasks cancelled. */
	int cancelAllPending();

	/** Returns the state of the task with the specified ID.
	The first value is false if there's no such task in the active list. */
	std::pair<bool, Task::State> taskState(const QString & aId) const;

	/** Returns the number of tasks that are still Pending. */
	int pendingCount() const;

	/** Returns a snapshot of the active task list, in the order of addition. */
	std::list<TaskPtr> tasks() const;

	/** Removes the tasks in a terminal state from the active list.
	Returns the number of tasks removed. */
	int removeFinishedTasks();

	/** Returns the breaker gating this queue. */
	std::shared_ptr<CircuitBreaker> circuitBreaker() const { return mCircuitBreaker; }


protected:

	/** The breaker gating the dispatch. */
	std::shared_ptr<CircuitBreaker> mCircuitBreaker;

	/** The mutex protecting mTasks and mQueue against multithreaded access. */
	mutable QMutex mMtx;

	/** All the tasks that have been added and not removed by removeFinishedTasks().
	Protected against multithreaded access by mMtx. */
	std::list<TaskPtr> mTasks;

	/** The tasks waiting to be dispatched, in FIFO order.
	May contain tasks that have been cancelled meanwhile, those are skipped when dispatching.
	Protected against multithreaded access by mMtx. */
	std::deque<TaskPtr> mQueue;


	/** Returns the task with the specified ID from the active list, or nullptr if not found.
	Expects mMtx to be locked by the caller. */
	TaskPtr findTaskLocked(const QString & aId) const;
};

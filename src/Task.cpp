#include "Task.hpp"
#include "Exception.hpp"





Task::Task(const QString & aId, Work aWork):
	mId(aId),
	mWork(std::move(aWork)),
	mState(State::Pending)
{
	if (!mWork)
	{
		throw LogicError("Task %1 has no work to do", aId);
	}
}





QVariant Task::execute()
{
	return mWork();
}





QVariant Task::result() const
{
	QMutexLocker lock(&mMtx);
	return mResult;
}





QString Task::error() const
{
	QMutexLocker lock(&mMtx);
	return mError;
}





bool Task::isFinished() const
{
	switch (mState.load())
	{
		case State::Pending:
		case State::Running:
		{
			return false;
		}
		case State::Completed:
		case State::Failed:
		case State::Cancelled:
		{
			return true;
		}
	}
	return false;
}





QString Task::stateName(State aState)
{
	switch (aState)
	{
		case State::Pending:   return "pending";
		case State::Running:   return "running";
		case State::Completed: return "completed";
		case State::Failed:    return "failed";
		case State::Cancelled: return "cancelled";
	}
	return QString("<unknown state %1>").arg(static_cast<int>(aState));
}

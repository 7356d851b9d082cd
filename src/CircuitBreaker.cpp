#include "CircuitBreaker.hpp"
#include <QDebug>
#include "Exception.hpp"





CircuitBreaker::CircuitBreaker(int aFailureThreshold, int aResetTimeoutSec):
	mFailureThreshold(aFailureThreshold),
	mResetTimeoutSec(aResetTimeoutSec),
	mFailureCount(0),
	mIsOpen(false)
{
	if (mFailureThreshold < 1)
	{
		throw LogicError("Invalid circuit breaker failure threshold: %1", aFailureThreshold);
	}
}





bool CircuitBreaker::recordFailure()
{
	int failureCount;
	{
		QMutexLocker lock(&mMtx);
		mFailureCount += 1;
		if (mIsOpen || (mFailureCount < mFailureThreshold))
		{
			return false;
		}
		mIsOpen = true;
		failureCount = mFailureCount;
	}
	qWarning() << "Circuit breaker opened after " << failureCount << " consecutive failures.";
	emit opened(failureCount);
	return true;
}





bool CircuitBreaker::recordSuccess()
{
	{
		QMutexLocker lock(&mMtx);
		mFailureCount = 0;
		if (!mIsOpen)
		{
			return false;
		}
		mIsOpen = false;
	}
	qDebug() << "Circuit breaker closed by a successful call.";
	emit closed();
	return true;
}





bool CircuitBreaker::allowRequest() const
{
	QMutexLocker lock(&mMtx);
	return !mIsOpen;
}





int CircuitBreaker::failureCount() const
{
	QMutexLocker lock(&mMtx);
	return mFailureCount;
}

#pragma once

#include <QObject>
#include <QMutex>
#include "ComponentCollection.hpp"





/** A consecutive-failure circuit breaker guarding the dispatch of tasks to a failing dependency.
Each recorded failure increments the failure count; when it reaches the threshold, the circuit opens
and allowRequest() starts returning false. Any recorded success resets the count and closes the circuit.
There is no time-based recovery: the breaker stays open until a success is recorded.
The reset timeout is only kept as a hint for the callers about how long to back off while the circuit is open.
The opened() and closed() signals are emitted from the thread recording the transition, after the internal lock is released.
Thread-safe. */
class CircuitBreaker:
	public QObject,
	public ComponentCollection::Component<ComponentCollection::ckCircuitBreaker>
{
	Q_OBJECT
	using Super = QObject;


public:

	CircuitBreaker(int aFailureThreshold = 5, int aResetTimeoutSec = 60);

	/** Records a failed call.
	Returns true if this very call has opened the circuit. */
	bool recordFailure();

	/** Records a successful call; resets the failure count and closes the circuit.
	Returns true if this very call has closed the circuit. */
	bool recordSuccess();

	/** Returns true if requests may be dispatched (the circuit is closed). */
	bool allowRequest() const;

	/** Returns true if the circuit is open (requests are being refused). */
	bool isOpen() const { return !allowRequest(); }

	/** Returns the number of failures recorded since the last success. */
	int failureCount() const;

	int failureThreshold() const { return mFailureThreshold; }

	/** Returns the number of seconds the callers should back off for while the circuit is open. */
	int resetTimeoutSec() const { return mResetTimeoutSec; }


signals:

	/** Emitted when the failures reach the threshold and the circuit opens. */
	void opened(int aFailureCount);

	/** Emitted when a success closes the open circuit. */
	void closed();


protected:

	/** The number of consecutive failures that opens the circuit. */
	const int mFailureThreshold;

	/** The back-off hint for the callers, in seconds. */
	const int mResetTimeoutSec;

	/** The mutex protecting mFailureCount and mIsOpen against multithreaded access. */
	mutable QMutex mMtx;

	/** Number of failures recorded since the last success. */
	int mFailureCount;

	/** True if the circuit is open. */
	bool mIsOpen;
};

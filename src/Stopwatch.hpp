#pragma once

#include <QElapsedTimer>





/** The monotonic clock of the program: nanoseconds since the first use.
The rate limiter refills its buckets by this clock and the pipeline measures the source call latencies with it,
so that wall-clock adjustments can neither make a bucket jump nor produce negative latencies. */
class TimeSinceStart
{
public:

	/** Returns the number of nanoseconds elapsed since the clock was first used. */
	static qint64 nsecElapsed();

	/** Returns the fractional number of seconds between the two nsecElapsed() values. */
	static double secondsBetween(qint64 aStartNsec, qint64 aEndNsec)
	{
		return static_cast<double>(aEndNsec - aStartNsec) / 1e9;
	}

	/** Returns the fractional number of seconds elapsed since the specified nsecElapsed() value. */
	static double secondsSince(qint64 aStartNsec)
	{
		return secondsBetween(aStartNsec, nsecElapsed());
	}


protected:

	QElapsedTimer mTimer;


	/** Starts the timer. Only used by get(). */
	TimeSinceStart();

	/** Returns the single instance of the clock. */
	static TimeSinceStart & get();
};





/** Measures the duration of a scope (a whole run, a batch of lookups), logs it when the scope is left.
The duration so far is available through elapsedSec(), for reporting it to the user. */
class Stopwatch
{
public:

	/** Starts measuring. aAction is the description used in the log message; it must outlive the stopwatch. */
	Stopwatch(const char * aSrcFile, int aSrcLine, const char * aAction);

	/** Logs the action and its duration. */
	~Stopwatch();

	/** Returns the number of seconds elapsed since the stopwatch was created. */
	double elapsedSec() const { return TimeSinceStart::secondsSince(mStartNsec); }


protected:

	const char * mSrcFile;
	int mSrcLine;
	const char * mAction;

	/** The TimeSinceStart::nsecElapsed() value when the stopwatch was created. */
	qint64 mStartNsec;
};

/** Measures the rest of the enclosing scope, logging it under the specified action name. */
#define STOPWATCH(X) Stopwatch sw(__FILE__, __LINE__, X);

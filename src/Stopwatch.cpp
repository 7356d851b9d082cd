#include "Stopwatch.hpp"
#include <QDebug>
#include "Utils.hpp"





////////////////////////////////////////////////////////////////////////////////
// TimeSinceStart:

TimeSinceStart::TimeSinceStart()
{
	mTimer.start();
}





TimeSinceStart & TimeSinceStart::get()
{
	static TimeSinceStart instance;
	return instance;
}





qint64 TimeSinceStart::nsecElapsed()
{
	return get().mTimer.nsecsElapsed();
}





////////////////////////////////////////////////////////////////////////////////
// Stopwatch:

Stopwatch::Stopwatch(const char * aSrcFile, int aSrcLine, const char * aAction):
	mSrcFile(aSrcFile),
	mSrcLine(aSrcLine),
	mAction(aAction),
	mStartNsec(TimeSinceStart::nsecElapsed())
{
}





Stopwatch::~Stopwatch()
{
	qDebug().nospace() << mAction << " took " << Utils::formatDuration(elapsedSec())
		<< " (" << mSrcFile << ":" << mSrcLine << ")";
}

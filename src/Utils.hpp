#pragma once

#include <cmath>





// Fwd:
class QString;
class QByteArray;





namespace Utils
{





/** Returns the value, clamped to the range provided. */
template <typename T> T clamp(T aValue, T aMin, T aMax)
{
	if (aValue < aMin)
	{
		return aMin;
	}
	if (aValue > aMax)
	{
		return aMax;
	}
	return aValue;
}





/** Returns true if the specified value lies within the specified range. Min and Max are inclusive. */
template <typename T> bool isInRange(T aValue, T aMin, T aMax)
{
	return (aValue >= aMin) && (aValue <= aMax);
}





/** Performs ceil and static_cast at the same time. */
template <typename T> T ceil(double aValue)
{
	return static_cast<T>(std::ceil(aValue));
}





/** Formats the time in fractional seconds into string "s.fff sec", or "mmm:ss" for times over a minute.
Used for reporting latencies and run durations. */
QString formatDuration(double aSeconds);

/** Returns a string that represents the data in hex. */
QString toHex(const QByteArray & aData);





}  // namespace Utils

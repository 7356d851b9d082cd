#ifndef EXCEPTION_H
#define EXCEPTION_H





#include <stdexcept>
#include <QString>
#include <QDebug>





/** A class that is the base of all exceptions used in the program.
Provides parametrical description message formatting.
Usage:
throw Exception(formatString, argValue1, argValue2);
*/
class Exception:
	public std::runtime_error
{
public:

	/** Creates an exception with the specified values concatenated as the description. */
	template <typename... OtherTs>
	Exception(const QString & aFormatString, const OtherTs &... aArgValues):
		std::runtime_error(format(aFormatString, aArgValues...).toStdString())
	{
		qWarning() << "Created an Exception: " << what();
	}


protected:


	/** Formats a single arithmetic value into the string (like QString::arg). */
	template <typename T>
	static QString formatSingle(
		const QString & aFormatString,
		T aValue,
		typename std::enable_if<std::is_arithmetic<T>::value, int>::type = 0
	)
	{
		return aFormatString.arg(aValue);
	}


	/** Formats a single QString value into the string. */
	static QString formatSingle(const QString & aFormatString, const QString & aValue)
	{
		return aFormatString.arg(aValue);
	}


	/** Formats a single std::string value into the string, treating it as UTF-8. */
	static QString formatSingle(const QString & aFormatString, const std::string & aValue)
	{
		return aFormatString.arg(QString::fromStdString(aValue));
	}


	/** Formats any other value through QDebug, for a more informational output. */
	template <typename T>
	static QString formatSingle(const QString & aFormatString, T aValue,
		typename std::enable_if<
			!std::is_same<T, std::string>::value &&
			!std::is_same<T, QString>::value &&
			!std::is_arithmetic<T>::value
		, int>::type = 0
	)
	{
		QString tmp;
		QDebug(&tmp).nospace().noquote() << aValue;
		return aFormatString.arg(tmp);
	}


	/** Recursively formats the given format string with the given arguments. */
	template <typename T, typename... OtherTs>
	static QString format(const QString & aFormatString, const T & aValue, const OtherTs & ... aValues)
	{
		return format(formatSingle(aFormatString, aValue), aValues...);
	}


	/** Terminator for the format() expansion. */
	static QString format(const QString & aFormatString)
	{
		return aFormatString;
	}
};





/** Descendant to be used for errors in the runtime. */
class RuntimeError: public Exception
{
public:
	using Exception::Exception;
};





/** Descendant to be used for errors that indicate a bug in the program. */
class LogicError: public Exception
{
public:
	using Exception::Exception;
};





/** A transient failure while talking to an external music-information source
(transport error, timeout, HTTP error status, unparseable reply).
Thrown only by MusicSource implementations; the enrichment task catches it per source,
so that one failing source doesn't prevent the others from contributing. */
class SourceError: public RuntimeError
{
public:

	template <typename... OtherTs>
	SourceError(const QString & aSourceName, const QString & aFormatString, const OtherTs &... aArgValues):
		RuntimeError(QString("%1: ").arg(aSourceName) + aFormatString, aArgValues...),
		mSourceName(aSourceName)
	{
	}

	/** Returns the name of the source that has failed. */
	const QString & sourceName() const { return mSourceName; }


protected:

	QString mSourceName;
};





#endif // EXCEPTION_H

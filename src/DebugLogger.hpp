#ifndef DEBUGLOGGER_HPP
#define DEBUGLOGGER_HPP





#include <memory>
#include <vector>
#include <QObject>
#include <QMutex>
#include <QDateTime>





// fwd:
class QFile;





/** Collects all the Qt log messages (qDebug(), qWarning() etc.) of the program.
Keeps the last messages in memory (so that the summary can show the recent warnings),
forwards the messages of sufficient severity to the previous handler (console),
and optionally appends each message to a log file. */
class DebugLogger:
	public QObject
{
	using Super = QObject;

	Q_OBJECT


public:

	/** Container for a single debug message. */
	struct Message
	{
		QDateTime mDateTime;
		QtMsgType mType;
		QString mFileName;
		QString mFunction;
		int mLineNum;
		QString mMessage;


		/** Default constructor, used for array initialization.
		The mDateTime is not assigned -> it will not be included in lastMessages() output. */
		Message() = default;


		/** Full constructor, used for copying. */
		Message(
			QtMsgType aType,
			const QMessageLogContext & aContext,
			const QString & aMessage
		):
			mDateTime(QDateTime::currentDateTimeUtc()),
			mType(aType),
			mFileName(QString::fromUtf8(aContext.file)),
			mFunction(QString::fromUtf8(aContext.function)),
			mLineNum(aContext.line),
			mMessage(aMessage)
		{
		}

		/** Returns the single-line representation used in the log file. */
		QString toLogLine() const;
	};


	/** Returns the only instance of this object. */
	static DebugLogger & get();

	~DebugLogger();

	/** Returns the (valid) messages stored in the logger, oldest first. */
	std::vector<Message> lastMessages() const;

	/** Returns the stored messages that are at least as severe as the specified type, oldest first. */
	std::vector<Message> lastMessages(QtMsgType aMinType) const;

	/** Starts appending all messages to the specified file.
	Returns false (and keeps logging to the previous file, if any) if the file cannot be opened. */
	bool setLogFile(const QString & aFileName);

	/** Sets the minimum type of messages that are forwarded to the previous handler (console).
	All messages are stored in the memory buffer and the log file regardless. */
	void setConsoleMinType(QtMsgType aMinType);

	/** Returns the severity rank of the message type, debug being the lowest.
	QtMsgType's numeric values are not ordered by severity (QtInfoMsg is 4). */
	static int severity(QtMsgType aType);


protected:

	/** The maximum count of messages remembered. */
	static const size_t MAX_MESSAGES = 1024;

	/** The last messages sent to the logger.
	Protected by mMtx against multithreaded access.
	Works as a circular buffer, with mNextMessageIdx pointing to the index where the next message will be written. */
	Message mMessages[MAX_MESSAGES];

	/** Index into mMessages where the next message will be written.
	Protected by mMtx against multithreaded access. */
	size_t mNextMessageIdx;

	/** The file into which all messages are appended, nullptr if none.
	Protected by mMtx against multithreaded access. */
	std::unique_ptr<QFile> mLogFile;

	/** The minimum type of messages to forward to the previous handler. */
	QtMsgType mConsoleMinType;

	/** The mutex protecting mMessages, mNextMessageIdx and mLogFile from multithreaded access. */
	mutable QMutex mMtx;


	/** Constructor not accessible to the outside -> singleton. */
	DebugLogger();

	/** The override message handler that stores messages in a DebugLogger. */
	static void messageHandler(
		QtMsgType aType,
		const QMessageLogContext & aContext,
		const QString & aMessage
	);

	/** Adds the specified message to mMessages[] and to the log file.
	Returns true if the message should be forwarded to the previous handler. */
	bool addMessage(
		QtMsgType aType,
		const QMessageLogContext & aContext,
		const QString & aMessage
	);
};





#endif // DEBUGLOGGER_HPP

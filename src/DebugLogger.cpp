#include "DebugLogger.hpp"
#include <QDebug>
#include <QFile>





/** The previous message handler. */
static QtMessageHandler g_OldHandler;





/** Returns the short name of the message type, as used in the log file. */
static const char * typeName(QtMsgType aType)
{
	switch (aType)
	{
		case QtDebugMsg:    return "DEBUG";
		case QtInfoMsg:     return "INFO";
		case QtWarningMsg:  return "WARNING";
		case QtCriticalMsg: return "CRITICAL";
		case QtFatalMsg:    return "FATAL";
	}
	return "UNKNOWN";
}





////////////////////////////////////////////////////////////////////////////////
// DebugLogger::Message:

QString DebugLogger::Message::toLogLine() const
{
	return QString("%1 %2 %3")
		.arg(mDateTime.toString(Qt::ISODateWithMs))
		.arg(QString::fromLatin1(typeName(mType)))
		.arg(mMessage);
}





////////////////////////////////////////////////////////////////////////////////
// DebugLogger:

DebugLogger::DebugLogger():
	mNextMessageIdx(0),
	mConsoleMinType(QtDebugMsg)
{
	g_OldHandler = qInstallMessageHandler(messageHandler);
}





DebugLogger::~DebugLogger()
{
	qInstallMessageHandler(g_OldHandler);
}





DebugLogger & DebugLogger::get()
{
	static DebugLogger inst;
	return inst;
}





std::vector<DebugLogger::Message> DebugLogger::lastMessages() const
{
	return lastMessages(QtDebugMsg);
}





std::vector<DebugLogger::Message> DebugLogger::lastMessages(QtMsgType aMinType) const
{
	QMutexLocker lock(&mMtx);
	std::vector<Message> res;
	size_t max = sizeof(mMessages) / sizeof(mMessages[0]);
	res.reserve(max);
	auto minSeverity = severity(aMinType);
	for (size_t i = 0; i < max; ++i)
	{
		size_t idx = (i + mNextMessageIdx) % max;
		if (mMessages[idx].mDateTime.isValid() && (severity(mMessages[idx].mType) >= minSeverity))
		{
			res.push_back(mMessages[idx]);
		}
	}
	return res;
}





bool DebugLogger::setLogFile(const QString & aFileName)
{
	auto f = std::make_unique<QFile>(aFileName);
	if (!f->open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text))
	{
		qWarning() << "Cannot open log file " << aFileName << ": " << f->errorString();
		return false;
	}
	{
		QMutexLocker lock(&mMtx);
		mLogFile = std::move(f);
	}
	qDebug() << "Logging into file " << aFileName;
	return true;
}





void DebugLogger::setConsoleMinType(QtMsgType aMinType)
{
	QMutexLocker lock(&mMtx);
	mConsoleMinType = aMinType;
}





int DebugLogger::severity(QtMsgType aType)
{
	switch (aType)
	{
		case QtDebugMsg:    return 0;
		case QtInfoMsg:     return 1;
		case QtWarningMsg:  return 2;
		case QtCriticalMsg: return 3;
		case QtFatalMsg:    return 4;
	}
	return 0;
}





void DebugLogger::messageHandler(
	QtMsgType aType,
	const QMessageLogContext & aContext,
	const QString & aMessage
)
{
	if (DebugLogger::get().addMessage(aType, aContext, aMessage) || (aType == QtFatalMsg))
	{
		g_OldHandler(aType, aContext, aMessage);
	}
}





bool DebugLogger::addMessage(
	QtMsgType aType,
	const QMessageLogContext & aContext,
	const QString & aMessage
)
{
	QMutexLocker lock(&mMtx);
	auto & msg = mMessages[mNextMessageIdx];
	msg = Message(aType, aContext, aMessage);
	mNextMessageIdx = (mNextMessageIdx + 1) % (sizeof(mMessages) / sizeof(mMessages[0]));
	if (mLogFile != nullptr)
	{
		mLogFile->write(msg.toLogLine().toUtf8());
		mLogFile->write("\n");
		mLogFile->flush();
	}
	return (severity(aType) >= severity(mConsoleMinType));
}

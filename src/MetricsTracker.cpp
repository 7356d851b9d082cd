#include "MetricsTracker.hpp"
#include <QFile>
#include <QSaveFile>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QDebug>





////////////////////////////////////////////////////////////////////////////////
// MetricsTracker::ApiMetrics:

QJsonObject MetricsTracker::ApiMetrics::toJson() const
{
	QJsonObject res;
	res["total_calls"]      = static_cast<double>(mTotalCalls);
	res["successful_calls"] = static_cast<double>(mSuccessfulCalls);
	res["failed_calls"]     = static_cast<double>(mFailedCalls);
	res["total_latency"]    = mTotalLatency;
	res["rate_limit_hits"]  = static_cast<double>(mRateLimitHits);
	return res;
}





void MetricsTracker::ApiMetrics::mergeJson(const QJsonObject & aJson)
{
	mTotalCalls      += static_cast<qint64>(aJson["total_calls"].toDouble(0));
	mSuccessfulCalls += static_cast<qint64>(aJson["successful_calls"].toDouble(0));
	mFailedCalls     += static_cast<qint64>(aJson["failed_calls"].toDouble(0));
	mTotalLatency    += aJson["total_latency"].toDouble(0);
	mRateLimitHits   += static_cast<qint64>(aJson["rate_limit_hits"].toDouble(0));
}





////////////////////////////////////////////////////////////////////////////////
// MetricsTracker:

MetricsTracker::MetricsTracker(const QString & aFileName):
	mFileName(aFileName)
{
	loadFromFile();
}





void MetricsTracker::recordApiCall(const QString & aSource, bool aSuccess, double aLatency, bool aWasRateLimited)
{
	QMutexLocker lock(&mMtx);
	auto & m = mMetrics[aSource];
	m.mTotalCalls += 1;
	m.mTotalLatency += aLatency;
	if (aSuccess)
	{
		m.mSuccessfulCalls += 1;
	}
	else
	{
		m.mFailedCalls += 1;
	}
	if (aWasRateLimited)
	{
		m.mRateLimitHits += 1;
	}
	saveLocked();
}





MetricsTracker::Summary MetricsTracker::metrics(const QString & aSource) const
{
	Summary res;
	auto m = rawMetrics(aSource);
	if (m.mTotalCalls <= 0)
	{
		return res;
	}
	auto total = static_cast<double>(m.mTotalCalls);
	res.mTotalCalls = m.mTotalCalls;
	res.mSuccessRate = static_cast<double>(m.mSuccessfulCalls) / total;
	res.mAvgLatency = m.mTotalLatency / total;
	res.mRateLimitRatio = static_cast<double>(m.mRateLimitHits) / total;
	return res;
}





MetricsTracker::ApiMetrics MetricsTracker::rawMetrics(const QString & aSource) const
{
	QMutexLocker lock(&mMtx);
	auto itr = mMetrics.find(aSource);
	if (itr == mMetrics.end())
	{
		return ApiMetrics();
	}
	return itr->second;
}





std::vector<QString> MetricsTracker::sources() const
{
	QMutexLocker lock(&mMtx);
	std::vector<QString> res;
	res.reserve(mMetrics.size());
	for (const auto & m: mMetrics)
	{
		res.push_back(m.first);
	}
	return res;
}





void MetricsTracker::resetMetrics(const QString & aSource)
{
	QMutexLocker lock(&mMtx);
	if (aSource.isEmpty())
	{
		mMetrics.clear();
	}
	else
	{
		mMetrics.erase(aSource);
	}
	saveLocked();
}





void MetricsTracker::loadFromFile()
{
	if (mFileName.isEmpty() || !QFile::exists(mFileName))
	{
		return;
	}
	QFile f(mFileName);
	if (!f.open(QIODevice::ReadOnly))
	{
		qWarning() << "Cannot open the metrics file " << mFileName << ", starting with empty metrics.";
		return;
	}
	auto data = f.readAll();
	f.close();

	QJsonParseError err;
	auto doc = QJsonDocument::fromJson(data, &err);
	if (err.error != QJsonParseError::NoError)
	{
		qWarning() << "The metrics file " << mFileName << " is corrupt (" << err.errorString()
			<< " at offset " << err.offset << "), starting with empty metrics.";
		return;
	}
	if (!doc.isObject())
	{
		qWarning() << "The metrics file " << mFileName << " doesn't contain an object, starting with empty metrics.";
		return;
	}

	QMutexLocker lock(&mMtx);
	auto root = doc.object();
	for (auto itr = root.constBegin(); itr != root.constEnd(); ++itr)
	{
		if (!itr.value().isObject())
		{
			qWarning() << "Skipping invalid metrics for source " << itr.key();
			continue;
		}
		mMetrics[itr.key()].mergeJson(itr.value().toObject());
	}
	qDebug() << "Loaded metrics for " << mMetrics.size() << " sources from " << mFileName;
}





void MetricsTracker::saveLocked() const
{
	if (mFileName.isEmpty())
	{
		return;
	}
	QJsonObject root;
	for (const auto & m: mMetrics)
	{
		root[m.first] = m.second.toJson();
	}
	auto data = QJsonDocument(root).toJson(QJsonDocument::Compact);

	QSaveFile f(mFileName);
	if (!f.open(QIODevice::WriteOnly))
	{
		qWarning() << "Cannot open the metrics file " << mFileName << " for writing: " << f.errorString();
		return;
	}
	if (f.write(data) != data.size())
	{
		qWarning() << "Cannot write the entire metrics file " << mFileName << ": " << f.errorString();
		f.cancelWriting();
		return;
	}
	if (!f.commit())
	{
		qWarning() << "Cannot save the metrics file " << mFileName << ": " << f.errorString();
	}
}

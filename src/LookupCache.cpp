#include "LookupCache.hpp"
#include <QDir>
#include <QFile>
#include <QSaveFile>
#include <QDateTime>
#include <QCryptographicHash>
#include <QJsonDocument>
#include <QJsonObject>
#include <QDebug>
#include "Utils.hpp"
#include "Exception.hpp"





LookupCache::LookupCache(const QString & aFolder, qint64 aTtlSec):
	mFolder(aFolder),
	mTtlSec(aTtlSec),
	mNumHits(0),
	mNumMisses(0)
{
	if (mTtlSec <= 0)
	{
		throw LogicError("Invalid lookup cache TTL: %1", aTtlSec);
	}
	if (!mFolder.endsWith('/'))
	{
		mFolder.append('/');
	}
	if (!QDir().mkpath(mFolder))
	{
		throw RuntimeError("Cannot create the lookup cache folder %1", mFolder);
	}
}





std::pair<bool, TrackInfo> LookupCache::get(const QString & aSource, const QString & aArtist, const QString & aTitle)
{
	auto fileName = fileNameFor(keyFor(aSource, aArtist, aTitle));
	QMutexLocker lock(&mMtx);
	auto res = readEntry(fileName);
	if (!res.first)
	{
		mNumMisses += 1;
		if (QFile::exists(fileName))
		{
			// Expired or corrupt, don't let it linger:
			QFile::remove(fileName);
		}
		return res;
	}
	mNumHits += 1;
	return res;
}





bool LookupCache::set(const QString & aSource, const QString & aArtist, const QString & aTitle, const TrackInfo & aInfo)
{
	QJsonObject entry;
	entry["expires"] = static_cast<double>(QDateTime::currentSecsSinceEpoch() + mTtlSec);
	entry["value"] = aInfo.toJson();
	auto data = QJsonDocument(entry).toJson(QJsonDocument::Compact);

	auto fileName = fileNameFor(keyFor(aSource, aArtist, aTitle));
	QMutexLocker lock(&mMtx);
	QSaveFile f(fileName);
	if (!f.open(QIODevice::WriteOnly))
	{
		qWarning() << "Cannot open cache entry " << fileName << " for writing: " << f.errorString();
		return false;
	}
	if (f.write(data) != data.size())
	{
		qWarning() << "Cannot write cache entry " << fileName << ": " << f.errorString();
		f.cancelWriting();
		return false;
	}
	if (!f.commit())
	{
		qWarning() << "Cannot save cache entry " << fileName << ": " << f.errorString();
		return false;
	}
	return true;
}





void LookupCache::clear()
{
	QMutexLocker lock(&mMtx);
	QDir dir(mFolder);
	for (const auto & fileName: dir.entryList({"*.json"}, QDir::Files))
	{
		if (!dir.remove(fileName))
		{
			qWarning() << "Cannot remove cache entry " << fileName;
		}
	}
}





int LookupCache::removeExpired()
{
	QMutexLocker lock(&mMtx);
	QDir dir(mFolder);
	int res = 0;
	for (const auto & fileName: dir.entryList({"*.json"}, QDir::Files))
	{
		if (readEntry(dir.filePath(fileName)).first)
		{
			continue;
		}
		if (dir.remove(fileName))
		{
			res += 1;
		}
		else
		{
			qWarning() << "Cannot remove cache entry " << fileName;
		}
	}
	qDebug() << "Removed " << res << " expired lookup cache entries.";
	return res;
}





QString LookupCache::keyFor(const QString & aSource, const QString & aArtist, const QString & aTitle)
{
	auto normalized = QString("%1\n%2\n%3").arg(
		aSource,
		aArtist.trimmed().toLower(),
		aTitle.trimmed().toLower()
	);
	return Utils::toHex(QCryptographicHash::hash(normalized.toUtf8(), QCryptographicHash::Sha1));
}





int LookupCache::numHits() const
{
	QMutexLocker lock(&mMtx);
	return mNumHits;
}





int LookupCache::numMisses() const
{
	QMutexLocker lock(&mMtx);
	return mNumMisses;
}





QString LookupCache::fileNameFor(const QString & aKey) const
{
	return mFolder + aKey + ".json";
}





std::pair<bool, TrackInfo> LookupCache::readEntry(const QString & aFileName)
{
	QFile f(aFileName);
	if (!f.open(QIODevice::ReadOnly))
	{
		return std::make_pair(false, TrackInfo());
	}
	auto doc = QJsonDocument::fromJson(f.readAll());
	f.close();
	if (!doc.isObject())
	{
		qDebug() << "Corrupt cache entry " << aFileName;
		return std::make_pair(false, TrackInfo());
	}
	auto entry = doc.object();
	auto expires = static_cast<qint64>(entry["expires"].toDouble(0));
	if (expires <= QDateTime::currentSecsSinceEpoch())
	{
		return std::make_pair(false, TrackInfo());
	}
	return std::make_pair(true, TrackInfo::fromJson(entry["value"].toObject()));
}

#include "MusicBrainzSource.hpp"
#include <algorithm>
#include <memory>
#include <QNetworkAccessManager>
#include <QNetworkRequest>
#include <QNetworkReply>
#include <QEventLoop>
#include <QTimer>
#include <QUrl>
#include <QUrlQuery>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonArray>
#include <QJsonParseError>
#include <QDebug>
#include "../Exception.hpp"





const char * MusicBrainzSource::SEARCH_URL = "https://musicbrainz.org/ws/2/recording";





/** Escapes the Lucene special characters in the value, so that it can be used in a quoted phrase. */
static QString escapeLucene(const QString & aValue)
{
	QString res;
	res.reserve(aValue.size());
	for (const auto & ch: aValue)
	{
		if ((ch == '"') || (ch == '\\'))
		{
			res.append('\\');
		}
		res.append(ch);
	}
	return res;
}





MusicBrainzSource::MusicBrainzSource(const QString & aUserAgent, int aTimeoutMsec):
	mUserAgent(aUserAgent),
	mTimeoutMsec(aTimeoutMsec)
{
}





TrackInfo MusicBrainzSource::lookup(const QString & aArtist, const QString & aTitle)
{
	if (aArtist.trimmed().isEmpty() || aTitle.trimmed().isEmpty())
	{
		// Nothing to search for
		TrackInfo res;
		res.mSourceName = name();
		return res;
	}

	QUrl url(SEARCH_URL);
	QUrlQuery query;
	query.addQueryItem("query", buildQuery(aArtist, aTitle));
	query.addQueryItem("limit", "5");
	query.addQueryItem("fmt", "json");
	url.setQuery(query);

	QNetworkRequest request(url);
	request.setHeader(QNetworkRequest::UserAgentHeader, mUserAgent);
	request.setRawHeader("Accept", "application/json");

	// The manager and the loop live in the calling (worker) thread:
	QNetworkAccessManager nam;
	QEventLoop loop;
	QTimer timer;
	timer.setSingleShot(true);
	QObject::connect(&timer, &QTimer::timeout, &loop, &QEventLoop::quit);
	std::unique_ptr<QNetworkReply> reply(nam.get(request));
	QObject::connect(reply.get(), &QNetworkReply::finished, &loop, &QEventLoop::quit);
	timer.start(mTimeoutMsec);
	loop.exec();

	if (!reply->isFinished())
	{
		reply->abort();
		throw SourceError(name(), "Request timed out after %1 msec", mTimeoutMsec);
	}
	auto status = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
	if (status >= 400)
	{
		throw SourceError(name(), "HTTP error %1 (%2)", status, reply->errorString());
	}
	if (reply->error() != QNetworkReply::NoError)
	{
		throw SourceError(name(), "Network error: %1", reply->errorString());
	}
	auto res = parseRecordingSearch(reply->readAll());
	qDebug() << "MusicBrainz: " << aArtist << " - " << aTitle << ": " << res.mGenres.size() << " tags";
	return res;
}





TrackInfo MusicBrainzSource::parseRecordingSearch(const QByteArray & aReply)
{
	TrackInfo res;
	res.mSourceName = "MusicBrainz";

	QJsonParseError err;
	auto doc = QJsonDocument::fromJson(aReply, &err);
	if (err.error != QJsonParseError::NoError)
	{
		throw SourceError(res.mSourceName, "Invalid JSON reply: %1 at offset %2", err.errorString(), err.offset);
	}
	if (!doc.isObject())
	{
		throw SourceError(res.mSourceName, "The reply is not a JSON object");
	}
	auto recordings = doc.object()["recordings"].toArray();
	if (recordings.isEmpty())
	{
		return res;
	}
	auto recording = recordings.at(0).toObject();

	// Tags, with the confidence derived from the vote counts:
	auto tags = recording["tags"].toArray();
	double maxCount = 0;
	for (const auto & t: tags)
	{
		maxCount = std::max(maxCount, t.toObject()["count"].toDouble(0));
	}
	for (const auto & t: tags)
	{
		auto tag = t.toObject();
		auto tagName = tag["name"].toString().trimmed();
		if (tagName.isEmpty())
		{
			continue;
		}
		auto count = tag["count"].toDouble(0);
		auto confidence = (maxCount > 0) ? std::max(0.0, count / maxCount) : 1.0;
		res.mGenres.emplace_back(tagName, confidence);
	}

	res.mYear = recording["first-release-date"].toString().left(4);
	auto releases = recording["releases"].toArray();
	if (!releases.isEmpty())
	{
		res.mAlbum = releases.at(0).toObject()["title"].toString();
	}
	return res;
}





QString MusicBrainzSource::buildQuery(const QString & aArtist, const QString & aTitle)
{
	return QString("artist:\"%1\" AND recording:\"%2\"")
		.arg(escapeLucene(aArtist.trimmed()), escapeLucene(aTitle.trimmed()));
}

#include "MusicSource.hpp"
#include <QJsonObject>
#include <QJsonArray>





bool TrackInfo::isEmpty() const
{
	return mGenres.empty() && mYear.isEmpty() && mAlbum.isEmpty();
}





QJsonObject TrackInfo::toJson() const
{
	QJsonArray genres;
	for (const auto & g: mGenres)
	{
		QJsonObject genre;
		genre["name"] = g.first;
		genre["confidence"] = g.second;
		genres.append(genre);
	}
	QJsonObject res;
	res["genres"] = genres;
	res["year"] = mYear;
	res["album"] = mAlbum;
	res["source"] = mSourceName;
	return res;
}





TrackInfo TrackInfo::fromJson(const QJsonObject & aJson)
{
	TrackInfo res;
	for (const auto & v: aJson["genres"].toArray())
	{
		auto genre = v.toObject();
		auto name = genre["name"].toString();
		if (name.isEmpty())
		{
			continue;
		}
		res.mGenres.emplace_back(name, genre["confidence"].toDouble(1.0));
	}
	res.mYear = aJson["year"].toString();
	res.mAlbum = aJson["album"].toString();
	res.mSourceName = aJson["source"].toString();
	return res;
}

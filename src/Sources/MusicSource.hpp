#pragma once

#include <memory>
#include <QString>
#include "../SignalAggregator.hpp"





// fwd:
class QJsonObject;





/** The information about a single track, as reported by a single source.
Any of the values may be empty, if the source doesn't know it. */
struct TrackInfo
{
	/** The raw genre tags reported by the source, with the source's confidence in each. */
	GenreScores mGenres;

	/** The release year, as text ("1998"). */
	QString mYear;

	QString mAlbum;

	/** The name of the source that provided the information. */
	QString mSourceName;


	/** Returns true if the info has no data at all (no genre, year or album). */
	bool isEmpty() const;

	/** Serializes the info into a JSON object (used by the lookup cache). */
	QJsonObject toJson() const;

	/** Deserializes the info from a JSON object created by toJson().
	Invalid values are skipped. */
	static TrackInfo fromJson(const QJsonObject & aJson);
};





/** The interface to a single external source of music information.
Implementations must not retry internally, and must not apply any rate limiting of their own,
both are the responsibility of the pipeline. */
class MusicSource
{
public:

	// Force a virtual destructor in all descendants
	virtual ~MusicSource() {}

	/** Returns the name of the source, used as the key for rate limits, metrics and cache entries. */
	virtual QString name() const = 0;

	/** Looks up the information about the specified track.
	Returns an empty TrackInfo if the source doesn't know the track.
	Throws a SourceError on transport failures (timeouts, connection errors, HTTP errors, invalid replies).
	Called from the worker threads, possibly concurrently. */
	virtual TrackInfo lookup(const QString & aArtist, const QString & aTitle) = 0;
};

using MusicSourcePtr = std::shared_ptr<MusicSource>;

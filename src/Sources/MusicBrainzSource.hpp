#pragma once

#include "MusicSource.hpp"





/** Looks up the track information in the MusicBrainz database, using its recording search web service.
Each lookup is a single blocking HTTP request, bounded by a timeout; the request is processed
in a local event loop of the calling thread, so the source can be used from any worker thread.
MusicBrainz requires each client to identify itself with a descriptive User-Agent. */
class MusicBrainzSource:
	public MusicSource
{
public:

	/** The base URL of the recording search service. */
	static const char * SEARCH_URL;


	MusicBrainzSource(const QString & aUserAgent, int aTimeoutMsec = 10000);

	// MusicSource overrides:
	virtual QString name() const override { return "MusicBrainz"; }
	virtual TrackInfo lookup(const QString & aArtist, const QString & aTitle) override;

	/** Parses the reply of the recording search into the track information.
	The first recording in the reply is used; the genres are the recording's tags, the confidence of each tag
	is its vote count relative to the most voted tag (1 if the counts are missing).
	Returns an empty info if the reply contains no recordings.
	Throws a SourceError if the reply is not valid JSON. */
	static TrackInfo parseRecordingSearch(const QByteArray & aReply);


protected:

	QString mUserAgent;

	int mTimeoutMsec;


	/** Builds the Lucene query for the recording search. */
	static QString buildQuery(const QString & aArtist, const QString & aTitle);
};

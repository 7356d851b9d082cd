#pragma once

#include <utility>
#include <QMutex>
#include <QString>
#include "ComponentCollection.hpp"
#include "Sources/MusicSource.hpp"





/** Persistent cache of the source lookups, so that tracks that have been seen recently
don't need to go through the rate limiter and the network again.
Each entry is stored as a separate JSON file in the cache folder, named by the hash of the query,
and expires after the TTL given at construction.
Thread-safe. */
class LookupCache:
	public ComponentCollection::Component<ComponentCollection::ckLookupCache>
{
public:

	/** Creates a cache storing its entries in the specified folder (created if missing).
	Throws a RuntimeError if the folder cannot be created, or a LogicError if the TTL is not positive. */
	LookupCache(const QString & aFolder, qint64 aTtlSec);

	/** Returns the cached info for the specified query.
	The first value is false if there's no valid entry (missing, expired or corrupt). */
	std::pair<bool, TrackInfo> get(const QString & aSource, const QString & aArtist, const QString & aTitle);

	/** Stores the info for the specified query, replacing any previous entry.
	Returns false (and logs) if the entry cannot be written. */
	bool set(const QString & aSource, const QString & aArtist, const QString & aTitle, const TrackInfo & aInfo);

	/** Removes all the entries. */
	void clear();

	/** Removes the expired (and corrupt) entries.
	Returns the number of entries removed. */
	int removeExpired();

	/** Returns the cache key for the specified query: the hex SHA-1 of the source and the normalized artist and title. */
	static QString keyFor(const QString & aSource, const QString & aArtist, const QString & aTitle);

	int numHits() const;
	int numMisses() const;


protected:

	/** The folder with the entries, including the trailing slash. */
	QString mFolder;

	qint64 mTtlSec;

	/** The mutex protecting the files and the counters against multithreaded access. */
	mutable QMutex mMtx;

	int mNumHits;
	int mNumMisses;


	/** Returns the file name for the entry with the specified key. */
	QString fileNameFor(const QString & aKey) const;

	/** Reads the entry from the file.
	The first value is false if the file is missing, corrupt or expired. */
	static std::pair<bool, TrackInfo> readEntry(const QString & aFileName);
};

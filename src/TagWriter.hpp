#pragma once

#include <utility>
#include <QString>
#include <QStringList>
#include "ComponentCollection.hpp"





/** The identification of a track, as read from an audio file. */
struct TrackTag
{
	QString mArtist;
	QString mTitle;

	/** The genre currently stored in the file, if any. */
	QString mGenre;
};





/** The tag I/O of the audio files: reads the track identification and writes the selected genres back.
Implementations must be callable from the worker threads concurrently, for different files. */
class TagWriter:
	public ComponentCollection::Component<ComponentCollection::ckTagWriter>
{
public:

	// Force a virtual destructor in all descendants
	virtual ~TagWriter() {}

	/** Reads the artist and title of the specified file.
	The first value is false if the file cannot be read or doesn't contain enough info to identify the track. */
	virtual std::pair<bool, TrackTag> readTrack(const QString & aFileName) = 0;

	/** Replaces the genre stored in the file with the specified genres.
	Returns true on success, false (and logs) on failure. */
	virtual bool writeGenres(const QString & aFileName, const QStringList & aGenres) = 0;
};

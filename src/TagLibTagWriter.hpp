#pragma once

#include "TagWriter.hpp"





// fwd:
namespace TagLib
{
	class FileRef;
}





/** Reads and writes the tags of the audio files using TagLib.
Multiple genres are stored in a single GENRE value, separated by GENRE_SEPARATOR. */
class TagLibTagWriter:
	public TagWriter
{
public:

	static const char * GENRE_SEPARATOR;


	TagLibTagWriter();

	// TagWriter overrides:
	virtual std::pair<bool, TrackTag> readTrack(const QString & aFileName) override;
	virtual bool writeGenres(const QString & aFileName, const QStringList & aGenres) override;

	/** Parses the artist and title out of a file name in the form "[folders/]Artist - Title.ext".
	If the name cannot be split, the whole bare name is returned as the title. */
	static TrackTag parseFileName(const QString & aFileName);


protected:

	/** Opens the specified file in TagLib. */
	static TagLib::FileRef openTagFile(const QString & aFileName);
};

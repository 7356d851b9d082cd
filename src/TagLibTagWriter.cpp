#include "TagLibTagWriter.hpp"
#include <QDebug>
#include <taglib/fileref.h>
#include <taglib/tag.h>
#include <taglib/tpropertymap.h>





const char * TagLibTagWriter::GENRE_SEPARATOR = ";";





/** If the tag has empty artist or title, attempts to split the other value into two.
Handles strings such as "artist - title" in a single tag entry.
The tag is changed in-place. */
static void trySplitArtistTitle(TrackTag & aTag)
{
	if (
		(aTag.mArtist.isEmpty() && aTag.mTitle.isEmpty()) ||
		(!aTag.mArtist.isEmpty() && !aTag.mTitle.isEmpty())
	)
	{
		// Nothing to be done in this case
		return;
	}

	// A spaced dash is the most reliable separator:
	auto src = aTag.mArtist.isEmpty() ? aTag.mTitle : aTag.mArtist;
	auto idxSpacedDash = src.indexOf(" - ");
	if (idxSpacedDash > 0)
	{
		aTag.mArtist = src.left(idxSpacedDash).simplified();
		aTag.mTitle = src.mid(idxSpacedDash + 3).simplified();
		if (!aTag.mArtist.isEmpty() && !aTag.mTitle.isEmpty())
		{
			return;
		}
		aTag.mArtist.clear();
		aTag.mTitle = src;
	}

	// Split into halves on the '-' closest to the string middle:
	auto halfLen = src.length() / 2;
	for (int i = 0; i <= halfLen; ++i)
	{
		for (auto idx: {halfLen + i, halfLen - i})
		{
			if ((idx <= 0) || (idx >= src.length() - 1) || (src[idx] != '-'))
			{
				continue;
			}
			auto artist = src.left(idx).simplified();
			auto title = src.mid(idx + 1).simplified();
			if (artist.isEmpty() || title.isEmpty())
			{
				continue;
			}
			aTag.mArtist = artist;
			aTag.mTitle = title;
			return;
		}
	}
}





TagLibTagWriter::TagLibTagWriter()
{
}





std::pair<bool, TrackTag> TagLibTagWriter::readTrack(const QString & aFileName)
{
	TrackTag res;
	auto fr = openTagFile(aFileName);
	if (fr.isNull())
	{
		// File format not recognized
		qDebug() << "Unable to parse file " << aFileName;
		return std::make_pair(false, res);
	}
	auto tag = fr.tag();
	if (tag != nullptr)
	{
		res.mArtist = QString::fromStdString(tag->artist().to8Bit(true)).simplified();
		res.mTitle = QString::fromStdString(tag->title().to8Bit(true)).simplified();
		res.mGenre = QString::fromStdString(tag->genre().to8Bit(true)).simplified();
	}
	trySplitArtistTitle(res);

	// Fall back to the file name if the tag doesn't identify the track:
	if (res.mArtist.isEmpty() || res.mTitle.isEmpty())
	{
		auto fromName = parseFileName(aFileName);
		if (res.mArtist.isEmpty())
		{
			res.mArtist = fromName.mArtist;
		}
		if (res.mTitle.isEmpty())
		{
			res.mTitle = fromName.mTitle;
		}
	}
	if (res.mArtist.isEmpty() || res.mTitle.isEmpty())
	{
		qDebug() << "Cannot identify the track in " << aFileName;
		return std::make_pair(false, res);
	}
	return std::make_pair(true, res);
}





bool TagLibTagWriter::writeGenres(const QString & aFileName, const QStringList & aGenres)
{
	auto fr = openTagFile(aFileName);
	if (fr.isNull())
	{
		// File format not recognized
		qWarning() << "Unable to parse file " << aFileName;
		return false;
	}
	auto props = fr.file()->properties();
	if (aGenres.isEmpty())
	{
		props.erase("GENRE");
	}
	else
	{
		props["GENRE"] = TagLib::StringList(
			TagLib::String(aGenres.join(GENRE_SEPARATOR).toStdString(), TagLib::String::Type::UTF8)
		);
	}
	auto refused = fr.file()->setProperties(props);
	if (!refused.isEmpty())
	{
		qWarning() << "Failed to set the following properties on file " << aFileName;
		for (const auto & prop: refused)
		{
			qWarning()
				<< "  " << prop.first.to8Bit(true).c_str()
				<< " (" << prop.second.toString(" | ").to8Bit(true).c_str()
			;
		}
		return false;
	}
	if (!fr.save())
	{
		qWarning() << "Failed to save the new genre into file " << aFileName;
		return false;
	}
	return true;
}





TrackTag TagLibTagWriter::parseFileName(const QString & aFileName)
{
	TrackTag res;
	auto bareName = aFileName.mid(aFileName.lastIndexOf('/') + 1);
	auto idxExt = bareName.lastIndexOf('.');
	if (idxExt > 0)
	{
		bareName.remove(idxExt, bareName.length());
	}
	res.mTitle = bareName.replace('_', ' ').simplified();
	trySplitArtistTitle(res);
	return res;
}





TagLib::FileRef TagLibTagWriter::openTagFile(const QString & aFileName)
{
	#ifdef _WIN32
		// TagLib on Windows needs UTF16-BE filenames:
		return TagLib::FileRef(reinterpret_cast<const wchar_t *>(aFileName.constData()), false);
	#else
		return TagLib::FileRef(aFileName.toUtf8().constData(), false);
	#endif
}

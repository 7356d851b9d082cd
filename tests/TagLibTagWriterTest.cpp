// TagLibTagWriterTest.cpp

// Tests the track identification from file names, writing the genres into a real audio file,
// and the handling of unreadable files





#include <iostream>
#include <QFile>
#include <QTemporaryDir>
#include <QtEndian>
#include <taglib/fileref.h>
#include <taglib/tpropertymap.h>
#include "../src/TagLibTagWriter.hpp"





/** Global failure flag, any failing test sets this to true.
The program's exit status is set according to this value. */
static bool g_HasFailed = false;





/** Compares the parsed file name against the expected artist and title. */
static void testParse(const QString & aFileName, const QString & aExpectedArtist, const QString & aExpectedTitle)
{
	auto tag = TagLibTagWriter::parseFileName(aFileName);
	if ((tag.mArtist != aExpectedArtist) || (tag.mTitle != aExpectedTitle))
	{
		std::cerr << "FAILED: Parsing file name \"" << aFileName.toStdString() << "\"" << std::endl;
		std::cerr << "  Expected: \"" << aExpectedArtist.toStdString() << "\" / \"" << aExpectedTitle.toStdString() << "\"" << std::endl;
		std::cerr << "  Actual:   \"" << tag.mArtist.toStdString() << "\" / \"" << tag.mTitle.toStdString() << "\"" << std::endl;
		g_HasFailed = true;
	}
}





static void testFileNames()
{
	testParse("Nirvana - Lithium.mp3",                    "Nirvana",        "Lithium");
	testParse("/music/90s/Nirvana - Lithium.mp3",         "Nirvana",        "Lithium");
	testParse("Daft_Punk_-_One_More_Time.mp3",            "Daft Punk",      "One More Time");
	testParse("Jay-Z - 99 Problems.mp3",                  "Jay-Z",          "99 Problems");
	testParse("Artist-Title.mp3",                         "Artist",         "Title");
	testParse("a-ha - Take On Me.flac",                   "a-ha",           "Take On Me");
	testParse("Untitled.mp3",                             "",               "Untitled");
	testParse("No Extension - Here",                      "No Extension",   "Here");
	testParse("- Leading dash.mp3",                       "",               "- Leading dash");
}





/** Appends the 32-bit little-endian value to the buffer. */
static void appendLE32(QByteArray & aDest, quint32 aValue)
{
	char buf[4];
	qToLittleEndian(aValue, reinterpret_cast<uchar *>(buf));
	aDest.append(buf, 4);
}





/** Appends the 16-bit little-endian value to the buffer. */
static void appendLE16(QByteArray & aDest, quint16 aValue)
{
	char buf[2];
	qToLittleEndian(aValue, reinterpret_cast<uchar *>(buf));
	aDest.append(buf, 2);
}





/** Writes a minimal valid WAV file (8 kHz mono 8-bit PCM, a few samples of silence).
Returns true on success. */
static bool writeSilentWav(const QString & aFileName)
{
	static const quint32 NUM_SAMPLES = 100;
	QByteArray wav;
	wav.append("RIFF", 4);
	appendLE32(wav, 36 + NUM_SAMPLES);
	wav.append("WAVE", 4);
	wav.append("fmt ", 4);
	appendLE32(wav, 16);    // fmt chunk size
	appendLE16(wav, 1);     // PCM
	appendLE16(wav, 1);     // mono
	appendLE32(wav, 8000);  // sample rate
	appendLE32(wav, 8000);  // byte rate
	appendLE16(wav, 1);     // block align
	appendLE16(wav, 8);     // bits per sample
	wav.append("data", 4);
	appendLE32(wav, NUM_SAMPLES);
	wav.append(QByteArray(NUM_SAMPLES, static_cast<char>(0x80)));

	QFile f(aFileName);
	if (!f.open(QIODevice::WriteOnly))
	{
		return false;
	}
	return (f.write(wav) == wav.size());
}





/** Returns the GENRE property values stored in the file, read directly through TagLib. */
static TagLib::StringList readGenreProperty(const QString & aFileName)
{
	TagLib::FileRef fr(aFileName.toUtf8().constData(), false);
	if (fr.isNull())
	{
		return TagLib::StringList();
	}
	auto props = fr.file()->properties();
	auto itr = props.find("GENRE");
	if (itr == props.end())
	{
		return TagLib::StringList();
	}
	return itr->second;
}





/** The genres are written into a real audio file joined by the separator, read back, and erased by an empty list. */
static void testWriteGenres(const QString & aFolder)
{
	auto fileName = aFolder + "/Some Artist - Some Title.wav";
	if (!writeSilentWav(fileName))
	{
		std::cerr << "FAILED: Cannot create the test WAV file" << std::endl;
		g_HasFailed = true;
		return;
	}
	TagLibTagWriter writer;

	if (!writer.writeGenres(fileName, {"Rock", "Pop"}))
	{
		std::cerr << "FAILED: Writing genres into a WAV file reports a failure" << std::endl;
		g_HasFailed = true;
	}
	auto genres = readGenreProperty(fileName);
	if ((genres.size() != 1) || (genres.front() != TagLib::String("Rock;Pop")))
	{
		std::cerr << "FAILED: The written GENRE property is not \"Rock;Pop\"" << std::endl;
		std::cerr << "  Actual: \"" << genres.toString(" | ").to8Bit(true) << "\"" << std::endl;
		g_HasFailed = true;
	}

	// The written genre is read back together with the track identification from the file name:
	auto track = writer.readTrack(fileName);
	if (
		!track.first ||
		(track.second.mArtist != "Some Artist") ||
		(track.second.mTitle != "Some Title") ||
		(track.second.mGenre != "Rock;Pop")
	)
	{
		std::cerr << "FAILED: Reading the track back from the WAV file" << std::endl;
		std::cerr << "  Actual: \"" << track.second.mArtist.toStdString() << "\" / \""
			<< track.second.mTitle.toStdString() << "\" / \"" << track.second.mGenre.toStdString() << "\"" << std::endl;
		g_HasFailed = true;
	}

	// Overwriting replaces the previous value:
	auto isOverwritten = writer.writeGenres(fileName, {"Jazz"});
	genres = readGenreProperty(fileName);
	if (!isOverwritten || (genres.size() != 1) || (genres.front() != TagLib::String("Jazz")))
	{
		std::cerr << "FAILED: Overwriting the genres in a WAV file" << std::endl;
		g_HasFailed = true;
	}

	// An empty list erases the genre:
	if (!writer.writeGenres(fileName, QStringList()))
	{
		std::cerr << "FAILED: Erasing the genres from a WAV file reports a failure" << std::endl;
		g_HasFailed = true;
	}
	if (!readGenreProperty(fileName).isEmpty())
	{
		std::cerr << "FAILED: The GENRE property is still present after writing an empty list" << std::endl;
		g_HasFailed = true;
	}
}





static void testUnreadableFiles(const QString & aFolder)
{
	TagLibTagWriter writer;

	// A file that doesn't exist at all:
	auto missing = writer.readTrack(aFolder + "/missing - file.mp3");
	if (missing.first)
	{
		std::cerr << "FAILED: A missing file is reported as readable" << std::endl;
		g_HasFailed = true;
	}

	// A file that is not an audio file:
	auto fileName = aFolder + "/Some Artist - Some Title.mp3";
	{
		QFile f(fileName);
		f.open(QIODevice::WriteOnly);
		f.write("This is not an MP3 file, just some text pretending to be one.");
	}
	if (writer.writeGenres(fileName, {"Rock"}))
	{
		std::cerr << "FAILED: Writing genres into a non-audio file is reported as successful" << std::endl;
		g_HasFailed = true;
	}
}





int main()
{
	QTemporaryDir tmp;
	if (!tmp.isValid())
	{
		std::cerr << "Cannot create a temporary folder" << std::endl;
		return 2;
	}

	testFileNames();
	testWriteGenres(tmp.path());
	testUnreadableFiles(tmp.path());

	if (!g_HasFailed)
	{
		std::cerr << "All tests passed" << std::endl;
	}
	return g_HasFailed ? 1 : 0;
}

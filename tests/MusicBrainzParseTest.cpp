// MusicBrainzParseTest.cpp

// Tests the parsing of the MusicBrainz recording search replies





#include <iostream>
#include <cmath>
#include "../src/Sources/MusicBrainzSource.hpp"
#include "../src/Exception.hpp"





/** Global failure flag, any failing test sets this to true.
The program's exit status is set according to this value. */
static bool g_HasFailed = false;





/** Reports the failure if the condition doesn't hold. */
static void expect(bool aCondition, const char * aDescription)
{
	if (!aCondition)
	{
		std::cerr << "FAILED: " << aDescription << std::endl;
		g_HasFailed = true;
	}
}





/** Returns the confidence of the specified genre in the info, or -1 if not present. */
static double confidenceOf(const TrackInfo & aInfo, const QString & aGenre)
{
	for (const auto & g: aInfo.mGenres)
	{
		if (g.first == aGenre)
		{
			return g.second;
		}
	}
	return -1;
}





static void testFullReply()
{
	const QByteArray reply = R"({
		"created": "2020-01-01T00:00:00.000Z",
		"count": 2,
		"offset": 0,
		"recordings": [
			{
				"id": "0",
				"title": "Lithium",
				"first-release-date": "1991-09-24",
				"tags": [
					{"count": 4, "name": "grunge"},
					{"count": 2, "name": "alternative rock"},
					{"count": 1, "name": "rock"},
					{"count": 3, "name": ""}
				],
				"releases": [
					{"id": "1", "title": "Nevermind"},
					{"id": "2", "title": "Lithium (single)"}
				]
			},
			{
				"id": "3",
				"title": "Lithium (live)",
				"tags": [{"count": 100, "name": "live"}]
			}
		]
	})";

	auto info = MusicBrainzSource::parseRecordingSearch(reply);
	expect(info.mSourceName == "MusicBrainz", "The source name is set");
	expect(info.mGenres.size() == 3, "Tags without a name are skipped, only the first recording is used");
	expect(std::abs(confidenceOf(info, "grunge") - 1.0) < 1e-9, "The most voted tag has confidence 1");
	expect(std::abs(confidenceOf(info, "alternative rock") - 0.5) < 1e-9, "Confidence is relative to the most voted tag");
	expect(std::abs(confidenceOf(info, "rock") - 0.25) < 1e-9, "Confidence is relative to the most voted tag");
	expect(confidenceOf(info, "live") < 0, "Tags of the other recordings are ignored");
	expect(info.mYear == "1991", "The year is taken from the first release date");
	expect(info.mAlbum == "Nevermind", "The album is the first release");
}





static void testMissingCounts()
{
	const QByteArray reply = R"({"recordings": [{"tags": [{"name": "jazz"}, {"name": "bebop"}]}]})";
	auto info = MusicBrainzSource::parseRecordingSearch(reply);
	expect(info.mGenres.size() == 2, "All named tags are used");
	expect(confidenceOf(info, "jazz") == 1.0, "Tags without vote counts have confidence 1");
	expect(confidenceOf(info, "bebop") == 1.0, "Tags without vote counts have confidence 1");
	expect(info.mYear.isEmpty(), "A missing release date yields an empty year");
	expect(info.mAlbum.isEmpty(), "Missing releases yield an empty album");
}





static void testNoRecordings()
{
	auto info = MusicBrainzSource::parseRecordingSearch(R"({"created": "x", "count": 0, "recordings": []})");
	expect(info.isEmpty(), "A reply without recordings yields an empty info");
	expect(MusicBrainzSource::parseRecordingSearch("{}").isEmpty(), "A reply without the recordings array yields an empty info");
}





static void testInvalidReplies()
{
	for (const auto & reply: {QByteArray("<html>Service unavailable</html>"), QByteArray("[1, 2]"), QByteArray("")})
	{
		bool hasThrown = false;
		try
		{
			MusicBrainzSource::parseRecordingSearch(reply);
		}
		catch (const SourceError & exc)
		{
			hasThrown = true;
			expect(exc.sourceName() == "MusicBrainz", "The error names the source");
		}
		expect(hasThrown, "An invalid reply throws a SourceError");
	}
}





int main()
{
	testFullReply();
	testMissingCounts();
	testNoRecordings();
	testInvalidReplies();

	if (!g_HasFailed)
	{
		std::cerr << "All tests passed" << std::endl;
	}
	return g_HasFailed ? 1 : 0;
}

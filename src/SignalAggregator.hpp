#pragma once

#include <map>
#include <vector>
#include <utility>
#include <QString>
#include <QStringList>





/** A single raw genre tag reported by a source for a single item. */
struct GenreSignal
{
	QString mTag;
	QString mSource;

	/** How much the source trusts the tag, in the range [0, 1]. */
	double mConfidence;

	GenreSignal(const QString & aTag, const QString & aSource, double aConfidence):
		mTag(aTag),
		mSource(aSource),
		mConfidence(aConfidence)
	{
	}
};


/** Genre names with their confidence, ordered by descending confidence. */
using GenreScores = std::vector<std::pair<QString, double>>;





/** Merges the raw, noisy genre tags gathered from several sources for a single item
into a short, clean list of genres.
The raw tags are split into sub-tags, noise (blacklisted terms, years, too short / long names) is dropped,
the rest is title-cased and deduplicated case-insensitively (keeping the highest confidence).
The final selection takes the genres that clear the confidence threshold; if none does,
the threshold is relaxed once, and if still nothing is selected, the single best candidate is used. */
class SignalAggregator
{
public:

	/** The outcome of the genre selection for a single item. */
	struct Selection
	{
		/** The selected genre names, best first. */
		QStringList mGenres;

		/** The confidence threshold that was actually used for the selection. */
		double mConfidenceUsed = 0;

		/** True if the configured threshold had to be lowered (or the best-candidate fallback was used). */
		bool mWasRelaxed = false;

		/** All the cleaned candidates the selection was made from. */
		GenreScores mCandidates;

		/** If no genre could be selected, the reason, such as "No valid genres". Empty on success. */
		QString mNoGenresReason;

		bool isEmpty() const { return mGenres.isEmpty(); }
	};


	/** Amount by which the threshold is lowered when no genre clears it. */
	static const double RELAXATION_STEP;

	/** Sub-tags this long or longer are considered garbage (sentences, URLs). */
	static const int MAX_GENRE_LENGTH = 50;


	SignalAggregator(double aConfidence = 0.5, int aMaxGenres = 3, int aMaxTags = 100, double aMinConfidence = 0.2);

	/** Merges the signals from all sources into a raw-tag -> confidence map.
	If several sources report the same raw tag, the highest confidence is kept. */
	static std::map<QString, double> collectSignals(const std::vector<GenreSignal> & aSignals);

	/** Splits a single raw tag into the cleaned genre names it contains.
	The tag is split on ';', ',' and '/'; sub-tags containing a blacklisted term are dropped,
	years (1900 - 2099) are stripped, the rest is title-cased and filtered for length and content.
	The output contains no case-insensitive duplicates, in the order of appearance. */
	static QStringList cleanAndSplitGenrePayload(const QString & aRawTag);

	/** Aggregates the raw tags into cleaned genre candidates.
	Only the aMaxTags raw tags with the highest confidence are considered.
	Each cleaned genre gets the highest confidence of all the raw tags it came from.
	The output is ordered by descending confidence. */
	static GenreScores aggregate(const std::map<QString, double> & aRawTags, int aMaxTags);

	/** Returns at most aMaxGenres of the candidates whose confidence is at least aConfidence,
	best first, without case-insensitive duplicates. */
	static QStringList selectGenres(const GenreScores & aCandidates, double aConfidence, int aMaxGenres);

	/** Selects the final genres from the candidates, relaxing the threshold if needed. */
	Selection select(const GenreScores & aCandidates) const;

	/** Runs the whole processing on the raw tags: aggregate() followed by select(). */
	Selection process(const std::map<QString, double> & aRawTags) const;

	/** Returns true if the text contains any of the blacklisted (non-genre) terms, case-insensitively. */
	static bool isBlacklisted(const QString & aText);

	/** Returns the text in title case: the first letter of each word in uppercase, the rest in lowercase.
	A letter starts a new word unless it follows another letter or a digit. */
	static QString titleCase(const QString & aText);


protected:

	/** The threshold a genre needs to clear in order to be selected. */
	double mConfidence;

	/** The maximum number of selected genres. */
	int mMaxGenres;

	/** The maximum number of raw tags considered. */
	int mMaxTags;

	/** The configured floor for the relaxed threshold. */
	double mMinConfidence;
};

#include "SignalAggregator.hpp"
#include <algorithm>
#include <QRegularExpression>
#include <QDebug>





const double SignalAggregator::RELAXATION_STEP = 0.2;
const int SignalAggregator::MAX_GENRE_LENGTH;





/** Terms that mark a tag as noise rather than a genre.
Matched as case-insensitive substrings. */
static const char * g_BlacklistedTerms[] =
{
	"victim", "fire", "universal", "compilation", "unknown", "soundtrack",
	"http", "fix", "tag", "mess", "error", "todo", "check",
	"wrong", "unclassifiable", "other", "others",
	"delete", "seen live", "favorites", "favourite", "test",
	"misc", "checked", "need", "spotify", "lastfm", "indy",
	"artist", "artists", "video", "title",
	"dj", "remix", "mix", "bootleg", "edit", "promo", "radio", "club", "live",
	"album", "single", "track", "version", "original", "extended", "instrumental",
};





/** Returns true if the text consists of punctuation and symbols only. */
static bool isPunctuationOnly(const QString & aText)
{
	for (const auto & ch: aText)
	{
		if (!ch.isPunct() && !ch.isSymbol() && !ch.isSpace())
		{
			return false;
		}
	}
	return true;
}





/** Returns true if the text consists of digits only. */
static bool isDigitsOnly(const QString & aText)
{
	for (const auto & ch: aText)
	{
		if (!ch.isDigit())
		{
			return false;
		}
	}
	return true;
}





/** Returns true if the list already contains the name, compared case-insensitively. */
static bool containsCaseInsensitive(const QStringList & aList, const QString & aName)
{
	return aList.contains(aName, Qt::CaseInsensitive);
}





////////////////////////////////////////////////////////////////////////////////
// SignalAggregator:

SignalAggregator::SignalAggregator(double aConfidence, int aMaxGenres, int aMaxTags, double aMinConfidence):
	mConfidence(aConfidence),
	mMaxGenres(aMaxGenres),
	mMaxTags(aMaxTags),
	mMinConfidence(aMinConfidence)
{
}





std::map<QString, double> SignalAggregator::collectSignals(const std::vector<GenreSignal> & aSignals)
{
	std::map<QString, double> res;
	for (const auto & signal: aSignals)
	{
		auto itr = res.find(signal.mTag);
		if (itr == res.end())
		{
			res[signal.mTag] = signal.mConfidence;
		}
		else if (signal.mConfidence > itr->second)
		{
			itr->second = signal.mConfidence;
		}
	}
	return res;
}





QStringList SignalAggregator::cleanAndSplitGenrePayload(const QString & aRawTag)
{
	static const QRegularExpression reSeparators("[;,/]");
	static const QRegularExpression reYear("\\s*\\b(19|20)\\d{2}\\b");

	QStringList res;
	auto parts = aRawTag.simplified().split(reSeparators);
	for (const auto & part: parts)
	{
		auto genre = part.trimmed();
		if (genre.isEmpty() || isBlacklisted(genre))
		{
			continue;
		}
		genre = titleCase(genre.remove(reYear).trimmed());
		if (
			(genre.length() < 2) ||
			(genre.length() >= MAX_GENRE_LENGTH) ||
			isDigitsOnly(genre) ||
			isPunctuationOnly(genre)
		)
		{
			continue;
		}
		if (!containsCaseInsensitive(res, genre))
		{
			res.append(genre);
		}
	}
	return res;
}





GenreScores SignalAggregator::aggregate(const std::map<QString, double> & aRawTags, int aMaxTags)
{
	// Sort the raw tags by their confidence, best first:
	GenreScores raw(aRawTags.begin(), aRawTags.end());
	std::stable_sort(raw.begin(), raw.end(),
		[](const std::pair<QString, double> & aLeft, const std::pair<QString, double> & aRight)
		{
			return (aLeft.second > aRight.second);
		}
	);
	if (aMaxTags >= 0 && raw.size() > static_cast<size_t>(aMaxTags))
	{
		raw.resize(static_cast<size_t>(aMaxTags));
	}

	// Clean the tags, keep the highest confidence for each genre:
	GenreScores res;
	std::map<QString, size_t> indexByLowerName;
	for (const auto & rawTag: raw)
	{
		for (const auto & genre: cleanAndSplitGenrePayload(rawTag.first))
		{
			auto lower = genre.toLower();
			auto itr = indexByLowerName.find(lower);
			if (itr == indexByLowerName.end())
			{
				indexByLowerName[lower] = res.size();
				res.emplace_back(genre, rawTag.second);
			}
			else if (rawTag.second > res[itr->second].second)
			{
				res[itr->second].second = rawTag.second;
			}
		}
	}

	// The raw tags were processed best-first, but a later raw tag may have still produced a new genre:
	std::stable_sort(res.begin(), res.end(),
		[](const std::pair<QString, double> & aLeft, const std::pair<QString, double> & aRight)
		{
			return (aLeft.second > aRight.second);
		}
	);
	return res;
}





QStringList SignalAggregator::selectGenres(const GenreScores & aCandidates, double aConfidence, int aMaxGenres)
{
	GenreScores sorted(aCandidates);
	std::stable_sort(sorted.begin(), sorted.end(),
		[](const std::pair<QString, double> & aLeft, const std::pair<QString, double> & aRight)
		{
			return (aLeft.second > aRight.second);
		}
	);

	QStringList res;
	for (const auto & candidate: sorted)
	{
		if (res.size() >= aMaxGenres)
		{
			break;
		}
		if ((candidate.second < aConfidence) || candidate.first.isEmpty())
		{
			continue;
		}
		auto name = candidate.first.at(0).toUpper() + candidate.first.mid(1);
		if (!containsCaseInsensitive(res, name))
		{
			res.append(name);
		}
	}
	return res;
}





SignalAggregator::Selection SignalAggregator::select(const GenreScores & aCandidates) const
{
	Selection res;
	res.mCandidates = aCandidates;
	res.mConfidenceUsed = mConfidence;
	if (aCandidates.empty())
	{
		res.mNoGenresReason = "No valid genres";
		return res;
	}

	res.mGenres = selectGenres(aCandidates, mConfidence, mMaxGenres);
	if (!res.mGenres.isEmpty())
	{
		return res;
	}

	// Nothing clears the threshold, relax it once:
	res.mWasRelaxed = true;
	res.mConfidenceUsed = std::max(0.0, std::min(mMinConfidence, mConfidence - RELAXATION_STEP));
	res.mGenres = selectGenres(aCandidates, res.mConfidenceUsed, mMaxGenres);
	if (!res.mGenres.isEmpty())
	{
		qDebug() << "Genre confidence relaxed from " << mConfidence << " to " << res.mConfidenceUsed;
		return res;
	}

	// Still nothing, use the single best candidate:
	auto best = std::max_element(aCandidates.begin(), aCandidates.end(),
		[](const std::pair<QString, double> & aLeft, const std::pair<QString, double> & aRight)
		{
			return (aLeft.second < aRight.second);
		}
	);
	res.mGenres = selectGenres({*best}, best->second, 1);
	res.mConfidenceUsed = best->second;
	qDebug() << "No genre cleared the relaxed confidence, using the best candidate " << best->first;
	return res;
}





SignalAggregator::Selection SignalAggregator::process(const std::map<QString, double> & aRawTags) const
{
	return select(aggregate(aRawTags, mMaxTags));
}





bool SignalAggregator::isBlacklisted(const QString & aText)
{
	for (const auto term: g_BlacklistedTerms)
	{
		if (aText.contains(QLatin1String(term), Qt::CaseInsensitive))
		{
			return true;
		}
	}
	return false;
}





QString SignalAggregator::titleCase(const QString & aText)
{
	QString res;
	res.reserve(aText.size());
	bool isInWord = false;
	for (const auto & ch: aText)
	{
		if (ch.isLetter())
		{
			res.append(isInWord ? ch.toLower() : ch.toUpper());
			isInWord = true;
		}
		else
		{
			res.append(ch);
			isInWord = ch.isDigit();
		}
	}
	return res;
}

#ifndef INSTALLCONFIGURATION_H
#define INSTALLCONFIGURATION_H





#include <QString>
#include "ComponentCollection.hpp"





/** Provides information that is specific to this installation of the program:
- writable data location
- names of the files stored there (settings, metrics, lookup cache, log) */
class InstallConfiguration:
	public ComponentCollection::Component<ComponentCollection::ckInstallConfiguration>
{
public:

	/** Initializes the paths by detecting a writable data folder.
	Throws a RuntimeError if no suitable path was found. */
	InstallConfiguration();

	/** Initializes the paths to use the specified data folder (used by tests).
	Throws a RuntimeError if the folder is not suitable. */
	explicit InstallConfiguration(const QString & aDataFolder);

	/** Returns the path where the specified file (with writable data) / folder should be stored. */
	QString dataLocation(const QString & aFileName) const { return mDataPath + aFileName; }

	/** Returns the filename of the settings file. */
	QString iniFileName() const { return dataLocation("GenreEnricher.ini"); }

	/** Returns the filename where the per-source call metrics are persisted. */
	QString metricsFileName() const { return dataLocation("api_metrics.json"); }

	/** Returns the folder where the lookup cache stores its entries. */
	QString cacheFolder() const { return dataLocation("cache/"); }

	/** Returns the default log file name. */
	QString logFileName() const { return dataLocation("GenreEnricher.log"); }


protected:

	/** The base path where the program should store its data (writable).
	If nonempty, includes the trailing slash. */
	QString mDataPath;


	/** Returns the folder to use for mDataPath.
	To be called from the constructor.
	Throws a RuntimeError if no suitable path was found. */
	static QString detectDataPath();

	/** Returns true if the specified path is suitable for data path.
	Checks that the path is writable.
	If the path doesn't exist, creates it. */
	static bool isDataPathSuitable(const QString & aFolder);
};





#endif // INSTALLCONFIGURATION_H

#include "InstallConfiguration.hpp"
#include <QDir>
#include <QFileInfo>
#include <QDebug>
#include <QStandardPaths>





#ifdef _WIN32
	// Needed for NTFS permission checking, as documented in QFileInfo
	extern Q_CORE_EXPORT int qt_ntfs_permission_lookup;
#endif  // _WIN32





/** Returns the folder name with a trailing slash added, if not already present. */
static QString withTrailingSlash(const QString & aFolder)
{
	if (aFolder.isEmpty() || aFolder.endsWith('/'))
	{
		return aFolder;
	}
	return aFolder + "/";
}





InstallConfiguration::InstallConfiguration():
	mDataPath(detectDataPath())
{
	qDebug() << "Using data path " << mDataPath;
}





InstallConfiguration::InstallConfiguration(const QString & aDataFolder):
	mDataPath(withTrailingSlash(aDataFolder))
{
	if (!isDataPathSuitable(aDataFolder))
	{
		throw RuntimeError("The data folder %1 is not writable.", aDataFolder);
	}
	qDebug() << "Using data path " << mDataPath;
}





QString InstallConfiguration::detectDataPath()
{
	// If the current folder is writable, use that as the data location ("portable" version):
	if (isDataPathSuitable("."))
	{
		return "";
	}

	// Try the local app data folder:
	auto writableData = QStandardPaths::writableLocation(QStandardPaths::AppLocalDataLocation);
	if (isDataPathSuitable(writableData))
	{
		return withTrailingSlash(writableData);
	}

	// No suitable location found
	throw RuntimeError("Cannot find a suitable location to store the data.");
}





bool InstallConfiguration::isDataPathSuitable(const QString & aFolder)
{
	if (aFolder.isEmpty())
	{
		return false;
	}
	QFileInfo folder(aFolder);
	if (!folder.exists())
	{
		QDir d;
		if (!d.mkpath(aFolder))
		{
			// Folder doesn't exist and cannot be created.
			return false;
		}
		folder.refresh();
	}

	#ifdef _WIN32
		qt_ntfs_permission_lookup++;  // Turn NTFS permission checking on
	#endif

	auto res = folder.isDir() && folder.isWritable();

	#ifdef _WIN32
		qt_ntfs_permission_lookup--;  // Turn NTFS permission checking off
	#endif

	return res;
}

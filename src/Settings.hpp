#ifndef SETTINGS_H
#define SETTINGS_H





// fwd:
class QSettings;





#include <memory>
#include <QString>
#include <QVariant>
#include <QStringList>





/** Saves and restores the app settings to a common INI file.
Values are organized into groups ("CircuitBreaker", "RateLimits/MusicBrainz", ...). */
class Settings
{
public:

	/** Initializes the Settings subsystem. */
	static void init(const QString & aIniFileName);

	/** Returns true if init() has been called. */
	static bool isInitialized();

	/** Saves a generic value. */
	static void saveValue(const char * aGroupName, const char * aValueName, const QVariant & aValue);

	/** Saves a generic value into a group whose name is only known at runtime. */
	static void saveValue(const QString & aGroupName, const QString & aValueName, const QVariant & aValue);

	/** Loads a previously saved generic value.
	If the Settings haven't been initialized, or the value is not present, returns aDefault. */
	static QVariant loadValue(const char * aGroupName, const char * aValueName, const QVariant & aDefault = QVariant());

	/** Loads a previously saved generic value from a group whose name is only known at runtime. */
	static QVariant loadValue(const QString & aGroupName, const QString & aValueName, const QVariant & aDefault = QVariant());

	/** Returns the names of the subgroups stored under the specified group.
	Used to enumerate per-source sections, such as "RateLimits/<source>". */
	static QStringList childGroups(const QString & aGroupName);


protected:

	static std::unique_ptr<QSettings> mSettings;
};





#endif // SETTINGS_H

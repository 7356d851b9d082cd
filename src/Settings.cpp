#include "Settings.hpp"
#include <QSettings>
#include <QDebug>





std::unique_ptr<QSettings> Settings::mSettings;





#define CHECK_VALID \
	if (mSettings == nullptr) \
	{ \
		qWarning() << "The Settings object has not been initialized."; \
		return; \
	} \





void Settings::init(const QString & aIniFileName)
{
	mSettings = std::make_unique<QSettings>(aIniFileName, QSettings::IniFormat);
	qDebug() << "Using settings file " << aIniFileName;
}





bool Settings::isInitialized()
{
	return (mSettings != nullptr);
}





void Settings::saveValue(const char * aGroupName, const char * aValueName, const QVariant & aValue)
{
	saveValue(QString::fromUtf8(aGroupName), QString::fromUtf8(aValueName), aValue);
}





void Settings::saveValue(const QString & aGroupName, const QString & aValueName, const QVariant & aValue)
{
	CHECK_VALID;

	mSettings->beginGroup(aGroupName);
		mSettings->setValue(aValueName, aValue);
	mSettings->endGroup();
	mSettings->sync();
}





QVariant Settings::loadValue(const char * aGroupName, const char * aValueName, const QVariant & aDefault)
{
	return loadValue(QString::fromUtf8(aGroupName), QString::fromUtf8(aValueName), aDefault);
}





QVariant Settings::loadValue(const QString & aGroupName, const QString & aValueName, const QVariant & aDefault)
{
	if (mSettings == nullptr)
	{
		return aDefault;
	}

	mSettings->beginGroup(aGroupName);
		auto res = mSettings->value(aValueName, aDefault);
	mSettings->endGroup();

	return res;
}





QStringList Settings::childGroups(const QString & aGroupName)
{
	if (mSettings == nullptr)
	{
		return {};
	}

	mSettings->beginGroup(aGroupName);
		auto res = mSettings->childGroups();
	mSettings->endGroup();

	return res;
}

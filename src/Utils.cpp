#include "Utils.hpp"
#include <QString>
#include <QByteArray>





namespace Utils
{





QString formatDuration(double aSeconds)
{
	if (aSeconds < 60)
	{
		return QString("%1 sec").arg(aSeconds, 0, 'f', 3);
	}
	auto seconds = static_cast<int>(std::round(aSeconds));
	auto minutes = seconds / 60;
	return QString("%1:%2").arg(minutes).arg(QString::number(seconds % 60), 2, '0');
}





QString toHex(const QByteArray & aData)
{
	QString res;
	auto len = aData.size();
	res.resize(len * 2);
	static const char hexChar[] = "0123456789abcdef";
	for (auto i = 0; i < len; ++i)
	{
		auto val = aData[i];
		res[2 * i] = hexChar[(val >> 4) & 0x0f];
		res[2 * i + 1] = hexChar[val & 0x0f];
	}
	return res;
}





}  // namespace Utils

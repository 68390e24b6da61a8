#include "convert/progressobserver.h"

#include <QDebug>

#include <exception>

void LogProgressObserver::notify(const QString& message)
{
    if (message.startsWith("[error") || message.startsWith("[write:error")) {
        qCritical().noquote() << message;
    } else if (message.startsWith("[warn") || message.startsWith("[write:warn")) {
        qWarning().noquote() << message;
    } else {
        qInfo().noquote() << message;
    }
}

void notifyProgress(ProgressObserver* observer, const QString& message)
{
    if (!observer) return;
    try {
        observer->notify(message);
    } catch (const std::exception& e) {
        qDebug() << "Progress observer failed:" << e.what();
    }
}

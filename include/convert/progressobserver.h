#ifndef PROGRESSOBSERVER_H
#define PROGRESSOBSERVER_H

#include <QString>

/**
 * @brief ProgressObserver - Receives one-line progress messages
 *
 * Called synchronously from the conversion loop. Implementations should not
 * block; anything they throw is caught by notifyProgress().
 */
class ProgressObserver {
public:
    virtual ~ProgressObserver() = default;
    virtual void notify(const QString& message) = 0;
};

/**
 * @brief Routes messages to Qt logging by their bracketed prefix
 *
 * "[warn" -> qWarning, "[error" -> qCritical, everything else -> qInfo.
 */
class LogProgressObserver : public ProgressObserver {
public:
    void notify(const QString& message) override;
};

// Null observer is allowed; observer failures are logged and dropped
void notifyProgress(ProgressObserver* observer, const QString& message);

#endif // PROGRESSOBSERVER_H

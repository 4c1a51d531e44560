#pragma once

#include <QString>
#include <QStringList>

// Access to the windowing system and the session bus. Every call carries its own
// timeout; an empty result means the tool is unavailable or had nothing to say.
class DesktopTools {
public:
    virtual ~DesktopTools() = default;

    virtual QStringList windowsByClass(const QString &windowClass, int timeoutMs) = 0;
    virtual QString focusedWindow(int timeoutMs) = 0;
    virtual QString activeWindow(int timeoutMs) = 0;
    virtual QString windowTitle(const QString &windowId, int timeoutMs) = 0;
    virtual QString windowProperties(const QString &windowId, const QStringList &properties, int timeoutMs) = 0;
    // Textual representation of a bus property value.
    virtual QString busProperty(const QString &service, const QString &objectPath,
                                const QString &interface, const QString &property, int timeoutMs) = 0;
};

class SystemDesktopTools : public DesktopTools {
public:
    QStringList windowsByClass(const QString &windowClass, int timeoutMs) override;
    QString focusedWindow(int timeoutMs) override;
    QString activeWindow(int timeoutMs) override;
    QString windowTitle(const QString &windowId, int timeoutMs) override;
    QString windowProperties(const QString &windowId, const QStringList &properties, int timeoutMs) override;
    QString busProperty(const QString &service, const QString &objectPath,
                        const QString &interface, const QString &property, int timeoutMs) override;

private:
    QString runWindowQuery(const QStringList &args, int timeoutMs);
};

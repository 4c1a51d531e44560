#pragma once

#include <QString>
#include <QStringList>

constexpr const char *kDefaultEditorCommand = "code";

QString configDirPath();
QString configFilePath();

// KEY=VALUE lines; unknown keys are kept on rewrite.
QString readSettingValue(const QString &filePath, const QString &key);
bool writeSettingValue(const QString &filePath, const QString &key, const QString &value);

// Folder lists are stored on one line as space-separated file:// URIs.
QString encodeFolderList(const QStringList &folders);
QStringList decodeFolderList(const QString &value);

class SettingsStore {
public:
    virtual ~SettingsStore() = default;

    virtual QString editorCommand() const = 0;
    virtual bool setEditorCommand(const QString &command) = 0;

    virtual QStringList favoriteFolders() const = 0;
    virtual bool setFavoriteFolders(const QStringList &folders) = 0;
};

class FileSettingsStore : public SettingsStore {
public:
    FileSettingsStore();
    explicit FileSettingsStore(const QString &filePath);

    QString editorCommand() const override;
    bool setEditorCommand(const QString &command) override;

    QStringList favoriteFolders() const override;
    bool setFavoriteFolders(const QStringList &folders) override;

    const QString &filePath() const { return filePath_; }

private:
    QString filePath_;
};

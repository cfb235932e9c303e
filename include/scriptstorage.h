#pragma once

#include <QDateTime>
#include <QJsonObject>
#include <QString>
#include <QVector>

struct VersionNumber {
    int majorVersion = 1;
    int minorVersion = 0;

    QString toString() const;
    // Parses "major.minor"; a bare "major" means minor 0.
    static bool fromString(const QString &text, VersionNumber &version);

    bool operator==(const VersionNumber &other) const { return majorVersion == other.majorVersion && minorVersion == other.minorVersion; }
    bool operator!=(const VersionNumber &other) const { return !(*this == other); }
};

struct SaveRecord {
    QString documentId;
    QString title;
    QString status;
    QJsonObject content;
    int majorVersion = 1;
    int minorVersion = 0;
    QDateTime savedAt;
    QString description;
    QString versionType;

    VersionNumber version() const { return {majorVersion, minorVersion}; }
    QString versionString() const { return version().toString(); }

    QJsonObject toJson() const;
    static SaveRecord fromJson(const QJsonObject &object);
};

// Persistence collaborator used by the autosave manager.
class IScriptStorage {
public:
    virtual ~IScriptStorage() = default;
    virtual bool save(const SaveRecord &record) = 0;
    virtual bool load(const QString &documentId, SaveRecord &record) const = 0;
};

// Stores the latest record of each document as <id>.json inside a directory.
// Major versions are also kept as <id>.v<major>.json.
class FileScriptStorage final : public IScriptStorage {
public:
    explicit FileScriptStorage(const QString &directory);

    bool save(const SaveRecord &record) override;
    bool load(const QString &documentId, SaveRecord &record) const override;

    QVector<VersionNumber> versions(const QString &documentId) const;
    bool loadVersion(const QString &documentId, int majorVersion, SaveRecord &record) const;
    QString directory() const { return m_directory; }

private:
    QString recordPath(const QString &documentId) const;
    QString versionPath(const QString &documentId, int majorVersion) const;
    bool writeRecord(const QString &path, const SaveRecord &record) const;
    bool readRecord(const QString &path, SaveRecord &record) const;

    QString m_directory;
};

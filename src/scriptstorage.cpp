#include "scriptstorage.h"

#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QRegularExpression>
#include <QSaveFile>
#include <algorithm>

QString VersionNumber::toString() const
{
    return QStringLiteral("%1.%2").arg(majorVersion).arg(minorVersion);
}

bool VersionNumber::fromString(const QString &text, VersionNumber &version)
{
    const QStringList parts = text.trimmed().split(QLatin1Char('.'));
    if (parts.isEmpty() || parts.size() > 2) {
        return false;
    }

    bool majorOk = false;
    const int parsedMajor = parts.at(0).toInt(&majorOk);
    bool minorOk = true;
    const int parsedMinor = parts.size() == 2 ? parts.at(1).toInt(&minorOk) : 0;
    if (!majorOk || !minorOk || parsedMajor < 0 || parsedMinor < 0) {
        return false;
    }

    version.majorVersion = parsedMajor;
    version.minorVersion = parsedMinor;
    return true;
}

QJsonObject SaveRecord::toJson() const
{
    QJsonObject metadata;
    metadata["description"] = description;
    metadata["versionType"] = versionType;
    metadata["versionNumber"] = versionString();

    QJsonObject object;
    object["documentId"] = documentId;
    object["title"] = title;
    object["status"] = status;
    object["content"] = content;
    object["majorVersion"] = majorVersion;
    object["minorVersion"] = minorVersion;
    object["savedAt"] = savedAt.toString(Qt::ISODateWithMs);
    object["metadata"] = metadata;
    return object;
}

SaveRecord SaveRecord::fromJson(const QJsonObject &object)
{
    SaveRecord record;
    record.documentId = object.value("documentId").toString();
    record.title = object.value("title").toString();
    record.status = object.value("status").toString();
    record.content = object.value("content").toObject();
    record.majorVersion = object.value("majorVersion").toInt(1);
    record.minorVersion = object.value("minorVersion").toInt(0);
    record.savedAt = QDateTime::fromString(object.value("savedAt").toString(), Qt::ISODateWithMs);

    const QJsonObject metadata = object.value("metadata").toObject();
    record.description = metadata.value("description").toString();
    record.versionType = metadata.value("versionType").toString();
    return record;
}

FileScriptStorage::FileScriptStorage(const QString &directory)
    : m_directory(directory)
{
}

bool FileScriptStorage::save(const SaveRecord &record)
{
    if (record.documentId.isEmpty()) {
        qWarning() << "[FileScriptStorage] Refusing to save a record without a document id";
        return false;
    }
    if (!QDir().mkpath(m_directory)) {
        qWarning() << "[FileScriptStorage] Cannot create directory" << m_directory;
        return false;
    }

    if (!writeRecord(recordPath(record.documentId), record)) {
        return false;
    }
    if (record.versionType == QLatin1String("major")) {
        return writeRecord(versionPath(record.documentId, record.majorVersion), record);
    }
    return true;
}

bool FileScriptStorage::load(const QString &documentId, SaveRecord &record) const
{
    return readRecord(recordPath(documentId), record);
}

QVector<VersionNumber> FileScriptStorage::versions(const QString &documentId) const
{
    QVector<VersionNumber> result;
    const QString prefix = QFileInfo(recordPath(documentId)).completeBaseName() + QStringLiteral(".v");
    const QStringList files = QDir(m_directory).entryList({prefix + QStringLiteral("*.json")}, QDir::Files);
    for (const QString &file : files) {
        bool ok = false;
        const int majorVersion = file.mid(prefix.size(), file.size() - prefix.size() - 5).toInt(&ok);
        if (ok) {
            VersionNumber version;
            version.majorVersion = majorVersion;
            result.append(version);
        }
    }
    std::sort(result.begin(), result.end(), [](const VersionNumber &a, const VersionNumber &b) {
        return a.majorVersion < b.majorVersion;
    });
    return result;
}

bool FileScriptStorage::loadVersion(const QString &documentId, int majorVersion, SaveRecord &record) const
{
    return readRecord(versionPath(documentId, majorVersion), record);
}

QString FileScriptStorage::recordPath(const QString &documentId) const
{
    QString safeId = documentId;
    safeId.replace(QRegularExpression(QStringLiteral("[^A-Za-z0-9_-]")), QStringLiteral("_"));
    return QDir(m_directory).filePath(safeId + QStringLiteral(".json"));
}

QString FileScriptStorage::versionPath(const QString &documentId, int majorVersion) const
{
    QString path = recordPath(documentId);
    path.chop(5);
    return path + QStringLiteral(".v%1.json").arg(majorVersion);
}

bool FileScriptStorage::writeRecord(const QString &path, const SaveRecord &record) const
{
    QSaveFile file(path);
    if (!file.open(QIODevice::WriteOnly)) {
        qWarning() << "[FileScriptStorage] Cannot open" << path << file.errorString();
        return false;
    }

    file.write(QJsonDocument(record.toJson()).toJson());
    if (!file.commit()) {
        qWarning() << "[FileScriptStorage] Failed to write" << path << file.errorString();
        return false;
    }
    return true;
}

bool FileScriptStorage::readRecord(const QString &path, SaveRecord &record) const
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        return false;
    }

    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll());
    file.close();
    if (doc.isNull() || !doc.isObject()) {
        qWarning() << "[FileScriptStorage] Corrupt record" << path;
        return false;
    }

    record = SaveRecord::fromJson(doc.object());
    return true;
}

#include "autosavemanager.h"

#include <QDebug>
#include <QTimer>

AutosaveManager::AutosaveManager(IScriptStorage *storage, const AutosaveSettings &settings, QObject *parent)
    : QObject(parent)
    , m_storage(storage)
    , m_settings(settings)
    , m_documentStatus(settings.defaultStatus)
{
    m_debounceTimer = new QTimer(this);
    m_debounceTimer->setSingleShot(true);
    m_debounceTimer->setInterval(m_settings.debounceMs);
    connect(m_debounceTimer, &QTimer::timeout, this, &AutosaveManager::onDebounceTimeout);

    m_statusTimer = new QTimer(this);
    m_statusTimer->setSingleShot(true);
    m_statusTimer->setInterval(m_settings.statusDisplayMs);
    connect(m_statusTimer, &QTimer::timeout, this, &AutosaveManager::onStatusTimeout);
}

void AutosaveManager::setDocumentInfo(const QString &documentId, const QString &title, const QString &status)
{
    m_documentId = documentId;
    m_title = title;
    // An empty status keeps the one already loaded.
    if (!status.isEmpty()) {
        m_documentStatus = status;
    } else if (m_documentStatus.isEmpty()) {
        m_documentStatus = m_settings.defaultStatus;
    }
}

void AutosaveManager::setReadOnly(bool readOnly)
{
    if (m_readOnly == readOnly) {
        return;
    }
    m_readOnly = readOnly;
    if (m_readOnly) {
        m_debounceTimer->stop();
    }
    qDebug() << "[Autosave] Read-only:" << m_readOnly;
}

void AutosaveManager::initialize(const SaveRecord &record)
{
    m_debounceTimer->stop();
    if (!record.documentId.isEmpty()) m_documentId = record.documentId;
    if (!record.title.isEmpty()) m_title = record.title;
    if (!record.status.isEmpty()) m_documentStatus = record.status;

    m_version = record.version();
    m_lastSavedState = record.content;
    m_latestState = record.content;
    qDebug() << "[Autosave] Initialized" << m_documentId << "at version" << versionString();
    emit versionChanged(versionString());
}

bool AutosaveManager::setVersion(const QString &versionString)
{
    VersionNumber parsed;
    if (!VersionNumber::fromString(versionString, parsed)) {
        qWarning() << "[Autosave] Invalid version string" << versionString;
        return false;
    }
    m_version = parsed;
    emit versionChanged(this->versionString());
    return true;
}

bool AutosaveManager::triggerAutosave(const QJsonObject &state, QString *errorMessage)
{
    if (!validate(errorMessage)) {
        return false;
    }

    m_latestState = state;
    m_debounceTimer->start();
    return true;
}

bool AutosaveManager::saveNow(QString *errorMessage)
{
    if (!validate(errorMessage)) {
        return false;
    }

    m_debounceTimer->stop();
    return saveLatest();
}

bool AutosaveManager::commitMajorVersion(const QString &description, QString *errorMessage)
{
    if (!validate(errorMessage)) {
        return false;
    }

    const QJsonObject state = m_latestState.isEmpty() ? m_lastSavedState : m_latestState;
    if (state.isEmpty()) {
        if (errorMessage) *errorMessage = QStringLiteral("Nothing to commit");
        qWarning() << "[Autosave] commitMajorVersion: no content to commit";
        return false;
    }

    m_debounceTimer->stop();

    const VersionNumber previous = m_version;
    m_version.majorVersion += 1;
    m_version.minorVersion = 0;

    setStatus(Saving);
    if (!persist(state, description, QStringLiteral("major"))) {
        m_version = previous;
        if (errorMessage) *errorMessage = QStringLiteral("Failed to save version");
        finishSave(false);
        return false;
    }

    m_lastSavedState = state;
    qInfo() << "[Autosave] Committed version" << versionString() << description;
    finishSave(true);
    return true;
}

bool AutosaveManager::hasPendingSave() const
{
    return m_debounceTimer->isActive();
}

QString AutosaveManager::statusName(SaveStatus status)
{
    switch (status) {
    case Idle:
        return QStringLiteral("idle");
    case Saving:
        return QStringLiteral("saving");
    case Saved:
        return QStringLiteral("saved");
    case Error:
        return QStringLiteral("error");
    }
    return QString();
}

void AutosaveManager::onDebounceTimeout()
{
    QString error;
    if (!validate(&error)) {
        setStatus(Error);
        m_statusTimer->start();
        return;
    }
    saveLatest();
}

void AutosaveManager::onStatusTimeout()
{
    setStatus(Idle);
}

bool AutosaveManager::validate(QString *errorMessage) const
{
    QString problem;
    if (m_readOnly) {
        problem = QStringLiteral("Document is read-only");
    } else if (!m_storage) {
        problem = QStringLiteral("No persistence backend");
    } else if (m_documentId.isEmpty()) {
        problem = QStringLiteral("Document id is required");
    } else if (m_title.trimmed().isEmpty()) {
        problem = QStringLiteral("Title is required");
    } else if (m_documentStatus.isEmpty()) {
        problem = QStringLiteral("Status is required");
    }

    if (problem.isEmpty()) {
        return true;
    }
    if (errorMessage) *errorMessage = problem;
    qWarning() << "[Autosave] Save rejected:" << problem;
    return false;
}

bool AutosaveManager::saveLatest()
{
    if (m_latestState.isEmpty() || m_latestState == m_lastSavedState) {
        qDebug() << "[Autosave] No changes since version" << versionString();
        return true;
    }

    const QJsonObject state = m_latestState;
    m_version.minorVersion += 1;

    setStatus(Saving);
    if (!persist(state, QString(), QStringLiteral("minor"))) {
        m_version.minorVersion -= 1;
        finishSave(false);
        return false;
    }

    m_lastSavedState = state;
    finishSave(true);
    return true;
}

bool AutosaveManager::persist(const QJsonObject &state, const QString &description, const QString &versionType)
{
    SaveRecord record;
    record.documentId = m_documentId;
    record.title = m_title;
    record.status = m_documentStatus;
    record.content = state;
    record.majorVersion = m_version.majorVersion;
    record.minorVersion = m_version.minorVersion;
    record.savedAt = QDateTime::currentDateTimeUtc();
    record.description = description;
    record.versionType = versionType;

    if (!m_storage->save(record)) {
        qWarning() << "[Autosave] Persistence failed for" << m_documentId << "version" << record.versionString();
        return false;
    }
    qDebug() << "[Autosave] Saved" << m_documentId << "version" << record.versionString();
    return true;
}

void AutosaveManager::finishSave(bool success)
{
    if (success) {
        emit versionChanged(versionString());
    }
    setStatus(success ? Saved : Error);
    m_statusTimer->start();
}

void AutosaveManager::setStatus(SaveStatus status)
{
    if (status == Saving) {
        m_statusTimer->stop();
    }
    if (m_status == status) {
        return;
    }
    m_status = status;
    emit saveStatusChanged(status);
}

#pragma once

#include "scriptstorage.h"

#include <QJsonObject>
#include <QObject>
#include <QString>

class QTimer;

struct AutosaveSettings {
    int debounceMs = 2000;
    int statusDisplayMs = 2000;
    QString defaultStatus = QStringLiteral("draft");
};

class AutosaveManager : public QObject {
    Q_OBJECT
public:
    enum SaveStatus {
        Idle = 0,
        Saving,
        Saved,
        Error
    };
    Q_ENUM(SaveStatus)

    explicit AutosaveManager(IScriptStorage *storage, const AutosaveSettings &settings = AutosaveSettings(),
                             QObject *parent = nullptr);

    void setStorage(IScriptStorage *storage) { m_storage = storage; }
    void setDocumentInfo(const QString &documentId, const QString &title, const QString &status = QString());
    QString documentId() const { return m_documentId; }
    QString title() const { return m_title; }

    void setReadOnly(bool readOnly);
    bool isReadOnly() const { return m_readOnly; }

    // Seeds version numbers and the last saved state from a stored record.
    void initialize(const SaveRecord &record);
    bool setVersion(const QString &versionString);

    // Records the state and restarts the debounce timer. Returns false when a
    // save precondition is not met.
    bool triggerAutosave(const QJsonObject &state, QString *errorMessage = nullptr);
    // Cancels the debounce and saves the latest state right away.
    bool saveNow(QString *errorMessage = nullptr);
    bool commitMajorVersion(const QString &description, QString *errorMessage = nullptr);

    bool hasPendingSave() const;
    SaveStatus status() const { return m_status; }
    VersionNumber version() const { return m_version; }
    QString versionString() const { return m_version.toString(); }
    QJsonObject lastSavedState() const { return m_lastSavedState; }
    const AutosaveSettings &settings() const { return m_settings; }

    static QString statusName(SaveStatus status);

signals:
    void saveStatusChanged(AutosaveManager::SaveStatus status);
    void versionChanged(const QString &version);

private slots:
    void onDebounceTimeout();
    void onStatusTimeout();

private:
    bool validate(QString *errorMessage) const;
    bool saveLatest();
    bool persist(const QJsonObject &state, const QString &description, const QString &versionType);
    void finishSave(bool success);
    void setStatus(SaveStatus status);

    IScriptStorage *m_storage = nullptr;
    AutosaveSettings m_settings;
    QTimer *m_debounceTimer = nullptr;
    QTimer *m_statusTimer = nullptr;

    QString m_documentId;
    QString m_title;
    QString m_documentStatus;
    bool m_readOnly = false;

    VersionNumber m_version;
    QJsonObject m_latestState;
    QJsonObject m_lastSavedState;
    SaveStatus m_status = Idle;
};

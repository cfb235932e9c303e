#pragma once

#include "scriptdocument.h"

#include <QHash>
#include <QMap>
#include <QObject>
#include <QStringList>

class QTimer;

class AutocompleteIndex : public QObject {
    Q_OBJECT
public:
    static constexpr int MAX_CACHE_SIZE = 1000;
    static constexpr int CACHE_TTL_MS = 60000;

    explicit AutocompleteIndex(QObject *parent = nullptr, int cacheTtlMs = CACHE_TTL_MS);

    static bool supportsRole(ScriptFormat::Role role);
    static QStringList staticTerms(ScriptFormat::Role role);

    // Best completion for the prefix, or a null string. Document lines of the
    // same role nearest to currentIndex win over other document lines, which
    // win over learned terms, which win over the built-in terms.
    QString suggest(ScriptFormat::Role role, const QString &prefix,
                    const QVector<ScriptLine> &lines = QVector<ScriptLine>(), int currentIndex = -1);
    QStringList candidates(ScriptFormat::Role role, const QString &prefix,
                           const QVector<ScriptLine> &lines = QVector<ScriptLine>(), int currentIndex = -1);
    // Text to append to the prefix to complete the suggestion.
    QString completionSuffix(ScriptFormat::Role role, const QString &prefix,
                             const QVector<ScriptLine> &lines = QVector<ScriptLine>(), int currentIndex = -1);

    bool learnTerm(ScriptFormat::Role role, const QString &term);
    QStringList learnedTerms(ScriptFormat::Role role) const { return m_learned.value(role); }

    void clearCache();
    int cacheSize() const { return m_cache.size(); }
    bool isCached(ScriptFormat::Role role, const QString &prefix) const;

private:
    static QString normalize(const QString &text);
    static QString cacheKey(ScriptFormat::Role role, const QString &prefix);
    QStringList termSetMatches(ScriptFormat::Role role, const QString &prefix);
    void clearCacheForRole(ScriptFormat::Role role);

    QMap<int, QStringList> m_learned;
    QHash<QString, QStringList> m_cache;
    QStringList m_cacheOrder;
    QTimer *m_cacheTimer = nullptr;
};

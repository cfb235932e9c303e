#include "autocompleteindex.h"

#include <QDebug>
#include <QSet>
#include <QTimer>

using ScriptFormat::Role;

namespace {

void appendMatch(QStringList &matches, QSet<QString> &seen, const QString &candidate, const QString &prefix)
{
    if (candidate.startsWith(prefix) && candidate != prefix && !seen.contains(candidate)) {
        seen.insert(candidate);
        matches.append(candidate);
    }
}

} // namespace

AutocompleteIndex::AutocompleteIndex(QObject *parent, int cacheTtlMs)
    : QObject(parent)
{
    m_cacheTimer = new QTimer(this);
    m_cacheTimer->setSingleShot(true);
    m_cacheTimer->setInterval(cacheTtlMs);
    connect(m_cacheTimer, &QTimer::timeout, this, &AutocompleteIndex::clearCache);
}

bool AutocompleteIndex::supportsRole(Role role)
{
    return role == ScriptFormat::Header || role == ScriptFormat::Speaker;
}

QStringList AutocompleteIndex::staticTerms(Role role)
{
    if (role == ScriptFormat::Header) {
        return {"INT. ", "EXT. ", "INT./EXT. ", "EST. ", "I/E. ", "INTERIOR", "EXTERIOR"};
    }
    return {};
}

QString AutocompleteIndex::suggest(Role role, const QString &prefix, const QVector<ScriptLine> &lines, int currentIndex)
{
    const QStringList matches = candidates(role, prefix, lines, currentIndex);
    return matches.isEmpty() ? QString() : matches.first();
}

QStringList AutocompleteIndex::candidates(Role role, const QString &prefix, const QVector<ScriptLine> &lines,
                                          int currentIndex)
{
    const QString normalizedPrefix = normalize(prefix);
    if (!supportsRole(role) || normalizedPrefix.trimmed().isEmpty()) {
        return {};
    }

    QStringList matches;
    QSet<QString> seen;

    // Nearest lines of the same role before and after the current one.
    if (currentIndex >= 0 && currentIndex < lines.size()) {
        for (int i = currentIndex - 1; i >= 0; --i) {
            if (lines.at(i).role == role) {
                appendMatch(matches, seen, normalize(lines.at(i).text), normalizedPrefix);
                break;
            }
        }
        for (int i = currentIndex + 1; i < lines.size(); ++i) {
            if (lines.at(i).role == role) {
                appendMatch(matches, seen, normalize(lines.at(i).text), normalizedPrefix);
                break;
            }
        }
    }

    for (int i = 0; i < lines.size(); ++i) {
        if (i != currentIndex && lines.at(i).role == role) {
            appendMatch(matches, seen, normalize(lines.at(i).text), normalizedPrefix);
        }
    }

    for (const QString &term : termSetMatches(role, normalizedPrefix)) {
        if (!seen.contains(term)) {
            seen.insert(term);
            matches.append(term);
        }
    }
    return matches;
}

QString AutocompleteIndex::completionSuffix(Role role, const QString &prefix, const QVector<ScriptLine> &lines,
                                            int currentIndex)
{
    const QString suggestion = suggest(role, prefix, lines, currentIndex);
    if (suggestion.isNull()) {
        return QString();
    }
    return suggestion.mid(normalize(prefix).size());
}

bool AutocompleteIndex::learnTerm(Role role, const QString &term)
{
    const QString normalized = normalize(term).trimmed();
    if (!supportsRole(role) || normalized.isEmpty()) {
        return false;
    }

    QStringList &learned = m_learned[role];
    if (learned.contains(normalized) || staticTerms(role).contains(normalized)) {
        return false;
    }

    learned.append(normalized);
    clearCacheForRole(role);
    qDebug() << "[Autocomplete] Learned" << ScriptFormat::tagForRole(role) << "term" << normalized;
    return true;
}

void AutocompleteIndex::clearCache()
{
    m_cache.clear();
    m_cacheOrder.clear();
    m_cacheTimer->stop();
}

bool AutocompleteIndex::isCached(Role role, const QString &prefix) const
{
    return m_cache.contains(cacheKey(role, normalize(prefix)));
}

QString AutocompleteIndex::normalize(const QString &text)
{
    return text.toUpper();
}

QString AutocompleteIndex::cacheKey(Role role, const QString &prefix)
{
    return prefix + QLatin1Char(':') + ScriptFormat::tagForRole(role);
}

QStringList AutocompleteIndex::termSetMatches(Role role, const QString &prefix)
{
    const QString key = cacheKey(role, prefix);
    const auto cached = m_cache.constFind(key);
    if (cached != m_cache.constEnd()) {
        return cached.value();
    }

    QStringList matches;
    QSet<QString> seen;
    for (const QString &term : m_learned.value(role)) {
        appendMatch(matches, seen, term, prefix);
    }
    for (const QString &term : staticTerms(role)) {
        appendMatch(matches, seen, term, prefix);
    }

    if (m_cache.size() >= MAX_CACHE_SIZE && !m_cacheOrder.isEmpty()) {
        m_cache.remove(m_cacheOrder.takeFirst());
    }
    m_cache.insert(key, matches);
    m_cacheOrder.append(key);
    m_cacheTimer->start();
    return matches;
}

void AutocompleteIndex::clearCacheForRole(Role role)
{
    const QString suffix = QStringLiteral(":") + ScriptFormat::tagForRole(role);
    for (auto it = m_cache.begin(); it != m_cache.end();) {
        if (it.key().endsWith(suffix)) {
            m_cacheOrder.removeAll(it.key());
            it = m_cache.erase(it);
        } else {
            ++it;
        }
    }
}

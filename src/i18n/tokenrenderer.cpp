/*
 * tokenrenderer.cpp — Problem-listing tokens to localized bullet lines
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "tokenrenderer.h"
#include "localizer.h"

#include <QRegularExpression>
#include <QSet>

const QString TokenRenderer::kBullet = QStringLiteral("• ");
const QString TokenRenderer::kMilestoneItemKey = QStringLiteral("milestone.item.v1");
const QString TokenRenderer::kMilestoneHeaderKey = QStringLiteral("milestone.header");

// Namespaces tried, in order, for coded arguments. The empty namespace
// is the argument itself.
static const QStringList kArgumentNamespaces = {
    QString(),
    QStringLiteral("value."),
    QStringLiteral("problem.arg."),
};

TokenRenderer::TokenRenderer(const Localizer &localizer,
                             const QString &milestoneItemPrefix)
    : m_localizer(localizer)
    , m_itemPrefix(milestoneItemPrefix)
{
}

bool TokenRenderer::isCodedKey(const QString &value)
{
    static const QRegularExpression re(
        QStringLiteral("^[a-z][a-z0-9_]*(\\.[a-z0-9_]+)+$"));
    return re.match(value).hasMatch();
}

bool TokenRenderer::isMilestoneToken(const QString &key)
{
    return key.startsWith(QLatin1String("milestone."));
}

QString TokenRenderer::resolveArgument(const QString &arg) const
{
    if (!isCodedKey(arg))
        return arg;
    for (const QString &ns : kArgumentNamespaces) {
        const QString key = ns + arg;
        if (m_localizer.contains(key))
            return m_localizer.text(key);
    }
    return arg;
}

QString TokenRenderer::lookup(const QString &catalogNamespace, const QString &code,
                              bool *found) const
{
    const QString key = catalogNamespace.isEmpty()
        ? code : catalogNamespace + QLatin1Char('.') + code;
    *found = m_localizer.contains(key);
    return *found ? m_localizer.text(key) : QString();
}

QString TokenRenderer::resolveCodedResult(const QString &catalogNamespace,
                                          const QString &code) const
{
    const QString raw = code.trimmed();
    if (raw.isEmpty())
        return raw;

    const QString lower = raw.toLower();
    QStringList candidates{raw, lower};

    QString underscored = lower;
    underscored.replace(QLatin1Char('.'), QLatin1Char('_'))
               .replace(QLatin1Char(' '), QLatin1Char('_'))
               .replace(QLatin1Char('-'), QLatin1Char('_'));
    QString dotted = lower;
    dotted.replace(QLatin1Char('_'), QLatin1Char('.'));
    candidates << underscored << dotted;

    static const QString suffix = QStringLiteral("_risk");
    if (underscored.endsWith(suffix))
        candidates << underscored.chopped(suffix.size());
    else
        candidates << underscored + suffix;

    bool found = false;
    QSet<QString> tried;
    for (const QString &candidate : std::as_const(candidates)) {
        if (tried.contains(candidate))
            continue;
        tried.insert(candidate);
        const QString label = lookup(catalogNamespace, candidate, &found);
        if (found)
            return label;
    }
    return raw;
}

QString TokenRenderer::renderMilestoneItem(const QStringList &args) const
{
    const QString code = args.value(0).trimmed();
    const QString status = args.value(1).trimmed();
    const QString note = args.value(2).trimmed();

    bool found = false;
    QString label = lookup(QStringLiteral("milestone.code"), code, &found);
    if (!found)
        label = resolveArgument(code);

    QString statusLabel = lookup(QStringLiteral("milestone.status"), status, &found);
    if (!found)
        statusLabel = resolveArgument(status);

    QString line = label;
    if (!statusLabel.isEmpty())
        line += QStringLiteral(" – ") + statusLabel;
    if (!note.isEmpty())
        line += QStringLiteral(" (") + note + QLatin1Char(')');
    return m_itemPrefix + line;
}

QString TokenRenderer::renderToken(const Report::ProblemToken &token) const
{
    if (token.key == kMilestoneItemKey)
        return renderMilestoneItem(token.args);

    QStringList args;
    args.reserve(token.args.size());
    for (const QString &a : token.args)
        args.append(resolveArgument(a));

    if (!m_localizer.contains(token.key))
        return token.key;
    return m_localizer.format(token.key, args).trimmed();
}

static QString withSingleBullet(const QString &text)
{
    QString t = text.trimmed();
    while (t.startsWith(QChar(0x2022)) || t.startsWith(QChar(0x00B7)))
        t = t.mid(1).trimmed();
    return TokenRenderer::kBullet + t;
}

QStringList TokenRenderer::renderLines(const QList<Report::ProblemToken> &tokens) const
{
    QStringList lines;
    bool headerEmitted = false;

    for (const auto &token : tokens) {
        if (isMilestoneToken(token.key) && !headerEmitted) {
            lines.append(withSingleBullet(m_localizer.text(kMilestoneHeaderKey)));
            headerEmitted = true;
        }
        if (token.key == kMilestoneHeaderKey)
            continue;

        const QString text = renderToken(token);
        if (text.trimmed().isEmpty())
            continue;
        lines.append(withSingleBullet(text));
    }
    return lines;
}

QString TokenRenderer::render(const QList<Report::ProblemToken> &tokens,
                              const QString &fallbackText) const
{
    const QStringList lines = renderLines(tokens);
    if (lines.isEmpty())
        return fallbackText;
    return lines.join(QLatin1Char('\n'));
}

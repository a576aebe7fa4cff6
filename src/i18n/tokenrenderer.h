/*
 * tokenrenderer.h — Problem-listing tokens to localized bullet lines
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef VISITREPORT_TOKENRENDERER_H
#define VISITREPORT_TOKENRENDERER_H

#include <QList>
#include <QString>
#include <QStringList>

#include "reportmodel.h"

class Localizer;

class TokenRenderer
{
public:
    explicit TokenRenderer(const Localizer &localizer,
                           const QString &milestoneItemPrefix = QString());

    // One "• "-prefixed line per rendered token. A single Milestones
    // header precedes the first milestone token.
    QStringList renderLines(const QList<Report::ProblemToken> &tokens) const;

    // Lines joined with '\n', or fallbackText verbatim when the tokens
    // render to nothing.
    QString render(const QList<Report::ProblemToken> &tokens,
                   const QString &fallbackText) const;

    // Coded arguments go through the namespace lookup; anything else
    // is returned verbatim.
    QString resolveArgument(const QString &arg) const;

    // Label for a coded result under a catalog namespace, trying exact,
    // '_'/'.' variants and "_risk" suffix variants before giving up and
    // returning the code. resolveCodedResult("mchat.result", "medium")
    // finds "mchat.result.medium_risk".
    QString resolveCodedResult(const QString &catalogNamespace,
                               const QString &code) const;

    static bool isCodedKey(const QString &value);
    static bool isMilestoneToken(const QString &key);

    static const QString kBullet;
    static const QString kMilestoneItemKey;
    static const QString kMilestoneHeaderKey;

private:
    QString renderToken(const Report::ProblemToken &token) const;
    QString renderMilestoneItem(const QStringList &args) const;
    QString lookup(const QString &catalogNamespace, const QString &code,
                   bool *found) const;

    const Localizer &m_localizer;
    QString m_itemPrefix;
};

#endif // VISITREPORT_TOKENRENDERER_H

// SshHostResolver.cpp

#include "SshHostResolver.h"

#include "SshHostPattern.h"

#include <QDebug>

QVector<SshHostBlock> SshHostResolver::resolve(const QVector<SshHostBlock>& blocks)
{
    const QVector<SshHostBlock> out =
        mergeSameHosts(applyNameToEmptyHostname(applyPatterns(blocks)));

    qDebug().noquote() << QString("Resolved %1 host block(s) into %2 host(s)")
                              .arg(blocks.size())
                              .arg(out.size());
    return out;
}

bool SshHostResolver::isPatternBlock(const SshHostBlock& b)
{
    for (const QString& p : b.patterns) {
        if (SshHostPattern::isWildcard(p))
            return true;
    }
    return false;
}

QVector<SshHostBlock> SshHostResolver::spread(const QVector<SshHostBlock>& blocks)
{
    QVector<SshHostBlock> out;
    out.reserve(blocks.size());

    for (const SshHostBlock& b : blocks) {
        if (b.patterns.size() <= 1) {
            out.push_back(b);
            continue;
        }

        for (const QString& p : b.patterns) {
            SshHostBlock single = b;
            single.patterns = QStringList{p};
            out.push_back(single);
        }
    }

    return out;
}

QVector<SshHostBlock> SshHostResolver::applyPatterns(const QVector<SshHostBlock>& blocks)
{
    const QVector<SshHostBlock> spreadBlocks = spread(blocks);

    // Partition, keeping relative order inside each group.
    QVector<SshHostBlock> literals;
    QVector<QVector<SshHostPatternMatcher>> matchers;
    QVector<const SshHostBlock*> patternBlocks;

    for (const SshHostBlock& b : spreadBlocks) {
        if (isPatternBlock(b)) {
            patternBlocks.push_back(&b);
            matchers.push_back(SshHostPattern::compileAll(b.patterns));
        } else {
            literals.push_back(b);
        }
    }

    for (int pi = 0; pi < patternBlocks.size(); ++pi) {
        const SshHostBlock& p = *patternBlocks[pi];

        for (SshHostBlock& literal : literals) {
            if (literal.patterns.isEmpty())
                continue;

            const QString& name = literal.patterns.first();
            for (const SshHostPatternMatcher& m : matchers[pi]) {
                if (!m.appliesTo(name))
                    continue;

                SshHostBlock::fillIfAbsent(literal.entries, p.entries);
                break;
            }
        }
    }

    return literals;
}

QVector<SshHostBlock> SshHostResolver::applyNameToEmptyHostname(const QVector<SshHostBlock>& blocks)
{
    QVector<SshHostBlock> out = blocks;

    for (SshHostBlock& b : out) {
        if (b.patterns.isEmpty() || !b.value(SshConfigKeyword::Hostname).isEmpty())
            continue;
        b.set(SshConfigKeyword::Hostname, b.patterns.first());
    }

    return out;
}

QVector<SshHostBlock> SshHostResolver::mergeSameHosts(const QVector<SshHostBlock>& blocks)
{
    // Each block joins the first kept block with equal entries, or is kept.
    QVector<SshHostBlock> out;
    out.reserve(blocks.size());

    for (const SshHostBlock& b : blocks) {
        bool merged = false;
        for (SshHostBlock& kept : out) {
            if (kept.entries != b.entries)
                continue;

            kept.patterns += b.patterns;
            merged = true;
            break;
        }

        if (!merged)
            out.push_back(b);
    }

    return out;
}

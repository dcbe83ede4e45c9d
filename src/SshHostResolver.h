#pragma once
//
// SshHostResolver.h
//
// Post-parse transformations over the list of host blocks. Each step is a
// pure function: it takes a list and returns a new one, the input is never
// modified.
//
// resolve() runs them in this fixed order:
//
//   1. spread()                    one block per pattern
//   2. applyPatterns()             wildcard blocks fill literal blocks, then vanish
//   3. applyNameToEmptyHostname()  Hostname defaults to the block's own pattern
//   4. mergeSameHosts()            blocks with identical entries collapse
//
// PRECEDENCE
// ----------
// Values a literal host block sets itself always win. Wildcard blocks only
// fill keys that are still missing, and they are applied in file order, so
// the first matching wildcard block that sets a key decides its value.

#include "SshHostBlock.h"

#include <QVector>

class SshHostResolver
{
public:
    static QVector<SshHostBlock> resolve(const QVector<SshHostBlock>& blocks);

    // "Host a b" {Port 22}  ->  "Host a" {Port 22}, "Host b" {Port 22}
    // Blocks without patterns are passed through unchanged.
    static QVector<SshHostBlock> spread(const QVector<SshHostBlock>& blocks);

    // Spreads first, then for every literal block L and every wildcard block P
    // (file order): if P applies to L's name, fill L from P. Wildcard blocks
    // are not part of the result.
    static QVector<SshHostBlock> applyPatterns(const QVector<SshHostBlock>& blocks);

    static QVector<SshHostBlock> applyNameToEmptyHostname(const QVector<SshHostBlock>& blocks);

    // Blocks whose entries are exactly equal are merged into the earliest one;
    // the later blocks' patterns are appended to it in list order.
    // mergeSameHosts(mergeSameHosts(x)) == mergeSameHosts(x)
    static QVector<SshHostBlock> mergeSameHosts(const QVector<SshHostBlock>& blocks);

private:
    static bool isPatternBlock(const SshHostBlock& b);
};

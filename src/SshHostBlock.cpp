// SshHostBlock.cpp

#include "SshHostBlock.h"

bool SshHostBlock::set(SshConfigKeyword k, const QString& value)
{
    if (k == SshConfigKeyword::Unknown || SshConfigKeywords::isStructural(k))
        return false;
    entries.insert(k, value);
    return true;
}

void SshHostBlock::overwrite(SshConfigEntries& dst, const SshConfigEntries& src)
{
    for (auto it = src.constBegin(); it != src.constEnd(); ++it)
        dst.insert(it.key(), it.value());
}

void SshHostBlock::fillIfAbsent(SshConfigEntries& dst, const SshConfigEntries& src)
{
    for (auto it = src.constBegin(); it != src.constEnd(); ++it) {
        if (!dst.contains(it.key()))
            dst.insert(it.key(), it.value());
    }
}

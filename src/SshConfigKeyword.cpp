// SshConfigKeyword.cpp
//
// Keyword table for the OpenSSH client configuration format.
//
// The table is the single source of truth for canonical spelling; the lookup
// index (lower-cased name -> keyword) is built from it on first use.

#include "SshConfigKeyword.h"

#include <QHash>

namespace {

struct KeywordName {
    SshConfigKeyword keyword;
    const char* name;
};

const KeywordName kKeywords[] = {
    { SshConfigKeyword::Host,                             "Host" },
    { SshConfigKeyword::Include,                          "Include" },
    { SshConfigKeyword::AddKeysToAgent,                   "AddKeysToAgent" },
    { SshConfigKeyword::AddressFamily,                    "AddressFamily" },
    { SshConfigKeyword::BatchMode,                        "BatchMode" },
    { SshConfigKeyword::BindAddress,                      "BindAddress" },
    { SshConfigKeyword::BindInterface,                    "BindInterface" },
    { SshConfigKeyword::CanonicalDomains,                 "CanonicalDomains" },
    { SshConfigKeyword::CanonicalizeFallbackLocal,        "CanonicalizeFallbackLocal" },
    { SshConfigKeyword::CanonicalizeHostname,             "CanonicalizeHostname" },
    { SshConfigKeyword::CanonicalizeMaxDots,              "CanonicalizeMaxDots" },
    { SshConfigKeyword::CanonicalizePermittedCNAMEs,      "CanonicalizePermittedCNAMEs" },
    { SshConfigKeyword::CASignatureAlgorithms,            "CASignatureAlgorithms" },
    { SshConfigKeyword::CertificateFile,                  "CertificateFile" },
    { SshConfigKeyword::ChallengeResponseAuthentication,  "ChallengeResponseAuthentication" },
    { SshConfigKeyword::ChannelTimeout,                   "ChannelTimeout" },
    { SshConfigKeyword::CheckHostIP,                      "CheckHostIP" },
    { SshConfigKeyword::Ciphers,                          "Ciphers" },
    { SshConfigKeyword::ClearAllForwardings,              "ClearAllForwardings" },
    { SshConfigKeyword::Compression,                      "Compression" },
    { SshConfigKeyword::ConnectionAttempts,               "ConnectionAttempts" },
    { SshConfigKeyword::ConnectTimeout,                   "ConnectTimeout" },
    { SshConfigKeyword::ControlMaster,                    "ControlMaster" },
    { SshConfigKeyword::ControlPath,                      "ControlPath" },
    { SshConfigKeyword::ControlPersist,                   "ControlPersist" },
    { SshConfigKeyword::DynamicForward,                   "DynamicForward" },
    { SshConfigKeyword::EnableEscapeCommandline,          "EnableEscapeCommandline" },
    { SshConfigKeyword::EnableSSHKeysign,                 "EnableSSHKeysign" },
    { SshConfigKeyword::EscapeChar,                       "EscapeChar" },
    { SshConfigKeyword::ExitOnForwardFailure,             "ExitOnForwardFailure" },
    { SshConfigKeyword::FingerprintHash,                  "FingerprintHash" },
    { SshConfigKeyword::ForkAfterAuthentication,          "ForkAfterAuthentication" },
    { SshConfigKeyword::ForwardAgent,                     "ForwardAgent" },
    { SshConfigKeyword::ForwardX11,                       "ForwardX11" },
    { SshConfigKeyword::ForwardX11Timeout,                "ForwardX11Timeout" },
    { SshConfigKeyword::ForwardX11Trusted,                "ForwardX11Trusted" },
    { SshConfigKeyword::GatewayPorts,                     "GatewayPorts" },
    { SshConfigKeyword::GlobalKnownHostsFile,             "GlobalKnownHostsFile" },
    { SshConfigKeyword::GSSAPIAuthentication,             "GSSAPIAuthentication" },
    { SshConfigKeyword::GSSAPIDelegateCredentials,        "GSSAPIDelegateCredentials" },
    { SshConfigKeyword::HashKnownHosts,                   "HashKnownHosts" },
    { SshConfigKeyword::HostbasedAcceptedAlgorithms,      "HostbasedAcceptedAlgorithms" },
    { SshConfigKeyword::HostbasedAuthentication,          "HostbasedAuthentication" },
    { SshConfigKeyword::HostKeyAlgorithms,                "HostKeyAlgorithms" },
    { SshConfigKeyword::HostKeyAlias,                     "HostKeyAlias" },
    { SshConfigKeyword::Hostname,                         "HostName" },
    { SshConfigKeyword::IdentitiesOnly,                   "IdentitiesOnly" },
    { SshConfigKeyword::IdentityAgent,                    "IdentityAgent" },
    { SshConfigKeyword::IdentityFile,                     "IdentityFile" },
    { SshConfigKeyword::IgnoreUnknown,                    "IgnoreUnknown" },
    { SshConfigKeyword::IPQoS,                            "IPQoS" },
    { SshConfigKeyword::KbdInteractiveAuthentication,     "KbdInteractiveAuthentication" },
    { SshConfigKeyword::KbdInteractiveDevices,            "KbdInteractiveDevices" },
    { SshConfigKeyword::KexAlgorithms,                    "KexAlgorithms" },
    { SshConfigKeyword::KnownHostsCommand,                "KnownHostsCommand" },
    { SshConfigKeyword::LocalCommand,                     "LocalCommand" },
    { SshConfigKeyword::LocalForward,                     "LocalForward" },
    { SshConfigKeyword::LogLevel,                         "LogLevel" },
    { SshConfigKeyword::LogVerbose,                       "LogVerbose" },
    { SshConfigKeyword::MACs,                             "MACs" },
    { SshConfigKeyword::Match,                            "Match" },
    { SshConfigKeyword::NoHostAuthenticationForLocalhost, "NoHostAuthenticationForLocalhost" },
    { SshConfigKeyword::NumberOfPasswordPrompts,          "NumberOfPasswordPrompts" },
    { SshConfigKeyword::ObscureKeystrokeTiming,           "ObscureKeystrokeTiming" },
    { SshConfigKeyword::PasswordAuthentication,           "PasswordAuthentication" },
    { SshConfigKeyword::PermitLocalCommand,               "PermitLocalCommand" },
    { SshConfigKeyword::PermitRemoteOpen,                 "PermitRemoteOpen" },
    { SshConfigKeyword::PKCS11Provider,                   "PKCS11Provider" },
    { SshConfigKeyword::Port,                             "Port" },
    { SshConfigKeyword::PreferredAuthentications,         "PreferredAuthentications" },
    { SshConfigKeyword::ProxyCommand,                     "ProxyCommand" },
    { SshConfigKeyword::ProxyJump,                        "ProxyJump" },
    { SshConfigKeyword::ProxyUseFdpass,                   "ProxyUseFdpass" },
    { SshConfigKeyword::PubkeyAcceptedAlgorithms,         "PubkeyAcceptedAlgorithms" },
    { SshConfigKeyword::PubkeyAcceptedKeyTypes,           "PubkeyAcceptedKeyTypes" },
    { SshConfigKeyword::PubkeyAuthentication,             "PubkeyAuthentication" },
    { SshConfigKeyword::RekeyLimit,                       "RekeyLimit" },
    { SshConfigKeyword::RemoteCommand,                    "RemoteCommand" },
    { SshConfigKeyword::RemoteForward,                    "RemoteForward" },
    { SshConfigKeyword::RequestTTY,                       "RequestTTY" },
    { SshConfigKeyword::RequiredRSASize,                  "RequiredRSASize" },
    { SshConfigKeyword::RevokedHostKeys,                  "RevokedHostKeys" },
    { SshConfigKeyword::SecurityKeyProvider,              "SecurityKeyProvider" },
    { SshConfigKeyword::SendEnv,                          "SendEnv" },
    { SshConfigKeyword::ServerAliveCountMax,              "ServerAliveCountMax" },
    { SshConfigKeyword::ServerAliveInterval,              "ServerAliveInterval" },
    { SshConfigKeyword::SessionType,                      "SessionType" },
    { SshConfigKeyword::SetEnv,                           "SetEnv" },
    { SshConfigKeyword::SmartcardDevice,                  "SmartcardDevice" },
    { SshConfigKeyword::StdinNull,                        "StdinNull" },
    { SshConfigKeyword::StreamLocalBindMask,              "StreamLocalBindMask" },
    { SshConfigKeyword::StreamLocalBindUnlink,            "StreamLocalBindUnlink" },
    { SshConfigKeyword::StrictHostKeyChecking,            "StrictHostKeyChecking" },
    { SshConfigKeyword::SyslogFacility,                   "SyslogFacility" },
    { SshConfigKeyword::Tag,                              "Tag" },
    { SshConfigKeyword::TCPKeepAlive,                     "TCPKeepAlive" },
    { SshConfigKeyword::Tunnel,                           "Tunnel" },
    { SshConfigKeyword::TunnelDevice,                     "TunnelDevice" },
    { SshConfigKeyword::UpdateHostKeys,                   "UpdateHostKeys" },
    { SshConfigKeyword::UseKeychain,                      "UseKeychain" },
    { SshConfigKeyword::User,                             "User" },
    { SshConfigKeyword::UserKnownHostsFile,               "UserKnownHostsFile" },
    { SshConfigKeyword::VerifyHostKeyDNS,                 "VerifyHostKeyDNS" },
    { SshConfigKeyword::VisualHostKey,                    "VisualHostKey" },
    { SshConfigKeyword::XAuthLocation,                    "XAuthLocation" },
};

const QHash<QString, SshConfigKeyword>& lowerIndex()
{
    static const QHash<QString, SshConfigKeyword> index = [] {
        QHash<QString, SshConfigKeyword> h;
        for (const auto& k : kKeywords)
            h.insert(QString::fromLatin1(k.name).toLower(), k.keyword);
        return h;
    }();
    return index;
}

} // namespace

QString SshConfigEntryKey::name() const
{
    if (isUnknown()) return unknownName;
    return SshConfigKeywords::canonicalName(keyword);
}

namespace SshConfigKeywords {

SshConfigEntryKey lookup(const QString& key)
{
    SshConfigEntryKey k;
    const auto& index = lowerIndex();
    const auto it = index.constFind(key.trimmed().toLower());
    if (it == index.constEnd()) {
        k.keyword = SshConfigKeyword::Unknown;
        k.unknownName = key;
        return k;
    }
    k.keyword = it.value();
    return k;
}

QString canonicalName(SshConfigKeyword k)
{
    for (const auto& e : kKeywords) {
        if (e.keyword == k)
            return QString::fromLatin1(e.name);
    }
    return QString();
}

bool isStructural(SshConfigKeyword k)
{
    return k == SshConfigKeyword::Host || k == SshConfigKeyword::Include;
}

int count()
{
    return int(sizeof(kKeywords) / sizeof(kKeywords[0]));
}

} // namespace SshConfigKeywords

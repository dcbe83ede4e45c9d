#pragma once
//
// SshConfigKeyword.h
//
// Closed set of OpenSSH client configuration keywords (ssh_config(5)) plus an
// Unknown arm for everything else.
//
// Keyword lookup is case-insensitive ("HOSTNAME", "HostName" and "hostname"
// all resolve to SshConfigKeyword::Hostname).
//
// SshConfigEntryKey is the tagged form used by the line classifier:
// - keyword != Unknown  -> recognized directive, unknownName is empty
// - keyword == Unknown  -> unrecognized directive, unknownName holds the key
//                          exactly as it was written in the file
//

#include <QString>

enum class SshConfigKeyword {
    Unknown,

    // Structural (consumed by the parser, never stored in a block)
    Host,
    Include,

    AddKeysToAgent,
    AddressFamily,
    BatchMode,
    BindAddress,
    BindInterface,
    CanonicalDomains,
    CanonicalizeFallbackLocal,
    CanonicalizeHostname,
    CanonicalizeMaxDots,
    CanonicalizePermittedCNAMEs,
    CASignatureAlgorithms,
    CertificateFile,
    ChallengeResponseAuthentication,
    ChannelTimeout,
    CheckHostIP,
    Ciphers,
    ClearAllForwardings,
    Compression,
    ConnectionAttempts,
    ConnectTimeout,
    ControlMaster,
    ControlPath,
    ControlPersist,
    DynamicForward,
    EnableEscapeCommandline,
    EnableSSHKeysign,
    EscapeChar,
    ExitOnForwardFailure,
    FingerprintHash,
    ForkAfterAuthentication,
    ForwardAgent,
    ForwardX11,
    ForwardX11Timeout,
    ForwardX11Trusted,
    GatewayPorts,
    GlobalKnownHostsFile,
    GSSAPIAuthentication,
    GSSAPIDelegateCredentials,
    HashKnownHosts,
    HostbasedAcceptedAlgorithms,
    HostbasedAuthentication,
    HostKeyAlgorithms,
    HostKeyAlias,
    Hostname,
    IdentitiesOnly,
    IdentityAgent,
    IdentityFile,
    IgnoreUnknown,
    IPQoS,
    KbdInteractiveAuthentication,
    KbdInteractiveDevices,
    KexAlgorithms,
    KnownHostsCommand,
    LocalCommand,
    LocalForward,
    LogLevel,
    LogVerbose,
    MACs,
    Match,
    NoHostAuthenticationForLocalhost,
    NumberOfPasswordPrompts,
    ObscureKeystrokeTiming,
    PasswordAuthentication,
    PermitLocalCommand,
    PermitRemoteOpen,
    PKCS11Provider,
    Port,
    PreferredAuthentications,
    ProxyCommand,
    ProxyJump,
    ProxyUseFdpass,
    PubkeyAcceptedAlgorithms,
    PubkeyAcceptedKeyTypes,
    PubkeyAuthentication,
    RekeyLimit,
    RemoteCommand,
    RemoteForward,
    RequestTTY,
    RequiredRSASize,
    RevokedHostKeys,
    SecurityKeyProvider,
    SendEnv,
    ServerAliveCountMax,
    ServerAliveInterval,
    SessionType,
    SetEnv,
    SmartcardDevice,
    StdinNull,
    StreamLocalBindMask,
    StreamLocalBindUnlink,
    StrictHostKeyChecking,
    SyslogFacility,
    Tag,
    TCPKeepAlive,
    Tunnel,
    TunnelDevice,
    UpdateHostKeys,
    UseKeychain,
    User,
    UserKnownHostsFile,
    VerifyHostKeyDNS,
    VisualHostKey,
    XAuthLocation
};

struct SshConfigEntryKey {
    SshConfigKeyword keyword = SshConfigKeyword::Unknown;
    QString unknownName;

    bool isUnknown() const { return keyword == SshConfigKeyword::Unknown; }

    // Canonical spelling for recognized keys, original text for unknown ones.
    QString name() const;
};

namespace SshConfigKeywords {
    // Case-insensitive lookup. Returns Unknown (with unknownName = key) on miss.
    SshConfigEntryKey lookup(const QString& key);

    // Canonical ssh_config(5) spelling, e.g. "ProxyCommand". Empty for Unknown.
    QString canonicalName(SshConfigKeyword k);

    // Host and Include shape the block structure and are never stored as data.
    bool isStructural(SshConfigKeyword k);

    int count();
}

// libssh2 backend: owns the TCP socket, the SSH session and the SFTP channel.
// Includes keepalive, known_hosts validation and password/key/agent auth.
#include "mediarelay/Libssh2Session.hpp"
#include <libssh2.h>
#include <libssh2_sftp.h>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <memory>
#include <mutex>
#include <string>
#include <initializer_list>
#include <thread>

// POSIX sockets
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

namespace mediarelay {

bool parseKnownHostsPolicy(const std::string &text, KnownHostsPolicy &out) {
    if (text == "strict") {
        out = KnownHostsPolicy::Strict;
        return true;
    }
    if (text == "accept-new") {
        out = KnownHostsPolicy::AcceptNew;
        return true;
    }
    if (text == "off") {
        out = KnownHostsPolicy::Off;
        return true;
    }
    return false;
}

const char *knownHostsPolicyName(KnownHostsPolicy p) {
    switch (p) {
    case KnownHostsPolicy::Strict:
        return "strict";
    case KnownHostsPolicy::AcceptNew:
        return "accept-new";
    case KnownHostsPolicy::Off:
        return "off";
    }
    return "strict";
}

std::string joinRemotePath(const std::string &base, const std::string &rel) {
    std::string r = rel;
    while (!r.empty() && r.front() == '/')
        r.erase(r.begin());
    if (base.empty())
        return std::string("/") + r;
    if (base.back() == '/')
        return base + r;
    return base + "/" + r;
}

namespace {

constexpr int kKeepaliveIntervalSec = 30;

// libssh2_init runs once per process; sessions come from several worker
// threads.
std::once_flag g_initOnce;
int g_initRc = 0;

bool ensureLibssh2(std::string &err) {
    std::call_once(g_initOnce, [] { g_initRc = libssh2_init(0); });
    if (g_initRc != 0) {
        err = "libssh2_init failed";
        return false;
    }
    return true;
}

// Repeats a libssh2 call while it reports EAGAIN.
template <typename Fn> int retryAgain(Fn fn) {
    int rc = fn();
    while (rc == LIBSSH2_ERROR_EAGAIN) {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        rc = fn();
    }
    return rc;
}

std::string sessionError(LIBSSH2_SESSION *s) {
    char *msg = nullptr;
    int len = 0;
    libssh2_session_last_error(s, &msg, &len, 0);
    if (!msg || len <= 0)
        return {};
    return std::string(msg, static_cast<std::size_t>(len));
}

std::string lowered(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](char c) {
        return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    });
    return s;
}

// Answers for keyboard-interactive prompts, reached through the session's
// abstract pointer.
struct PromptAnswers {
    std::string user;
    std::string pass;
};

// Prompts mentioning "user" or "name" get the username, any other prompt
// the password.
void answerPrompts(const char *, int, const char *, int, int count,
                   const LIBSSH2_USERAUTH_KBDINT_PROMPT *prompts,
                   LIBSSH2_USERAUTH_KBDINT_RESPONSE *responses,
                   void **abstract) {
    const auto *answers =
        (abstract && *abstract) ? static_cast<const PromptAnswers *>(*abstract)
                                : nullptr;
    for (int i = 0; i < count; ++i) {
        responses[i].text = nullptr;
        responses[i].length = 0;
        if (!answers)
            continue;
        std::string prompt;
        if (prompts && prompts[i].text) {
            prompt = lowered(std::string(
                reinterpret_cast<const char *>(prompts[i].text),
                prompts[i].length));
        }
        const bool asksUser = prompt.find("user") != std::string::npos ||
                              prompt.find("name") != std::string::npos;
        const std::string &reply = asksUser ? answers->user : answers->pass;
        if (reply.empty())
            continue;
        // Freed by libssh2 with its default allocator.
        char *copy = static_cast<char *>(std::malloc(reply.size() + 1));
        if (!copy)
            continue;
        std::memcpy(copy, reply.c_str(), reply.size() + 1);
        responses[i].text = copy;
        responses[i].length = static_cast<unsigned int>(reply.size());
    }
}

struct AddrInfoDeleter {
    void operator()(addrinfo *p) const {
        if (p)
            ::freeaddrinfo(p);
    }
};

struct KnownHostsDeleter {
    void operator()(LIBSSH2_KNOWNHOSTS *p) const {
        if (p)
            libssh2_knownhost_free(p);
    }
};
using KnownHostsPtr = std::unique_ptr<LIBSSH2_KNOWNHOSTS, KnownHostsDeleter>;

// Probes idle connections; a transfer can sit between chunk requests while
// the staging disk catches up.
void enableKeepalive(int fd) {
    int on = 1;
    if (::setsockopt(fd, SOL_SOCKET, SO_KEEPALIVE, &on, sizeof(on)) != 0)
        return;
#if defined(__linux__)
    int idle = 60;
    int interval = 10;
    int probes = 3;
    ::setsockopt(fd, IPPROTO_TCP, TCP_KEEPIDLE, &idle, sizeof(idle));
    ::setsockopt(fd, IPPROTO_TCP, TCP_KEEPINTVL, &interval, sizeof(interval));
    ::setsockopt(fd, IPPROTO_TCP, TCP_KEEPCNT, &probes, sizeof(probes));
#elif defined(__APPLE__)
    int idle = 60;
    ::setsockopt(fd, IPPROTO_TCP, TCP_KEEPALIVE, &idle, sizeof(idle));
#endif
}

struct HostKeyKind {
    int sessionType;
    int knownHostKey;
    const char *name;
};

const HostKeyKind kHostKeyKinds[] = {
    {LIBSSH2_HOSTKEY_TYPE_RSA, LIBSSH2_KNOWNHOST_KEY_SSHRSA, "RSA"},
    {LIBSSH2_HOSTKEY_TYPE_DSS, LIBSSH2_KNOWNHOST_KEY_SSHDSS, "DSA"},
#ifdef LIBSSH2_KNOWNHOST_KEY_ECDSA_256
    {LIBSSH2_HOSTKEY_TYPE_ECDSA_256, LIBSSH2_KNOWNHOST_KEY_ECDSA_256,
     "ECDSA-256"},
    {LIBSSH2_HOSTKEY_TYPE_ECDSA_384, LIBSSH2_KNOWNHOST_KEY_ECDSA_384,
     "ECDSA-384"},
    {LIBSSH2_HOSTKEY_TYPE_ECDSA_521, LIBSSH2_KNOWNHOST_KEY_ECDSA_521,
     "ECDSA-521"},
#endif
#ifdef LIBSSH2_KNOWNHOST_KEY_ED25519
    {LIBSSH2_HOSTKEY_TYPE_ED25519, LIBSSH2_KNOWNHOST_KEY_ED25519, "ED25519"},
#endif
};

const HostKeyKind *hostKeyKind(int sessionType) {
    for (const auto &k : kHostKeyKinds) {
        if (k.sessionType == sessionType)
            return &k;
    }
    return nullptr;
}

// "SHA256:AB:CD:..." of the server key, empty when libssh2 cannot hash it.
std::string sha256Fingerprint(LIBSSH2_SESSION *s) {
    const auto *digest = reinterpret_cast<const unsigned char *>(
        libssh2_hostkey_hash(s, LIBSSH2_HOSTKEY_HASH_SHA256));
    if (!digest)
        return {};
    static const char kHex[] = "0123456789ABCDEF";
    std::string out = "SHA256:";
    for (int i = 0; i < 32; ++i) {
        if (i)
            out += ':';
        out += kHex[digest[i] >> 4];
        out += kHex[digest[i] & 0x0F];
    }
    return out;
}

std::string defaultKnownHostsPath() {
    const char *home = std::getenv("HOME");
    return (home && *home) ? std::string(home) + "/.ssh/known_hosts"
                           : std::string();
}

} // namespace

Libssh2Session::Libssh2Session() = default;

Libssh2Session::~Libssh2Session() { disconnect(); }

bool Libssh2Session::tcpConnect(const std::string &host, std::uint16_t port,
                                std::string &err) {
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    const std::string service = std::to_string(port);

    addrinfo *raw = nullptr;
    const int gai = ::getaddrinfo(host.c_str(), service.c_str(), &hints, &raw);
    if (gai != 0) {
        err = std::string("Name resolution failed: ") + gai_strerror(gai);
        return false;
    }
    const std::unique_ptr<addrinfo, AddrInfoDeleter> addrs(raw);
    for (const addrinfo *ai = addrs.get(); ai != nullptr; ai = ai->ai_next) {
        const int fd = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (fd < 0)
            continue;
        enableKeepalive(fd);
        if (::connect(fd, ai->ai_addr, ai->ai_addrlen) == 0) {
            sock_ = fd;
            return true;
        }
        ::close(fd);
    }
    err = "Could not reach the SSH server on port " + service;
    return false;
}

bool Libssh2Session::verifyHostKey(const SessionOptions &opt,
                                   std::string &err) {
    const KnownHostsPolicy policy = opt.known_hosts_policy;
    if (policy == KnownHostsPolicy::Off)
        return true;

    KnownHostsPtr known(libssh2_knownhost_init(session_));
    if (!known) {
        err = "Could not initialize known_hosts";
        return false;
    }
    const std::string path =
        opt.known_hosts_path.value_or(defaultKnownHostsPath());
    const bool loaded =
        !path.empty() &&
        libssh2_knownhost_readfile(known.get(), path.c_str(),
                                   LIBSSH2_KNOWNHOST_FILE_OPENSSH) >= 0;
    if (!loaded && policy == KnownHostsPolicy::Strict) {
        err = "known_hosts missing or unreadable (strict policy)";
        return false;
    }

    std::size_t keyLen = 0;
    int keyType = 0;
    const char *key = libssh2_session_hostkey(session_, &keyLen, &keyType);
    if (!key || keyLen == 0) {
        err = "Server sent no host key";
        return false;
    }
    const HostKeyKind *kind = hostKeyKind(keyType);
    const int keyBits = kind ? kind->knownHostKey : 0;
    const std::string keyName = kind ? kind->name : "UNKNOWN";

    // Plain entries first, then hashed ones (HashKnownHosts).
    int check = LIBSSH2_KNOWNHOST_CHECK_NOTFOUND;
    for (const int hostType :
         {LIBSSH2_KNOWNHOST_TYPE_PLAIN, LIBSSH2_KNOWNHOST_TYPE_SHA1}) {
        libssh2_knownhost *entry = nullptr;
        check = libssh2_knownhost_checkp(
            known.get(), opt.host.c_str(), opt.port, key, keyLen,
            hostType | LIBSSH2_KNOWNHOST_KEYENC_RAW | keyBits, &entry);
        if (check == LIBSSH2_KNOWNHOST_CHECK_MATCH)
            return true;
        if (check == LIBSSH2_KNOWNHOST_CHECK_MISMATCH)
            break;
    }
    if (check == LIBSSH2_KNOWNHOST_CHECK_MISMATCH) {
        err = "Host key (" + keyName + ") does not match known_hosts";
        return false;
    }
    if (check == LIBSSH2_KNOWNHOST_CHECK_FAILURE) {
        err = "known_hosts lookup failed";
        return false;
    }
    if (policy == KnownHostsPolicy::Strict) {
        err = "Host not present in known_hosts";
        return false;
    }

    // AcceptNew: trust on first use, after the optional confirmation.
    const std::string fingerprint = sha256Fingerprint(session_);
    if (opt.hostkey_confirm_cb &&
        !opt.hostkey_confirm_cb(opt.host, opt.port, keyName, fingerprint)) {
        err = "Unknown host: fingerprint not confirmed";
        return false;
    }
    if (path.empty()) {
        err = "known_hosts path is not defined";
        return false;
    }
    if (libssh2_knownhost_addc(known.get(), opt.host.c_str(), nullptr, key,
                               keyLen, nullptr, 0,
                               LIBSSH2_KNOWNHOST_TYPE_PLAIN |
                                   LIBSSH2_KNOWNHOST_KEYENC_RAW | keyBits,
                               nullptr) != 0) {
        err = "Could not add host to known_hosts";
        return false;
    }
    if (libssh2_knownhost_writefile(known.get(), path.c_str(),
                                    LIBSSH2_KNOWNHOST_FILE_OPENSSH) != 0) {
        err = "Could not write known_hosts";
        return false;
    }
    return true;
}

bool Libssh2Session::tryAgentAuth(const std::string &user) {
    LIBSSH2_AGENT *agent = libssh2_agent_init(session_);
    if (!agent)
        return false;
    bool ok = false;
    if (libssh2_agent_connect(agent) == 0) {
        if (libssh2_agent_list_identities(agent) == 0) {
            libssh2_agent_publickey *identity = nullptr;
            libssh2_agent_publickey *prev = nullptr;
            // Servers close the connection after a few rejected keys.
            const int kMaxIdentities = 3;
            for (int n = 0; n < kMaxIdentities && !ok; ++n) {
                if (libssh2_agent_get_identity(agent, &identity, prev) != 0)
                    break;
                prev = identity;
                ok = retryAgain([&]() {
                         return libssh2_agent_userauth(agent, user.c_str(),
                                                       identity);
                     }) == 0;
            }
        }
        libssh2_agent_disconnect(agent);
    }
    libssh2_agent_free(agent);
    return ok;
}

bool Libssh2Session::authenticate(const SessionOptions &opt,
                                  std::string &err) {
    const char *user = opt.username.c_str();

    // An explicit key is authoritative: no fallback when it is refused.
    if (opt.private_key_path.has_value()) {
        const char *passphrase = opt.private_key_passphrase
                                     ? opt.private_key_passphrase->c_str()
                                     : nullptr;
        const int rc = retryAgain([&]() {
            return libssh2_userauth_publickey_fromfile(
                session_, user, nullptr, opt.private_key_path->c_str(),
                passphrase);
        });
        if (rc == 0)
            return true;
        err = "Public key authentication failed: " + sessionError(session_);
        return false;
    }

    const char *listed = libssh2_userauth_list(
        session_, user, static_cast<unsigned>(opt.username.size()));
    if (!listed && libssh2_userauth_authenticated(session_))
        return true; // "none" was accepted
    const std::string methods = listed ? std::string(listed) : std::string();
    auto offers = [&methods](const char *m) {
        return methods.find(m) != std::string::npos;
    };

    if (opt.password.has_value()) {
        const int rc = retryAgain([&]() {
            return libssh2_userauth_password(session_, user,
                                             opt.password->c_str());
        });
        if (rc == 0)
            return true;
        if (rc == LIBSSH2_ERROR_SOCKET_DISCONNECT ||
            rc == LIBSSH2_ERROR_SOCKET_SEND ||
            rc == LIBSSH2_ERROR_SOCKET_RECV) {
            err = "Server closed the connection after the password attempt";
            return false;
        }
        if (offers("keyboard-interactive")) {
            PromptAnswers answers{opt.username, *opt.password};
            void **abstract = libssh2_session_abstract(session_);
            if (abstract)
                *abstract = &answers;
            const int kbd = retryAgain([&]() {
                return libssh2_userauth_keyboard_interactive(session_, user,
                                                             answerPrompts);
            });
            if (abstract)
                *abstract = nullptr;
            if (kbd == 0)
                return true;
        }
    }

    if (offers("publickey") && tryAgentAuth(opt.username))
        return true;

    err = "Authentication failed";
    if (!methods.empty())
        err += " (server offers: " + methods + ")";
    const std::string last = sessionError(session_);
    if (!last.empty())
        err += ": " + last;
    return false;
}

bool Libssh2Session::connect(const SessionOptions &opt, std::string &err) {
    if (connected_) {
        err = "Already connected";
        return false;
    }
    if (opt.host.empty() || opt.username.empty()) {
        err = "Host and username are required";
        return false;
    }
    if (!ensureLibssh2(err))
        return false;
    if (!tcpConnect(opt.host, opt.port, err))
        return false;

    session_ = libssh2_session_init();
    if (!session_) {
        err = "libssh2_session_init failed";
        disconnect();
        return false;
    }
    // Blocking calls give up after io_timeout_ms, the handshake included,
    // so a silent server fails the transfer instead of holding its slot.
    libssh2_session_set_blocking(session_, 1);
    libssh2_session_set_timeout(session_, opt.io_timeout_ms);
    if (libssh2_session_handshake(session_, sock_) != 0) {
        err = "SSH handshake failed: " + sessionError(session_);
        disconnect();
        return false;
    }
    // Sent from read() and writeAll() once the interval has elapsed.
    libssh2_keepalive_config(session_, 1, kKeepaliveIntervalSec);

    if (!verifyHostKey(opt, err) || !authenticate(opt, err)) {
        disconnect();
        return false;
    }

    sftp_ = libssh2_sftp_init(session_);
    if (!sftp_) {
        err = "Could not initialize SFTP";
        disconnect();
        return false;
    }
    connected_ = true;
    return true;
}

void Libssh2Session::disconnect() {
    if (sftp_) {
        libssh2_sftp_shutdown(sftp_);
        sftp_ = nullptr;
    }
    if (session_) {
        libssh2_session_disconnect(session_, "bye");
        libssh2_session_free(session_);
        session_ = nullptr;
    }
    if (sock_ != -1) {
        ::close(sock_);
        sock_ = -1;
    }
    connected_ = false;
}

bool Libssh2Session::statSize(const std::string &remote, std::uint64_t &size,
                              bool &hasSize, std::string &err) {
    size = 0;
    hasSize = false;
    if (!connected_ || !sftp_) {
        err = "Not connected";
        return false;
    }
    LIBSSH2_SFTP_ATTRIBUTES st{};
    const int rc =
        libssh2_sftp_stat_ex(sftp_, remote.c_str(),
                             static_cast<unsigned>(remote.size()),
                             LIBSSH2_SFTP_STAT, &st);
    if (rc != 0) {
        const unsigned long sftpErr = libssh2_sftp_last_error(sftp_);
        if (sftpErr == LIBSSH2_FX_NO_SUCH_FILE) {
            err.clear();
            return false;
        }
        err = "Remote stat failed for: " + remote;
        return false;
    }
    if (st.flags & LIBSSH2_SFTP_ATTR_SIZE) {
        size = static_cast<std::uint64_t>(st.filesize);
        hasSize = true;
    }
    return true;
}

LIBSSH2_SFTP_HANDLE *Libssh2Session::openRead(const std::string &remote,
                                              std::string &err) {
    if (!connected_ || !sftp_) {
        err = "Not connected";
        return nullptr;
    }
    LIBSSH2_SFTP_HANDLE *h = libssh2_sftp_open_ex(
        sftp_, remote.c_str(), static_cast<unsigned>(remote.size()),
        LIBSSH2_FXF_READ, 0, LIBSSH2_SFTP_OPENFILE);
    if (!h)
        err = "Could not open remote file for reading: " + remote;
    return h;
}

LIBSSH2_SFTP_HANDLE *Libssh2Session::openWrite(const std::string &remote,
                                               std::string &err) {
    if (!connected_ || !sftp_) {
        err = "Not connected";
        return nullptr;
    }
    LIBSSH2_SFTP_HANDLE *h = libssh2_sftp_open_ex(
        sftp_, remote.c_str(), static_cast<unsigned>(remote.size()),
        LIBSSH2_FXF_WRITE | LIBSSH2_FXF_CREAT | LIBSSH2_FXF_TRUNC, 0644,
        LIBSSH2_SFTP_OPENFILE);
    if (!h)
        err = "Could not open remote file for writing: " + remote;
    return h;
}

bool Libssh2Session::sendKeepalive() {
    int secondsToNext = 0;
    return libssh2_keepalive_send(session_, &secondsToNext) == 0;
}

ssize_t Libssh2Session::read(LIBSSH2_SFTP_HANDLE *h, char *buf,
                             std::size_t len) {
    if (!sendKeepalive())
        return -1;
    return libssh2_sftp_read(h, buf, len);
}

bool Libssh2Session::writeAll(LIBSSH2_SFTP_HANDLE *h, const char *buf,
                              std::size_t len, std::string &err) {
    if (!sendKeepalive()) {
        err = "SSH keepalive failed: " + sessionError(session_);
        return false;
    }
    const char *p = buf;
    std::size_t remain = len;
    while (remain > 0) {
        const ssize_t w = libssh2_sftp_write(h, p, remain);
        if (w < 0) {
            err = "Remote write failed";
            return false;
        }
        remain -= static_cast<std::size_t>(w);
        p += w;
    }
    return true;
}

void Libssh2Session::closeHandle(LIBSSH2_SFTP_HANDLE *h) {
    if (h)
        libssh2_sftp_close(h);
}

bool Libssh2Session::mkdirs(const std::string &remoteDir, std::string &err) {
    if (!connected_ || !sftp_) {
        err = "Not connected";
        return false;
    }
    std::string cur;
    std::size_t pos = 0;
    while (pos <= remoteDir.size()) {
        std::size_t next = remoteDir.find('/', pos);
        if (next == std::string::npos)
            next = remoteDir.size();
        const std::string part = remoteDir.substr(pos, next - pos);
        pos = next + 1;
        if (part.empty())
            continue;
        cur += "/" + part;
        LIBSSH2_SFTP_ATTRIBUTES st{};
        if (libssh2_sftp_stat_ex(sftp_, cur.c_str(),
                                 static_cast<unsigned>(cur.size()),
                                 LIBSSH2_SFTP_STAT, &st) == 0)
            continue;
        if (libssh2_sftp_mkdir(sftp_, cur.c_str(), 0755) != 0) {
            err = "sftp_mkdir failed: " + cur;
            return false;
        }
    }
    return true;
}

bool Libssh2Session::rename(const std::string &from, const std::string &to,
                            std::string &err) {
    if (!connected_ || !sftp_) {
        err = "Not connected";
        return false;
    }
    // No OVERWRITE: an existing target makes the rename fail.
    const long flags = LIBSSH2_SFTP_RENAME_ATOMIC | LIBSSH2_SFTP_RENAME_NATIVE;
    const int rc = libssh2_sftp_rename_ex(
        sftp_, from.c_str(), static_cast<unsigned>(from.size()), to.c_str(),
        static_cast<unsigned>(to.size()), flags);
    if (rc != 0) {
        err = "sftp_rename_ex failed: " + from + " -> " + to;
        return false;
    }
    return true;
}

bool Libssh2Session::removeFile(const std::string &remote, std::string &err) {
    if (!connected_ || !sftp_) {
        err = "Not connected";
        return false;
    }
    if (libssh2_sftp_unlink(sftp_, remote.c_str()) != 0) {
        err = "sftp_unlink failed: " + remote;
        return false;
    }
    return true;
}

bool Libssh2Session::removeDir(const std::string &remote, std::string &err) {
    if (!connected_ || !sftp_) {
        err = "Not connected";
        return false;
    }
    if (libssh2_sftp_rmdir(sftp_, remote.c_str()) != 0) {
        err = "sftp_rmdir failed: " + remote;
        return false;
    }
    return true;
}

} // namespace mediarelay

// libssh2 backend: owns the TCP socket, the SSH session and the SFTP channel.
// Host keys are checked against known_hosts before any authentication.
#include "skiff/Libssh2SftpClient.hpp"
#include <libssh2.h>
#include <libssh2_sftp.h>

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

// POSIX sockets
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

namespace skiff {

// Global libssh2 initialisation (once per process)
static bool g_libssh2_inited = false;

namespace {

std::string joinSessionPath(const std::string& dir, const std::string& name) {
    if (dir.empty() || dir == ".") return name;
    if (dir.back() == '/') return dir + name;
    return dir + "/" + name;
}

bool isMissingError(unsigned long sftp_err) {
    return sftp_err == LIBSSH2_FX_NO_SUCH_FILE ||
           sftp_err == LIBSSH2_FX_NO_SUCH_PATH;
}

void fillInfo(const LIBSSH2_SFTP_ATTRIBUTES& attrs, FileInfo& fi) {
    const bool hasPerm = (attrs.flags & LIBSSH2_SFTP_ATTR_PERMISSIONS) != 0;
    fi.is_dir = hasPerm && ((attrs.permissions & LIBSSH2_SFTP_S_IFMT) == LIBSSH2_SFTP_S_IFDIR);
    fi.is_symlink = hasPerm && ((attrs.permissions & LIBSSH2_SFTP_S_IFMT) == LIBSSH2_SFTP_S_IFLNK);
    fi.size = (attrs.flags & LIBSSH2_SFTP_ATTR_SIZE) ? (std::uint64_t)attrs.filesize : 0;
}

// Handle over an open SFTP file. The session must outlive it.
class Libssh2File : public SftpFile {
public:
    Libssh2File(LIBSSH2_SFTP_HANDLE* h, std::string path)
        : handle_(h), path_(std::move(path)) {}
    ~Libssh2File() override {
        std::string ignored;
        close(ignored);
    }

    long long read(char* buf, std::size_t len, std::string& err) override {
        if (!handle_) {
            err = "file already closed: " + path_;
            return -1;
        }
        ssize_t n = libssh2_sftp_read(handle_, buf, len);
        if (n < 0) {
            err = "remote read failed: " + path_;
            return -1;
        }
        return (long long)n;
    }

    long long write(const char* buf, std::size_t len, std::string& err) override {
        if (!handle_) {
            err = "file already closed: " + path_;
            return -1;
        }
        ssize_t w = libssh2_sftp_write(handle_, buf, len);
        if (w < 0) {
            err = "remote write failed: " + path_;
            return -1;
        }
        return (long long)w;
    }

    bool close(std::string& err) override {
        if (!handle_) return true;
        int rc = libssh2_sftp_close(handle_);
        handle_ = nullptr;
        if (rc != 0) {
            err = "remote close failed: " + path_;
            return false;
        }
        return true;
    }

private:
    LIBSSH2_SFTP_HANDLE* handle_;
    std::string path_;
};

const char* hostKeyAlgorithmName(int keytype) {
    switch (keytype) {
        case LIBSSH2_HOSTKEY_TYPE_RSA: return "RSA";
        case LIBSSH2_HOSTKEY_TYPE_DSS: return "DSA";
        case LIBSSH2_HOSTKEY_TYPE_ECDSA_256: return "ECDSA-256";
        case LIBSSH2_HOSTKEY_TYPE_ECDSA_384: return "ECDSA-384";
        case LIBSSH2_HOSTKEY_TYPE_ECDSA_521: return "ECDSA-521";
        case LIBSSH2_HOSTKEY_TYPE_ED25519: return "ED25519";
        default: return "UNKNOWN";
    }
}

int knownHostKeyMask(int keytype) {
    switch (keytype) {
        case LIBSSH2_HOSTKEY_TYPE_RSA:
            return LIBSSH2_KNOWNHOST_KEY_SSHRSA;
        case LIBSSH2_HOSTKEY_TYPE_DSS:
            return LIBSSH2_KNOWNHOST_KEY_SSHDSS;
#ifdef LIBSSH2_KNOWNHOST_KEY_ECDSA_256
        case LIBSSH2_HOSTKEY_TYPE_ECDSA_256:
            return LIBSSH2_KNOWNHOST_KEY_ECDSA_256;
#endif
#ifdef LIBSSH2_KNOWNHOST_KEY_ECDSA_384
        case LIBSSH2_HOSTKEY_TYPE_ECDSA_384:
            return LIBSSH2_KNOWNHOST_KEY_ECDSA_384;
#endif
#ifdef LIBSSH2_KNOWNHOST_KEY_ECDSA_521
        case LIBSSH2_HOSTKEY_TYPE_ECDSA_521:
            return LIBSSH2_KNOWNHOST_KEY_ECDSA_521;
#endif
#ifdef LIBSSH2_KNOWNHOST_KEY_ED25519
        case LIBSSH2_HOSTKEY_TYPE_ED25519:
            return LIBSSH2_KNOWNHOST_KEY_ED25519;
#endif
        default:
            return 0;
    }
}

} // namespace

Libssh2SftpClient::Libssh2SftpClient() {
    if (!g_libssh2_inited) {
        int rc = libssh2_init(0);
        (void)rc;
        g_libssh2_inited = true;
    }
}

Libssh2SftpClient::~Libssh2SftpClient() {
    disconnect();
}

bool Libssh2SftpClient::tcpConnect(const std::string& host, uint16_t port, std::string& err) {
    struct addrinfo hints{};
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    char portStr[16];
    std::snprintf(portStr, sizeof(portStr), "%u", static_cast<unsigned>(port));

    struct addrinfo* res = nullptr;
    int gai = getaddrinfo(host.c_str(), portStr, &hints, &res);
    if (gai != 0) {
        err = std::string("getaddrinfo: ") + gai_strerror(gai);
        return false;
    }

    int s = -1;
    for (auto rp = res; rp != nullptr; rp = rp->ai_next) {
        s = ::socket(rp->ai_family, rp->ai_socktype, rp->ai_protocol);
        if (s == -1) continue;
        int opt = 1;
        ::setsockopt(s, SOL_SOCKET, SO_KEEPALIVE, &opt, sizeof(opt));
#if defined(__linux__)
        int idle = 60, intvl = 10, cnt = 3;
        ::setsockopt(s, IPPROTO_TCP, TCP_KEEPIDLE, &idle, sizeof(idle));
        ::setsockopt(s, IPPROTO_TCP, TCP_KEEPINTVL, &intvl, sizeof(intvl));
        ::setsockopt(s, IPPROTO_TCP, TCP_KEEPCNT, &cnt, sizeof(cnt));
#endif
        if (::connect(s, rp->ai_addr, rp->ai_addrlen) == 0) {
            sock_ = s;
            freeaddrinfo(res);
            return true;
        }
        ::close(s);
        s = -1;
    }
    freeaddrinfo(res);
    err = "could not connect to " + host + ":" + portStr;
    return false;
}

std::string Libssh2SftpClient::lastSessionError() const {
    if (!session_) return {};
    char* emsgPtr = nullptr;
    int emlen = 0;
    (void)libssh2_session_last_error(session_, &emsgPtr, &emlen, 0);
    if (emsgPtr && emlen > 0) return std::string(emsgPtr, (size_t)emlen);
    return {};
}

bool Libssh2SftpClient::verifyHostKey(const SessionOptions& opt, std::string& err) {
    if (opt.known_hosts_policy == KnownHostsPolicy::Off) return true;

    LIBSSH2_KNOWNHOSTS* nh = libssh2_knownhost_init(session_);
    if (!nh) {
        err = "could not initialise known_hosts";
        return false;
    }

    std::string khPath;
    if (opt.known_hosts_path.has_value()) {
        khPath = *opt.known_hosts_path;
    } else {
        const char* home = std::getenv("HOME");
        if (home) khPath = std::string(home) + "/.ssh/known_hosts";
    }

    bool khLoaded = false;
    if (!khPath.empty()) {
        khLoaded = (libssh2_knownhost_readfile(nh, khPath.c_str(), LIBSSH2_KNOWNHOST_FILE_OPENSSH) >= 0);
    }
    if (!khLoaded && opt.known_hosts_policy == KnownHostsPolicy::Strict) {
        libssh2_knownhost_free(nh);
        err = "unable to load host keys from file '" + khPath + "'";
        return false;
    }

    size_t keylen = 0;
    int keytype = 0;
    const char* hostkey = libssh2_session_hostkey(session_, &keylen, &keytype);
    if (!hostkey || keylen == 0) {
        libssh2_knownhost_free(nh);
        err = "could not obtain the server host key";
        return false;
    }

    const int alg = knownHostKeyMask(keytype);
    int typemask_plain = LIBSSH2_KNOWNHOST_TYPE_PLAIN | LIBSSH2_KNOWNHOST_KEYENC_RAW | alg;
    int typemask_hash = LIBSSH2_KNOWNHOST_TYPE_SHA1 | LIBSSH2_KNOWNHOST_KEYENC_RAW | alg;

    struct libssh2_knownhost* host = nullptr;
    int check = libssh2_knownhost_checkp(nh, opt.host.c_str(), opt.port,
                                         hostkey, keylen, typemask_plain, &host);
    if (check != LIBSSH2_KNOWNHOST_CHECK_MATCH) {
        check = libssh2_knownhost_checkp(nh, opt.host.c_str(), opt.port,
                                         hostkey, keylen, typemask_hash, &host);
    }

    if (check == LIBSSH2_KNOWNHOST_CHECK_MATCH) {
        libssh2_knownhost_free(nh);
        return true;
    }

    if (opt.known_hosts_policy == KnownHostsPolicy::AcceptNew &&
        check == LIBSSH2_KNOWNHOST_CHECK_NOTFOUND) {
        std::string fpStr;
#ifdef LIBSSH2_HOSTKEY_HASH_SHA256
        const unsigned char* h = (const unsigned char*)libssh2_hostkey_hash(session_, LIBSSH2_HOSTKEY_HASH_SHA256);
        const int hlen = 32;
        const char* prefix = "SHA256:";
#else
        const unsigned char* h = (const unsigned char*)libssh2_hostkey_hash(session_, LIBSSH2_HOSTKEY_HASH_SHA1);
        const int hlen = 20;
        const char* prefix = "SHA1:";
#endif
        if (h) {
            std::ostringstream oss;
            oss << prefix;
            for (int i = 0; i < hlen; ++i) {
                if (i) oss << ':';
                char b[4];
                std::snprintf(b, sizeof(b), "%02X", (unsigned)h[i]);
                oss << b;
            }
            fpStr = oss.str();
        }
        bool confirmed = false;
        if (opt.hostkey_confirm_cb) {
            confirmed = opt.hostkey_confirm_cb(opt.host, opt.port, hostKeyAlgorithmName(keytype), fpStr);
        }
        if (!confirmed) {
            libssh2_knownhost_free(nh);
            err = "unknown host: fingerprint not confirmed";
            return false;
        }
        if (khPath.empty()) {
            libssh2_knownhost_free(nh);
            err = "known_hosts path is not defined";
            return false;
        }
        int addMask = LIBSSH2_KNOWNHOST_TYPE_PLAIN | LIBSSH2_KNOWNHOST_KEYENC_RAW | alg;
        int addrc = libssh2_knownhost_addc(nh, opt.host.c_str(), nullptr,
                                           hostkey, (size_t)keylen,
                                           nullptr, 0, addMask, nullptr);
        if (addrc != 0 || libssh2_knownhost_writefile(nh, khPath.c_str(), LIBSSH2_KNOWNHOST_FILE_OPENSSH) != 0) {
            libssh2_knownhost_free(nh);
            err = "could not add host to known_hosts";
            return false;
        }
        libssh2_knownhost_free(nh);
        return true;
    }

    libssh2_knownhost_free(nh);
    if (check == LIBSSH2_KNOWNHOST_CHECK_MISMATCH) {
        err = "host key does not match known_hosts";
        return false;
    }
    // AcceptNew handled NOTFOUND above; only Strict rejects unknown hosts here.
    if (opt.known_hosts_policy == KnownHostsPolicy::Strict) {
        err = "host not found in known_hosts";
        return false;
    }
    return true;
}

bool Libssh2SftpClient::authenticateWithAgent(const std::string& user) {
    bool authed = false;
    LIBSSH2_AGENT* agent = libssh2_agent_init(session_);
    if (agent && libssh2_agent_connect(agent) == 0) {
        if (libssh2_agent_list_identities(agent) == 0) {
            struct libssh2_agent_publickey* identity = nullptr;
            struct libssh2_agent_publickey* prev = nullptr;
            int tries = 0;
            const int kMaxAgentTries = 3; // conservative limit
            while (libssh2_agent_get_identity(agent, &identity, prev) == 0 && tries < kMaxAgentTries) {
                prev = identity;
                ++tries;
                int arc = -1;
                for (;;) {
                    arc = libssh2_agent_userauth(agent, user.c_str(), identity);
                    if (arc != LIBSSH2_ERROR_EAGAIN) break;
                    std::this_thread::sleep_for(std::chrono::milliseconds(50));
                }
                if (arc == 0) {
                    authed = true;
                    break;
                }
            }
        }
    }
    if (agent) {
        libssh2_agent_disconnect(agent);
        libssh2_agent_free(agent);
    }
    return authed;
}

// Authentication order: explicit key, then ssh-agent, then default identity
// files. Passwords are never used.
bool Libssh2SftpClient::authenticate(const SessionOptions& opt, std::string& err) {
    const char* passphrase = opt.private_key_passphrase ? opt.private_key_passphrase->c_str() : nullptr;
    if (opt.private_key_path.has_value()) {
        int rc = libssh2_userauth_publickey_fromfile(session_,
                                                     opt.username.c_str(),
                                                     nullptr, // public key derived from the private one
                                                     opt.private_key_path->c_str(),
                                                     passphrase);
        if (rc != 0) {
            err = "key authentication failed for '" + *opt.private_key_path + "'";
            const std::string last = lastSessionError();
            if (!last.empty()) err += " (" + last + ")";
            return false;
        }
        return true;
    }

    char* methods = libssh2_userauth_list(session_, opt.username.c_str(), (unsigned)opt.username.size());
    if (!methods && libssh2_userauth_authenticated(session_)) return true;
    const std::string authlist = methods ? std::string(methods) : std::string();
    if (authlist.find("publickey") == std::string::npos) {
        err = "server does not offer publickey authentication";
        if (!authlist.empty()) err += " (methods: " + authlist + ")";
        return false;
    }

    if (authenticateWithAgent(opt.username)) return true;

    for (const auto& identity : opt.default_identities) {
        if (::access(identity.c_str(), R_OK) != 0) continue;
        int rc = libssh2_userauth_publickey_fromfile(session_,
                                                     opt.username.c_str(),
                                                     nullptr,
                                                     identity.c_str(),
                                                     passphrase);
        if (rc == 0) return true;
    }

    err = "no credentials accepted: agent and identity files were refused";
    const std::string last = lastSessionError();
    if (!last.empty()) err += " (" + last + ")";
    return false;
}

bool Libssh2SftpClient::connect(const SessionOptions& opt,
                                std::string& err,
                                ConnectFailure* failure) {
    auto fail = [&](ConnectFailure stage) {
        if (failure) *failure = stage;
        disconnect();
        return false;
    };
    if (failure) *failure = ConnectFailure::None;
    if (connected_) {
        err = "already connected";
        return fail(ConnectFailure::Network);
    }
    if (!tcpConnect(opt.host, opt.port, err)) return fail(ConnectFailure::Network);

    session_ = libssh2_session_init();
    if (!session_) {
        err = "libssh2_session_init failed";
        return fail(ConnectFailure::Network);
    }
    if (libssh2_session_handshake(session_, sock_) != 0) {
        err = "SSH handshake failed";
        const std::string last = lastSessionError();
        if (!last.empty()) err += " (" + last + ")";
        return fail(ConnectFailure::Network);
    }

    // Blocking mode with a sane timeout so auth never sees EAGAIN
    libssh2_session_set_blocking(session_, 1);
#ifdef LIBSSH2_SESSION_TIMEOUT
    libssh2_session_set_timeout(session_, 20000); // 20s
#endif
    libssh2_keepalive_config(session_, 1, 30);

    if (!verifyHostKey(opt, err)) return fail(ConnectFailure::HostKey);
    if (!authenticate(opt, err)) return fail(ConnectFailure::Authentication);

    sftp_ = libssh2_sftp_init(session_);
    if (!sftp_) {
        err = "could not start the SFTP subsystem";
        return fail(ConnectFailure::Protocol);
    }

    connected_ = true;
    return true;
}

void Libssh2SftpClient::disconnect() {
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

bool Libssh2SftpClient::isConnected() const {
    if (!connected_ || !session_) return false;
    switch (libssh2_session_last_errno(session_)) {
        case LIBSSH2_ERROR_SOCKET_DISCONNECT:
        case LIBSSH2_ERROR_SOCKET_SEND:
        case LIBSSH2_ERROR_SOCKET_RECV:
        case LIBSSH2_ERROR_SOCKET_TIMEOUT:
            return false;
        default:
            return true;
    }
}

bool Libssh2SftpClient::list(const std::string& remote_path,
                             std::vector<FileInfo>& out,
                             std::string& err) {
    if (!connected_ || !sftp_) {
        err = "not connected";
        return false;
    }

    std::string path = remote_path.empty() ? "." : remote_path;

    LIBSSH2_SFTP_HANDLE* dir = libssh2_sftp_opendir(sftp_, path.c_str());
    if (!dir) {
        err = "sftp_opendir failed for: " + path;
        return false;
    }

    out.clear();
    out.reserve(64);

    char filename[512];
    char longentry[1024];
    LIBSSH2_SFTP_ATTRIBUTES attrs;

    while (true) {
        std::memset(&attrs, 0, sizeof(attrs));
        int rc = libssh2_sftp_readdir_ex(dir,
                                         filename, sizeof(filename),
                                         longentry, sizeof(longentry),
                                         &attrs);
        if (rc > 0) {
            // rc = name length
            FileInfo fi{};
            fi.name = std::string(filename, rc);
            if (fi.name == "." || fi.name == "..") continue;
            fillInfo(attrs, fi);
            out.push_back(std::move(fi));
        } else if (rc == 0) {
            break; // end of directory
        } else {
            err = "sftp_readdir_ex failed for: " + path;
            libssh2_sftp_closedir(dir);
            return false;
        }
    }
    libssh2_sftp_closedir(dir);

    // readdir reports link attributes; resolve what the links point at.
    for (auto& fi : out) {
        if (!fi.is_symlink) continue;
        LIBSSH2_SFTP_ATTRIBUTES st{};
        const std::string full = joinSessionPath(path, fi.name);
        if (libssh2_sftp_stat_ex(sftp_, full.c_str(), (unsigned)full.size(),
                                 LIBSSH2_SFTP_STAT, &st) == 0) {
            fillInfo(st, fi);
            fi.is_symlink = true;
        }
    }
    return true;
}

// Remote metadata via sftp_stat. Returns false with empty err if the path
// does not exist.
bool Libssh2SftpClient::stat(const std::string& remote_path,
                             FileInfo& info,
                             std::string& err) {
    if (!connected_ || !sftp_) {
        err = "not connected";
        return false;
    }

    LIBSSH2_SFTP_ATTRIBUTES st{};
    int rc = libssh2_sftp_stat_ex(
        sftp_, remote_path.c_str(), (unsigned)remote_path.size(),
        LIBSSH2_SFTP_STAT, &st);
    if (rc != 0) {
        unsigned long sftp_err = libssh2_sftp_last_error(sftp_);
        if (isMissingError(sftp_err)) {
            err.clear();
            return false;
        }
        err = "remote stat failed for: " + remote_path +
              " (sftp status " + std::to_string(sftp_err) + ")";
        return false;
    }
    info = FileInfo{};
    fillInfo(st, info);
    return true;
}

bool Libssh2SftpClient::realpath(const std::string& remote_path,
                                 std::string& out,
                                 std::string& err) {
    if (!connected_ || !sftp_) {
        err = "not connected";
        return false;
    }
    const std::string path = remote_path.empty() ? "." : remote_path;
    std::vector<char> buf(4096);
    int rc = libssh2_sftp_symlink_ex(sftp_, path.c_str(), (unsigned)path.size(),
                                     buf.data(), (unsigned)buf.size(),
                                     LIBSSH2_SFTP_REALPATH);
    if (rc < 0) {
        err = "sftp_realpath failed for: " + path;
        return false;
    }
    out.assign(buf.data(), (size_t)rc);
    return true;
}

bool Libssh2SftpClient::mkdir(const std::string& remote_dir,
                              std::string& err,
                              unsigned int mode) {
    if (!connected_ || !sftp_) {
        err = "not connected";
        return false;
    }
    int rc = libssh2_sftp_mkdir(sftp_, remote_dir.c_str(), mode);
    if (rc != 0) {
        err = "sftp_mkdir failed for: " + remote_dir;
        return false;
    }
    return true;
}

bool Libssh2SftpClient::removeFile(const std::string& remote_path,
                                   std::string& err) {
    if (!connected_ || !sftp_) {
        err = "not connected";
        return false;
    }
    int rc = libssh2_sftp_unlink(sftp_, remote_path.c_str());
    if (rc != 0) {
        err = "sftp_unlink failed for: " + remote_path;
        return false;
    }
    return true;
}

bool Libssh2SftpClient::removeDir(const std::string& remote_dir,
                                  std::string& err) {
    if (!connected_ || !sftp_) {
        err = "not connected";
        return false;
    }
    int rc = libssh2_sftp_rmdir(sftp_, remote_dir.c_str());
    if (rc != 0) {
        err = "sftp_rmdir failed for: " + remote_dir;
        return false;
    }
    return true;
}

std::unique_ptr<SftpFile> Libssh2SftpClient::openRead(const std::string& remote_path,
                                                      std::string& err) {
    if (!connected_ || !sftp_) {
        err = "not connected";
        return nullptr;
    }
    LIBSSH2_SFTP_HANDLE* rh = libssh2_sftp_open_ex(
        sftp_, remote_path.c_str(), (unsigned)remote_path.size(),
        LIBSSH2_FXF_READ, 0, LIBSSH2_SFTP_OPENFILE);
    if (!rh) {
        err = "could not open remote file for reading: " + remote_path;
        return nullptr;
    }
    return std::make_unique<Libssh2File>(rh, remote_path);
}

std::unique_ptr<SftpFile> Libssh2SftpClient::openWrite(const std::string& remote_path,
                                                       std::string& err,
                                                       unsigned int mode) {
    if (!connected_ || !sftp_) {
        err = "not connected";
        return nullptr;
    }
    unsigned long flags = LIBSSH2_FXF_WRITE | LIBSSH2_FXF_CREAT | LIBSSH2_FXF_TRUNC;
    LIBSSH2_SFTP_HANDLE* wh = libssh2_sftp_open_ex(
        sftp_, remote_path.c_str(), (unsigned)remote_path.size(),
        flags, mode, LIBSSH2_SFTP_OPENFILE);
    if (!wh) {
        err = "could not open remote file for writing: " + remote_path;
        return nullptr;
    }
    return std::make_unique<Libssh2File>(wh, remote_path);
}

} // namespace skiff

// Integration tests for Libssh2SftpClient and the transfer session against a
// test SFTP server. The test is skipped (exit code 77) unless the required
// SKIFF_IT_* env vars exist.
#include "skiff/Libssh2SftpClient.hpp"
#include "skiff/LocalFileSystem.hpp"
#include "skiff/TransferSession.hpp"

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace {

constexpr int kSkipExitCode = 77;

struct TestContext {
    int failures = 0;

    void check(bool cond, const std::string &msg) {
        if (!cond) {
            ++failures;
            std::cerr << "[FAIL] " << msg << "\n";
        }
    }
};

std::optional<std::string> envValue(const char *key) {
    const char *raw = std::getenv(key);
    if (!raw || !*raw)
        return std::nullopt;
    return std::string(raw);
}

std::string uniqueToken() {
    const auto now =
        std::chrono::steady_clock::now().time_since_epoch().count();
    return std::to_string(static_cast<long long>(now));
}

std::string joinRemotePath(const std::string &base, const std::string &name) {
    if (base.empty())
        return std::string("/") + name;
    if (base.back() == '/')
        return base + name;
    return base + "/" + name;
}

bool readFile(const fs::path &p, std::string &out) {
    std::ifstream in(p, std::ios::binary);
    if (!in.is_open())
        return false;
    out.assign(std::istreambuf_iterator<char>(in),
               std::istreambuf_iterator<char>());
    return true;
}

bool parsePort(const std::optional<std::string> &raw, std::uint16_t &out) {
    if (!raw.has_value()) {
        out = 22;
        return true;
    }
    try {
        const int n = std::stoi(*raw);
        if (n < 1 || n > 65535)
            return false;
        out = static_cast<std::uint16_t>(n);
        return true;
    } catch (const std::exception &) {
        return false;
    }
}

bool listContainsName(const std::vector<skiff::FileInfo> &entries,
                      const std::string &name) {
    return std::any_of(entries.begin(), entries.end(),
                       [&name](const skiff::FileInfo &e) {
                           return e.name == name;
                       });
}

bool allSucceeded(const std::vector<skiff::TransferOutcome> &outcomes) {
    return !outcomes.empty() &&
           std::all_of(outcomes.begin(), outcomes.end(),
                       [](const skiff::TransferOutcome &o) { return o.ok(); });
}

} // namespace

int main() {
    const auto host = envValue("SKIFF_IT_SFTP_HOST");
    const auto user = envValue("SKIFF_IT_SFTP_USER");
    const auto keyPath = envValue("SKIFF_IT_SFTP_KEY");
    const auto keyPassphrase = envValue("SKIFF_IT_SFTP_KEY_PASSPHRASE");
    const std::string remoteBase =
        envValue("SKIFF_IT_REMOTE_BASE").value_or("/tmp");

    if (!host.has_value() || !user.has_value() || !keyPath.has_value()) {
        std::cout << "[SKIP] skiff_sftp_integration_tests requires env vars: "
                  << "SKIFF_IT_SFTP_HOST, SKIFF_IT_SFTP_USER and "
                     "SKIFF_IT_SFTP_KEY\n";
        return kSkipExitCode;
    }
    if (!fs::exists(*keyPath)) {
        std::cerr << "[FAIL] SKIFF_IT_SFTP_KEY does not exist: " << *keyPath
                  << "\n";
        return EXIT_FAILURE;
    }

    std::uint16_t port = 22;
    if (!parsePort(envValue("SKIFF_IT_SFTP_PORT"), port)) {
        std::cerr << "[FAIL] SKIFF_IT_SFTP_PORT is invalid\n";
        return EXIT_FAILURE;
    }

    TestContext t;
    skiff::SessionOptions opt;
    opt.port = port;
    opt.private_key_path = *keyPath;
    if (keyPassphrase.has_value())
        opt.private_key_passphrase = *keyPassphrase;
    opt.known_hosts_policy = skiff::KnownHostsPolicy::Off;

    const std::string token = uniqueToken();
    const std::string suiteName = "skiff-it-" + token;
    const std::string remoteSuiteDir = joinRemotePath(remoteBase, suiteName);

    const fs::path localTmpRoot = fs::temp_directory_path() / suiteName;
    std::error_code ec;
    fs::create_directories(localTmpRoot / "up" / "nested", ec);
    fs::create_directories(localTmpRoot / "down", ec);
    if (ec) {
        std::cerr << "[FAIL] could not create temp dir: " << ec.message()
                  << "\n";
        return EXIT_FAILURE;
    }

    const std::string payload = "skiff integration payload\nline-2\n";
    {
        std::ofstream a(localTmpRoot / "up" / "payload.txt",
                        std::ios::binary | std::ios::trunc);
        std::ofstream b(localTmpRoot / "up" / "nested" / "inner.txt",
                        std::ios::binary | std::ios::trunc);
        if (!a.is_open() || !b.is_open()) {
            std::cerr << "[FAIL] could not create source files\n";
            fs::remove_all(localTmpRoot, ec);
            return EXIT_FAILURE;
        }
        a << payload;
        b << "inner";
    }

    skiff::Libssh2SftpClient client;
    std::string err;

    // Prepare the remote folder with a bare connection first.
    skiff::SessionOptions bare = opt;
    bare.host = *host;
    bare.username = *user;
    t.check(client.connect(bare, err),
            std::string("connect should succeed: ") + err);
    if (t.failures == 0) {
        err.clear();
        t.check(client.mkdir(remoteSuiteDir, err, 0755),
                std::string("mkdir remoteSuiteDir should succeed: ") + err);
        std::string abs;
        err.clear();
        t.check(client.realpath(remoteSuiteDir, abs, err) && !abs.empty(),
                std::string("realpath should succeed: ") + err);
    }
    client.disconnect();

    skiff::Target target;
    target.principal = *user;
    target.host = *host;
    target.base_directory = remoteSuiteDir;

    // Recursive upload preserving the hierarchy.
    if (t.failures == 0) {
        skiff::LocalFileSystem local((localTmpRoot / "up").string());
        skiff::TransferSession session(client, local);
        skiff::SessionRequest req;
        req.direction = skiff::Direction::Upload;
        req.recursive = true;
        req.pattern = std::string("txt$");
        req.policy.preserve_hierarchy = true;
        std::vector<skiff::TransferOutcome> outcomes;
        skiff::Error fatal;
        const bool completed = session.run(target, opt, req, outcomes, fatal);
        t.check(completed, "upload run should complete: " + fatal.message());
        t.check(outcomes.size() == 2, "upload should see two candidates");
        t.check(allSucceeded(outcomes), "both uploads should succeed");
        t.check(!client.isConnected(), "session should release the connection");
    }
    if (t.failures == 0) {
        err.clear();
        t.check(client.connect(bare, err), "reconnect should succeed: " + err);
        std::vector<skiff::FileInfo> entries;
        err.clear();
        t.check(client.list(remoteSuiteDir, entries, err),
                std::string("list(remoteSuiteDir) should succeed: ") + err);
        t.check(listContainsName(entries, "payload.txt"),
                "list should include payload.txt");
        t.check(listContainsName(entries, "nested"),
                "list should include the nested folder");
        skiff::FileInfo st{};
        err.clear();
        t.check(client.stat(joinRemotePath(remoteSuiteDir, "payload.txt"), st,
                            err),
                std::string("stat(payload) should succeed: ") + err);
        t.check(st.size == payload.size(),
                "remote file size should match payload size");
        client.disconnect();
    }

    // Download with move: the remote source goes away.
    if (t.failures == 0) {
        skiff::LocalFileSystem local((localTmpRoot / "down").string());
        skiff::TransferSession session(client, local);
        skiff::SessionRequest req;
        req.direction = skiff::Direction::Download;
        req.paths = {"payload.txt"};
        req.policy.delete_source_on_success = true;
        std::vector<skiff::TransferOutcome> outcomes;
        skiff::Error fatal;
        const bool completed = session.run(target, opt, req, outcomes, fatal);
        t.check(completed, "download run should complete: " + fatal.message());
        t.check(allSucceeded(outcomes), "download should succeed");
        std::string downloaded;
        t.check(readFile(localTmpRoot / "down" / "payload.txt", downloaded),
                "downloaded file should be readable");
        t.check(downloaded == payload,
                "downloaded content should match uploaded payload");
    }
    if (t.failures == 0) {
        err.clear();
        t.check(client.connect(bare, err), "reconnect should succeed: " + err);
        skiff::FileInfo st{};
        err.clear();
        t.check(!client.stat(joinRemotePath(remoteSuiteDir, "payload.txt"), st,
                             err) &&
                    err.empty(),
                "moved source should no longer exist remotely");
    }

    // Best-effort cleanup regardless of test result.
    if (!client.isConnected()) {
        std::string reconnectErr;
        if (!client.connect(bare, reconnectErr))
            std::cerr << "[WARN] cleanup reconnect failed: " << reconnectErr
                      << "\n";
    }
    std::string cleanupErr;
    const std::string nestedDir = joinRemotePath(remoteSuiteDir, "nested");
    for (const std::string &path :
         {joinRemotePath(remoteSuiteDir, "payload.txt"),
          joinRemotePath(nestedDir, "inner.txt")}) {
        cleanupErr.clear();
        (void)client.removeFile(path, cleanupErr);
    }
    cleanupErr.clear();
    (void)client.removeDir(nestedDir, cleanupErr);
    cleanupErr.clear();
    (void)client.removeDir(remoteSuiteDir, cleanupErr);
    client.disconnect();
    fs::remove_all(localTmpRoot, ec);

    if (t.failures != 0) {
        std::cerr << "[FAILURES] " << t.failures << "\n";
        return EXIT_FAILURE;
    }
    std::cout << "[OK] skiff_sftp_integration_tests\n";
    return EXIT_SUCCESS;
}

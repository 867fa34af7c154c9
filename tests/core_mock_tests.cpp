// Core unit tests without external framework (run via CTest).
#include "skiff/MockSftpClient.hpp"

#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace {

struct TestContext {
    int failures = 0;

    void check(bool cond, const std::string &msg) {
        if (!cond) {
            ++failures;
            std::cerr << "[FAIL] " << msg << "\n";
        }
    }

    void checkContains(const std::string &haystack, const std::string &needle,
                       const std::string &msg) {
        check(haystack.find(needle) != std::string::npos, msg);
    }
};

skiff::SessionOptions validOptions() {
    skiff::SessionOptions opt;
    opt.host = "example.test";
    opt.username = "alice";
    return opt;
}

std::string readAll(skiff::SftpFile &f, std::string &err) {
    std::string out;
    char buf[4];
    long long n = 0;
    while ((n = f.read(buf, sizeof(buf), err)) > 0)
        out.append(buf, static_cast<std::size_t>(n));
    return out;
}

void test_session_defaults(TestContext &t) {
    skiff::SessionOptions o;
    t.check(o.port == 22, "default port should be 22");
    t.check(o.known_hosts_policy == skiff::KnownHostsPolicy::Strict,
            "default known_hosts_policy should be Strict");
    t.check(!o.private_key_path.has_value(),
            "private_key_path should be empty by default");
    t.check(o.default_identities.empty(),
            "default_identities should be empty by default");
    t.check(!o.hostkey_confirm_cb, "no host key prompt by default");
}

void test_connect_validation(TestContext &t) {
    skiff::MockSftpClient c;
    std::string err;
    skiff::SessionOptions opt;
    opt.host = "";
    opt.username = "user";
    t.check(!c.connect(opt, err), "connect should fail when host is empty");

    err.clear();
    opt.host = "example.test";
    opt.username.clear();
    t.check(!c.connect(opt, err), "connect should fail when username is empty");

    err.clear();
    opt.username = "alice";
    t.check(c.connect(opt, err), "connect should succeed with host+username");
    t.check(c.isConnected(),
            "client should report connected after successful connect");
    t.check(c.lastOptions().username == "alice",
            "mock should remember the options it connected with");
}

void test_injected_connect_failure(TestContext &t) {
    skiff::MockSftpClient c;
    std::string err;
    skiff::ConnectFailure stage = skiff::ConnectFailure::None;
    c.failNextConnect(skiff::ConnectFailure::Authentication);
    t.check(!c.connect(validOptions(), err, &stage),
            "injected failure should make connect fail");
    t.check(stage == skiff::ConnectFailure::Authentication,
            "connect should report the injected stage");
    t.check(!c.isConnected(), "failed connect should leave client disconnected");

    err.clear();
    t.check(c.connect(validOptions(), err, &stage),
            "injection applies to a single attempt");
    t.check(stage == skiff::ConnectFailure::None,
            "successful connect should report no failure stage");
    t.check(c.connectCount() == 2, "both attempts should be counted");
}

void test_disconnect_changes_state(TestContext &t) {
    skiff::MockSftpClient c;
    std::string err;
    t.check(c.connect(validOptions(), err),
            "connect should succeed before disconnect test");
    c.disconnect();
    t.check(!c.isConnected(), "disconnect should flip isConnected to false");
    c.disconnect();
    t.check(c.disconnectCount() == 1,
            "disconnect of a closed client should not count");

    std::vector<skiff::FileInfo> out;
    err.clear();
    t.check(!c.list("/", out, err), "list should fail after disconnect");
    t.check(!err.empty(), "list should provide error when disconnected");
}

void test_list_children(TestContext &t) {
    skiff::MockSftpClient c;
    c.addFile("docs/a.txt", "aaa");
    c.addFile("docs/sub/b.txt", "b");
    c.addSymlinkToDir("docs/link");
    std::string err;
    t.check(c.connect(validOptions(), err), "connect should succeed");

    std::vector<skiff::FileInfo> out;
    t.check(c.list("docs", out, err), "list of a relative dir should succeed");
    t.check(out.size() == 3, "docs should have three children");
    int files = 0, dirs = 0, links = 0;
    for (const auto &fi : out) {
        if (fi.is_symlink)
            ++links;
        else if (fi.is_dir)
            ++dirs;
        else
            ++files;
        if (fi.name == "a.txt")
            t.check(fi.size == 3, "file size should be reported");
    }
    t.check(files == 1 && dirs == 1 && links == 1,
            "list should report one file, one dir and one link");

    std::vector<skiff::FileInfo> empty;
    t.check(c.list("", empty, err), "list('') should list home");
    t.check(empty.size() == 1 && empty[0].name == "docs",
            "home should only contain docs");
}

void test_stat_and_realpath(TestContext &t) {
    skiff::MockSftpClient c;
    c.addFile("a.txt", "x");
    std::string err;
    t.check(c.connect(validOptions(), err), "connect should succeed");

    skiff::FileInfo info;
    t.check(c.stat("a.txt", info, err), "stat on existing file should succeed");
    t.check(!info.is_dir && info.name == "a.txt", "stat should describe the file");

    err = "stale";
    t.check(!c.stat("missing", info, err), "stat on missing path should fail");
    t.check(err.empty(), "missing path is reported with an empty error");

    c.denyAccess("secret");
    t.check(!c.stat("secret", info, err), "stat on denied path should fail");
    t.check(!err.empty(), "denied path is reported with an error");

    std::string abs;
    t.check(c.realpath(".", abs, err), "realpath of home should succeed");
    t.check(abs == "/home/alice", "realpath should resolve to home");
    t.check(c.realpath("../alice/./a.txt", abs, err),
            "realpath should collapse dot segments");
    t.check(abs == "/home/alice/a.txt", "realpath should be absolute");
    err.clear();
    t.check(!c.realpath("nope", abs, err), "realpath of missing path fails");
    t.checkContains(err, "no such path", "realpath should explain failure");
}

void test_mkdir_and_remove(TestContext &t) {
    skiff::MockSftpClient c;
    std::string err;
    t.check(c.connect(validOptions(), err), "connect should succeed");

    t.check(c.mkdir("d", err), "mkdir should create a new directory");
    t.check(c.hasDir("d"), "directory should exist after mkdir");
    t.check(!c.mkdir("d", err), "mkdir on existing path should fail");
    t.check(!c.mkdir("x/y", err), "mkdir without parent should fail");

    c.addFile("d/f", "1");
    t.check(c.removeFile("d/f", err), "removeFile should delete a file");
    t.check(!c.hasFile("d/f"), "file should be gone after removeFile");
    t.check(!c.removeFile("d", err), "removeFile should refuse directories");

    t.check(!c.removeDir("d/missing", err), "removeDir on missing dir fails");
    c.addFile("d/g", "1");
    t.check(!c.removeDir("d", err), "removeDir should refuse non-empty dirs");
    t.check(c.removeFile("d/g", err) && c.removeDir("d", err),
            "removeDir should delete an emptied directory");
    t.check(!c.hasDir("d"), "directory should be gone after removeDir");

    c.addFile("keep", "1");
    c.failRemoval("keep");
    t.check(!c.removeFile("keep", err), "injected removal failure should fail");
    t.check(c.hasFile("keep"), "file should survive a failed removal");
}

void test_file_handles(TestContext &t) {
    skiff::MockSftpClient c;
    c.addFile("in.txt", "hello world");
    std::string err;
    t.check(c.connect(validOptions(), err), "connect should succeed");

    auto r = c.openRead("in.txt", err);
    t.check(static_cast<bool>(r), "openRead should succeed on a file");
    if (r) {
        t.check(readAll(*r, err) == "hello world",
                "reads should return the whole content in chunks");
        t.check(r->close(err), "close should succeed");
    }

    auto w = c.openWrite("out.txt", err);
    t.check(static_cast<bool>(w), "openWrite should create a file");
    if (w) {
        t.check(w->write("abc", 3, err) == 3, "write should accept all bytes");
        t.check(w->write("de", 2, err) == 2, "writes should append");
    }
    t.check(c.fileData("out.txt") == "abcde", "written data should be stored");

    auto trunc = c.openWrite("in.txt", err);
    t.check(static_cast<bool>(trunc), "openWrite should truncate existing files");
    t.check(c.fileData("in.txt").empty(), "truncated file should be empty");

    err.clear();
    t.check(!c.openRead("nope", err), "openRead on missing file should fail");
    t.check(!err.empty(), "openRead failure should carry an error");
    t.check(!c.openWrite("no/dir/file", err),
            "openWrite without parent dir should fail");
}

void test_connection_drop(TestContext &t) {
    skiff::MockSftpClient c;
    c.addFile("big.bin", "data");
    c.dropConnectionOn("big.bin");
    std::string err;
    t.check(c.connect(validOptions(), err), "connect should succeed");
    t.check(!c.openRead("big.bin", err), "opening a dropping path should fail");
    t.check(!c.isConnected(), "the connection should be gone afterwards");
    t.checkContains(err, "connection lost", "drop should be explained");
}

} // namespace

int main() {
    TestContext t;
    test_session_defaults(t);
    test_connect_validation(t);
    test_injected_connect_failure(t);
    test_disconnect_changes_state(t);
    test_list_children(t);
    test_stat_and_realpath(t);
    test_mkdir_and_remove(t);
    test_file_handles(t);
    test_connection_drop(t);

    if (t.failures != 0) {
        std::cerr << "[FAILURES] " << t.failures << "\n";
        return EXIT_FAILURE;
    }
    std::cout << "[OK] skiff_core_tests\n";
    return EXIT_SUCCESS;
}

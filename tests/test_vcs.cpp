#include <catch2/catch.hpp>
#include <trellis/vcs.hpp>
#include "test_helpers.hpp"

using namespace trellis;
using trellis::testing::TempDir;
using trellis::testing::git_available;
using trellis::testing::git_in;
namespace fs = std::filesystem;

static const std::string C1 = "645ef00459ed84a119197bfb8d8205042c6df63d";
static const std::string C2 = "42b84f9ec624953ecbf81a94feccb3f5935c5edf";
static const std::string C3 = "8e6902fdd0361e8fa30226b350e62973e3625ed5";

// ===== run_command() =====

TEST_CASE("run_command captures stdout and exit code", "[vcs]") {
    auto r = run_command({"echo", "hello"});
    REQUIRE(r.is_ok());
    REQUIRE(r.value().exit_code == 0);
    REQUIRE(r.value().stdout_str == "hello\n");

    auto f = run_command({"false"});
    REQUIRE(f.is_ok());
    REQUIRE(f.value().exit_code != 0);
}

TEST_CASE("run_command captures stderr", "[vcs]") {
    auto r = run_command({"sh", "-c", "echo err >&2"});
    REQUIRE(r.is_ok());
    REQUIRE(r.value().stderr_str.find("err") != std::string::npos);
}

TEST_CASE("run_command with working dir", "[vcs]") {
    TempDir td;
    auto r = run_command({"pwd"}, td.path.string());
    REQUIRE(r.is_ok());
    REQUIRE(r.value().stdout_str.find(td.path.filename().string()) != std::string::npos);
}

TEST_CASE("run_command errors", "[vcs]") {
    REQUIRE(run_command({}).error().code == TrellisError::InvalidArg);

    auto missing = run_command({"__trellis_nonexistent_binary__"});
    REQUIRE(missing.is_ok());
    REQUIRE(missing.value().exit_code == 127);
}

TEST_CASE("run_command times out", "[vcs]") {
    auto r = run_command({"sleep", "5"}, "", 1);
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == TrellisError::IO);
    REQUIRE(r.error().message.find("timed out") != std::string::npos);
}

// ===== parse_ref_listing() =====

TEST_CASE("parse empty ref listing", "[vcs]") {
    auto r = parse_ref_listing("");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().branches.empty());
    REQUIRE(r.value().tags.empty());
}

TEST_CASE("parse branches and tags", "[vcs]") {
    std::string output =
        C1 + "  refs/heads/master\n" +
        C2 + "  refs/heads/feature/x\n" +
        C1 + "  refs/tags/v0.8.0\n" +
        "0000000000000000000000000000000000000000 " + C3 + " refs/tags/v1.0.0\n" +
        C2 + "  refs/remotes/origin/master\n";

    auto r = parse_ref_listing(output);
    REQUIRE(r.is_ok());
    auto& st = r.value();
    REQUIRE(st.branches.size() == 2);
    REQUIRE(st.branches.at("master") == C1);
    REQUIRE(st.branches.at("feature/x") == C2);
    REQUIRE(st.tags.size() == 2);
    REQUIRE(st.tags.at("v0.8.0") == C1);
    // annotated tag resolves to the peeled commit
    REQUIRE(st.tags.at("v1.0.0") == C3);
}

TEST_CASE("parse malformed ref listing", "[vcs]") {
    auto r = parse_ref_listing("garbage\n");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == TrellisError::VcsQuery);
}

// ===== classify_checkout() =====

TEST_CASE("classify branch tip", "[vcs]") {
    RepoState st;
    st.head = C3;
    st.branches = {{"another-branch", C3}, {"master", C1}};
    st.tags = {{"v1.0.0", C3}};

    auto r = classify_checkout(st);
    REQUIRE(r.is_ok());
    REQUIRE(r.value() == Version::branch("another-branch").is(C3));
}

TEST_CASE("checked out branch wins over other tips", "[vcs]") {
    RepoState st;
    st.head = C1;
    st.current_branch = "zeta";
    st.branches = {{"alpha", C1}, {"zeta", C1}};

    REQUIRE(classify_checkout(st).value() == Version::branch("zeta").is(C1));

    st.current_branch.reset();
    REQUIRE(classify_checkout(st).value() == Version::branch("alpha").is(C1));
}

TEST_CASE("classify semver tag", "[vcs]") {
    RepoState st;
    st.head = C1;
    st.branches = {{"master", C2}};
    st.tags = {{"v0.8.0", C1}, {"nightly", C1}, {"v0.7.0", C1}, {"v9.9.9", C2}};

    auto r = classify_checkout(st);
    REQUIRE(r.is_ok());
    REQUIRE(r.value().kind() == Version::Tag);
    REQUIRE(r.value() == Version::tag("v0.8.0").is(C1));
}

TEST_CASE("classify semver tag with build metadata", "[vcs]") {
    RepoState st;
    st.head = C1;
    st.tags = {{"v1.0.0+build.5", C1}, {"v0.9.0", C1}};

    auto r = classify_checkout(st);
    REQUIRE(r.is_ok());
    REQUIRE(r.value() == Version::tag("v1.0.0+build.5").is(C1));
}

TEST_CASE("classify bare revision", "[vcs]") {
    RepoState st;
    st.head = C2;
    st.branches = {{"master", C1}};
    st.tags = {{"nightly", C2}};

    auto r = classify_checkout(st);
    REQUIRE(r.is_ok());
    REQUIRE(r.value() == Version::revision(C2));
}

TEST_CASE("classify without head fails", "[vcs]") {
    RepoState st;
    REQUIRE(classify_checkout(st).error().code == TrellisError::VcsQuery);
}

// ===== GitInspector =====

TEST_CASE("git inspector on a directory that is not a repository", "[vcs][git]") {
    if (!git_available()) {
        WARN("git not available; skipping");
        return;
    }

    TempDir td;
    GitInspector git(30);
    auto r = git.inspect(td.path);
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == TrellisError::VcsQuery);
}

TEST_CASE("git inspector reads head, branches and tags", "[vcs][git]") {
    if (!git_available()) {
        WARN("git not available; skipping");
        return;
    }

    TempDir td;
    fs::path repo = td.mkdir("repo");
    git_in(repo, {"init", "-q"});
    git_in(repo, {"symbolic-ref", "HEAD", "refs/heads/main"});
    td.write_file("repo/a.txt", "one");
    git_in(repo, {"add", "a.txt"});
    git_in(repo, {"commit", "-q", "-m", "first"});
    std::string first = git_in(repo, {"rev-parse", "HEAD"});
    git_in(repo, {"tag", "-a", "v0.8.0", "-m", "release"});
    td.write_file("repo/a.txt", "two");
    git_in(repo, {"commit", "-q", "-am", "second"});
    std::string second = git_in(repo, {"rev-parse", "HEAD"});
    REQUIRE_FALSE(first.empty());
    REQUIRE_FALSE(second.empty());

    GitInspector git(30);
    auto st = git.inspect(repo);
    REQUIRE(st.is_ok());
    REQUIRE(st.value().head == second);
    REQUIRE(st.value().current_branch == std::string("main"));
    REQUIRE(st.value().branches.at("main") == second);
    // annotated tag peeled to its commit
    REQUIRE(st.value().tags.at("v0.8.0") == first);
}

TEST_CASE("git inspector rejects a subdirectory of a repository", "[vcs][git]") {
    if (!git_available()) {
        WARN("git not available; skipping");
        return;
    }

    TempDir td;
    fs::path repo = td.mkdir("repo");
    git_in(repo, {"init", "-q"});
    td.write_file("repo/sub/file.txt", "x");
    git_in(repo, {"add", "."});
    git_in(repo, {"commit", "-q", "-m", "init"});

    GitInspector git(30);
    auto r = git.inspect(repo / "sub");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == TrellisError::VcsQuery);
}

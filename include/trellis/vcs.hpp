#pragma once

#include <trellis/result.hpp>
#include <trellis/version.hpp>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace trellis {

// Result of running an external command
struct CommandResult {
    int exit_code;
    std::string stdout_str;
    std::string stderr_str;
};

// Run an external command, capturing stdout and stderr.
// Returns error on fork/exec failure or timeout.
Result<CommandResult> run_command(const std::vector<std::string>& args,
                                  const std::string& working_dir = "",
                                  int timeout_seconds = 60);

// Local checkout state of a repository
struct RepoState {
    std::string head;                             // active commit
    std::optional<std::string> current_branch;    // unset when detached
    std::map<std::string, std::string> branches;  // local branch -> tip commit
    std::map<std::string, std::string> tags;      // tag -> peeled commit
};

// Parse `git for-each-ref --format='%(objectname) %(*objectname) %(refname)'`
// output. Annotated tags carry the peeled commit in the second column.
// Refs outside refs/heads/ and refs/tags/ are skipped.
Result<RepoState> parse_ref_listing(const std::string& output);

// Classify the checkout, most specific first: branch tip, then semver tag,
// then bare revision.
Result<Version> classify_checkout(const RepoState& state);

// Reads local repository state. Implementations must not touch the network.
class VcsInspector {
public:
    virtual ~VcsInspector() = default;
    virtual Result<RepoState> inspect(const std::filesystem::path& repo_dir) const = 0;
};

// VcsInspector backed by the git CLI
class GitInspector : public VcsInspector {
public:
    explicit GitInspector(int timeout_seconds = 60)
        : timeout_seconds_(timeout_seconds) {}

    Result<RepoState> inspect(const std::filesystem::path& repo_dir) const override;

    int timeout() const { return timeout_seconds_; }

private:
    Result<std::string> git(const std::filesystem::path& repo_dir,
                            const std::vector<std::string>& args) const;

    int timeout_seconds_;
};

} // namespace trellis

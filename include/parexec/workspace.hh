#pragma once

#include <chrono>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace parexec {

// Raised when a workspace cannot be created (e.g. the scratch filesystem is
// full), it is a host-level failure not attributable to the submitted code
class ResourceExhausted : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Exclusively owned scratch directory of a single request
class Workspace {
    std::string path_; // absolute, with trailing '/'
    std::string name_; // last path component
    bool released_ = false;

    friend class WorkspaceManager;

public:
    Workspace(std::string path, std::string name)
    : path_(std::move(path))
    , name_(std::move(name)) {
        if (path_.empty() or path_.back() != '/') {
            path_ += '/';
        }
    }

    Workspace(const Workspace&) = delete;
    Workspace(Workspace&&) noexcept = default;
    Workspace& operator=(const Workspace&) = delete;
    Workspace& operator=(Workspace&&) noexcept = default;

    ~Workspace() = default;

    [[nodiscard]] const std::string& path() const noexcept { return path_; }

    [[nodiscard]] const std::string& name() const noexcept { return name_; }

    // Returns absolute path of file @p filename inside the workspace
    [[nodiscard]] std::string file(std::string_view filename) const {
        std::string res = path_;
        res += filename;
        return res;
    }

    [[nodiscard]] bool released() const noexcept { return released_; }
};

class WorkspaceManager {
protected:
    static void mark_released(Workspace& ws) noexcept { ws.released_ = true; }

public:
    WorkspaceManager() = default;
    WorkspaceManager(const WorkspaceManager&) = delete;
    WorkspaceManager(WorkspaceManager&&) = delete;
    WorkspaceManager& operator=(const WorkspaceManager&) = delete;
    WorkspaceManager& operator=(WorkspaceManager&&) = delete;

    virtual ~WorkspaceManager() = default;

    // Creates a new uniquely named workspace. Throws ResourceExhausted on
    // failure
    virtual Workspace acquire() = 0;

    // Removes the workspace recursively. Idempotent: releasing an already
    // released or vanished workspace is a no-op. Failures are logged
    virtual void release(Workspace& ws) noexcept = 0;
};

// Keeps workspaces as directories under a scratch root
class DiskWorkspaceManager : public WorkspaceManager {
    std::string scratch_root_; // with trailing '/'

public:
    static constexpr std::string_view NAME_PREFIX = "parexec.";

    // Creates @p scratch_root if it does not exist. Throws std::runtime_error
    // on failure
    explicit DiskWorkspaceManager(std::string scratch_root);

    [[nodiscard]] const std::string& scratch_root() const noexcept { return scratch_root_; }

    Workspace acquire() override;

    void release(Workspace& ws) noexcept override;

    /**
     * @brief Removes workspaces left behind (e.g. by a crashed process)
     * @details Only entries named with NAME_PREFIX that were last modified
     *   more than @p max_age ago are removed.
     *
     * @return number of removed workspaces
     *
     * @errors Throws std::runtime_error if the scratch root cannot be read,
     *   failures to remove single entries are logged
     */
    size_t sweep_stale(std::chrono::seconds max_age) const;
};

// Releases the held workspace exactly once, on every path out of the scope
class WorkspaceGuard {
    WorkspaceManager& manager_;
    Workspace workspace_;

public:
    WorkspaceGuard(WorkspaceManager& manager, Workspace ws)
    : manager_(manager)
    , workspace_(std::move(ws)) {}

    WorkspaceGuard(const WorkspaceGuard&) = delete;
    WorkspaceGuard(WorkspaceGuard&&) = delete;
    WorkspaceGuard& operator=(const WorkspaceGuard&) = delete;
    WorkspaceGuard& operator=(WorkspaceGuard&&) = delete;

    [[nodiscard]] const Workspace& workspace() const noexcept { return workspace_; }

    ~WorkspaceGuard() {
        if (not workspace_.released()) {
            manager_.release(workspace_);
        }
    }
};

} // namespace parexec

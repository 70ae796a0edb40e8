#pragma once

#include <execbox/common/class_traits.hpp>
#include <execbox/common/error_types.hpp>
#include <execbox/common/memory_size.hpp>
#include <execbox/execution/execution_request.hpp>
#include <execbox/execution/execution_result.hpp>
#include <execbox/runners/runner_registry.hpp>
#include <execbox/sandbox/admission_gate.hpp>
#include <execbox/sandbox/resource_limiter.hpp>

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace execbox {

/// Anything that turns an ExecutionRequest into an ExecutionResult
class Executor
{
public:
    virtual ~Executor() = default;

    /// Must always produce a result; implementations may still throw on internal faults,
    /// which callers running batches are expected to contain
    virtual ExecutionResult execute(const ExecutionRequest& request) = 0;
};

struct SandboxConfig
{
    /// Parent directory of the per-run working directories
    std::filesystem::path workspace_root = std::filesystem::temp_directory_path() / "execbox";

    LimiterConfig limiter;

    /// Cap on captured bytes per stream; the rest is read and discarded
    std::size_t max_output_bytes = 1 * MIB;

    bool isolate_network = false;
};

/// Runs one untrusted program to completion or forced termination, under isolation.
///
/// Each run gets a fresh workspace, a limiter, and a child process supervised from the calling
/// thread. Everything is torn down before ``execute`` returns, on every path.
class ExecutionSandbox : public Executor, NonMovable
{
public:
    ExecutionSandbox(SandboxConfig config, const RunnerRegistry& runners, AdmissionGate& gate);

    /// Never throws; every failure is expressed in the result
    ExecutionResult execute(const ExecutionRequest& request) override;

    const SandboxConfig& config() const { return config_; }

private:
    ExecutionResult run(const ExecutionRequest& request);

    SandboxConfig config_;
    const RunnerRegistry* runners_;
    AdmissionGate* gate_;
};

/// Environment of every sandboxed process. Nothing from the engine's environment is passed on.
std::vector<std::string> sandbox_environment(const std::filesystem::path& working_dir);

} // namespace execbox

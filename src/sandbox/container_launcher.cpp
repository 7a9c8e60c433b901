#include "sandbox/container_launcher.hpp"

#include <filesystem>
#include <string>
#include <system_error>

#include "sandbox/path_guard.hpp"
#include "sandbox/sandbox_error.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace ilbox::sandbox {
namespace {

// Exit status the engine CLI uses for its own failures (daemon, image, flags).
constexpr int kEngineErrorStatus = 125;
constexpr int kKilledStatus = 128 + 9;

// Reads the program from stdin. When its last statement is a bare expression
// other than a print() call, that statement becomes print(repr(...)). Source
// that does not parse is compiled as-is so the usual SyntaxError is reported.
constexpr const char* kEchoLastExprRunner = R"PY(import ast, sys, traceback
source = sys.stdin.read()
try:
    tree = ast.parse(source, "<stdin>")
except SyntaxError:
    tree = None
if tree is not None and tree.body and isinstance(tree.body[-1], ast.Expr):
    last = tree.body[-1]
    call = last.value
    if not (isinstance(call, ast.Call) and isinstance(call.func, ast.Name) and call.func.id == "print"):
        wrapped = ast.Call(ast.Name("repr", ast.Load()), [call], [])
        last.value = ast.Call(ast.Name("print", ast.Load()), [wrapped], [])
        ast.fix_missing_locations(tree)
try:
    code = compile(tree if tree is not None else source, "<stdin>", "exec")
except SyntaxError:
    traceback.print_exc(limit=0)
    sys.exit(1)
del ast, tree, source
try:
    exec(code, {"__name__": "__main__", "__builtins__": __builtins__})
except SystemExit:
    raise
except BaseException:
    kind, error, trace = sys.exc_info()
    traceback.print_exception(kind, error, trace.tb_next)
    sys.exit(1)
)PY";

std::string RemediationHint(const std::string& engine_error) {
    const auto lowered = utils::ToLower(engine_error);
    if (lowered.find("unable to find image") != std::string::npos ||
        lowered.find("no such image") != std::string::npos ||
        lowered.find("pull access denied") != std::string::npos) {
        return "image not pulled";
    }
    if (lowered.find("cannot connect") != std::string::npos ||
        lowered.find("daemon") != std::string::npos) {
        return "is the container daemon running?";
    }
    return "check the container engine";
}

}  // namespace

ContainerLauncher::ContainerLauncher(const ContainerRuntime& runtime, LauncherOptions options)
    : runtime_(runtime)
    , options_(options) {}

LaunchSpec ContainerLauncher::BuildLaunchSpec(const Sandbox& sandbox,
                                              const ExecutionRequest& request,
                                              const std::string& container_name) const {
    const auto host_workdir = PathGuard::Resolve(sandbox.root, request.workdir);
    std::error_code ec;
    if (!std::filesystem::is_directory(host_workdir, ec)) {
        throw SandboxError(ErrorCode::kPathNotFound, "working directory does not exist: " + request.workdir);
    }
    const auto rel = PathGuard::Relative(sandbox.root, host_workdir);

    LaunchSpec spec{};
    spec.name = container_name;
    spec.mount_source = sandbox.root;
    spec.mount_target = kContainerWorkspace;
    spec.workdir = rel == "." ? std::string(kContainerWorkspace)
                              : std::string(kContainerWorkspace) + "/" + rel;
    spec.network = false;
    spec.interactive = true;
    spec.limits = request.limits;
    spec.env.emplace_back("PYTHONPATH", std::string(kContainerWorkspace) + "/" + kPackagesDir);
    if (options_.echo_last_expr) {
        spec.command = {"python", "-c", kEchoLastExprRunner};
    } else {
        spec.command = {"python", "-"};
    }
    return spec;
}

ExecutionResult ContainerLauncher::Run(const Sandbox& sandbox, const ExecutionRequest& request) const {
    if (options_.ensure_image) {
        runtime_.EnsureImage(true);
    }

    const auto name = ContainerRuntime::NewContainerName("ilbox-run");
    const auto spec = BuildLaunchSpec(sandbox, request, name);
    const auto args = runtime_.BuildRunArgs(spec);

    CommandOptions options;
    options.timeout = request.timeout;
    options.input = request.code;
    options.max_output_bytes = options_.max_output_bytes;

    utils::LogInfo("launcher", "run user=" + sandbox.user_id + " container=" + name +
                   " timeout=" + std::to_string(request.timeout.count()) + "s");
    ExecutionResult result{};
    try {
        result = runtime_.Exec(args, options);
    } catch (const SandboxError&) {
        runtime_.RemoveContainer(name);
        throw;
    }

    if (!result.timed_out && result.exit_code == kEngineErrorStatus) {
        runtime_.RemoveContainer(name);
        const auto message = utils::Trim(result.error);
        utils::LogError("launcher", "engine error user=" + sandbox.user_id + ": " + message);
        throw SandboxError(ErrorCode::kInfrastructure,
                           "container engine failed (" + RemediationHint(message) + "): " + message);
    }

    if (!result.timed_out) {
        result.resource_exceeded = runtime_.WasOomKilled(name) || result.exit_code == kKilledStatus;
    }
    runtime_.RemoveContainer(name);

    utils::LogInfo("launcher", "done user=" + sandbox.user_id + " exit=" + std::to_string(result.exit_code) +
                   (result.timed_out ? " timed_out" : "") +
                   (result.resource_exceeded ? " resource_exceeded" : "") +
                   " elapsed=" + std::to_string(result.elapsed.count()) + "ms");
    return result;
}

}  // namespace ilbox::sandbox

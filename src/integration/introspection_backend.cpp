#include <devscope/integration/introspection_backend.h>
#include <devscope/integration/process_runner.h>

#include <spdlog/spdlog.h>

namespace devscope::integration {

Result<AnalysisReport> AnalysisReport::fromJson(const json& j) {
    if (!j.is_object()) {
        return Error{ErrorCode::InvalidData, "Analyzer report must be a JSON object"};
    }
    AnalysisReport report;
    if (auto it = j.find("summary"); it != j.end() && it->is_string()) {
        report.summary = it->get<std::string>();
    }
    if (auto it = j.find("data"); it != j.end()) {
        report.data = *it;
    }
    if (auto it = j.find("itemCount"); it != j.end() && it->is_number_unsigned()) {
        report.itemCount = it->get<std::size_t>();
    } else if (it != j.end() && it->is_number_integer() && it->get<long long>() >= 0) {
        report.itemCount = static_cast<std::size_t>(it->get<long long>());
    } else if (report.data.is_array() || report.data.is_object()) {
        report.itemCount = report.data.size();
    }
    return report;
}

CommandIntrospectionBackend::CommandIntrospectionBackend(std::string commandLine,
                                                         std::filesystem::path projectRoot,
                                                         std::chrono::milliseconds timeout)
    : commandLine_(std::move(commandLine)),
      projectRoot_(std::move(projectRoot)),
      timeout_(timeout) {}

Result<AnalysisReport> CommandIntrospectionBackend::query(const AnalysisQuery& query) {
    auto spec = makeCommandSpec(commandLine_, {query.kind});
    if (!spec) {
        return Error{ErrorCode::NotSupported, "Analyzer command is not configured"};
    }
    auto processSpec = std::move(spec).value();
    processSpec.stdinData = query.arguments.dump();
    processSpec.timeout = timeout_;
    if (!projectRoot_.empty()) {
        processSpec.workdir = projectRoot_;
    }

    spdlog::debug("CommandIntrospectionBackend: running '{}' for {}", commandLine_, query.kind);
    auto run = ProcessRunner::run(processSpec);
    if (!run) {
        return run.error();
    }
    const auto& out = run.value();
    if (out.timedOut) {
        return Error{ErrorCode::Timeout, "Analyzer timed out after " +
                                             std::to_string(timeout_.count()) + " ms"};
    }
    if (out.exitCode != 0) {
        return Error{ErrorCode::InternalError, "Analyzer failed for " + query.kind + " (exit " +
                                                   std::to_string(out.exitCode) +
                                                   "): " + out.stderrData};
    }
    auto parsed = json::parse(out.stdoutData, nullptr, false);
    if (parsed.is_discarded()) {
        return Error{ErrorCode::InvalidData, "Analyzer returned malformed JSON for " + query.kind};
    }
    return AnalysisReport::fromJson(parsed);
}

Result<AnalysisReport> UnavailableIntrospectionBackend::query(const AnalysisQuery& query) {
    return Error{ErrorCode::NotSupported, "No analyzer configured for " + query.kind +
                                              " (set analyzer.command or --analyzer-command)"};
}

} // namespace devscope::integration

#pragma once

#include <devscope/core/types.h>

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>

namespace devscope::integration {

using json = nlohmann::json;

struct AnalysisQuery {
    std::string kind; // the tool name, e.g. "get_database_schema"
    json arguments = json::object();
};

struct AnalysisReport {
    std::string summary;
    std::size_t itemCount = 0;
    json data;

    static Result<AnalysisReport> fromJson(const json& j);
};

// Codebase, schema and API analyzers live behind this boundary
class IIntrospectionBackend {
public:
    virtual ~IIntrospectionBackend() = default;
    virtual Result<AnalysisReport> query(const AnalysisQuery& query) = 0;
};

/**
 * Runs `<command> <kind>` in the project root with the arguments JSON on stdin and reads one
 * report object {summary, itemCount, data} from stdout.
 */
class CommandIntrospectionBackend : public IIntrospectionBackend {
public:
    CommandIntrospectionBackend(std::string commandLine, std::filesystem::path projectRoot,
                                std::chrono::milliseconds timeout);

    Result<AnalysisReport> query(const AnalysisQuery& query) override;

private:
    std::string commandLine_;
    std::filesystem::path projectRoot_;
    std::chrono::milliseconds timeout_;
};

class UnavailableIntrospectionBackend : public IIntrospectionBackend {
public:
    Result<AnalysisReport> query(const AnalysisQuery& query) override;
};

} // namespace devscope::integration

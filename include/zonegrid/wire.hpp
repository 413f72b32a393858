#pragma once

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "zonegrid/algorithm_registry.hpp"
#include "zonegrid/problem.hpp"

namespace zonegrid {

// Request sent to an out-of-process algorithm runner.
struct RunRequest {
    std::string algorithm_id;
    GridProblem problem;
    std::optional<RunOptions> options;
};

// snake_case JSON shapes. Non-finite multipliers are written as 1 and an
// infinite cost as null. Decoding a problem validates it (InvalidProblem).
void to_json(nlohmann::json& j, const Bounds& b);
void from_json(const nlohmann::json& j, Bounds& b);

void to_json(nlohmann::json& j, const GridProblem& p);
void from_json(const nlohmann::json& j, GridProblem& p);

void to_json(nlohmann::json& j, const RunOptions& o);
void from_json(const nlohmann::json& j, RunOptions& o);

void to_json(nlohmann::json& j, const RunRequest& r);
void from_json(const nlohmann::json& j, RunRequest& r);

void to_json(nlohmann::json& j, const RunResponse& r);
void from_json(const nlohmann::json& j, RunResponse& r);

void to_json(nlohmann::json& j, const AlgorithmInfo& info);
void from_json(const nlohmann::json& j, AlgorithmInfo& info);

// Parse helpers that report malformed JSON as InvalidProblem.
RunRequest parse_run_request(const std::string& text);
RunResponse parse_run_response(const std::string& text);

} // namespace zonegrid

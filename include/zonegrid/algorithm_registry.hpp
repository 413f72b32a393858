#pragma once

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "zonegrid/problem.hpp"

namespace zonegrid {

struct AlgorithmInfo {
    std::string id;
    std::string name;
    std::string description;
};

// Pathfinding plugin. run() must be a pure function of its arguments and must
// not write to the problem arrays.
class Algorithm {
public:
    virtual ~Algorithm() = default;

    virtual AlgorithmInfo info() const = 0;
    virtual AlgorithmResult run(const GridProblem& problem, const RunOptions& options) const = 0;
};

using AlgorithmFn = std::function<AlgorithmResult(const GridProblem&, const RunOptions&)>;

std::unique_ptr<Algorithm> make_algorithm(AlgorithmInfo info, AlgorithmFn fn);

struct RunResponse {
    std::vector<CellId> path;
    std::vector<CellId> visited;
    long long expanded = 0;
    double cost = 0.0;
    double runtime_ms = 0.0;
};

// Start-time registration table keyed by algorithm id. Read-only once
// populated, so concurrent run() calls are safe.
class AlgorithmRegistry {
public:
    AlgorithmRegistry() = default;

    AlgorithmRegistry(const AlgorithmRegistry&) = delete;
    AlgorithmRegistry& operator=(const AlgorithmRegistry&) = delete;
    AlgorithmRegistry(AlgorithmRegistry&&) = default;
    AlgorithmRegistry& operator=(AlgorithmRegistry&&) = default;

    // Throws std::invalid_argument on a null plugin or a duplicate id.
    void add(std::unique_ptr<Algorithm> algorithm);

    const Algorithm* find(const std::string& id) const;
    std::vector<AlgorithmInfo> list() const;   // sorted by id
    size_t size() const { return algorithms_.size(); }

    // Validates the problem, times the call and normalises visited. Throws
    // UnknownAlgorithm, InvalidProblem, or AlgorithmFault if the plugin throws.
    RunResponse run(const std::string& id, const GridProblem& problem,
                    const RunOptions& options = {}) const;

private:
    std::map<std::string, std::unique_ptr<Algorithm>> algorithms_;
};

} // namespace zonegrid

#include "zonegrid/algorithm_registry.hpp"

#include <chrono>
#include <stdexcept>

#include "zonegrid/errors.hpp"
#include "zonegrid/log.hpp"

namespace zonegrid {

namespace {
class FunctionAlgorithm : public Algorithm {
public:
    FunctionAlgorithm(AlgorithmInfo info, AlgorithmFn fn)
        : info_(std::move(info)), fn_(std::move(fn)) {}

    AlgorithmInfo info() const override { return info_; }
    AlgorithmResult run(const GridProblem& problem, const RunOptions& options) const override {
        return fn_(problem, options);
    }

private:
    AlgorithmInfo info_;
    AlgorithmFn fn_;
};
}

std::unique_ptr<Algorithm> make_algorithm(AlgorithmInfo info, AlgorithmFn fn) {
    if (!fn) throw std::invalid_argument("Algorithm " + info.id + " has no run function");
    return std::make_unique<FunctionAlgorithm>(std::move(info), std::move(fn));
}

void AlgorithmRegistry::add(std::unique_ptr<Algorithm> algorithm) {
    if (!algorithm) throw std::invalid_argument("Cannot register a null algorithm");
    std::string id = algorithm->info().id;
    if (id.empty()) throw std::invalid_argument("Algorithm id must not be empty");
    if (algorithms_.count(id)) throw std::invalid_argument("Duplicate algorithm id: " + id);
    algorithms_.emplace(std::move(id), std::move(algorithm));
}

const Algorithm* AlgorithmRegistry::find(const std::string& id) const {
    auto it = algorithms_.find(id);
    return it == algorithms_.end() ? nullptr : it->second.get();
}

std::vector<AlgorithmInfo> AlgorithmRegistry::list() const {
    std::vector<AlgorithmInfo> out;
    out.reserve(algorithms_.size());
    for (const auto& [id, algo] : algorithms_) out.push_back(algo->info());
    return out;
}

RunResponse AlgorithmRegistry::run(const std::string& id, const GridProblem& problem,
                                   const RunOptions& options) const {
    const Algorithm* algo = find(id);
    if (!algo) throw UnknownAlgorithm(id);
    validate(problem);

    auto logger = log::get();
    logger->debug("Running {} on {}x{} grid, start {} goal {}",
                  id, problem.width, problem.height, problem.start, problem.goal);

    AlgorithmResult result;
    auto t0 = std::chrono::steady_clock::now();
    try {
        result = algo->run(problem, options);
    } catch (const std::exception& e) {
        logger->warn("Algorithm {} threw: {}", id, e.what());
        throw AlgorithmFault(id, e.what());
    } catch (...) {
        logger->warn("Algorithm {} threw a non-standard exception", id);
        throw AlgorithmFault(id, "unknown exception");
    }
    auto t1 = std::chrono::steady_clock::now();

    RunResponse response;
    response.path = std::move(result.path);
    response.expanded = result.expanded;
    response.cost = result.cost;
    response.runtime_ms = std::chrono::duration<double, std::milli>(t1 - t0).count();

    if (options.return_visited) {
        response.visited = std::move(result.visited);
        const size_t cap = options.max_visited > 0 ? static_cast<size_t>(options.max_visited) : 0;
        if (response.visited.size() > cap) response.visited.resize(cap);
    }

    logger->debug("{} finished in {:.2f} ms: {} expanded, path {} cells",
                  id, response.runtime_ms, response.expanded, response.path.size());
    return response;
}

} // namespace zonegrid

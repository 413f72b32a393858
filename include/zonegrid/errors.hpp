#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace zonegrid {

// Requested grid exceeds the configured cell cap. Raised by check_cell_cap,
// never by the rasterizer itself.
class InputTooLarge : public std::length_error {
public:
    InputTooLarge(size_t cells, size_t cap)
        : std::length_error("Grid too large (" + std::to_string(cells) +
                            " cells, cap " + std::to_string(cap) +
                            "). Shrink the planning area or increase the resolution.")
        , cells_(cells)
        , cap_(cap) {}

    size_t cells() const { return cells_; }
    size_t cap() const { return cap_; }

private:
    size_t cells_;
    size_t cap_;
};

class OutOfBounds : public std::out_of_range {
public:
    using std::out_of_range::out_of_range;
};

enum class Endpoint { Start, Goal };

class BlockedEndpoint : public std::runtime_error {
public:
    explicit BlockedEndpoint(Endpoint which)
        : std::runtime_error(which == Endpoint::Start
                                 ? "Start is inside a no-fly region"
                                 : "Goal is inside a no-fly region")
        , which_(which) {}

    Endpoint which() const { return which_; }

private:
    Endpoint which_;
};

class InvalidProblem : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

class UnknownAlgorithm : public std::out_of_range {
public:
    explicit UnknownAlgorithm(const std::string& id)
        : std::out_of_range("Unknown algorithm_id: " + id) {}
};

// A plugin threw. Its result must not be trusted.
class AlgorithmFault : public std::runtime_error {
public:
    AlgorithmFault(const std::string& id, const std::string& what)
        : std::runtime_error("Algorithm " + id + " crashed: " + what)
        , algorithm_id_(id) {}

    const std::string& algorithm_id() const { return algorithm_id_; }

private:
    std::string algorithm_id_;
};

class SceneError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

} // namespace zonegrid

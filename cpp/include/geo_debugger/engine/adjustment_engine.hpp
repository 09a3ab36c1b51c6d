#pragma once

#include "engine.hpp"
#include "../problem/problem.hpp"
#include "../random/rng.hpp"
#include <memory>
#include <vector>

namespace geo_debugger {

// Parallel random-adjustment generator.
//
// Every cycle each of worker_count candidates starts from the current best
// point set and moves every point by up to its worker's magnitude, scaled by
// how much error the point carries. The best candidate replaces the current
// state only if it strictly lowers the total error, so error() never grows.
// Worker RNGs are split before the parallel section: results do not depend
// on the OpenMP thread count.
class AdjustmentEngine : public Engine {
public:
    // Upper bound on worker_count; also keeps the OpenMP loop index in range
    static constexpr size_t kMaxWorkers = size_t{1} << 20;
    // Upper bound on worker_count * num_points held in candidate buffers
    static constexpr size_t kMaxCandidatePoints = size_t{1} << 26;

    // Throws std::invalid_argument for a null problem or a worker count of 0
    // or above kMaxWorkers, std::length_error when the candidate buffers
    // would exceed kMaxCandidatePoints.
    AdjustmentEngine(std::shared_ptr<const Problem> problem, size_t worker_count, bool verbose = false);

    [[nodiscard]] Magnitudes bake_magnitudes(double max_adjustment) const override;

    void cycle(const Magnitudes& magnitudes) override;

    [[nodiscard]] Figure materialize(const FigureTemplate& figure) const override;

    [[nodiscard]] double error() const override { return error_; }
    [[nodiscard]] uint64_t iteration() const override { return iteration_; }

    [[nodiscard]] EnginePtr clone() const override;

    [[nodiscard]] size_t worker_count() const { return worker_count_; }
    [[nodiscard]] const std::vector<Vec2>& points() const { return points_; }

private:
    std::shared_ptr<const Problem> problem_;
    size_t worker_count_;
    bool verbose_;

    RNG rng_;
    std::vector<Vec2> points_;
    std::vector<double> point_errors_;
    double error_{0.0};
    uint64_t iteration_{0};

    // Per-worker scratch buffers, reused across cycles
    std::vector<std::vector<Vec2>> candidates_;
    std::vector<double> candidate_errors_;
    std::vector<RNG> worker_rngs_;

    void adjust_candidate(size_t worker, double magnitude);
};

}  // namespace geo_debugger

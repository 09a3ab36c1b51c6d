#include "geo_debugger/engine/adjustment_engine.hpp"
#include <algorithm>
#include <iostream>
#include <stdexcept>
#include <string>

#ifdef _OPENMP
#include <omp.h>
#endif

namespace geo_debugger {

AdjustmentEngine::AdjustmentEngine(std::shared_ptr<const Problem> problem, size_t worker_count, bool verbose)
    : problem_(std::move(problem))
    , worker_count_(worker_count)
    , verbose_(verbose)
{
    if (!problem_) {
        throw std::invalid_argument("AdjustmentEngine: problem is null");
    }
    if (worker_count_ == 0) {
        throw std::invalid_argument("AdjustmentEngine: worker count must be positive");
    }
    if (worker_count_ > kMaxWorkers) {
        throw std::invalid_argument(
            "AdjustmentEngine: worker count " + std::to_string(worker_count_) +
            " exceeds " + std::to_string(kMaxWorkers));
    }
    const size_t n_points = std::max<size_t>(problem_->num_points(), 1);
    if (worker_count_ > kMaxCandidatePoints / n_points) {
        throw std::length_error(
            "AdjustmentEngine: " + std::to_string(worker_count_) + " workers x " +
            std::to_string(problem_->num_points()) + " points exceeds the candidate budget");
    }

    rng_ = RNG(problem_->flags().seed);

    // Initial placement: uniform in the unit square
    points_.resize(problem_->num_points());
    for (auto& p : points_) {
        p.x = rng_.uniform();
        p.y = rng_.uniform();
    }
    error_ = problem_->error(points_, point_errors_);

    candidates_.assign(worker_count_, points_);
    candidate_errors_.assign(worker_count_, 0.0);
}

Magnitudes AdjustmentEngine::bake_magnitudes(double max_adjustment) const {
    Magnitudes magnitudes(worker_count_);
    double n = static_cast<double>(worker_count_);
    for (size_t i = 0; i < worker_count_; ++i) {
        magnitudes[i] = max_adjustment * static_cast<double>(i + 1) / n;
    }
    return magnitudes;
}

void AdjustmentEngine::adjust_candidate(size_t worker, double magnitude) {
    auto& candidate = candidates_[worker];
    RNG& rng = worker_rngs_[worker];
    const bool bounded = problem_->flags().point_bounds;

    candidate = points_;
    for (size_t i = 0; i < candidate.size(); ++i) {
        // Points carrying more error move further
        double e = point_errors_[i];
        double weight = e / (1.0 + e);
        candidate[i].x += magnitude * weight * rng.uniform(-1.0, 1.0);
        candidate[i].y += magnitude * weight * rng.uniform(-1.0, 1.0);
        if (bounded) {
            candidate[i].x = std::clamp(candidate[i].x, 0.0, 1.0);
            candidate[i].y = std::clamp(candidate[i].y, 0.0, 1.0);
        }
    }
    candidate_errors_[worker] = problem_->error(candidate);
}

void AdjustmentEngine::cycle(const Magnitudes& magnitudes) {
    if (magnitudes.size() != worker_count_) {
        throw std::invalid_argument("AdjustmentEngine::cycle: magnitudes size mismatch");
    }

    // Split RNGs sequentially so the parallel section stays deterministic
    worker_rngs_.clear();
    worker_rngs_.reserve(worker_count_);
    for (size_t w = 0; w < worker_count_; ++w) {
        worker_rngs_.push_back(rng_.split());
    }

    const int n_workers = static_cast<int>(worker_count_);
    #ifdef _OPENMP
    #pragma omp parallel for schedule(static)
    #endif
    for (int w = 0; w < n_workers; ++w) {
        adjust_candidate(static_cast<size_t>(w), magnitudes[static_cast<size_t>(w)]);
    }

    size_t best = 0;
    for (size_t w = 1; w < worker_count_; ++w) {
        if (candidate_errors_[w] < candidate_errors_[best]) {
            best = w;
        }
    }

    if (candidate_errors_[best] < error_) {
        points_.swap(candidates_[best]);
        error_ = problem_->error(points_, point_errors_);
        if (verbose_) {
            std::cout << "[AdjustmentEngine] iter=" << iteration_ + 1
                      << " worker=" << best
                      << " error=" << error_ << "\n";
        }
    }

    ++iteration_;
}

Figure AdjustmentEngine::materialize(const FigureTemplate& figure) const {
    return materialize_template(figure, points_);
}

EnginePtr AdjustmentEngine::clone() const {
    return std::make_unique<AdjustmentEngine>(*this);
}

}  // namespace geo_debugger

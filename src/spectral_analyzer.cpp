#include "spectral_analyzer.hpp"
#include <Eigen/Eigenvalues>
#include <Eigen/SparseCholesky>
#include <algorithm>
#include <cmath>
#include <deque>

SpectralAnalyzer::SpectralAnalyzer(const GraphConfig& config)
    : config_(config) {}

Eigen::SparseMatrix<double> SpectralAnalyzer::laplacian(const CompactGraph& graph) {
    const auto n = static_cast<Eigen::Index>(graph.size());
    std::vector<Eigen::Triplet<double>> triplets;
    std::vector<double> degree(graph.size(), 0.0);

    for (size_t i = 0; i < graph.size(); ++i) {
        for (const auto& arc : graph.out[i]) {
            auto a = static_cast<Eigen::Index>(i);
            auto b = static_cast<Eigen::Index>(arc.target);
            // Duplicates are summed by setFromTriplets, which folds A->B and B->A together
            triplets.emplace_back(a, b, -arc.weight);
            triplets.emplace_back(b, a, -arc.weight);
            degree[i] += arc.weight;
            degree[arc.target] += arc.weight;
        }
    }
    for (size_t i = 0; i < graph.size(); ++i) {
        auto idx = static_cast<Eigen::Index>(i);
        triplets.emplace_back(idx, idx, degree[i]);
    }

    Eigen::SparseMatrix<double> L(n, n);
    L.setFromTriplets(triplets.begin(), triplets.end());
    return L;
}

int SpectralAnalyzer::countComponents(const CompactGraph& graph) {
    const size_t n = graph.size();
    std::vector<bool> seen(n, false);
    int count = 0;

    for (size_t root = 0; root < n; ++root) {
        if (seen[root]) {
            continue;
        }
        ++count;
        std::deque<size_t> queue{root};
        seen[root] = true;
        while (!queue.empty()) {
            size_t v = queue.front();
            queue.pop_front();
            for (const auto* arcs : {&graph.out[v], &graph.in[v]}) {
                for (const auto& arc : *arcs) {
                    if (!seen[arc.target]) {
                        seen[arc.target] = true;
                        queue.push_back(arc.target);
                    }
                }
            }
        }
    }
    return count;
}

double SpectralAnalyzer::snap(double eigenvalue) const {
    return std::fabs(eigenvalue) < config_.zeroEigenvalueEpsilon ? 0.0 : eigenvalue;
}

SpectralResult SpectralAnalyzer::analyze(const CompactGraph& graph) const {
    SpectralResult result;
    result.componentCount = countComponents(graph);

    // One node has no second eigenvalue; several components give a repeated zero
    if (graph.size() < 2 || result.componentCount > 1) {
        return result;
    }

    Eigen::SparseMatrix<double> L = laplacian(graph);
    if (graph.size() <= config_.denseEigenLimit) {
        result = solveDense(L);
    } else {
        result = solveSparse(L);
    }
    result.componentCount = 1;
    return result;
}

SpectralResult SpectralAnalyzer::solveDense(const Eigen::SparseMatrix<double>& L) const {
    SpectralResult result;
    Eigen::MatrixXd dense = L.toDense();
    Eigen::SelfAdjointEigenSolver<Eigen::MatrixXd> solver(dense, Eigen::EigenvaluesOnly);

    if (solver.info() != Eigen::Success) {
        result.approximate = true;
        return result;
    }

    // Eigenvalues come back in ascending order
    const auto& values = solver.eigenvalues();
    double smallest = snap(values(0));
    double second = snap(values(1));
    result.fiedlerValue = std::max(0.0, second);
    result.spectralGap = std::max(0.0, second - smallest);
    return result;
}

/**
 * @brief Second-smallest eigenvalue of a large connected Laplacian
 *
 * Inverse iteration with a sparse LDL^T factorization of L + eps*I. The
 * constant vector spans the null space of a connected Laplacian, so it is
 * projected out after every solve and the iteration settles on lambda_2.
 * The eigenvalue is the Rayleigh quotient x'Lx of the unit iterate.
 */
SpectralResult SpectralAnalyzer::solveSparse(const Eigen::SparseMatrix<double>& L) const {
    SpectralResult result;
    const Eigen::Index n = L.rows();

    double maxDegree = 0.0;
    for (Eigen::Index i = 0; i < n; ++i) {
        maxDegree = std::max(maxDegree, L.coeff(i, i));
    }

    // Small enough to keep lambda_2 dominant, large enough for a stable factorization
    const double epsilon = 1e-8 * std::max(1.0, maxDegree);
    Eigen::SparseMatrix<double> shifted = L;
    for (Eigen::Index i = 0; i < n; ++i) {
        shifted.coeffRef(i, i) += epsilon;
    }

    Eigen::SimplicialLDLT<Eigen::SparseMatrix<double>> solver;
    solver.compute(shifted);
    if (solver.info() != Eigen::Success) {
        result.approximate = true;
        return result;
    }

    // Deterministic start vector, orthogonal to the constant vector
    Eigen::VectorXd x(n);
    for (Eigen::Index i = 0; i < n; ++i) {
        x(i) = static_cast<double>(i) - static_cast<double>(n - 1) / 2.0;
    }
    x.normalize();

    double lambda = x.dot(L * x);
    result.approximate = true;
    for (int iter = 1; iter <= config_.eigenMaxIterations; ++iter) {
        Eigen::VectorXd y = solver.solve(x);
        if (solver.info() != Eigen::Success) {
            break;
        }
        y.array() -= y.mean();
        double norm = y.norm();
        if (norm == 0.0) {
            break;
        }
        y /= norm;

        double next = y.dot(L * y);
        result.iterations = iter;
        bool done = std::fabs(next - lambda) < config_.eigenTolerance * std::max(1.0, std::fabs(next));
        lambda = next;
        x = std::move(y);
        if (done) {
            result.approximate = false;
            break;
        }
    }

    double second = snap(lambda);
    result.fiedlerValue = std::max(0.0, second);
    result.spectralGap = result.fiedlerValue;
    return result;
}

#pragma once

#include <vector>
#include <Eigen/Dense>
#include <Eigen/Sparse>
#include "graph_model.hpp"
#include "fusion_config.hpp"

struct SpectralResult {
    double fiedlerValue = 0.0;    // second-smallest Laplacian eigenvalue, 0 when disconnected
    double spectralGap = 0.0;     // second-smallest minus smallest
    int componentCount = 0;       // multiplicity of the zero eigenvalue
    bool approximate = false;     // iterative solver stopped at its cap or could not factor L
    int iterations = 0;
};

// Eigen-analysis of the combinatorial Laplacian L = D - A of the undirected,
// weighted view of the dependency graph.
class SpectralAnalyzer {
public:
    explicit SpectralAnalyzer(const GraphConfig& config);

    SpectralResult analyze(const CompactGraph& graph) const;

    static Eigen::SparseMatrix<double> laplacian(const CompactGraph& graph);
    static int countComponents(const CompactGraph& graph);

private:
    GraphConfig config_;

    SpectralResult solveDense(const Eigen::SparseMatrix<double>& L) const;
    SpectralResult solveSparse(const Eigen::SparseMatrix<double>& L) const;
    double snap(double eigenvalue) const;
};

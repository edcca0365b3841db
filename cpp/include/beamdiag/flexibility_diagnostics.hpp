/**
 * @file flexibility_diagnostics.hpp
 * @brief Conditioning analysis of the flexibility matrix.
 *
 * The flexibility matrix of a well-posed redundant system is symmetric
 * positive definite. It degenerates when two redundant supports nearly
 * coincide: their unit-load deflection columns become almost identical.
 * The eigenvector of the smallest eigenvalue then points at exactly those
 * supports, which is what this module reports.
 */

#pragma once

#include <Eigen/Dense>
#include <string>
#include <vector>

namespace beamdiag {

/**
 * @brief Participation of one redundant support in the weakest mode
 */
struct RedundantParticipation {
    std::string support;          ///< Support name
    double participation = 0.0;   ///< |eigenvector component|, normalized to max 1
};

/**
 * @brief Result of flexibility matrix diagnostics
 */
struct FlexibilityDiagnostics {
    /// Whether the matrix is rejected (rcond below threshold)
    bool is_singular = false;

    /// Reciprocal condition number in the 1-norm, 0 for an exactly singular matrix
    double rcond = 1.0;

    /// Smallest and largest eigenvalue of the symmetric part
    double min_eigenvalue = 0.0;
    double max_eigenvalue = 0.0;

    /// Participation of each redundant support in the weakest mode, largest first
    std::vector<RedundantParticipation> weakest_mode;

    /// Supports with significant participation in the weakest mode
    std::vector<std::string> involved_supports;

    std::string to_string() const;
};

/**
 * @brief Analyzer for flexibility matrices
 *
 * Usage:
 *   auto diag = FlexibilityAnalyzer::analyze(f, {"B", "C"}, 1e-7);
 *   if (diag.is_singular) {
 *       std::cerr << diag.to_string() << std::endl;
 *   }
 */
class FlexibilityAnalyzer {
public:
    /**
     * @brief Analyze a flexibility matrix
     * @param f Square flexibility matrix
     * @param supports Redundant support names, one per row
     * @param singular_rcond Matrices with rcond below this are flagged singular
     * @param participation_threshold Minimum normalized participation to be reported
     */
    static FlexibilityDiagnostics analyze(const Eigen::MatrixXd& f,
                                          const std::vector<std::string>& supports,
                                          double singular_rcond,
                                          double participation_threshold = 0.1);

    /**
     * @brief Reciprocal condition number 1 / (||f||_1 ||f^-1||_1)
     *
     * Computed from the explicit inverse; the matrices involved are small.
     */
    static double reciprocal_condition(const Eigen::MatrixXd& f);
};

} // namespace beamdiag

#include "beamdiag/flexibility_diagnostics.hpp"

#include <Eigen/Eigenvalues>
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace beamdiag {

std::string FlexibilityDiagnostics::to_string() const {
    std::ostringstream oss;
    oss << std::scientific << std::setprecision(3);

    oss << (is_singular ? "Flexibility matrix is singular" : "Flexibility matrix is well-conditioned")
        << " (rcond=" << rcond << ", eigenvalues in [" << min_eigenvalue
        << ", " << max_eigenvalue << "])";

    if (!weakest_mode.empty()) {
        oss << "\nWeakest mode participation:";
        oss << std::fixed << std::setprecision(3);
        for (const auto& p : weakest_mode) {
            oss << "\n  " << p.support << ": " << p.participation;
        }
    }
    return oss.str();
}

double FlexibilityAnalyzer::reciprocal_condition(const Eigen::MatrixXd& f) {
    if (f.size() == 0) return 1.0;

    Eigen::FullPivLU<Eigen::MatrixXd> lu(f);
    if (!lu.isInvertible()) return 0.0;

    Eigen::MatrixXd inv = lu.inverse();
    double norm_f = f.cwiseAbs().colwise().sum().maxCoeff();
    double norm_inv = inv.cwiseAbs().colwise().sum().maxCoeff();
    if (!(norm_f > 0.0) || !std::isfinite(norm_inv)) return 0.0;
    return 1.0 / (norm_f * norm_inv);
}

FlexibilityDiagnostics FlexibilityAnalyzer::analyze(const Eigen::MatrixXd& f,
                                                    const std::vector<std::string>& supports,
                                                    double singular_rcond,
                                                    double participation_threshold) {
    FlexibilityDiagnostics result;
    if (f.rows() == 0) return result;

    result.rcond = reciprocal_condition(f);
    result.is_singular = result.rcond < singular_rcond;

    // Maxwell reciprocity makes f symmetric up to quadrature error
    Eigen::MatrixXd sym = 0.5 * (f + f.transpose());
    Eigen::SelfAdjointEigenSolver<Eigen::MatrixXd> solver(sym);
    if (solver.info() != Eigen::Success) return result;

    const Eigen::VectorXd& eigenvalues = solver.eigenvalues();
    result.min_eigenvalue = eigenvalues(0);
    result.max_eigenvalue = eigenvalues(eigenvalues.size() - 1);

    Eigen::VectorXd mode = solver.eigenvectors().col(0).cwiseAbs();
    double max_component = mode.maxCoeff();
    if (max_component <= 0.0) return result;

    for (Eigen::Index i = 0; i < mode.size(); ++i) {
        RedundantParticipation p;
        p.support = i < static_cast<Eigen::Index>(supports.size())
            ? supports[static_cast<size_t>(i)] : std::to_string(i);
        p.participation = mode(i) / max_component;
        result.weakest_mode.push_back(p);
    }

    std::sort(result.weakest_mode.begin(), result.weakest_mode.end(),
        [](const RedundantParticipation& a, const RedundantParticipation& b) {
            return a.participation > b.participation;
        });

    for (const auto& p : result.weakest_mode) {
        if (p.participation >= participation_threshold) {
            result.involved_supports.push_back(p.support);
        }
    }

    return result;
}

} // namespace beamdiag

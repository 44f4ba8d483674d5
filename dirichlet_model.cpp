/*  dirichlet_model.cpp  --------------------------------------
 *  joint Dirichlet regression, common parametrisation:
 *      alpha_ij = exp( x_i · beta_j ),  x_i = (1, dims…)
 *  fitted by Fisher scoring on the full log-likelihood;
 *  predictions are expected compositions  alpha_ij / Σ_j alpha_ij
 * ----------------------------------------------------------- */
#include <algorithm>
#include <cmath>
#include <limits>
#include <memory>

#include "model_iface.hpp"

namespace feature_enhance {

namespace {

constexpr double ETA_CLIP  = 200.0;     // keeps exp(eta) finite
constexpr double RIDGE     = 1e-8;      // Fisher info floor
constexpr int    MAX_HALVE = 40;

/* ψ(x): recurrence up to 6, then the asymptotic series */
double digamma(double x)
{
    double r = 0.0;
    while (x < 6.0) { r -= 1.0 / x; x += 1.0; }
    const double f = 1.0 / (x * x);
    return r + std::log(x) - 0.5 / x
         - f * (1.0/12 - f * (1.0/120 - f * (1.0/252 - f * (1.0/240 - f / 132))));
}

/* ψ₁(x) */
double trigamma(double x)
{
    double r = 0.0;
    while (x < 6.0) { r += 1.0 / (x * x); x += 1.0; }
    const double t = 1.0 / x, f = t * t;
    return r + t + 0.5 * f + t * f * (1.0/6 - f * (1.0/30 - f * (1.0/42 - f / 30)));
}

/* responses as an n × k composition, shrunk off the boundary */
Eigen::MatrixXd prepare_composition(const LabeledMatrix& y_ref,
                                    const std::vector<std::string>& features)
{
    Eigen::MatrixXd Y = y_ref.select_rows(features).values.transpose();
    const Eigen::Index n = Y.rows(), k = Y.cols();

    chk((Y.array() >= 0.0).all() && Y.allFinite(),
        "dirichlet: features must be finite and non-negative");
    for (Eigen::Index i = 0; i < n; ++i) {
        const double s = Y.row(i).sum();
        chk(s > 0.0, "dirichlet: sample " + std::to_string(i + 1) +
                     " has zero total over the selected features");
        Y.row(i) /= s;
    }

    if ((Y.array() <= 0.0).any() || (Y.array() >= 1.0).any()) {
        logI("dirichlet: compositions touch the simplex boundary, applying "
             "(y(n-1) + 1/k) / n shrinkage");
        Y = ((Y.array() * double(n - 1) + 1.0 / double(k)) / double(n)).matrix();
    }
    return Y;
}

struct DirichletFit {
    Eigen::MatrixXd B;            // (d+1) × k
    double          loglik = 0;
    int             iters  = 0;
    bool            converged = false;
};

class DirichletSolver {
public:
    DirichletSolver(const Eigen::MatrixXd& X, const Eigen::MatrixXd& Y)
        : X_(X), Y_(Y), logY_(Y.array().log().matrix()) {}

    double loglik(const Eigen::MatrixXd& B) const
    {
        const Eigen::MatrixXd A = alpha(B);
        double ll = 0.0;
        for (Eigen::Index i = 0; i < A.rows(); ++i) {
            ll += std::lgamma(A.row(i).sum());
            for (Eigen::Index j = 0; j < A.cols(); ++j)
                ll += -std::lgamma(A(i, j)) + (A(i, j) - 1.0) * logY_(i, j);
        }
        return std::isfinite(ll) ? ll : -std::numeric_limits<double>::infinity();
    }

    /* one Fisher scoring direction at B */
    Eigen::MatrixXd direction(const Eigen::MatrixXd& B) const
    {
        const Eigen::Index n = X_.rows(), q = X_.cols(), k = Y_.cols();
        const Eigen::MatrixXd A    = alpha(B);
        const Eigen::VectorXd Asum = A.rowwise().sum();

        Eigen::VectorXd psiA(n), tri_A(n);
        for (Eigen::Index i = 0; i < n; ++i) {
            psiA(i)  = digamma(Asum(i));
            tri_A(i) = trigamma(Asum(i));
        }

        /* score: X' [ a_ij (ψ(A_i) − ψ(a_ij) + log y_ij) ] */
        Eigen::MatrixXd R(n, k);
        for (Eigen::Index i = 0; i < n; ++i)
            for (Eigen::Index j = 0; j < k; ++j)
                R(i, j) = A(i, j) * (psiA(i) - digamma(A(i, j)) + logY_(i, j));
        const Eigen::MatrixXd G = X_.transpose() * R;

        /* info block (j,l) = X' diag( a_ij a_il (δ_jl ψ₁(a_ij) − ψ₁(A_i)) ) X */
        Eigen::MatrixXd info = Eigen::MatrixXd::Zero(q * k, q * k);
        Eigen::VectorXd w(n);
        for (Eigen::Index j = 0; j < k; ++j) {
            for (Eigen::Index l = j; l < k; ++l) {
                for (Eigen::Index i = 0; i < n; ++i) {
                    w(i) = -A(i, j) * A(i, l) * tri_A(i);
                    if (j == l) w(i) += A(i, j) * A(i, j) * trigamma(A(i, j));
                }
                const Eigen::MatrixXd blk = X_.transpose() * w.asDiagonal() * X_;
                info.block(j * q, l * q, q, q) = blk;
                if (j != l) info.block(l * q, j * q, q, q) = blk.transpose();
            }
        }
        info.diagonal().array() += RIDGE * (1.0 + info.diagonal().cwiseAbs().maxCoeff());

        const Eigen::Map<const Eigen::VectorXd> g(G.data(), q * k);
        Eigen::VectorXd step = info.ldlt().solve(g);
        return Eigen::Map<Eigen::MatrixXd>(step.data(), q, k);
    }

    Eigen::MatrixXd start() const
    {
        const Eigen::Index q = X_.cols(), k = Y_.cols();
        const Eigen::RowVectorXd m = Y_.colwise().mean();
        const double v = (Y_.col(0).array() - m(0)).square().mean();

        /* precision from the first component's moments */
        double s = (v > 0.0) ? m(0) * (1.0 - m(0)) / v - 1.0 : double(k);
        if (!std::isfinite(s) || s <= 0.0) s = double(k);
        s = std::min(std::max(s, 0.1), 1e6);

        Eigen::MatrixXd B = Eigen::MatrixXd::Zero(q, k);
        for (Eigen::Index j = 0; j < k; ++j) B(0, j) = std::log(m(j) * s);
        return B;
    }

private:
    Eigen::MatrixXd alpha(const Eigen::MatrixXd& B) const
    {
        return (X_ * B).cwiseMin(ETA_CLIP).cwiseMax(-ETA_CLIP).array().exp().matrix();
    }

    const Eigen::MatrixXd& X_;
    const Eigen::MatrixXd& Y_;
    Eigen::MatrixXd        logY_;
};

DirichletFit fit_dirichlet(const Eigen::MatrixXd& X, const Eigen::MatrixXd& Y,
                           const TrainOpt& opt)
{
    DirichletSolver solver(X, Y);
    DirichletFit fit;
    fit.B      = solver.start();
    fit.loglik = solver.loglik(fit.B);
    chk(std::isfinite(fit.loglik), "dirichlet: log-likelihood at start is not finite");

    for (fit.iters = 1; fit.iters <= opt.max_iter; ++fit.iters) {
        if (opt.cancel && opt.cancel->load())
            throw cancelled_error("dirichlet fit stopped at iteration " +
                                  std::to_string(fit.iters));

        const Eigen::MatrixXd step = solver.direction(fit.B);
        if (!step.allFinite()) {
            logW("dirichlet: non-finite scoring step, stopping");
            break;
        }

        double          t = 1.0;
        Eigen::MatrixXd B_new;
        double          ll_new = -std::numeric_limits<double>::infinity();
        for (int h = 0; h < MAX_HALVE; ++h, t *= 0.5) {
            B_new  = fit.B + t * step;
            ll_new = solver.loglik(B_new);
            if (ll_new >= fit.loglik) break;
        }
        if (!(ll_new >= fit.loglik)) {           // no ascent along the step
            fit.converged = true;
            break;
        }

        const double change = ll_new - fit.loglik;
        fit.B      = B_new;
        fit.loglik = ll_new;
        if (change <= opt.tol * (std::fabs(fit.loglik) + opt.tol)) {
            fit.converged = true;
            break;
        }
    }
    return fit;
}

/* row-wise softmax of eta, i.e. alpha / Σ alpha without overflow */
Eigen::MatrixXd expected_composition(const Eigen::MatrixXd& eta)
{
    Eigen::MatrixXd mu(eta.rows(), eta.cols());
    for (Eigen::Index i = 0; i < eta.rows(); ++i) {
        const double mx = eta.row(i).maxCoeff();
        mu.row(i) = (eta.row(i).array() - mx).exp().matrix();
        mu.row(i) /= mu.row(i).sum();
    }
    return mu;
}

} // namespace

class DirichletModel : public IModel {
public:
    ModelKind   kind()   const override { return ModelKind::dirichlet; }
    InputLayout layout() const override { return InputLayout::table; }

    EnhancedMatrix fit_predict(const ModelInput&               X,
                               const LabeledMatrix&            y_ref,
                               const std::vector<std::string>& features,
                               const TrainOpt&                 opt) const override
    {
        chk(X.layout == InputLayout::table, "dirichlet expects tabular embeddings");
        chk(features.size() >= 2, "dirichlet: a composition needs at least 2 features, got " +
                                  std::to_string(features.size()));
        chk(y_ref.cols() == X.num_ref(),
            "response has " + std::to_string(y_ref.cols()) + " samples, embedding has " +
            std::to_string(X.num_ref()));
        chk(X.enh_table.columns == X.ref_table.columns,
            "dirichlet: enhanced embedding columns differ from reference");

        const Eigen::MatrixXd Y  = prepare_composition(y_ref, features);
        const Eigen::MatrixXd Xr = X.ref_table.design();
        const Eigen::MatrixXd Xe = X.enh_table.design();

        logI("dirichlet: joint fit of " + std::to_string(features.size()) +
             " components on " + std::to_string(Xr.rows()) + " samples");

        const DirichletFit fit = fit_dirichlet(Xr, Y, opt);
        if (fit.converged)
            logI("dirichlet: converged after " + std::to_string(fit.iters) +
                 " iterations, logLik = " + std::to_string(fit.loglik));
        else
            logW("dirichlet: no convergence within " + std::to_string(opt.max_iter) +
                 " iterations, using last estimate (logLik = " +
                 std::to_string(fit.loglik) + ")");

        EnhancedMatrix out;
        out.values = LabeledMatrix(expected_composition(Xe * fit.B).transpose(),
                                   features, X.enh_ids());
        out.diagnostics.kind = DiagKind::none;
        return out;
    }
};

std::unique_ptr<IModel> make_dirichlet()
{
    return std::make_unique<DirichletModel>();
}

} // namespace feature_enhance

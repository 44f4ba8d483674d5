/*───────────────────────────────────────────────────────────
 *  common.hpp   –  shared types, logging and error helpers
 *───────────────────────────────────────────────────────────*/
#pragma once

/* ---------- STL ---------- */
#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>

/* ---------- deps ---------- */
#include <Eigen/Dense>

namespace feature_enhance {

/* ────────────────── errors ────────────────── */
class enhance_error : public std::runtime_error {
public:
    explicit enhance_error(const std::string& msg) : std::runtime_error(msg) {}
};

/* fatal input contract violation; the call is aborted with no result */
class precondition_error : public enhance_error {
public:
    explicit precondition_error(const std::string& msg)
        : enhance_error("precondition failed: " + msg) {}
};

/* a numerical backend (LightGBM, solver) reported failure */
class backend_error : public enhance_error {
public:
    explicit backend_error(const std::string& msg)
        : enhance_error("backend error: " + msg) {}
};

class cancelled_error : public enhance_error {
public:
    explicit cancelled_error(const std::string& msg)
        : enhance_error("cancelled: " + msg) {}
};

/* ★ util – precondition check, throws instead of aborting */
inline void chk(bool ok, const std::string& msg)
{
    if (!ok) throw precondition_error(msg);
}

/* ────────────────── logging ────────────────── */
void logI(const std::string& msg);
void logW(const std::string& msg);
void logE(const std::string& msg);

std::string join(const std::vector<std::string>& v,
                 const std::string& sep = ", ");

/* ────────────────── labeled matrix ────────────────── */
/*  Dense matrix with optional dimnames.  An empty name vector
    means "no labels"; a non-empty one must match the extent.   */
struct LabeledMatrix {
    Eigen::MatrixXd          values;
    std::vector<std::string> row_names;
    std::vector<std::string> col_names;

    LabeledMatrix() = default;
    LabeledMatrix(Eigen::MatrixXd v,
                  std::vector<std::string> rn = {},
                  std::vector<std::string> cn = {});

    Eigen::Index rows() const { return values.rows(); }
    Eigen::Index cols() const { return values.cols(); }

    bool has_row_names() const { return !row_names.empty(); }
    bool has_col_names() const { return !col_names.empty(); }

    /* -1 if absent or unlabeled */
    Eigen::Index row_index(const std::string& name) const;

    /* sub-matrix made of the given rows, in the given order */
    LabeledMatrix select_rows(const std::vector<std::string>& names) const;
};

} // namespace feature_enhance

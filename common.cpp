/*───────────────────────────────────────────────────────────
 *  common.cpp   –  logging + LabeledMatrix helpers
 *───────────────────────────────────────────────────────────*/
#include "common.hpp"

#include <iostream>
#include <utility>

namespace feature_enhance {

void logI(const std::string& s){ std::cerr << "[INFO]  " << s << '\n'; }
void logW(const std::string& s){ std::cerr << "[WARN]  " << s << '\n'; }
void logE(const std::string& s){ std::cerr << "[ERR]   " << s << '\n'; }

std::string join(const std::vector<std::string>& v, const std::string& sep)
{
    std::string out;
    for (size_t i = 0; i < v.size(); ++i) {
        out += v[i];
        if (i + 1 < v.size()) out += sep;
    }
    return out;
}

/* ─────────────────────────  LabeledMatrix  ───────────────────────── */
LabeledMatrix::LabeledMatrix(Eigen::MatrixXd v,
                             std::vector<std::string> rn,
                             std::vector<std::string> cn)
    : values(std::move(v)), row_names(std::move(rn)), col_names(std::move(cn))
{
    chk(row_names.empty() || Eigen::Index(row_names.size()) == values.rows(),
        "row names (" + std::to_string(row_names.size()) +
        ") do not match row count (" + std::to_string(values.rows()) + ")");
    chk(col_names.empty() || Eigen::Index(col_names.size()) == values.cols(),
        "column names (" + std::to_string(col_names.size()) +
        ") do not match column count (" + std::to_string(values.cols()) + ")");
}

Eigen::Index LabeledMatrix::row_index(const std::string& name) const
{
    for (size_t i = 0; i < row_names.size(); ++i)
        if (row_names[i] == name) return Eigen::Index(i);
    return -1;
}

LabeledMatrix LabeledMatrix::select_rows(const std::vector<std::string>& names) const
{
    Eigen::MatrixXd out(Eigen::Index(names.size()), values.cols());
    for (size_t k = 0; k < names.size(); ++k) {
        const Eigen::Index r = row_index(names[k]);
        chk(r >= 0, "row '" + names[k] + "' not found");
        out.row(Eigen::Index(k)) = values.row(r);
    }
    return LabeledMatrix(std::move(out), names, col_names);
}

} // namespace feature_enhance

#include "spot_data.hpp"

#include <utility>

namespace feature_enhance {

template <typename Map>
static std::vector<std::string> keys_of(const Map& m)
{
    std::vector<std::string> out;
    out.reserve(m.size());
    for (const auto& kv : m) out.push_back(kv.first);
    return out;
}

SpotData::SpotData(std::vector<std::string> spot_ids)
    : spot_ids_(std::move(spot_ids)) {}

const LabeledMatrix& SpotData::get_embedding(const std::string& name) const
{
    auto it = reduced_dims_.find(name);
    chk(it != reduced_dims_.end(), "no embedding named '" + name + "'");
    return it->second;
}

const LabeledMatrix& SpotData::get_assay(const std::string& name) const
{
    auto it = assays_.find(name);
    chk(it != assays_.end(), "no assay named '" + name + "'");
    return it->second;
}

const LabeledMatrix& SpotData::get_alt_assay(const std::string& alt,
                                             const std::string& name) const
{
    auto it = alt_exps_.find(alt);
    chk(it != alt_exps_.end(), "no alternate experiment named '" + alt + "'");
    auto jt = it->second.assays.find(name);
    chk(jt != it->second.assays.end(),
        "alternate experiment '" + alt + "' has no assay named '" + name + "'");
    return jt->second;
}

bool SpotData::has_embedding(const std::string& name) const { return reduced_dims_.count(name) > 0; }
bool SpotData::has_assay(const std::string& name) const { return assays_.count(name) > 0; }
bool SpotData::has_alt_exp(const std::string& name) const { return alt_exps_.count(name) > 0; }

std::vector<std::string> SpotData::embedding_names() const { return keys_of(reduced_dims_); }
std::vector<std::string> SpotData::assay_names() const { return keys_of(assays_); }

void SpotData::check_spot_columns(const LabeledMatrix& m, const std::string& what) const
{
    chk(size_t(m.cols()) == spot_ids_.size(),
        what + " has " + std::to_string(m.cols()) + " columns but the object has " +
        std::to_string(spot_ids_.size()) + " spots");
}

SpotData SpotData::with_embedding(const std::string& name, LabeledMatrix emb) const
{
    chk(size_t(emb.rows()) == spot_ids_.size(),
        "embedding '" + name + "' has " + std::to_string(emb.rows()) +
        " rows but the object has " + std::to_string(spot_ids_.size()) + " spots");
    if (!emb.has_row_names()) emb.row_names = spot_ids_;

    SpotData out(*this);
    out.reduced_dims_[name] = std::move(emb);
    return out;
}

SpotData SpotData::with_assay(const std::string& name, LabeledMatrix m) const
{
    check_spot_columns(m, "assay '" + name + "'");
    if (!m.has_col_names()) m.col_names = spot_ids_;

    SpotData out(*this);
    out.assays_[name] = std::move(m);
    return out;
}

SpotData SpotData::with_alt_exp(const std::string& name, AltExperiment alt) const
{
    for (auto& kv : alt.assays) {
        check_spot_columns(kv.second, "alternate assay '" + name + "/" + kv.first + "'");
        if (!kv.second.has_col_names()) kv.second.col_names = spot_ids_;
    }
    SpotData out(*this);
    out.alt_exps_[name] = std::move(alt);
    return out;
}

} // namespace feature_enhance

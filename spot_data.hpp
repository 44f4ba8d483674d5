/* ──────────────────────────────────────────────────────────────
   spot_data.hpp  –  in-memory experiment container
   Holds per-spot embeddings (reduced dims), primary assays and
   alternate experiments.  Every mutator returns a new copy.
   ────────────────────────────────────────────────────────────── */
#pragma once
#include <map>
#include <string>
#include <vector>

#include "common.hpp"

namespace feature_enhance {

/* a side experiment over the same spots (e.g. protein panel) */
struct AltExperiment {
    std::map<std::string, LabeledMatrix> assays;   // features × spots
};

class SpotData {
public:
    SpotData() = default;
    explicit SpotData(std::vector<std::string> spot_ids);

    const std::vector<std::string>& spot_ids() const { return spot_ids_; }
    size_t num_spots() const { return spot_ids_.size(); }

    /* spots × dims; row names are the spot ids */
    const LabeledMatrix& get_embedding(const std::string& name) const;
    /* features × spots */
    const LabeledMatrix& get_assay(const std::string& name) const;
    const LabeledMatrix& get_alt_assay(const std::string& alt,
                                       const std::string& name) const;

    bool has_embedding(const std::string& name) const;
    bool has_assay(const std::string& name) const;
    bool has_alt_exp(const std::string& name) const;

    std::vector<std::string> embedding_names() const;
    std::vector<std::string> assay_names() const;

    /* ---- non-destructive updates ---- */
    SpotData with_embedding(const std::string& name, LabeledMatrix emb) const;
    SpotData with_assay(const std::string& name, LabeledMatrix m) const;
    SpotData with_alt_exp(const std::string& name, AltExperiment alt) const;

private:
    void check_spot_columns(const LabeledMatrix& m, const std::string& what) const;

    std::vector<std::string>              spot_ids_;
    std::map<std::string, LabeledMatrix>  reduced_dims_;
    std::map<std::string, LabeledMatrix>  assays_;
    std::map<std::string, AltExperiment>  alt_exps_;
};

} // namespace feature_enhance

#include "config.hpp"

#include <fstream>
#include <initializer_list>

namespace feature_enhance {

namespace {

void warn_unknown(const json& j, const char* where,
                  std::initializer_list<const char*> known)
{
    for (auto it = j.begin(); it != j.end(); ++it) {
        bool ok = false;
        for (const char* k : known) ok = ok || it.key() == k;
        if (!ok) logW(std::string("ignored ") + where + " key: " + it.key());
    }
}

template <typename T>
void read_key(const json& j, const char* key, T& out)
{
    if (!j.contains(key) || j.at(key).is_null()) return;
    try {
        out = j.at(key).get<T>();
    } catch (const json::exception& e) {
        throw precondition_error(std::string("config key '") + key + "': " + e.what());
    }
}

} // namespace

TrainOpt train_opt_from_json(const json& j)
{
    chk(j.is_object(), "train options must be a JSON object");
    warn_unknown(j, "train", {"trees", "max_depth", "lr", "lgbm_threads",
                              "threads", "max_iter", "tol"});
    TrainOpt opt;
    read_key(j, "trees",        opt.trees);
    read_key(j, "max_depth",    opt.max_depth);
    read_key(j, "lr",           opt.lr);
    read_key(j, "lgbm_threads", opt.lgbm_threads);
    read_key(j, "threads",      opt.threads);
    read_key(j, "max_iter",     opt.max_iter);
    read_key(j, "tol",          opt.tol);

    chk(opt.trees > 0,     "train.trees must be positive");
    chk(opt.max_depth > 0, "train.max_depth must be positive");
    chk(opt.lr > 0.0,      "train.lr must be positive");
    chk(opt.max_iter > 0,  "train.max_iter must be positive");
    return opt;
}

EnhanceOptions options_from_json(const json& j)
{
    chk(j.is_object(), "options must be a JSON object");
    warn_unknown(j, "options", {"use_dimred", "assay_type", "alt_exp_type",
                                "feature_names", "model", "train"});
    EnhanceOptions opt;
    read_key(j, "use_dimred",    opt.use_dimred);
    read_key(j, "assay_type",    opt.assay_type);
    read_key(j, "feature_names", opt.feature_names);

    std::string alt;
    read_key(j, "alt_exp_type", alt);
    if (!alt.empty()) opt.alt_exp_type = alt;

    std::string model;
    read_key(j, "model", model);
    if (!model.empty()) opt.model = parse_model_kind(model);

    if (j.contains("train")) opt.train = train_opt_from_json(j.at("train"));
    return opt;
}

EnhanceOptions load_options(const std::string& path)
{
    std::ifstream in(path);
    chk(bool(in), "cannot open config file " + path);
    json j;
    try {
        in >> j;
    } catch (const json::parse_error& e) {
        throw precondition_error("config file " + path + ": " + e.what());
    }
    logI("loaded options from " + path);
    return options_from_json(j);
}

json to_json(const TrainOpt& opt)
{
    return json{{"trees",        opt.trees},
                {"max_depth",    opt.max_depth},
                {"lr",           opt.lr},
                {"lgbm_threads", opt.lgbm_threads},
                {"threads",      opt.threads},
                {"max_iter",     opt.max_iter},
                {"tol",          opt.tol}};
}

json to_json(const EnhanceOptions& opt)
{
    json j{{"use_dimred",    opt.use_dimred},
           {"assay_type",    opt.assay_type},
           {"feature_names", opt.feature_names},
           {"model",         model_name(opt.model)},
           {"train",         to_json(opt.train)}};
    j["alt_exp_type"] = opt.alt_exp_type ? json(*opt.alt_exp_type) : json(nullptr);
    return j;
}

} // namespace feature_enhance

#include "config.hpp"
#include <fstream>
#include <sstream>

/*------------------------------------------------------------------------------------------------*/

namespace {

    std::string source_name(gt::segment_source src) {
        return (src == gt::segment_source::original) ? "original" : "preprocessed";
    }

    gt::segment_source parse_segment_source(const std::string& str) {
        auto lower = gt::to_lower(str);
        if (lower == "original") {
            return gt::segment_source::original;
        } else if (lower == "preprocessed") {
            return gt::segment_source::preprocessed;
        }
        throw gt::config_error("unknown segment source: " + str);
    }

    template<typename T>
    void read_section(const gt::json& js, const char* key, T& section) {
        if (js.contains(key)) {
            gt::from_json(js.at(key), section);
        }
    }
}

void gt::to_json(json& js, const pipeline_config& cfg) {
    js = json{
        {"preprocess", cfg.preprocess},
        {"segmentation", cfg.segmentation},
        {"vectorizer", cfg.vectorizer},
        {"postprocess", cfg.postprocess},
        {"detector", cfg.detector},
        {"fallback_bounds", cfg.fallback_bounds},
        {"segment_source", source_name(cfg.source)}
    };
}

void gt::from_json(const json& js, pipeline_config& cfg) {
    if (!js.is_object()) {
        throw config_error("configuration must be a JSON object");
    }
    try {
        read_section(js, "preprocess", cfg.preprocess);
        read_section(js, "segmentation", cfg.segmentation);
        read_section(js, "vectorizer", cfg.vectorizer);
        read_section(js, "postprocess", cfg.postprocess);
        read_section(js, "detector", cfg.detector);
        read_section(js, "fallback_bounds", cfg.fallback_bounds);
        if (js.contains("segment_source")) {
            cfg.source = parse_segment_source(js.at("segment_source").get<std::string>());
        }
    } catch (const config_error&) {
        throw;
    } catch (const std::exception& e) {
        throw config_error(std::string("invalid configuration: ") + e.what());
    }
    if (!cfg.fallback_bounds.is_valid()) {
        throw config_error("fallback_bounds must satisfy west < east and south < north");
    }
}

gt::pipeline_config gt::parse_config(const std::string& text) {
    json js;
    try {
        js = json::parse(text);
    } catch (const json::parse_error& e) {
        throw config_error(std::string("malformed configuration: ") + e.what());
    }
    pipeline_config cfg;
    from_json(js, cfg);
    return cfg;
}

gt::pipeline_config gt::load_config(const std::string& path) {
    std::ifstream infile(path);
    if (!infile) {
        throw config_error("unable to open " + path);
    }
    std::stringstream ss;
    ss << infile.rdbuf();
    return parse_config(ss.str());
}

void gt::save_config(const std::string& path, const pipeline_config& cfg) {
    std::ofstream outfile(path);
    if (!outfile) {
        throw config_error("unable to write " + path);
    }
    json js = cfg;
    outfile << js.dump(4);
}

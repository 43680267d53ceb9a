#include "pipeline.hpp"
#include "preprocess.hpp"
#include "postprocess.hpp"
#include "raster.hpp"
#include "vectorizer.hpp"
#include <chrono>
#include <filesystem>

/*------------------------------------------------------------------------------------------------*/

namespace fs = std::filesystem;

namespace {

    void ensure_directory(const std::string& dir) {
        std::error_code ec;
        fs::create_directories(dir, ec);
        if (ec) {
            throw gt::artifact_write_error("unable to create " + dir + ": " + ec.message());
        }
    }

    std::optional<gt::feature_collection> run_detector(const gt::detector_registry& detectors,
            const std::string& raster_path, gt::feature_type type, const gt::pipeline_config& cfg,
            const gt::callbacks& cbs) {
        auto iter = detectors.find(type);
        if (iter == detectors.end() || !iter->second) {
            return {};
        }
        gt::diagnostics diag(cbs);
        auto& detector = *iter->second;
        diag.status("detecting " + gt::to_string(type) + " with " + detector.name());
        try {
            auto detections = detector.detect(raster_path, cfg.detector);
            return gt::detections_to_feature_collection(detections, cfg.detector,
                gt::to_string(type), cbs);
        } catch (const std::exception& e) {
            diag.log(detector.name() + " failed, falling back to segmentation: " + e.what());
            return {};
        }
    }

    gt::feature_collection empty_collection(gt::feature_type type,
            const gt::georeference_result& georef) {
        auto fc = gt::empty_feature_collection(gt::to_string(type));
        fc.bounds = georef.bounds;
        fc.georeference_source = georef.source;
        fc.georeference_degraded = georef.degraded;
        return fc;
    }

    gt::feature_collection polygons_to_features(const std::vector<gt::polygon>& raw_polys,
            gt::dimensions<int> dims, gt::feature_type type, const gt::georeference_result& georef,
            const gt::pipeline_config& cfg, const gt::callbacks& cbs) {
        auto polys = gt::post_process(raw_polys, type, cfg.postprocess, cbs);
        auto fc = gt::assemble_feature_collection(polys, dims, georef.bounds,
            gt::to_string(type), cbs);
        fc.georeference_source = georef.source;
        fc.georeference_degraded = georef.degraded;
        return fc;
    }
}

std::string gt::geojson_output_path(const std::string& raster_path, const std::string& output_dir,
        feature_type type) {
    auto stem = fs::path(raster_path).stem().string();
    return (fs::path(output_dir) / (stem + "_" + to_string(type) + ".geojson")).string();
}

gt::feature_collection gt::extract_features(const std::string& raster_path,
        const std::string& output_dir, feature_type type, const pipeline_config& cfg,
        const callbacks& cbs, const detector_registry& detectors) {
    diagnostics diag(cbs);
    auto start_time = std::chrono::high_resolution_clock().now();

    diag.status("loading " + raster_path);
    auto ras = load_raster(raster_path);
    auto invocation_id = unique_id();
    ensure_directory(output_dir);
    auto out_path = geojson_output_path(raster_path, output_dir, type);

    auto detected = run_detector(detectors, raster_path, type, cfg, cbs);
    if (detected) {
        write_geojson(out_path, *detected);
        return *detected;
    }

    diag.status("preprocessing");
    auto pre = preprocess_raster(ras, output_dir, invocation_id, cfg.preprocess);

    diag.status("georeferencing");
    auto georef = georeferencer(cfg.fallback_bounds).georeference(ras, cbs);

    diag.status("segmenting " + to_string(type));
    auto source_path = (cfg.source == segment_source::preprocessed) ? pre.path : ras.path;
    auto mask_path = (fs::path(output_dir) / (invocation_id + "_mask.png")).string();
    auto seg = segment_raster_file(source_path, type, cfg.segmentation, mask_path, cbs);
    if (!seg) {
        auto fc = empty_collection(type, georef);
        write_geojson(out_path, fc);
        return fc;
    }

    diag.status("vectorizing");
    auto polys = vectorize(seg->mask, cfg.vectorizer, cbs);

    auto fc = polygons_to_features(polys, seg->dims, type, georef, cfg, cbs);

    write_geojson(out_path, fc);
    diag.status("complete.");
    diag.log("  (" + std::to_string(fc.size()) + " features written to " + out_path + ")");

    std::chrono::duration<double> elapsed = std::chrono::high_resolution_clock().now() - start_time;
    diag.log(std::string("( ") + std::to_string(elapsed.count()) + " seconds)");

    return fc;
}

gt::feature_collection gt::extract_features_from_mask(const cv::Mat& mask, feature_type type,
        const geo_bounds& bounds, const pipeline_config& cfg, const callbacks& cbs) {
    georeference_result georef{ bounds, "supplied", false };
    if (mask.empty()) {
        return empty_collection(type, georef);
    }
    auto polys = vectorize(mask, cfg.vectorizer, cbs);
    return polygons_to_features(polys, mat_dimensions(mask), type, georef, cfg, cbs);
}

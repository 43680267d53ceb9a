#pragma once

#include <string>
#include <functional>
#include <stdexcept>

/*------------------------------------------------------------------------------------------------*/

namespace gt {

    struct geo_bounds;

    class image_decode_error : public std::runtime_error {
    public:
        image_decode_error(const std::string& path, const std::string& reason);
        const std::string& path() const;
    private:
        std::string path_;
    };

    class geojson_error : public std::runtime_error {
        using std::runtime_error::runtime_error;
    };

    class config_error : public std::runtime_error {
        using std::runtime_error::runtime_error;
    };

    class artifact_write_error : public std::runtime_error {
        using std::runtime_error::runtime_error;
    };

    enum class pipeline_stage {
        vectorize,
        simplify,
        merge,
        assemble,
        detector
    };

    std::string to_string(pipeline_stage stage);

    struct callbacks {
        std::function<void(const std::string&, const std::string&)> decode_failure_cb;
        std::function<void(const std::string&, const geo_bounds&)> georeference_degraded_cb;
        std::function<void(pipeline_stage, size_t)> polygons_dropped_cb;
        std::function<void(const std::string&)> status_cb;
        std::function<void(const std::string&)> log_message_cb;
    };

    // routes every event to the "geotrace" Qt logging category.
    callbacks logging_callbacks();

    class diagnostics {
    private:
        callbacks cbs_;

    public:
        diagnostics(const callbacks& cbs);

        void decode_failure(const std::string& path, const std::string& reason) const;
        void georeference_degraded(const std::string& path, const geo_bounds& bounds) const;
        void polygons_dropped(pipeline_stage stage, size_t count) const;
        void status(const std::string& msg) const;
        void log(const std::string& msg) const;
    };
}

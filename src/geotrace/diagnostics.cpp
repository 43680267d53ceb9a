#include "diagnostics.hpp"
#include "georeference.hpp"
#include <QLoggingCategory>
#include <QString>

/*------------------------------------------------------------------------------------------------*/

namespace {

    Q_LOGGING_CATEGORY(lc_geotrace, "geotrace")

    QString qstr(const std::string& str) {
        return QString::fromStdString(str);
    }

}

gt::image_decode_error::image_decode_error(const std::string& path, const std::string& reason) :
    std::runtime_error("unable to decode " + path + ": " + reason),
    path_(path)
{}

const std::string& gt::image_decode_error::path() const {
    return path_;
}

std::string gt::to_string(pipeline_stage stage) {
    switch (stage) {
        case pipeline_stage::vectorize: return "vectorize";
        case pipeline_stage::simplify: return "simplify";
        case pipeline_stage::merge: return "merge";
        case pipeline_stage::assemble: return "assemble";
        case pipeline_stage::detector: return "detector";
    }
    return "unknown";
}

gt::callbacks gt::logging_callbacks() {
    return {
        [](const std::string& path, const std::string& reason) {
            qCWarning(lc_geotrace) << "decode failure:" << qstr(path) << "-" << qstr(reason);
        },
        [](const std::string& path, const geo_bounds& b) {
            qCWarning(lc_geotrace) << "georeferencing degraded for" << qstr(path) <<
                "- using placeholder bounds" << b.west << b.south << b.east << b.north;
        },
        [](pipeline_stage stage, size_t count) {
            qCInfo(lc_geotrace) << "dropped" << count << "invalid polygons during" <<
                qstr(to_string(stage));
        },
        [](const std::string& msg) {
            qCInfo(lc_geotrace).noquote() << qstr(msg);
        },
        [](const std::string& msg) {
            qCDebug(lc_geotrace).noquote() << qstr(msg);
        }
    };
}

/*------------------------------------------------------------------------------------------------*/

gt::diagnostics::diagnostics(const callbacks& cbs) :
    cbs_(cbs)
{}

void gt::diagnostics::decode_failure(const std::string& path, const std::string& reason) const {
    if (cbs_.decode_failure_cb) {
        cbs_.decode_failure_cb(path, reason);
    }
}

void gt::diagnostics::georeference_degraded(const std::string& path, const geo_bounds& bounds) const {
    if (cbs_.georeference_degraded_cb) {
        cbs_.georeference_degraded_cb(path, bounds);
    }
}

void gt::diagnostics::polygons_dropped(pipeline_stage stage, size_t count) const {
    if (count > 0 && cbs_.polygons_dropped_cb) {
        cbs_.polygons_dropped_cb(stage, count);
    }
}

void gt::diagnostics::status(const std::string& msg) const {
    if (cbs_.status_cb) {
        cbs_.status_cb(msg);
    }
    log(std::string("----") + msg + std::string("----"));
}

void gt::diagnostics::log(const std::string& msg) const {
    if (cbs_.log_message_cb) {
        cbs_.log_message_cb(msg);
    }
}

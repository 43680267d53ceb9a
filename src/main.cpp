#include "geotrace/config.hpp"
#include "geotrace/pipeline.hpp"
#include <QCoreApplication>
#include <QCommandLineParser>
#include <QStringList>
#include <iostream>

/*------------------------------------------------------------------------------------------------*/

int main(int argc, char* argv[]) {
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName("geotrace");

    QCommandLineParser parser;
    parser.setApplicationDescription("extracts vector features from raster imagery as GeoJSON");
    parser.addHelpOption();
    parser.addPositionalArgument("raster", "input image");
    parser.addPositionalArgument("output_dir", "directory for intermediate images and the GeoJSON");
    parser.addPositionalArgument("feature_type", "buildings, trees, water, roads or other", "[feature_type]");
    QCommandLineOption config_opt("config", "JSON pipeline configuration", "file");
    parser.addOption(config_opt);
    parser.process(app);

    auto args = parser.positionalArguments();
    if (args.size() < 2 || args.size() > 3) {
        std::cerr << parser.helpText().toStdString();
        return 1;
    }

    auto raster_path = args[0].toStdString();
    auto output_dir = args[1].toStdString();
    auto type = gt::parse_feature_type(args.size() > 2 ? args[2].toStdString() : "buildings");

    try {
        gt::pipeline_config cfg;
        if (parser.isSet(config_opt)) {
            cfg = gt::load_config(parser.value(config_opt).toStdString());
        }
        gt::extract_features(raster_path, output_dir, type, cfg, gt::logging_callbacks());
        std::cout << gt::geojson_output_path(raster_path, output_dir, type) << "\n";
    } catch (const gt::image_decode_error& e) {
        std::cerr << e.what() << "\n";
        return 1;
    } catch (const gt::config_error& e) {
        std::cerr << e.what() << "\n";
        return 1;
    } catch (const std::runtime_error& e) {
        std::cerr << e.what() << "\n";
        return 2;
    }

    return 0;
}

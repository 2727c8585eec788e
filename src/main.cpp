/**
 * GeoMesh Converter - Entry Point
 *
 *   geomesh export --output <file> [--name <project>] <object.json>...
 *   geomesh import --input <file> --output-dir <dir>
 *   geomesh inspect <file>
 *   geomesh --help
 */

#include "geomesh/config.hpp"
#include "geomesh/exporter.hpp"
#include "geomesh/files.hpp"
#include "geomesh/importer.hpp"
#include "geomesh/logging.hpp"
#include "geomesh/mesh_json.hpp"
#include "geomesh/surface_file.hpp"
#include "geomesh/table_store.hpp"

#include <iostream>
#include <optional>
#include <string>
#include <vector>
#include <filesystem>

namespace fs = std::filesystem;

// CLI argument parsing
struct CliArgs {
    bool show_help = false;
    std::string command;
    std::vector<std::string> inputs;
    std::string input_path;
    std::string output_path;
    std::string output_dir;
    std::string project_name;
    std::string store_path;
    std::string config_path;
    std::optional<int> epsg_code;
    bool verbose = false;
    bool debug_logging = false;
    std::string error;
};

void print_help() {
    std::cout << R"(
GeoMesh Converter - canonical triangle meshes <-> surface files

Usage:
  geomesh export --output <file> [--name <project>] <object.json>...
  geomesh import --input <file> --output-dir <dir>
  geomesh inspect <file>
  geomesh --help

Options:
  --help, -h             Show this help message
  --output, -o <file>    Surface file to write (export)
  --name, -n <name>      Project name (export, default: output file stem)
  --input, -i <file>     Surface file to read (import)
  --output-dir <dir>     Directory for the imported object documents
  --store, -s <path>     Table store database (default from config)
  --config, -c <path>    Configuration file (default: geomesh.json if present)
  --epsg <code>          EPSG code given to imported meshes
  --verbose, -v          Verbose output
  --debug, -d            Enable debug logging

Examples:
  geomesh export -o surfaces.gmsx fault.json horizon.json
  geomesh import -i surfaces.gmsx --output-dir ./objects --epsg 32650
  geomesh inspect surfaces.gmsx

)" << std::endl;
}

CliArgs parse_args(int argc, char* argv[]) {
    CliArgs args;

    auto next_value = [&](int& i, const std::string& flag) -> std::string {
        if (i + 1 < argc) {
            return argv[++i];
        }
        args.error = "Missing value for " + flag;
        return {};
    };

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            args.show_help = true;
        }
        else if (arg == "--output" || arg == "-o") {
            args.output_path = next_value(i, arg);
        }
        else if (arg == "--name" || arg == "-n") {
            args.project_name = next_value(i, arg);
        }
        else if (arg == "--input" || arg == "-i") {
            args.input_path = next_value(i, arg);
        }
        else if (arg == "--output-dir") {
            args.output_dir = next_value(i, arg);
        }
        else if (arg == "--store" || arg == "-s") {
            args.store_path = next_value(i, arg);
        }
        else if (arg == "--config" || arg == "-c") {
            args.config_path = next_value(i, arg);
        }
        else if (arg == "--epsg") {
            std::string value = next_value(i, arg);
            try {
                args.epsg_code = std::stoi(value);
            } catch (const std::exception&) {
                args.error = "Invalid EPSG code: " + value;
            }
        }
        else if (arg == "--verbose" || arg == "-v") {
            args.verbose = true;
        }
        else if (arg == "--debug" || arg == "-d") {
            args.debug_logging = true;
        }
        else if (!arg.empty() && arg[0] == '-') {
            args.error = "Unknown option: " + arg;
        }
        else if (args.command.empty()) {
            args.command = arg;
        }
        else {
            args.inputs.push_back(arg);
        }
    }

    return args;
}

geomesh::Result<geomesh::Config> resolve_config(const CliArgs& args) {
    geomesh::Config config;
    if (!args.config_path.empty()) {
        TRY_ASSIGN(loaded, geomesh::load_config(args.config_path));
        config = loaded;
    } else if (fs::exists(geomesh::DEFAULT_CONFIG_FILE)) {
        TRY_ASSIGN(loaded, geomesh::load_config(geomesh::DEFAULT_CONFIG_FILE));
        config = loaded;
    }

    if (!args.store_path.empty()) config.store_path = args.store_path;
    if (args.epsg_code) config.epsg_code = args.epsg_code;
    if (args.debug_logging) config.log_level = geomesh::LogLevel::Debug;
    return config;
}

void print_failures(const std::vector<geomesh::FailedItem>& failed) {
    for (const auto& item : failed) {
        std::cerr << "  FAILED " << item.name << ": " << geomesh::error_code_name(item.error.code)
                  << ": " << item.error.full_message() << "\n";
    }
}

int run_export(const CliArgs& args, const geomesh::Config& config, geomesh::TableStore& store) {
    if (args.output_path.empty()) {
        std::cerr << "Error: No output file specified (use --output)\n";
        return 1;
    }
    if (args.inputs.empty()) {
        std::cerr << "Error: No object documents specified\n";
        return 1;
    }

    std::vector<geomesh::TriangleMesh> meshes;
    std::vector<geomesh::FailedItem> failed;
    for (const auto& input : args.inputs) {
        auto mesh = geomesh::load_triangle_mesh(input);
        if (!mesh) {
            LOG_ERROR("Export", "Cannot load " << input << ": " << mesh.error().full_message());
            failed.push_back({input, mesh.error()});
            continue;
        }
        meshes.push_back(std::move(*mesh));
    }

    fs::path output(args.output_path);
    std::string project_name = args.project_name.empty() ? output.stem().string() : args.project_name;

    geomesh::SurfaceExporter exporter(store);
    auto report = exporter.export_meshes(meshes, project_name);
    failed.insert(failed.end(), report.failed.begin(), report.failed.end());

    if (args.verbose) {
        for (const auto& element : report.project.elements) {
            std::cout << "Exported: " << element.name << " (" << element.data.size() << " data arrays)\n";
        }
    }

    auto written = geomesh::write_surface_file(output, report.project, config.surface_compression_level);
    if (!written) {
        std::cerr << "Error: " << written.error().full_message() << "\n";
        return 1;
    }

    std::cout << "\nExported: " << report.project.elements.size() << " elements";
    if (!failed.empty()) std::cout << " (" << failed.size() << " failed)";
    std::cout << "\n";
    print_failures(failed);

    return failed.empty() ? 0 : 1;
}

int run_import(const CliArgs& args, const geomesh::Config& config, geomesh::TableStore& store) {
    std::string input = !args.input_path.empty() ? args.input_path
                      : (!args.inputs.empty() ? args.inputs.front() : std::string());
    if (input.empty()) {
        std::cerr << "Error: No surface file specified (use --input)\n";
        return 1;
    }
    if (args.output_dir.empty()) {
        std::cerr << "Error: No output directory specified (use --output-dir)\n";
        return 1;
    }

    geomesh::ImportOptions options;
    options.epsg_code = config.epsg_code;
    geomesh::SurfaceImporter importer(store, options);

    auto report = importer.import_file(input);
    if (!report) {
        std::cerr << "Error: " << report.error().full_message() << "\n";
        return 1;
    }

    fs::path out_dir(args.output_dir);
    std::error_code ec;
    fs::create_directories(out_dir, ec);
    if (ec) {
        std::cerr << "Error: Failed to create " << out_dir.string() << ": " << ec.message() << "\n";
        return 1;
    }

    size_t written = 0;
    size_t failed = report->skipped.size();
    for (const auto& mesh : report->meshes) {
        auto path = geomesh::ensure_unique_path(out_dir / (geomesh::sanitize_filename(mesh.name) + ".json"));
        auto saved = geomesh::save_triangle_mesh(path, mesh);
        if (!saved) {
            std::cerr << "  FAILED " << mesh.name << ": " << saved.error().full_message() << "\n";
            failed++;
            continue;
        }
        if (args.verbose) {
            std::cout << "Imported: " << mesh.name << " -> " << path.string() << "\n";
        }
        written++;
    }

    std::cout << "\nImported: " << written << " meshes";
    if (failed > 0) std::cout << " (" << failed << " failed)";
    std::cout << "\n";
    print_failures(report->skipped);

    return failed > 0 ? 1 : 0;
}

int run_inspect(const CliArgs& args) {
    std::string input = !args.input_path.empty() ? args.input_path
                      : (!args.inputs.empty() ? args.inputs.front() : std::string());
    if (input.empty()) {
        std::cerr << "Error: No surface file specified\n";
        return 1;
    }

    auto project = geomesh::read_surface_file(input);
    if (!project) {
        std::cerr << "Error: " << project.error().full_message() << "\n";
        return 1;
    }

    std::cout << "Project: " << project->name << "\n";
    if (!project->description.empty()) {
        std::cout << "Description: " << project->description << "\n";
    }
    std::cout << "Elements: " << project->elements.size() << "\n\n";

    for (const auto& element : project->elements) {
        std::cout << element.name << " [" << geomesh::geometry_type_name(element.geometry) << "]";
        if (const auto* surface = std::get_if<geomesh::SurfaceGeometry>(&element.geometry)) {
            std::cout << " " << surface->vertices.size() << " vertices, "
                      << surface->triangles.size() << " triangles";
        }
        std::cout << "\n";

        for (const auto& data : element.data) {
            std::cout << "  " << geomesh::location_name(data.location) << ": " << data.name
                      << " (" << geomesh::data_array_size(data.array) << " values";
            if (data.is_category()) std::cout << ", " << data.legend.size() << " categories";
            std::cout << ")\n";
        }
    }

    if (!project->unreadable.empty()) {
        std::cout << "\nUnreadable: " << project->unreadable.size() << " elements\n";
        print_failures(project->unreadable);
        return 1;
    }
    return 0;
}

int run_cli(const CliArgs& args) {
    if (args.show_help || args.command.empty()) {
        print_help();
        return args.show_help ? 0 : 1;
    }
    if (!args.error.empty()) {
        std::cerr << "Error: " << args.error << "\n";
        return 1;
    }

    auto config = resolve_config(args);
    if (!config) {
        std::cerr << "Error: " << config.error().full_message() << "\n";
        return 1;
    }
    auto logging = geomesh::apply_logging(*config);
    if (!logging) {
        std::cerr << "Warning: " << logging.error().full_message() << "\n";
    }
    if (args.debug_logging) {
        LOG_INFO("App", "Debug logging enabled");
    }

    if (args.command == "inspect") {
        return run_inspect(args);
    }
    if (args.command != "export" && args.command != "import") {
        std::cerr << "Error: Unknown command: " << args.command << "\n";
        print_help();
        return 1;
    }

    geomesh::SqliteTableStore store(config->store_path, config->table_compression);
    auto opened = store.open();
    if (!opened) {
        std::cerr << "Error: " << opened.error().full_message() << "\n";
        return 1;
    }

    return args.command == "export" ? run_export(args, *config, store) : run_import(args, *config, store);
}

int main(int argc, char* argv[]) {
    CliArgs args = parse_args(argc, argv);
    return run_cli(args);
}

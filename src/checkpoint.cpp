#include "gatenet/checkpoint.hpp"

#include <cmath>
#include <filesystem>
#include <fstream>
#include <ios>
#include <sstream>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>

#include <nlohmann/json.hpp>

#include "gatenet/activations.hpp"
#include "gatenet/errors.hpp"

using nlohmann::json;
using std::ifstream;
using std::ios;
using std::isfinite;
using std::ofstream;
using std::ostringstream;
using std::size_t;
using std::string;
using std::vector;

static void require_supported_version(const string& version, const string& context)
{
    if (version != CHECKPOINT_VERSION) {
        throw UnsupportedVersionError(context + ": unsupported format version '" + version +
                                      "', expected '" + CHECKPOINT_VERSION + "'",
                                      version);
    }
}

static const json& require_field(const json& object, const char* key, const string& context)
{
    if (!object.is_object()) {
        throw CorruptFormatError(context + ": expected a JSON object");
    }

    const auto it = object.find(key);
    if (it == object.end()) {
        throw CorruptFormatError(context + ": missing field '" + key + "'");
    }
    return *it;
}

static size_t read_size(const json& object, const char* key, const string& context)
{
    const json& value = require_field(object, key, context);
    if (!value.is_number_unsigned()) {
        throw CorruptFormatError(context + ": field '" + key + "' must be a non-negative integer");
    }
    return value.get<size_t>();
}

static double read_double(const json& object, const char* key, const string& context)
{
    const json& value = require_field(object, key, context);
    if (!value.is_number()) {
        throw CorruptFormatError(context + ": field '" + key + "' must be a number");
    }
    return value.get<double>();
}

static string read_string(const json& object, const char* key, const string& context)
{
    const json& value = require_field(object, key, context);
    if (!value.is_string()) {
        throw CorruptFormatError(context + ": field '" + key + "' must be a string");
    }
    return value.get<string>();
}

static const json& read_array(const json& object, const char* key, const string& context)
{
    const json& value = require_field(object, key, context);
    if (!value.is_array()) {
        throw CorruptFormatError(context + ": field '" + key + "' must be an array");
    }
    return value;
}

static json matrix_to_json(const Matrix& m)
{
    return json{{"rows", m.get_rows()}, {"cols", m.get_cols()}, {"data", m.get_data()}};
}

static Matrix matrix_from_json(const json& record, const string& context)
{
    const size_t rows = read_size(record, "rows", context);
    const size_t cols = read_size(record, "cols", context);
    const json& data = read_array(record, "data", context);

    vector<double> values;
    values.reserve(data.size());
    for (const json& v : data) {
        if (!v.is_number()) {
            throw CorruptFormatError(context + ": matrix data must contain only numbers");
        }
        values.push_back(v.get<double>());
    }

    if (rows != 0 && cols > values.size() / rows) {
        throw CorruptFormatError(context + ": matrix data is shorter than rows * cols");
    }
    if (values.size() != rows * cols) {
        throw CorruptFormatError(context + ": matrix data length does not match rows * cols");
    }

    return Matrix::from_data(rows, cols, std::move(values));
}

static vector<Matrix> matrices_from_json(const json& object, const char* key, const string& context)
{
    const json& records = read_array(object, key, context);

    vector<Matrix> result;
    result.reserve(records.size());
    for (size_t i = 0; i < records.size(); ++i) {
        result.push_back(matrix_from_json(records[i], context + "." + key + "[" + std::to_string(i) + "]"));
    }
    return result;
}

static void require_finite(const vector<Matrix>& matrices, const char* name, const string& context)
{
    for (size_t i = 0; i < matrices.size(); ++i) {
        for (double v : matrices[i].get_data()) {
            if (!isfinite(v)) {
                throw CorruptFormatError(context + ": " + name + "[" + std::to_string(i) +
                                         "] contains a non-finite value");
            }
        }
    }
}

// JSON has no NaN or infinity, nlohmann would write them as null
static void require_finite_network(const NetworkSnapshot& snapshot, const string& context)
{
    require_finite(snapshot.weights, "weights", context);
    require_finite(snapshot.biases, "biases", context);
    if (!isfinite(snapshot.learning_rate)) {
        throw CorruptFormatError(context + ": learning_rate is not finite");
    }
}

static json network_to_json(const NetworkSnapshot& snapshot)
{
    json weights = json::array();
    for (const Matrix& w : snapshot.weights) {
        weights.push_back(matrix_to_json(w));
    }

    json biases = json::array();
    for (const Matrix& b : snapshot.biases) {
        biases.push_back(matrix_to_json(b));
    }

    return json{
        {"architecture", snapshot.architecture},
        {"weights", weights},
        {"biases", biases},
        {"activation", snapshot.activation},
        {"learning_rate", snapshot.learning_rate},
    };
}

static NetworkSnapshot network_from_json(const json& object, const string& context)
{
    NetworkSnapshot snapshot;

    for (const json& layer : read_array(object, "architecture", context)) {
        if (!layer.is_number_unsigned()) {
            throw CorruptFormatError(context + ": architecture entries must be non-negative integers");
        }
        snapshot.architecture.push_back(layer.get<size_t>());
    }

    snapshot.weights = matrices_from_json(object, "weights", context);
    snapshot.biases = matrices_from_json(object, "biases", context);
    snapshot.activation = read_string(object, "activation", context);
    snapshot.learning_rate = read_double(object, "learning_rate", context);

    return snapshot;
}

static Checkpoint checkpoint_from_json(const json& document, const string& context)
{
    const json& metadata = require_field(document, "metadata", context);

    Checkpoint checkpoint;

    // version gates everything else
    checkpoint.metadata.version = read_string(metadata, "version", context + ".metadata");
    require_supported_version(checkpoint.metadata.version, context);

    checkpoint.metadata.example = read_string(metadata, "example", context + ".metadata");
    checkpoint.metadata.epoch = read_size(metadata, "epoch", context + ".metadata");
    checkpoint.metadata.total_epochs = read_size(metadata, "total_epochs", context + ".metadata");
    checkpoint.metadata.learning_rate = read_double(metadata, "learning_rate", context + ".metadata");
    checkpoint.metadata.timestamp = read_string(metadata, "timestamp", context + ".metadata");

    checkpoint.network = network_from_json(require_field(document, "network", context), context + ".network");
    return checkpoint;
}

static ModelFile model_from_json(const json& document, const string& context)
{
    const json& summary = require_field(document, "summary", context);

    ModelFile model;

    model.summary.version = read_string(summary, "version", context + ".summary");
    require_supported_version(model.summary.version, context);

    model.summary.example = read_string(summary, "example", context + ".summary");
    model.summary.trained_epochs = read_size(summary, "trained_epochs", context + ".summary");
    model.summary.final_accuracy = read_double(summary, "final_accuracy", context + ".summary");
    model.summary.final_loss = read_double(summary, "final_loss", context + ".summary");
    model.summary.created = read_string(summary, "created", context + ".summary");

    model.network = network_from_json(require_field(document, "network", context), context + ".network");
    return model;
}

static json read_json_document(const string& path, const string& context)
{
    if (path.empty()) {
        throw IoError(context + ": invalid path");
    }

    std::error_code ec;
    if (std::filesystem::is_directory(path, ec)) {
        throw IoError(context + ": path is a directory: " + path);
    }

    ifstream f(path);
    if (!f) {
        throw IoError(context + ": failed to open file: " + path);
    }

    ostringstream contents;
    contents << f.rdbuf();
    if (f.bad()) {
        throw IoError(context + ": failed to read file: " + path);
    }

    json document;
    try {
        document = json::parse(contents.str());
    } catch (const json::parse_error& e) {
        throw CorruptFormatError(context + ": " + path + " is not valid JSON (" + e.what() + ")");
    }

    if (!document.is_object()) {
        throw CorruptFormatError(context + ": " + path + " must contain a JSON object");
    }
    return document;
}

static void write_json_document(const json& document, const string& path, const string& context)
{
    namespace fs = std::filesystem;

    if (path.empty()) {
        throw IoError(context + ": invalid path");
    }

    const fs::path target(path);
    std::error_code ec;

    if (target.has_parent_path()) {
        fs::create_directories(target.parent_path(), ec);
        if (ec) {
            throw IoError(context + ": failed to create directory " + target.parent_path().string() +
                          ": " + ec.message());
        }
    }

    // whole-file replacement: readers see either the old or the new document
    const fs::path staging(path + ".tmp");
    {
        ofstream f(staging, ios::out | ios::trunc);
        if (!f) {
            throw IoError(context + ": failed to open file for writing: " + staging.string());
        }

        f << document.dump(2) << '\n';
        f.close();
        if (!f) {
            std::error_code cleanup_ec;
            fs::remove(staging, cleanup_ec);
            throw IoError(context + ": failed to write file: " + staging.string());
        }
    }

    fs::rename(staging, target, ec);
    if (ec) {
        std::error_code cleanup_ec;
        fs::remove(staging, cleanup_ec);
        throw IoError(context + ": failed to replace " + path + ": " + ec.message());
    }
}

NetworkSnapshot snapshot_network(const Network& network)
{
    NetworkSnapshot snapshot;
    snapshot.architecture = network.get_architecture();
    snapshot.weights = network.get_weights();
    snapshot.biases = network.get_biases();
    snapshot.activation = network.get_activation().get_name();
    snapshot.learning_rate = network.get_learning_rate();
    return snapshot;
}

Network restore_network(const NetworkSnapshot& snapshot)
{
    const Activation activation = Activation::from_name(snapshot.activation);

    if (!isfinite(snapshot.learning_rate) || snapshot.learning_rate <= 0.0) {
        throw CorruptFormatError("restore_network: stored learning_rate must be positive and finite");
    }

    return Network::from_parameters(snapshot.architecture, snapshot.weights, snapshot.biases,
                                    activation, snapshot.learning_rate);
}

Checkpoint to_checkpoint(const Network& network, const CheckpointMetadata& metadata)
{
    Checkpoint checkpoint;
    checkpoint.metadata = metadata;
    checkpoint.network = snapshot_network(network);
    return checkpoint;
}

Network from_checkpoint(const Checkpoint& checkpoint)
{
    require_supported_version(checkpoint.metadata.version, "from_checkpoint");
    return restore_network(checkpoint.network);
}

void save_checkpoint(const Checkpoint& checkpoint, const string& path)
{
    require_finite_network(checkpoint.network, "save_checkpoint");
    if (!isfinite(checkpoint.metadata.learning_rate)) {
        throw CorruptFormatError("save_checkpoint: metadata learning_rate is not finite");
    }

    const CheckpointMetadata& m = checkpoint.metadata;

    const json document{
        {"metadata", {
            {"version", m.version},
            {"example", m.example},
            {"epoch", m.epoch},
            {"total_epochs", m.total_epochs},
            {"learning_rate", m.learning_rate},
            {"timestamp", m.timestamp},
        }},
        {"network", network_to_json(checkpoint.network)},
    };

    write_json_document(document, path, "save_checkpoint");
}

Checkpoint load_checkpoint(const string& path)
{
    return checkpoint_from_json(read_json_document(path, "load_checkpoint"), "load_checkpoint");
}

ModelFile to_model_file(const Network& network, const ModelSummary& summary)
{
    ModelFile model;
    model.summary = summary;
    model.network = snapshot_network(network);
    return model;
}

Network from_model_file(const ModelFile& model)
{
    require_supported_version(model.summary.version, "from_model_file");
    return restore_network(model.network);
}

void save_model(const ModelFile& model, const string& path)
{
    require_finite_network(model.network, "save_model");
    if (!isfinite(model.summary.final_accuracy) || !isfinite(model.summary.final_loss)) {
        throw CorruptFormatError("save_model: summary accuracy and loss must be finite");
    }

    const ModelSummary& s = model.summary;

    const json document{
        {"summary", {
            {"version", s.version},
            {"example", s.example},
            {"trained_epochs", s.trained_epochs},
            {"final_accuracy", s.final_accuracy},
            {"final_loss", s.final_loss},
            {"created", s.created},
        }},
        {"network", network_to_json(model.network)},
    };

    write_json_document(document, path, "save_model");
}

ModelFile load_model(const string& path)
{
    return model_from_json(read_json_document(path, "load_model"), "load_model");
}

static StoredFileKind file_kind_of(const json& document, const string& context)
{
    if (document.contains("metadata")) {
        return StoredFileKind::Checkpoint;
    }
    if (document.contains("summary")) {
        return StoredFileKind::Model;
    }
    throw CorruptFormatError(context + ": neither a checkpoint (metadata) nor a model file (summary)");
}

StoredFileKind detect_file_kind(const string& path)
{
    return file_kind_of(read_json_document(path, "detect_file_kind"), "detect_file_kind");
}

Network load_network(const string& path)
{
    const json document = read_json_document(path, "load_network");

    if (file_kind_of(document, "load_network") == StoredFileKind::Checkpoint) {
        return from_checkpoint(checkpoint_from_json(document, "load_network"));
    }
    return from_model_file(model_from_json(document, "load_network"));
}

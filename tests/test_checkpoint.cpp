#include "tests/test_common.hpp"

static CheckpointMetadata sample_metadata(size_t epoch, size_t total_epochs)
{
    CheckpointMetadata metadata;
    metadata.example = "xor";
    metadata.epoch = epoch;
    metadata.total_epochs = total_epochs;
    metadata.learning_rate = 0.5;
    metadata.timestamp = "2024-01-01T00:00:00Z";
    return metadata;
}

TEST_CASE("Checkpoint round trip restores a bit-identical network")
{
    TempDir dir("checkpoint_roundtrip");
    reset_deterministic_rng(42);

    Network network({2, 3, 1}, Activation::sigmoid(), 0.5);
    const Example ex = get_example("xor");
    network.train(ex.inputs, ex.targets, 50);

    const string path = dir.path("net.json");
    save_checkpoint(to_checkpoint(network, sample_metadata(50, 100)), path);

    const Checkpoint loaded = load_checkpoint(path);
    CHECK(loaded.metadata.version == CHECKPOINT_VERSION);
    CHECK(loaded.metadata.example == "xor");
    CHECK(loaded.metadata.epoch == 50);
    CHECK(loaded.metadata.total_epochs == 100);
    CHECK(loaded.metadata.learning_rate == doctest::Approx(0.5));
    CHECK(loaded.metadata.timestamp == "2024-01-01T00:00:00Z");
    CHECK(loaded.network.activation == "sigmoid");

    const Network restored = from_checkpoint(loaded);
    CHECK(same_parameters(network, restored));
    CHECK(restored.get_learning_rate() == network.get_learning_rate());
    CHECK(restored.get_activation() == network.get_activation());

    for (const auto& input : ex.inputs) {
        CHECK(restored.evaluate(input) == network.evaluate(input));
    }
}

TEST_CASE("save_checkpoint writes the documented layout")
{
    TempDir dir("checkpoint_layout");
    const Network network = make_zero_network({2, 1});

    const string path = dir.path("net.json");
    save_checkpoint(to_checkpoint(network, sample_metadata(1, 2)), path);

    const string text = read_text_file(path);
    CHECK(text.find("\"metadata\"") != string::npos);
    CHECK(text.find("\"version\": \"1.0\"") != string::npos);
    CHECK(text.find("\"network\"") != string::npos);
    CHECK(text.find("\"architecture\"") != string::npos);
    CHECK(text.find("\"activation\": \"sigmoid\"") != string::npos);

    CHECK_FALSE(std::filesystem::exists(path + ".tmp"));
}

TEST_CASE("save_checkpoint replaces an existing file and creates parent directories")
{
    TempDir dir("checkpoint_replace");
    const Network network = make_zero_network({2, 1});

    const string path = dir.path("nested/deeper/net.json");
    save_checkpoint(to_checkpoint(network, sample_metadata(1, 10)), path);
    save_checkpoint(to_checkpoint(network, sample_metadata(2, 10)), path);

    CHECK(load_checkpoint(path).metadata.epoch == 2);
}

TEST_CASE("load_checkpoint rejects an unsupported version before reading the network")
{
    TempDir dir("checkpoint_version");

    Checkpoint checkpoint = to_checkpoint(make_zero_network({2, 1}), sample_metadata(1, 2));
    checkpoint.metadata.version = "999.0";
    checkpoint.network.architecture = {7};

    const string path = dir.path("future.json");
    save_checkpoint(checkpoint, path);

    CHECK_THROWS_WITH_AS(load_checkpoint(path),
                         "load_checkpoint: unsupported format version '999.0', expected '1.0'",
                         UnsupportedVersionError);

    try {
        load_checkpoint(path);
        FAIL("expected UnsupportedVersionError");
    } catch (const UnsupportedVersionError& e) {
        CHECK(e.get_version() == "999.0");
    }

    CHECK_THROWS_AS(from_checkpoint(checkpoint), UnsupportedVersionError);
}

TEST_CASE("load_checkpoint reports missing files and directories as IoError")
{
    TempDir dir("checkpoint_missing");

    CHECK_THROWS_AS(load_checkpoint(dir.path("absent.json")), IoError);
    CHECK_THROWS_WITH_AS(load_checkpoint(""), "load_checkpoint: invalid path", IoError);
    CHECK_THROWS_AS(load_checkpoint(dir.root.string()), IoError);
}

TEST_CASE("load_checkpoint reports malformed documents as CorruptFormatError")
{
    TempDir dir("checkpoint_corrupt");

    const string garbage = dir.path("garbage.json");
    write_text_file(garbage, "{ this is not json");
    CHECK_THROWS_AS(load_checkpoint(garbage), CorruptFormatError);

    const string not_object = dir.path("array.json");
    write_text_file(not_object, "[1, 2, 3]");
    CHECK_THROWS_AS(load_checkpoint(not_object), CorruptFormatError);

    const string missing_network = dir.path("no_network.json");
    write_text_file(missing_network,
                    R"({"metadata": {"version": "1.0", "example": "and", "epoch": 1,
                        "total_epochs": 2, "learning_rate": 0.5, "timestamp": "t"}})");
    CHECK_THROWS_WITH_AS(load_checkpoint(missing_network),
                         "load_checkpoint: missing field 'network'",
                         CorruptFormatError);

    const string bad_epoch = dir.path("bad_epoch.json");
    write_text_file(bad_epoch,
                    R"({"metadata": {"version": "1.0", "example": "and", "epoch": -1,
                        "total_epochs": 2, "learning_rate": 0.5, "timestamp": "t"},
                        "network": {}})");
    CHECK_THROWS_WITH_AS(load_checkpoint(bad_epoch),
                         "load_checkpoint.metadata: field 'epoch' must be a non-negative integer",
                         CorruptFormatError);

    const string short_data = dir.path("short_data.json");
    write_text_file(short_data,
                    R"({"metadata": {"version": "1.0", "example": "and", "epoch": 1,
                        "total_epochs": 2, "learning_rate": 0.5, "timestamp": "t"},
                        "network": {"architecture": [2, 1],
                                    "weights": [{"rows": 1, "cols": 2, "data": [0.1]}],
                                    "biases": [{"rows": 1, "cols": 1, "data": [0.0]}],
                                    "activation": "sigmoid", "learning_rate": 0.5}})");
    CHECK_THROWS_AS(load_checkpoint(short_data), CorruptFormatError);
}

TEST_CASE("from_checkpoint rejects parameters that disagree with the architecture")
{
    Checkpoint checkpoint = to_checkpoint(make_zero_network({2, 3, 1}), sample_metadata(1, 2));
    checkpoint.network.architecture = {2, 4, 1};

    CHECK_THROWS_AS(from_checkpoint(checkpoint), ArchitectureMismatchError);

    checkpoint.network.architecture = {2, 3, 1};
    checkpoint.network.biases.pop_back();
    CHECK_THROWS_AS(from_checkpoint(checkpoint), ArchitectureMismatchError);
}

TEST_CASE("from_checkpoint rejects unknown activations and invalid learning rates")
{
    TempDir dir("checkpoint_activation");

    Checkpoint checkpoint = to_checkpoint(make_zero_network({2, 1}), sample_metadata(1, 2));
    checkpoint.network.activation = "tanh";

    const string path = dir.path("tanh.json");
    save_checkpoint(checkpoint, path);

    const Checkpoint loaded = load_checkpoint(path);
    CHECK_THROWS_WITH_AS(from_checkpoint(loaded),
                         "Activation::from_name: unknown activation 'tanh'. use sigmoid",
                         CorruptFormatError);
    CHECK_THROWS_AS(load_network(path), CorruptFormatError);

    checkpoint.network.activation = "sigmoid";
    checkpoint.network.learning_rate = -1.0;
    CHECK_THROWS_AS(from_checkpoint(checkpoint), CorruptFormatError);
}

TEST_CASE("save_checkpoint reports an unwritable destination as IoError")
{
    TempDir dir("checkpoint_unwritable");

    const string blocker = dir.path("blocker");
    write_text_file(blocker, "regular file");

    const Checkpoint checkpoint = to_checkpoint(make_zero_network({2, 1}), sample_metadata(1, 2));
    CHECK_THROWS_AS(save_checkpoint(checkpoint, blocker + "/net.json"), IoError);
    CHECK_THROWS_AS(save_checkpoint(checkpoint, ""), IoError);

    CHECK(read_text_file(blocker) == "regular file");
}

TEST_CASE("Model files round trip and are told apart from checkpoints")
{
    TempDir dir("checkpoint_model");
    reset_deterministic_rng(9);
    const Network network({2, 2, 1}, Activation::sigmoid(), 0.5);

    ModelSummary summary;
    summary.example = "and";
    summary.trained_epochs = 5000;
    summary.final_accuracy = 1.0;
    summary.final_loss = 0.001;
    summary.created = "2024-01-01T00:00:00Z";

    const string model_path = dir.path("model.json");
    save_model(to_model_file(network, summary), model_path);

    const ModelFile loaded = load_model(model_path);
    CHECK(loaded.summary.version == CHECKPOINT_VERSION);
    CHECK(loaded.summary.example == "and");
    CHECK(loaded.summary.trained_epochs == 5000);
    CHECK(loaded.summary.final_accuracy == doctest::Approx(1.0));
    CHECK(loaded.summary.final_loss == doctest::Approx(0.001));
    CHECK(same_parameters(network, from_model_file(loaded)));

    const string checkpoint_path = dir.path("checkpoint.json");
    save_checkpoint(to_checkpoint(network, sample_metadata(3, 4)), checkpoint_path);

    CHECK(detect_file_kind(model_path) == StoredFileKind::Model);
    CHECK(detect_file_kind(checkpoint_path) == StoredFileKind::Checkpoint);
    CHECK(same_parameters(network, load_network(model_path)));
    CHECK(same_parameters(network, load_network(checkpoint_path)));

    CHECK_THROWS_AS(load_checkpoint(model_path), CorruptFormatError);

    const string neither = dir.path("neither.json");
    write_text_file(neither, R"({"something": 1})");
    CHECK_THROWS_AS(detect_file_kind(neither), CorruptFormatError);
}

TEST_CASE("Saving refuses non-finite parameters and leaves the previous file")
{
    TempDir dir("checkpoint_non_finite");
    const string path = dir.path("net.json");

    const Network good = make_zero_network({2, 1});
    save_checkpoint(to_checkpoint(good, sample_metadata(1, 4)), path);

    const Network diverged = Network::from_parameters(
        {2, 1},
        {Matrix::from_data(1, 2, {numeric_limits<double>::quiet_NaN(), 0.0})},
        {Matrix::zeros(1, 1)},
        Activation::sigmoid(), 0.5);

    CHECK_THROWS_WITH_AS(save_checkpoint(to_checkpoint(diverged, sample_metadata(2, 4)), path),
                         "save_checkpoint: weights[0] contains a non-finite value",
                         CorruptFormatError);
    CHECK(load_checkpoint(path).metadata.epoch == 1);
    CHECK_FALSE(std::filesystem::exists(path + ".tmp"));

    Checkpoint infinite_bias = to_checkpoint(good, sample_metadata(2, 4));
    infinite_bias.network.biases[0](0, 0) = numeric_limits<double>::infinity();
    CHECK_THROWS_WITH_AS(save_checkpoint(infinite_bias, path),
                         "save_checkpoint: biases[0] contains a non-finite value",
                         CorruptFormatError);

    ModelSummary summary;
    summary.example = "and";
    summary.final_loss = numeric_limits<double>::quiet_NaN();
    CHECK_THROWS_AS(save_model(to_model_file(good, summary), dir.path("model.json")), CorruptFormatError);
    CHECK_FALSE(std::filesystem::exists(dir.path("model.json")));

    CHECK_THROWS_AS(save_model(to_model_file(diverged, ModelSummary{}), dir.path("model.json")),
                    CorruptFormatError);
}

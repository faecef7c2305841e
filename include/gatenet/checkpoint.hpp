#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "gatenet/matrix.hpp"
#include "gatenet/network.hpp"

// Only this format version is accepted by load_checkpoint and load_model.
inline constexpr const char* CHECKPOINT_VERSION = "1.0";

struct CheckpointMetadata
{
    std::string version = CHECKPOINT_VERSION;
    std::string example;
    std::size_t epoch = 0;
    std::size_t total_epochs = 0;
    double learning_rate = 0.0;
    std::string timestamp;
};

// Plain-data copy of everything needed to rebuild a Network.
struct NetworkSnapshot
{
    std::vector<std::size_t> architecture;
    std::vector<Matrix> weights;
    std::vector<Matrix> biases;
    std::string activation;
    double learning_rate = 0.0;
};

struct Checkpoint
{
    CheckpointMetadata metadata;
    NetworkSnapshot network;
};

struct ModelSummary
{
    std::string version = CHECKPOINT_VERSION;
    std::string example;
    std::size_t trained_epochs = 0;
    double final_accuracy = 0.0;
    double final_loss = 0.0;
    std::string created;
};

// Evaluation-only artifact: same network section, summary instead of
// resumable training metadata.
struct ModelFile
{
    ModelSummary summary;
    NetworkSnapshot network;
};

enum class StoredFileKind { Checkpoint, Model };

NetworkSnapshot snapshot_network(const Network& network);
Network restore_network(const NetworkSnapshot& snapshot);

Checkpoint to_checkpoint(const Network& network, const CheckpointMetadata& metadata);
Network from_checkpoint(const Checkpoint& checkpoint);

void save_checkpoint(const Checkpoint& checkpoint, const std::string& path);
Checkpoint load_checkpoint(const std::string& path);

ModelFile to_model_file(const Network& network, const ModelSummary& summary);
Network from_model_file(const ModelFile& model);

void save_model(const ModelFile& model, const std::string& path);
ModelFile load_model(const std::string& path);

StoredFileKind detect_file_kind(const std::string& path);
// rebuilds the network from either a checkpoint or a model file
Network load_network(const std::string& path);

#include "gatenet/training.hpp"

#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>

#include "gatenet/core_utils.hpp"
#include "gatenet/errors.hpp"
#include "gatenet/losses.hpp"

using std::cout;
using std::optional;
using std::runtime_error;
using std::size_t;
using std::string;
using std::to_string;
using std::vector;

const char* training_state_name(TrainingState state)
{
    switch (state) {
    case TrainingState::Idle:
        return "idle";
    case TrainingState::Running:
        return "running";
    case TrainingState::Completed:
        return "completed";
    case TrainingState::Interrupted:
        return "interrupted";
    case TrainingState::Failed:
        return "failed";
    }
    return "unknown";
}

FunctionCallback::FunctionCallback(EpochFunction on_epoch, EndFunction on_end)
    : on_epoch(std::move(on_epoch)), on_end(std::move(on_end))
{
    if (!this->on_epoch) {
        throw runtime_error("FunctionCallback: epoch function must be set");
    }
}

CallbackAction FunctionCallback::on_epoch_end(const EpochReport& report)
{
    return on_epoch(report.epoch, report.loss) ? CallbackAction::Continue : CallbackAction::Stop;
}

void FunctionCallback::on_training_end(const TrainingSummary& summary)
{
    if (on_end) {
        on_end(summary);
    }
}

TrainingController::TrainingController(Network network, TrainingConfig config)
    : network(std::move(network)), config(std::move(config))
{
    validate_config(this->config);
}

void TrainingController::validate_config(const TrainingConfig& config)
{
    if (config.epochs == 0) {
        throw runtime_error("TrainingController: epochs must be > 0");
    }
    if (config.checkpoint_interval && *config.checkpoint_interval == 0) {
        throw runtime_error("TrainingController: checkpoint_interval must be > 0");
    }
    if (config.checkpoint_path && config.checkpoint_path->empty()) {
        throw runtime_error("TrainingController: checkpoint_path must not be empty");
    }
}

TrainingController TrainingController::resume_from_checkpoint(const string& path, TrainingConfig config)
{
    validate_config(config);

    const Checkpoint checkpoint = load_checkpoint(path);
    Network restored = from_checkpoint(checkpoint);

    if (checkpoint.metadata.epoch >= config.epochs) {
        throw NothingToResumeError("TrainingController::resume_from_checkpoint: checkpoint is at epoch " +
                                   to_string(checkpoint.metadata.epoch) + ", target is " +
                                   to_string(config.epochs) + " epochs");
    }

    if (config.example_name.empty()) {
        config.example_name = checkpoint.metadata.example;
    }

    TrainingController controller(std::move(restored), std::move(config));
    controller.current_epoch = checkpoint.metadata.epoch;
    return controller;
}

void TrainingController::add_callback(TrainingCallback& callback)
{
    if (state != TrainingState::Idle) {
        throw runtime_error("TrainingController::add_callback: callbacks can only be added while idle");
    }
    callbacks.push_back(&callback);
}

void TrainingController::add_callback(FunctionCallback::EpochFunction on_epoch,
                                      FunctionCallback::EndFunction on_end)
{
    auto callback = std::make_unique<FunctionCallback>(std::move(on_epoch), std::move(on_end));
    add_callback(*callback);
    owned_callbacks.push_back(std::move(callback));
}

void TrainingController::validate_dataset(const vector<vector<double>>& inputs,
                                          const vector<vector<double>>& targets) const
{
    if (inputs.empty()) {
        throw runtime_error("TrainingController::train: inputs must be non-empty");
    }
    if (inputs.size() != targets.size()) {
        throw DimensionMismatchError("TrainingController::train: got " + to_string(inputs.size()) +
                                     " inputs but " + to_string(targets.size()) + " targets");
    }

    for (size_t i = 0; i < inputs.size(); ++i) {
        if (inputs[i].size() != network.get_input_size()) {
            throw DimensionMismatchError("TrainingController::train: input " + to_string(i) + " has " +
                                         to_string(inputs[i].size()) + " values, network expects " +
                                         to_string(network.get_input_size()));
        }
        if (targets[i].size() != network.get_output_size()) {
            throw DimensionMismatchError("TrainingController::train: target " + to_string(i) + " has " +
                                         to_string(targets[i].size()) + " values, network produces " +
                                         to_string(network.get_output_size()));
        }
    }
}

TrainingState TrainingController::train(const vector<vector<double>>& inputs,
                                        const vector<vector<double>>& targets)
{
    if (state == TrainingState::Running) {
        throw runtime_error("TrainingController::train: training is already running");
    }
    if (state == TrainingState::Failed) {
        throw runtime_error("TrainingController::train: controller has failed, resume from the last checkpoint");
    }
    if (state != TrainingState::Idle) {
        throw runtime_error(string("TrainingController::train: controller is ") + training_state_name(state) +
                            ", raise the budget with set_total_epochs to continue");
    }

    validate_dataset(inputs, targets);

    vector<Matrix> input_columns;
    vector<Matrix> target_columns;
    input_columns.reserve(inputs.size());
    target_columns.reserve(targets.size());
    for (size_t i = 0; i < inputs.size(); ++i) {
        input_columns.push_back(Matrix::column(inputs[i]));
        target_columns.push_back(Matrix::column(targets[i]));
    }

    state = TrainingState::Running;

    try {
        LossMeanSquaredError loss;

        for (size_t epoch = current_epoch + 1; epoch <= config.epochs; ++epoch) {
            loss.new_pass();
            for (size_t i = 0; i < input_columns.size(); ++i) {
                loss.add_sample_loss(network.train_step(input_columns[i], target_columns[i]));
            }

            const double epoch_loss = loss.calculate_accumulated();
            current_epoch = epoch;
            last_loss = epoch_loss;

            if (config.verbose && should_log_epoch(epoch)) {
                cout << "epoch: " << epoch << '/' << config.epochs << ", loss: " << epoch_loss << '\n';
            }

            vector<Matrix> predictions;
            predictions.reserve(input_columns.size());
            for (const Matrix& input : input_columns) {
                predictions.push_back(network.evaluate(input));
            }

            const EpochReport report{epoch, config.epochs, epoch_loss, predictions, network};

            // every callback sees the epoch even after an earlier one asked to stop
            bool stop_requested = false;
            for (TrainingCallback* callback : callbacks) {
                CallbackAction action = CallbackAction::Continue;
                try {
                    action = callback->on_epoch_end(report);
                } catch (const TrainingCancelled&) {
                    action = CallbackAction::Stop;
                }
                if (action == CallbackAction::Stop) {
                    stop_requested = true;
                }
            }

            if (stop_requested) {
                if (config.checkpoint_path) {
                    write_checkpoint(*config.checkpoint_path);
                }
                if (config.verbose) {
                    cout << "training interrupted at epoch " << epoch << '\n';
                }
                state = TrainingState::Interrupted;
                notify_training_end();
                return state;
            }

            if (checkpoint_due(epoch)) {
                write_checkpoint(*config.checkpoint_path);
            }
        }

        state = TrainingState::Completed;
        notify_training_end();
    } catch (const std::exception&) {
        state = TrainingState::Failed;
        throw;
    }

    return state;
}

bool TrainingController::checkpoint_due(size_t epoch) const
{
    if (!config.checkpoint_path) {
        return false;
    }
    if (epoch == config.epochs) {
        return true;
    }
    return config.checkpoint_interval && epoch % *config.checkpoint_interval == 0;
}

bool TrainingController::should_log_epoch(size_t epoch) const
{
    if (config.epochs < 100) {
        return true;
    }
    return epoch % (config.epochs / 100) == 0;
}

void TrainingController::notify_training_end()
{
    const TrainingSummary summary{state, current_epoch, config.epochs, last_loss};
    for (TrainingCallback* callback : callbacks) {
        callback->on_training_end(summary);
    }
}

CheckpointMetadata TrainingController::make_metadata() const
{
    CheckpointMetadata metadata;
    metadata.version = CHECKPOINT_VERSION;
    metadata.example = config.example_name.empty() ? "training" : config.example_name;
    metadata.epoch = current_epoch;
    metadata.total_epochs = config.epochs;
    metadata.learning_rate = network.get_learning_rate();
    metadata.timestamp = utc_timestamp_iso8601();
    return metadata;
}

void TrainingController::write_checkpoint(const string& path) const
{
    ::save_checkpoint(to_checkpoint(network, make_metadata()), path);

    if (config.verbose) {
        cout << "checkpoint saved: " << path << " (epoch " << current_epoch << ")\n";
    }
}

void TrainingController::save_checkpoint() const
{
    if (!config.checkpoint_path) {
        throw runtime_error("TrainingController::save_checkpoint: no checkpoint_path configured");
    }
    write_checkpoint(*config.checkpoint_path);
}

void TrainingController::save_checkpoint(const string& path) const
{
    write_checkpoint(path);
}

void TrainingController::set_total_epochs(size_t epochs)
{
    if (state == TrainingState::Running) {
        throw runtime_error("TrainingController::set_total_epochs: training is running");
    }
    if (epochs == 0) {
        throw runtime_error("TrainingController: epochs must be > 0");
    }

    config.epochs = epochs;
    if ((state == TrainingState::Completed || state == TrainingState::Interrupted) && current_epoch < epochs) {
        state = TrainingState::Idle;
    }
}

TrainingState TrainingController::get_state() const
{
    return state;
}

size_t TrainingController::get_current_epoch() const
{
    return current_epoch;
}

optional<double> TrainingController::get_last_loss() const
{
    return last_loss;
}

const TrainingConfig& TrainingController::get_config() const
{
    return config;
}

const Network& TrainingController::get_network() const
{
    return network;
}

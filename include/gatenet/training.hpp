#pragma once

#include <cstddef>
#include <exception>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "gatenet/checkpoint.hpp"
#include "gatenet/matrix.hpp"
#include "gatenet/network.hpp"

enum class TrainingState { Idle, Running, Completed, Interrupted, Failed };

enum class CallbackAction { Continue, Stop };

const char* training_state_name(TrainingState state);

struct TrainingConfig
{
    std::size_t epochs = 0;
    // with a checkpoint_path, save every checkpoint_interval epochs
    std::optional<std::size_t> checkpoint_interval;
    // when set, a checkpoint is also written after the final epoch and on cancellation
    std::optional<std::string> checkpoint_path;
    bool verbose = false;
    std::string example_name;
};

// What a callback sees after each completed epoch. Valid only for the
// duration of the call.
struct EpochReport
{
    std::size_t epoch;
    std::size_t total_epochs;
    double loss;
    const std::vector<Matrix>& predictions;
    const Network& network;
};

struct TrainingSummary
{
    TrainingState state;
    std::size_t epochs_completed;
    std::size_t total_epochs;
    std::optional<double> final_loss;
};

// Thrown from on_epoch_end as an alternative to returning CallbackAction::Stop.
class TrainingCancelled : public std::exception
{
public:
    const char* what() const noexcept override
    {
        return "training cancelled by callback";
    }
};

class TrainingCallback
{
public:
    virtual ~TrainingCallback() = default;

    virtual CallbackAction on_epoch_end(const EpochReport& report) = 0;
    virtual void on_training_end(const TrainingSummary&) {}
};

class FunctionCallback : public TrainingCallback
{
public:
    // return false to request cancellation
    using EpochFunction = std::function<bool(std::size_t epoch, double loss)>;
    using EndFunction = std::function<void(const TrainingSummary& summary)>;

    explicit FunctionCallback(EpochFunction on_epoch, EndFunction on_end = nullptr);

    CallbackAction on_epoch_end(const EpochReport& report) override;
    void on_training_end(const TrainingSummary& summary) override;

private:
    EpochFunction on_epoch;
    EndFunction on_end;
};

// Runs full-batch training epochs over a fixed dataset.
//
//   Idle -> Running -> Completed | Interrupted | Failed
//
// Cancellation is only observed between epochs, so the network and every
// checkpoint always correspond to a whole number of epochs. A Completed or
// Interrupted controller can be trained further after set_total_epochs.
class TrainingController
{
public:
    TrainingController(Network network, TrainingConfig config);

    TrainingController(const TrainingController&) = delete;
    TrainingController& operator=(const TrainingController&) = delete;
    TrainingController(TrainingController&&) noexcept = default;
    TrainingController& operator=(TrainingController&&) noexcept = default;

    static TrainingController resume_from_checkpoint(const std::string& path, TrainingConfig config);

    // callback must outlive the controller
    void add_callback(TrainingCallback& callback);
    void add_callback(FunctionCallback::EpochFunction on_epoch,
                      FunctionCallback::EndFunction on_end = nullptr);

    TrainingState train(const std::vector<std::vector<double>>& inputs,
                        const std::vector<std::vector<double>>& targets);

    void save_checkpoint() const;
    void save_checkpoint(const std::string& path) const;

    void set_total_epochs(std::size_t epochs);

    TrainingState get_state() const;
    std::size_t get_current_epoch() const;
    std::optional<double> get_last_loss() const;
    const TrainingConfig& get_config() const;
    const Network& get_network() const;

private:
    static void validate_config(const TrainingConfig& config);
    void validate_dataset(const std::vector<std::vector<double>>& inputs,
                          const std::vector<std::vector<double>>& targets) const;

    CheckpointMetadata make_metadata() const;
    void write_checkpoint(const std::string& path) const;
    bool checkpoint_due(std::size_t epoch) const;
    bool should_log_epoch(std::size_t epoch) const;
    void notify_training_end();

    Network network;
    TrainingConfig config;
    std::vector<TrainingCallback*> callbacks;
    std::vector<std::unique_ptr<TrainingCallback>> owned_callbacks;

    std::size_t current_epoch = 0;
    TrainingState state = TrainingState::Idle;
    std::optional<double> last_loss;
};

#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "gatenet/training.hpp"

// Records the loss of every completed epoch, in order.
class LossHistory : public TrainingCallback
{
public:
    CallbackAction on_epoch_end(const EpochReport& report) override;

    const std::vector<std::size_t>& get_epochs() const;
    const std::vector<double>& get_losses() const;

private:
    std::vector<std::size_t> epochs;
    std::vector<double> losses;
};

void plot_loss_curve(const std::string& path, const std::vector<double>& losses, std::size_t first_epoch = 1);

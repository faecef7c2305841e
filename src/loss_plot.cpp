#include "gatenet/loss_plot.hpp"

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#ifdef ENABLE_MATPLOT
#include <matplot/matplot.h>
#endif

using std::runtime_error;
using std::size_t;
using std::string;
using std::vector;

CallbackAction LossHistory::on_epoch_end(const EpochReport& report)
{
    epochs.push_back(report.epoch);
    losses.push_back(report.loss);
    return CallbackAction::Continue;
}

const vector<size_t>& LossHistory::get_epochs() const
{
    return epochs;
}

const vector<double>& LossHistory::get_losses() const
{
    return losses;
}

void plot_loss_curve(const string& path, const vector<double>& losses, size_t first_epoch)
{
#ifndef ENABLE_MATPLOT
    (void)path;
    (void)losses;
    (void)first_epoch;
    throw runtime_error("plot_loss_curve: built without Matplot++ (ENABLE_MATPLOT=OFF)");
#else
    if (path.empty()) {
        throw runtime_error("plot_loss_curve: given path is invalid");
    }
    if (losses.empty()) {
        throw runtime_error("plot_loss_curve: losses must be non-empty");
    }

    vector<double> xs;
    xs.reserve(losses.size());
    for (size_t i = 0; i < losses.size(); ++i) {
        xs.push_back(static_cast<double>(first_epoch + i));
    }

    const auto [min_it, max_it] = std::minmax_element(losses.begin(), losses.end());
    const double pad = std::max((*max_it - *min_it) * 0.05, 1e-6);

    matplot::figure(true);
    auto p = matplot::plot(xs, losses, "-");
    p->line_width(1.5);

    matplot::title("Training Loss");
    matplot::xlabel("epoch");
    matplot::ylabel("mean squared error");
    matplot::xlim({xs.front(), std::max(xs.back(), xs.front() + 1.0)});
    matplot::ylim({*min_it - pad, *max_it + pad});
    matplot::grid(matplot::on);

    (void)matplot::save(path);

    // some Matplot++/backend combinations complete file output asynchronously
    constexpr int max_attempts = 100;
    constexpr auto retry_delay = std::chrono::milliseconds(10);
    bool wrote_file = false;
    for (int attempt = 0; attempt < max_attempts; ++attempt) {
        std::error_code ec;
        const bool exists = std::filesystem::exists(path, ec);
        const auto bytes = (exists && !ec) ? std::filesystem::file_size(path, ec) : 0;
        wrote_file = !ec && exists && bytes > 0;
        if (wrote_file) {
            break;
        }
        std::this_thread::sleep_for(retry_delay);
    }

    if (!wrote_file) {
        throw runtime_error("plot_loss_curve: failed to write output file: " + path);
    }
#endif
}

#include "gatenet/cli.hpp"

#include <csignal>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <iomanip>
#include <limits>
#include <map>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "gatenet/accuracy.hpp"
#include "gatenet/activations.hpp"
#include "gatenet/checkpoint.hpp"
#include "gatenet/core_utils.hpp"
#include "gatenet/data.hpp"
#include "gatenet/loss_plot.hpp"
#include "gatenet/network.hpp"
#include "gatenet/rng.hpp"
#include "gatenet/training.hpp"

using std::endl;
using std::fixed;
using std::map;
using std::numeric_limits;
using std::ostream;
using std::ostringstream;
using std::runtime_error;
using std::setprecision;
using std::size_t;
using std::string;
using std::vector;

static volatile std::sig_atomic_t g_interrupt_requested = 0;

void request_interrupt()
{
    g_interrupt_requested = 1;
}

bool interrupt_requested()
{
    return g_interrupt_requested != 0;
}

void reset_interrupt()
{
    g_interrupt_requested = 0;
}

struct OptionSpec
{
    const char* long_name;
    char short_name;
    bool takes_value;
};

using OptionValues = map<string, string>;

static const vector<OptionSpec> train_options = {
    {"example", 'e', true},
    {"epochs", 'n', true},
    {"learning-rate", 'l', true},
    {"output", 'o', true},
    {"checkpoint", 'c', true},
    {"checkpoint-interval", 'k', true},
    {"seed", 's', true},
    {"plot", 'p', true},
    {"verbose", 'v', false},
};

static const vector<OptionSpec> resume_options = {
    {"checkpoint", 'c', true},
    {"epochs", 'n', true},
    {"output", 'o', true},
    {"checkpoint-interval", 'k', true},
    {"plot", 'p', true},
    {"verbose", 'v', false},
};

static const vector<OptionSpec> eval_options = {
    {"model", 'm', true},
    {"input", 'i', true},
};

static const vector<OptionSpec> info_options = {
    {"model", 'm', true},
};

static OptionValues parse_options(const vector<string>& args, size_t first,
                                  const vector<OptionSpec>& specs, const string& command)
{
    OptionValues values;

    for (size_t i = first; i < args.size(); ++i) {
        string arg = args[i];
        string inline_value;
        bool has_inline_value = false;

        const size_t eq = arg.find('=');
        if (arg.rfind("--", 0) == 0 && eq != string::npos) {
            inline_value = arg.substr(eq + 1);
            arg = arg.substr(0, eq);
            has_inline_value = true;
        }

        const OptionSpec* spec = nullptr;
        for (const OptionSpec& s : specs) {
            if (arg == string("--") + s.long_name || (arg.size() == 2 && arg[0] == '-' && arg[1] == s.short_name)) {
                spec = &s;
                break;
            }
        }

        if (!spec) {
            throw runtime_error("unknown option for '" + command + "': " + args[i]);
        }

        if (!spec->takes_value) {
            if (has_inline_value) {
                throw runtime_error("option --" + string(spec->long_name) + " does not take a value");
            }
            values[spec->long_name] = "true";
            continue;
        }

        if (has_inline_value) {
            values[spec->long_name] = inline_value;
        } else if (i + 1 < args.size()) {
            values[spec->long_name] = args[++i];
        } else {
            throw runtime_error("missing value for --" + string(spec->long_name));
        }
    }

    return values;
}

static bool has_option(const OptionValues& options, const char* name)
{
    return options.find(name) != options.end();
}

static const string& require_option(const OptionValues& options, const char* name, const string& command)
{
    const auto it = options.find(name);
    if (it == options.end()) {
        throw runtime_error("'" + command + "' requires --" + name);
    }
    return it->second;
}

static size_t parse_size(const string& text, const char* name)
{
    size_t consumed = 0;
    unsigned long long value = 0;
    try {
        value = std::stoull(text, &consumed);
    } catch (const std::logic_error&) {
        throw runtime_error(string("invalid value for --") + name + ": " + text);
    }
    if (consumed != text.size() || text.find('-') != string::npos ||
        value > static_cast<unsigned long long>(numeric_limits<size_t>::max())) {
        throw runtime_error(string("invalid value for --") + name + ": " + text);
    }
    return static_cast<size_t>(value);
}

static double parse_double(const string& text, const char* name)
{
    size_t consumed = 0;
    double value = 0.0;
    try {
        value = std::stod(text, &consumed);
    } catch (const std::logic_error&) {
        throw runtime_error(string("invalid value for --") + name + ": " + text);
    }
    if (consumed != text.size()) {
        throw runtime_error(string("invalid value for --") + name + ": " + text);
    }
    return value;
}

static vector<double> parse_input_list(const string& text)
{
    vector<double> values;
    std::istringstream stream(text);
    string item;
    while (std::getline(stream, item, ',')) {
        values.push_back(parse_double(item, "input"));
    }
    if (values.empty()) {
        throw runtime_error("invalid value for --input: " + text);
    }
    return values;
}

static string format_values(const vector<double>& values)
{
    ostringstream oss;
    oss << '[' << fixed << setprecision(6);
    for (size_t i = 0; i < values.size(); ++i) {
        if (i != 0) {
            oss << ", ";
        }
        oss << values[i];
    }
    oss << ']';
    return oss.str();
}

class InterruptCallback : public TrainingCallback
{
public:
    explicit InterruptCallback(ostream& out)
        : out(out)
    {
    }

    CallbackAction on_epoch_end(const EpochReport& report) override
    {
        if (!interrupt_requested()) {
            return CallbackAction::Continue;
        }
        out << "Interrupt received, stopping after epoch " << report.epoch << endl;
        return CallbackAction::Stop;
    }

private:
    ostream& out;
};

static void print_usage(ostream& out)
{
    out << "gatenet " << GATENET_VERSION << " - Neural Network Demonstration Platform\n"
        << "\n"
        << "usage: gatenet <command> [options]\n"
        << "\n"
        << "commands:\n"
        << "  list                              list available training examples\n"
        << "  train  -e NAME [-n EPOCHS] [-l RATE] [-o MODEL] [-c CHECKPOINT]\n"
        << "         [-k INTERVAL] [-s SEED] [-p PLOT] [-v]\n"
        << "                                    train a network on an example\n"
        << "  resume -c CHECKPOINT -n EPOCHS [-o MODEL] [-k INTERVAL] [-p PLOT] [-v]\n"
        << "                                    continue training from a checkpoint\n"
        << "  eval   -m MODEL [-i a,b,...]      evaluate a trained model\n"
        << "  info   -m MODEL                   show checkpoint or model metadata\n"
        << "\n"
        << "  -h, --help                        show this message\n"
        << "  -V, --version                     show the version\n";
}

static void print_results(const Network& network, const Example& example, ostream& out)
{
    out << "\nResults:\n";
    for (size_t i = 0; i < example.inputs.size(); ++i) {
        out << "  " << format_values(example.inputs[i])
            << " -> " << format_values(network.evaluate(example.inputs[i]))
            << " (expected " << format_values(example.targets[i]) << ")\n";
    }
    out << "Accuracy: " << dataset_accuracy(network, example.inputs, example.targets) * 100.0 << "%\n";
    out << "Loss: " << dataset_loss(network, example.inputs, example.targets) << '\n';
}

static int run_training(TrainingController& controller, const Example& example,
                        const OptionValues& options, ostream& out)
{
    LossHistory history;
    controller.add_callback(history);
    InterruptCallback interrupt(out);
    controller.add_callback(interrupt);

    reset_interrupt();
    out << "Training..." << endl;
    const TrainingState state = controller.train(example.inputs, example.targets);

    const TrainingConfig& config = controller.get_config();
    if (state == TrainingState::Interrupted) {
        out << "Training interrupted at epoch " << controller.get_current_epoch()
            << " of " << config.epochs << '\n';
        if (config.checkpoint_path) {
            out << "Checkpoint saved to: " << *config.checkpoint_path << '\n'
                << "Resume with: gatenet resume --checkpoint " << *config.checkpoint_path
                << " --epochs " << config.epochs << '\n';
        }
    } else {
        out << "Training complete!\n";
    }

    const Network& network = controller.get_network();
    print_results(network, example, out);

    if (has_option(options, "output")) {
        const string& output_path = options.at("output");

        ModelSummary summary;
        summary.example = example.name;
        summary.trained_epochs = controller.get_current_epoch();
        summary.final_accuracy = dataset_accuracy(network, example.inputs, example.targets);
        summary.final_loss = dataset_loss(network, example.inputs, example.targets);
        summary.created = utc_timestamp_iso8601();

        out << "\nSaving model to: " << output_path << '\n';
        save_model(to_model_file(network, summary), output_path);
        out << "Model saved successfully!\n";
    }

    if (has_option(options, "plot") && !history.get_losses().empty()) {
        const string& plot_path = options.at("plot");
        plot_loss_curve(plot_path, history.get_losses(), history.get_epochs().front());
        out << "Loss curve written to: " << plot_path << '\n';
    }

    return 0;
}

static void apply_checkpoint_options(const OptionValues& options, TrainingConfig& config)
{
    if (has_option(options, "checkpoint-interval")) {
        if (!config.checkpoint_path) {
            throw runtime_error("--checkpoint-interval requires --checkpoint");
        }
        config.checkpoint_interval = parse_size(options.at("checkpoint-interval"), "checkpoint-interval");
    }
    config.verbose = has_option(options, "verbose");
}

static int cmd_list(ostream& out)
{
    out << "Available Examples:\n\n";
    for (const string& name : list_examples()) {
        const Example example = get_example(name);
        out << "  " << name << " - " << example.description << '\n';
    }
    return 0;
}

static int cmd_train(const OptionValues& options, ostream& out)
{
    const Example example = get_example(require_option(options, "example", "train"));

    const size_t epochs = has_option(options, "epochs")
        ? parse_size(options.at("epochs"), "epochs")
        : example.recommended_epochs;
    const double learning_rate = has_option(options, "learning-rate")
        ? parse_double(options.at("learning-rate"), "learning-rate")
        : example.recommended_learning_rate;

    if (has_option(options, "seed")) {
        const size_t seed = parse_size(options.at("seed"), "seed");
        if (seed > numeric_limits<uint32_t>::max()) {
            throw runtime_error("invalid value for --seed: " + options.at("seed"));
        }
        set_global_seed(static_cast<uint32_t>(seed));
    } else {
        set_nondeterministic_seed();
    }

    TrainingConfig config;
    config.epochs = epochs;
    config.example_name = example.name;
    if (has_option(options, "checkpoint")) {
        config.checkpoint_path = options.at("checkpoint");
    }
    apply_checkpoint_options(options, config);

    out << "Training " << example.name << " network\n"
        << "Architecture: " << format_architecture(example.recommended_architecture) << '\n'
        << "Epochs: " << epochs << '\n'
        << "Learning rate: " << learning_rate << "\n\n";

    TrainingController controller(
        Network(example.recommended_architecture, Activation::sigmoid(), learning_rate), config);
    return run_training(controller, example, options, out);
}

static int cmd_resume(const OptionValues& options, ostream& out)
{
    const string& checkpoint_path = require_option(options, "checkpoint", "resume");

    TrainingConfig config;
    config.epochs = parse_size(require_option(options, "epochs", "resume"), "epochs");
    config.checkpoint_path = checkpoint_path;
    apply_checkpoint_options(options, config);

    TrainingController controller = TrainingController::resume_from_checkpoint(checkpoint_path, config);

    const string& example_name = controller.get_config().example_name;
    if (!has_example(example_name)) {
        throw runtime_error("checkpoint example '" + example_name + "' is not a built-in example");
    }
    const Example example = get_example(example_name);

    out << "Resuming " << example.name << " training from epoch " << controller.get_current_epoch()
        << " to epoch " << config.epochs << '\n'
        << "Architecture: " << format_architecture(controller.get_network().get_architecture()) << '\n'
        << "Learning rate: " << controller.get_network().get_learning_rate() << "\n\n";

    return run_training(controller, example, options, out);
}

static string stored_example_name(const string& path)
{
    if (detect_file_kind(path) == StoredFileKind::Checkpoint) {
        return load_checkpoint(path).metadata.example;
    }
    return load_model(path).summary.example;
}

static int cmd_eval(const OptionValues& options, ostream& out)
{
    const string& model_path = require_option(options, "model", "eval");
    const Network network = load_network(model_path);

    if (has_option(options, "input")) {
        const vector<double> input = parse_input_list(options.at("input"));
        out << "Input: " << format_values(input) << '\n'
            << "Output: " << format_values(network.evaluate(input)) << '\n';
        return 0;
    }

    const string example_name = stored_example_name(model_path);
    if (!has_example(example_name)) {
        throw runtime_error("no --input given and '" + example_name + "' is not a built-in example");
    }

    const Example example = get_example(example_name);
    out << "Evaluating " << example.name << " truth table\n";
    print_results(network, example, out);
    return 0;
}

static int cmd_info(const OptionValues& options, ostream& out)
{
    const string& model_path = require_option(options, "model", "info");

    if (detect_file_kind(model_path) == StoredFileKind::Checkpoint) {
        const Checkpoint checkpoint = load_checkpoint(model_path);
        const Network network = from_checkpoint(checkpoint);
        const CheckpointMetadata& m = checkpoint.metadata;

        out << "Checkpoint: " << model_path << '\n'
            << "  Version: " << m.version << '\n'
            << "  Example: " << m.example << '\n'
            << "  Epoch: " << m.epoch << " / " << m.total_epochs << '\n'
            << "  Learning rate: " << m.learning_rate << '\n'
            << "  Timestamp: " << m.timestamp << '\n'
            << "  Architecture: " << format_architecture(network.get_architecture()) << '\n'
            << "  Activation: " << network.get_activation().get_name() << '\n'
            << "  Parameters: " << network.parameter_count() << '\n';
        return 0;
    }

    const ModelFile model = load_model(model_path);
    const Network network = from_model_file(model);
    const ModelSummary& s = model.summary;

    out << "Model: " << model_path << '\n'
        << "  Version: " << s.version << '\n'
        << "  Example: " << s.example << '\n'
        << "  Trained epochs: " << s.trained_epochs << '\n'
        << "  Final accuracy: " << s.final_accuracy * 100.0 << "%\n"
        << "  Final loss: " << s.final_loss << '\n'
        << "  Created: " << s.created << '\n'
        << "  Architecture: " << format_architecture(network.get_architecture()) << '\n'
        << "  Activation: " << network.get_activation().get_name() << '\n'
        << "  Learning rate: " << network.get_learning_rate() << '\n'
        << "  Parameters: " << network.parameter_count() << '\n';
    return 0;
}

int run_cli(const vector<string>& args, ostream& out, ostream& err)
{
    if (args.empty()) {
        print_usage(err);
        return 1;
    }

    const string& command = args[0];

    try {
        if (command == "-h" || command == "--help" || command == "help") {
            print_usage(out);
            return 0;
        }
        if (command == "-V" || command == "--version") {
            out << "gatenet " << GATENET_VERSION << '\n';
            return 0;
        }
        if (command == "list") {
            parse_options(args, 1, {}, command);
            return cmd_list(out);
        }
        if (command == "train") {
            return cmd_train(parse_options(args, 1, train_options, command), out);
        }
        if (command == "resume") {
            return cmd_resume(parse_options(args, 1, resume_options, command), out);
        }
        if (command == "eval") {
            return cmd_eval(parse_options(args, 1, eval_options, command), out);
        }
        if (command == "info") {
            return cmd_info(parse_options(args, 1, info_options, command), out);
        }
    } catch (const std::exception& e) {
        err << "error: " << e.what() << '\n';
        return 1;
    }

    err << "error: unknown command '" << command << "'\n\n";
    print_usage(err);
    return 1;
}

// src/tinylm.cpp
// Command line front end: prepare | vocab | train | eval | generate
#include "tinylm/config.hpp"
#include "tinylm/data/dataset.hpp"
#include "tinylm/errors.hpp"
#include "tinylm/inference/generation_engine.hpp"
#include "tinylm/tokenizer/bpe_tokenizer.hpp"
#include "tinylm/training/evaluator.hpp"
#include "tinylm/training/progress.hpp"
#include "tinylm/training/trainer.hpp"
#ifdef TINYLM_WITH_MPI
#include "tinylm/distributed/mpi_communicator.hpp"
#endif
#include <boost/program_options.hpp>
#include <atomic>
#include <chrono>
#include <csignal>
#include <iomanip>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

namespace po = boost::program_options;
using namespace tinylm;

namespace {

volatile std::sig_atomic_t g_interrupted = 0;

void handle_interrupt(int) {
    g_interrupted = 1;
}

bool is_finished(training::TrainingState state) {
    return state == training::TrainingState::Completed ||
           state == training::TrainingState::Failed ||
           state == training::TrainingState::Cancelled;
}

void print_event(const training::ProgressEvent& event) {
    using training::EventKind;
    switch (event.kind) {
        case EventKind::Step:
            break;
        case EventKind::Evaluation:
            if (event.seed) {
                std::cout << "[eval " << event.step << "/" << event.max_steps << "] seed " << *event.seed
                          << ": val loss " << std::fixed << std::setprecision(4) << event.val_loss.value_or(0.0)
                          << std::defaultfloat << std::endl;
            }
            break;
        case EventKind::Checkpoint:
            std::cout << "[checkpoint] " << event.message << " -> " << event.checkpoint_path << std::endl;
            break;
        case EventKind::Completed:
        case EventKind::Cancelled:
            std::cout << "[" << training::to_string(event.kind) << "] " << event.message << std::endl;
            break;
        case EventKind::Failed:
            std::cerr << "[failed] " << event.message;
            if (!event.checkpoint_path.empty()) {
                std::cerr << " (last checkpoint: " << event.checkpoint_path << ")";
            }
            std::cerr << std::endl;
            break;
    }
}

std::vector<std::string> split_lines(const std::string& text) {
    std::vector<std::string> lines;
    std::istringstream stream(text);
    std::string line;
    while (std::getline(stream, line)) {
        if (!line.empty()) {
            lines.push_back(line);
        }
    }
    return lines;
}

int run_prepare(const Config& config) {
    if (config.data.input_path.empty()) {
        throw std::invalid_argument("Config key 'data.input_path' is required for prepare");
    }
    std::string text = DatasetBuilder::read_text_file(config.data.input_path);
    DatasetBuilder builder(config.data.dataset_options());
    Dataset dataset = builder.build_and_save(text, config.data.data_dir);

    DatasetManifest manifest = dataset.manifest();
    std::cout << "vocab size: " << manifest.vocab_size << std::endl;
    std::cout << "train has " << manifest.train_tokens << " tokens" << std::endl;
    if (manifest.has_validation) {
        std::cout << "val has " << manifest.val_tokens << " tokens" << std::endl;
    }
    std::cout << "Wrote dataset to " << config.data.data_dir << std::endl;
    return 0;
}

int run_vocab(const Config& config) {
    if (config.data.input_path.empty()) {
        throw std::invalid_argument("Config key 'data.input_path' is required for vocab");
    }
    if (config.data.subword_vocab_path.empty()) {
        throw std::invalid_argument("Config key 'data.subword_vocab_path' is required for vocab");
    }
    std::string text = DatasetBuilder::read_text_file(config.data.input_path);

    BPETokenizer tokenizer;
    tokenizer.enable_debug_logging(config.training.verbose);
    tokenizer.train(split_lines(text), config.data.subword_vocab_size);
    if (config.training.verbose) {
        tokenizer.dump_merges();
    }
    tokenizer.save(config.data.subword_vocab_path);
    std::cout << "Saved " << tokenizer.vocab_size() << " token vocabulary to "
              << config.data.subword_vocab_path << std::endl;
    return 0;
}

int run_train(Config config, int* argc, char*** argv) {
    training::ProgressChannel channel(config.training.event_queue_capacity);

#ifdef TINYLM_WITH_MPI
    std::unique_ptr<distributed::MpiEnvironment> mpi;
    std::unique_ptr<distributed::MpiCommunicator> comm;
    if (distributed::launched_under_mpi()) {
        mpi = std::make_unique<distributed::MpiEnvironment>(argc, argv);
        comm = std::make_unique<distributed::MpiCommunicator>();
    }
    bool main_process = !comm || comm->is_main();
    auto orchestrator = comm ? std::make_unique<training::TrainingOrchestrator>(config, channel, *comm)
                             : std::make_unique<training::TrainingOrchestrator>(config, channel);
#else
    (void)argc;
    (void)argv;
    bool main_process = true;
    auto orchestrator = std::make_unique<training::TrainingOrchestrator>(config, channel);
#endif

    std::unique_ptr<training::ProgressDispatcher> dispatcher;
    if (main_process) {
        dispatcher = std::make_unique<training::ProgressDispatcher>(channel, print_event);
    }

    std::signal(SIGINT, handle_interrupt);
    orchestrator->start();
    while (!is_finished(orchestrator->state())) {
        if (g_interrupted) {
            orchestrator->cancel();
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
    training::TrainingOutcome outcome = orchestrator->wait();
    if (dispatcher) {
        dispatcher->stop();
    }

    if (main_process && channel.dropped() > 0 && config.training.verbose) {
        std::cout << channel.dropped() << " progress events were dropped" << std::endl;
    }
    if (outcome.best_val_loss && main_process) {
        std::cout << "best val loss " << *outcome.best_val_loss << std::endl;
    }

    switch (outcome.state) {
        case training::TrainingState::Completed: return 0;
        case training::TrainingState::Cancelled: return 130;
        default:
            if (outcome.error) {
                std::cerr << outcome.error->dump() << std::endl;
            }
            return 1;
    }
}

std::string checkpoint_path(const Config& config) {
    if (!config.generation.checkpoint.empty()) {
        return config.generation.checkpoint;
    }
    return CheckpointStore(config.training.output_dir).latest_path();
}

int run_eval(const Config& config) {
    training::ProgressChannel channel(config.training.event_queue_capacity);
    training::ProgressDispatcher dispatcher(channel, print_event);
    training::EvaluationRun evaluation(config, checkpoint_path(config), channel);

    std::signal(SIGINT, handle_interrupt);
    std::atomic<bool> done{false};
    std::thread watcher([&] {
        while (!done) {
            if (g_interrupted) {
                evaluation.cancel();
                return;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
    });

    training::EvaluationResult result;
    try {
        result = evaluation.run();
    } catch (const std::exception&) {
        done = true;
        watcher.join();
        dispatcher.stop();
        throw;
    }
    done = true;
    watcher.join();
    dispatcher.stop();

    std::cout << "mean val loss " << std::fixed << std::setprecision(4) << result.mean_loss << std::defaultfloat
              << " over " << result.per_seed_losses.size() << " seed(s)" << std::endl;
    return 0;
}

int run_generate(const Config& config) {
    Dataset dataset = Dataset::load(config.data.data_dir);

    ModelConfig expected = config.model;
    expected.vocab_size = dataset.tokenizer().vocab_size();

    GenerationEngine engine = GenerationEngine::from_checkpoint(checkpoint_path(config), dataset.shared_tokenizer(), expected);
    GenerationResult result = engine.generate(config.generation.prompt, config.generation.max_new_tokens,
                                              config.generation.temperature, config.generation.top_k,
                                              config.generation.seed);
    std::cout << result.text << std::endl;
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    std::string command;
    std::string config_path;
    std::vector<std::string> overrides;

    po::options_description desc("Options");
    desc.add_options()
        ("help,h", "Show this help")
        ("config,c", po::value<std::string>(&config_path), "JSON configuration file")
        ("set,s", po::value<std::vector<std::string>>(&overrides)->multitoken(),
         "Override a setting, e.g. --set training.max_steps=500")
        ("checkpoint", po::value<std::string>(), "Checkpoint to evaluate or sample from")
        ("prompt,p", po::value<std::string>(), "Prompt for generate")
        ("max-new-tokens,n", po::value<size_t>(), "Tokens to generate")
        ("temperature,t", po::value<double>(), "Sampling temperature, 0 for greedy")
        ("top-k,k", po::value<size_t>(), "Sample only from the k most likely tokens")
        ("seed", po::value<uint64_t>(), "Random seed")
        ("verbose,v", po::bool_switch(), "Log every log_interval steps")
        ("print-config", po::bool_switch(), "Print the effective configuration");

    po::options_description hidden;
    hidden.add_options()
        ("command", po::value<std::string>(&command), "prepare | vocab | train | eval | generate");

    po::options_description all;
    all.add(desc).add(hidden);
    po::positional_options_description positional;
    positional.add("command", 1);

    po::variables_map vm;
    try {
        po::store(po::command_line_parser(argc, argv).options(all).positional(positional).run(), vm);
        if (vm.count("help") || !vm.count("command")) {
            std::cout << "Usage: tinylm <prepare|vocab|train|eval|generate> [options]\n" << desc << std::endl;
            return vm.count("help") ? 0 : 1;
        }
        po::notify(vm);
    } catch (const po::error& e) {
        std::cerr << "Error: " << e.what() << "\n" << desc << std::endl;
        return 1;
    }

    try {
        Config config = config_path.empty() ? Config{} : Config::load(config_path);
        for (const auto& assignment : overrides) {
            config.apply_override(assignment);
        }
        if (vm.count("checkpoint")) config.generation.checkpoint = vm["checkpoint"].as<std::string>();
        if (vm.count("prompt")) config.generation.prompt = vm["prompt"].as<std::string>();
        if (vm.count("max-new-tokens")) config.generation.max_new_tokens = vm["max-new-tokens"].as<size_t>();
        if (vm.count("temperature")) config.generation.temperature = vm["temperature"].as<double>();
        if (vm.count("top-k")) config.generation.top_k = vm["top-k"].as<size_t>();
        if (vm.count("seed")) {
            config.training.seed = vm["seed"].as<uint64_t>();
            config.generation.seed = config.training.seed;
        }
        if (vm["verbose"].as<bool>()) config.training.verbose = true;
        config.validate();

        if (vm["print-config"].as<bool>()) {
            config.print();
        }

        if (command == "prepare") return run_prepare(config);
        if (command == "vocab") return run_vocab(config);
        if (command == "train") return run_train(config, &argc, &argv);
        if (command == "eval") return run_eval(config);
        if (command == "generate") return run_generate(config);

        std::cerr << "Unknown command '" << command << "'\n" << desc << std::endl;
        return 1;
    } catch (const Error& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        std::cerr << e.to_json().dump() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}

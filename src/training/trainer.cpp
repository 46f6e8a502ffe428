// src/training/trainer.cpp
#include "tinylm/training/trainer.hpp"
#include "tinylm/data/batch_sampler.hpp"
#include "tinylm/distributed/thread_communicator.hpp"
#include "tinylm/errors.hpp"
#include "tinylm/training/evaluator.hpp"
#include <cmath>
#include <iomanip>
#include <iostream>
#include <limits>
#include <stdexcept>

namespace tinylm {
namespace training {

namespace {

// Keeps evaluation batches apart from the training batch sequence
constexpr uint64_t kEvalSeedSalt = 0x5DEECE66DULL;

constexpr size_t kNotSaved = std::numeric_limits<size_t>::max();

nlohmann::json describe_error(const std::exception& e) {
    if (const auto* error = dynamic_cast<const Error*>(&e)) {
        return error->to_json();
    }
    return nlohmann::json{{"kind", "Internal"}, {"message", e.what()}};
}

bool all_finite(const std::vector<Eigen::MatrixXf>& tensors) {
    for (const auto& t : tensors) {
        if (!t.allFinite()) {
            return false;
        }
    }
    return true;
}

} // namespace

std::string to_string(TrainingState state) {
    switch (state) {
        case TrainingState::Idle:      return "idle";
        case TrainingState::Preparing: return "preparing";
        case TrainingState::Running:   return "running";
        case TrainingState::Completed: return "completed";
        case TrainingState::Failed:    return "failed";
        case TrainingState::Cancelled: return "cancelled";
    }
    return "idle";
}

TrainingOutcome combine_outcomes(const std::vector<TrainingOutcome>& outcomes) {
    if (outcomes.empty()) {
        throw std::invalid_argument("combine_outcomes needs at least one outcome");
    }
    const TrainingOutcome& main = outcomes.front();
    if (main.state == TrainingState::Failed) {
        return main;
    }
    for (const auto& peer : outcomes) {
        if (peer.state == TrainingState::Failed) {
            TrainingOutcome outcome = peer;
            outcome.last_checkpoint = main.last_checkpoint;
            outcome.best_val_loss = main.best_val_loss;
            return outcome;
        }
    }
    return main;
}

void TrainingOutcome::rethrow() const {
    if (exception) {
        std::rethrow_exception(exception);
    }
}

TrainingOrchestrator::TrainingOrchestrator(Config config, ProgressChannel& channel)
    : config_(std::move(config)),
      channel_(channel),
      store_(config_.training.output_dir),
      best_val_loss_(std::numeric_limits<double>::infinity()),
      last_saved_step_(kNotSaved) {}

TrainingOrchestrator::TrainingOrchestrator(Config config, ProgressChannel& channel,
                                           distributed::Communicator& communicator)
    : TrainingOrchestrator(std::move(config), channel) {
    external_comm_ = &communicator;
}

TrainingOrchestrator::~TrainingOrchestrator() {
    if (!threads_.empty()) {
        cancel();
        for (auto& thread : threads_) {
            if (thread.joinable()) {
                thread.join();
            }
        }
    }
}

const LanguageModel& TrainingOrchestrator::replica(size_t index) const {
    if (index >= workers_.size()) {
        throw std::out_of_range("No replica " + std::to_string(index));
    }
    return *workers_[index].model;
}

void TrainingOrchestrator::prepare() {
    TrainingState expected = TrainingState::Idle;
    if (!state_.compare_exchange_strong(expected, TrainingState::Preparing)) {
        throw std::logic_error("prepare() called in state " + to_string(expected));
    }

    try {
        config_.validate();
        const TrainingConfig& tc = config_.training;

        dataset_ = Dataset::load(config_.data.data_dir);
        model_config_ = config_.model;
        model_config_.vocab_size = dataset_->tokenizer().vocab_size();
        model_config_.validate();
        dataset_->require_sufficient(model_config_.block_size);
        schedule_.emplace(tc.lr_schedule());

        if (external_comm_) {
            // One worker per process; the peers live elsewhere
        } else if (tc.distributed_world_size == 1) {
            owned_comms_.push_back(std::make_unique<distributed::LocalCommunicator>());
        } else {
            owned_comms_ = distributed::make_thread_communicators(static_cast<int>(tc.distributed_world_size));
        }

        // gradient_accumulation_steps counts micro-batches across the whole group
        const size_t world_size = external_comm_ ? static_cast<size_t>(external_comm_->world_size())
                                                 : tc.distributed_world_size;
        if (tc.gradient_accumulation_steps % world_size != 0) {
            throw std::invalid_argument("Config key 'training.gradient_accumulation_steps' (" +
                                        std::to_string(tc.gradient_accumulation_steps) +
                                        ") must be divisible by the world size (" + std::to_string(world_size) + ")");
        }
        micro_steps_ = tc.gradient_accumulation_steps / world_size;
        std::cout << "Tokens per iteration: "
                  << tc.gradient_accumulation_steps * tc.batch_size * model_config_.block_size
                  << " (" << micro_steps_ << " micro-batches of " << tc.batch_size << " per worker)" << std::endl;

        LanguageModel base(model_config_, tc.seed);
        AdamOptimizer optimizer(static_cast<float>(tc.learning_rate), static_cast<float>(tc.beta1),
                                static_cast<float>(tc.beta2), 1e-8f, static_cast<float>(tc.weight_decay));

        switch (tc.init_mode) {
            case InitMode::Fresh:
                best_val_loss_ = store_.best_val_loss().value_or(std::numeric_limits<double>::infinity());
                std::cout << "Initializing a new model from scratch" << std::endl;
                break;

            case InitMode::Resume: {
                ModelCheckpoint checkpoint = CheckpointStore::load(store_.latest_path(), LoadMode::Resume, model_config_);
                base.set_parameters(std::move(checkpoint.parameters));
                optimizer = checkpoint.optimizer;
                start_step_ = checkpoint.step;
                best_val_loss_ = checkpoint.best_val_loss;
                loss_log_ = store_.load_loss_log();
                loss_log_.truncate_after(start_step_);
                last_checkpoint_ = store_.latest_path();
                last_saved_step_ = start_step_;
                std::cout << "Resuming training from " << last_checkpoint_ << " at step " << start_step_ << std::endl;
                break;
            }

            case InitMode::Pretrained: {
                ModelCheckpoint checkpoint = CheckpointStore::load(tc.pretrained_path, LoadMode::Pretrained, model_config_);
                base.set_parameters(std::move(checkpoint.parameters));
                best_val_loss_ = store_.best_val_loss().value_or(std::numeric_limits<double>::infinity());
                last_checkpoint_ = tc.pretrained_path;
                std::cout << "Initializing from pretrained weights " << tc.pretrained_path << std::endl;
                break;
            }
        }

        std::vector<distributed::Communicator*> comms;
        if (external_comm_) {
            comms.push_back(external_comm_);
        } else {
            for (auto& comm : owned_comms_) {
                comms.push_back(comm.get());
            }
        }

        workers_.clear();
        for (auto* comm : comms) {
            Worker worker;
            worker.comm = comm;
            worker.model = std::make_unique<LanguageModel>(base);
            worker.optimizer = optimizer;
            workers_.push_back(std::move(worker));
        }

        std::cout << "Model has " << base.num_parameters() << " parameters, vocabulary of "
                  << model_config_.vocab_size << " " << to_string(dataset_->tokenizer().kind()) << " tokens" << std::endl;
    } catch (const std::exception&) {
        state_ = TrainingState::Failed;
        throw;
    }
}

void TrainingOrchestrator::start() {
    if (state_ == TrainingState::Idle) {
        prepare();
    }
    TrainingState expected = TrainingState::Preparing;
    if (!state_.compare_exchange_strong(expected, TrainingState::Running)) {
        throw std::logic_error("start() called in state " + to_string(expected));
    }

    started_at_ = std::chrono::steady_clock::now();
    threads_.reserve(workers_.size());
    for (size_t i = 0; i < workers_.size(); ++i) {
        threads_.emplace_back(&TrainingOrchestrator::run_worker, this, i);
    }
}

TrainingOutcome TrainingOrchestrator::wait() {
    if (outcome_) {
        return *outcome_;
    }
    if (threads_.empty()) {
        throw std::logic_error("wait() called before start()");
    }

    for (auto& thread : threads_) {
        thread.join();
    }
    threads_.clear();

    std::vector<TrainingOutcome> outcomes;
    outcomes.reserve(workers_.size());
    for (const auto& worker : workers_) {
        outcomes.push_back(worker.outcome);
    }
    TrainingOutcome outcome = combine_outcomes(outcomes);
    state_ = outcome.state;
    outcome_ = outcome;
    return outcome;
}

TrainingOutcome TrainingOrchestrator::run() {
    start();
    return wait();
}

ProgressEvent TrainingOrchestrator::make_event(EventKind kind, size_t step) const {
    ProgressEvent event;
    event.kind = kind;
    event.step = step;
    event.max_steps = config_.training.max_steps;
    event.elapsed_seconds = std::chrono::duration<double>(std::chrono::steady_clock::now() - started_at_).count();

    const size_t done = step > start_step_ ? step - start_step_ : 0;
    const size_t remaining = config_.training.max_steps > step ? config_.training.max_steps - step : 0;
    if (done > 0) {
        event.eta_seconds = event.elapsed_seconds / static_cast<double>(done) * static_cast<double>(remaining);
    }
    return event;
}

ModelCheckpoint TrainingOrchestrator::make_checkpoint(const Worker& worker, size_t step) const {
    const TrainingConfig& tc = config_.training;

    ModelCheckpoint checkpoint;
    checkpoint.model_config = model_config_;
    checkpoint.parameters = worker.model->parameters();
    checkpoint.optimizer = worker.optimizer;
    checkpoint.step = step;
    checkpoint.best_val_loss = best_val_loss_;
    checkpoint.training.seed = tc.seed;
    checkpoint.training.learning_rate = tc.learning_rate;
    checkpoint.training.batch_size = tc.batch_size;
    checkpoint.training.world_size = static_cast<size_t>(worker.comm->world_size());
    checkpoint.training.lr_scheduler = to_string(tc.lr_scheduler);
    return checkpoint;
}

std::string TrainingOrchestrator::save_latest(const Worker& worker, size_t step) {
    if (last_saved_step_ == step && !last_checkpoint_.empty()) {
        return last_checkpoint_;
    }
    last_checkpoint_ = store_.save_latest(make_checkpoint(worker, step));
    last_saved_step_ = step;
    store_.save_loss_log(loss_log_);
    return last_checkpoint_;
}

void TrainingOrchestrator::evaluate_and_checkpoint(Worker& worker, size_t step, double lr) {
    const TrainingConfig& tc = config_.training;

    EvaluationOptions options;
    options.block_size = model_config_.block_size;
    options.batch_size = tc.batch_size;
    options.eval_iters = tc.eval_iters;
    options.seed = tc.seed;
    Evaluator evaluator(options);

    auto train_rng = BatchSampler::step_rng(tc.seed ^ kEvalSeedSalt, step, 0);
    const double train_loss = evaluator.estimate_loss(*worker.model, dataset_->train(), "train", train_rng);

    std::optional<double> val_loss;
    if (dataset_->has_validation()) {
        auto val_rng = BatchSampler::step_rng(tc.seed ^ kEvalSeedSalt, step, 1);
        val_loss = evaluator.estimate_loss(*worker.model, dataset_->validation(), "validation", val_rng);
    }

    // Weights that score non-finite never reach a checkpoint
    if (!std::isfinite(train_loss)) {
        throw NumericalInstabilityError(step, train_loss, "train loss estimate");
    }
    if (val_loss && !std::isfinite(*val_loss)) {
        throw NumericalInstabilityError(step, *val_loss, "validation loss estimate");
    }

    loss_log_.record_train(step, train_loss);
    if (val_loss) {
        loss_log_.record_val(step, *val_loss);
    }

    std::cout << "step " << step << ": train loss " << std::fixed << std::setprecision(4) << train_loss;
    if (val_loss) {
        std::cout << ", val loss " << *val_loss;
    }
    std::cout << std::defaultfloat << std::endl;

    ProgressEvent evaluation = make_event(EventKind::Evaluation, step);
    evaluation.train_loss = train_loss;
    evaluation.val_loss = val_loss;
    evaluation.learning_rate = lr;
    channel_.publish(std::move(evaluation));

    const bool improved = val_loss && *val_loss < best_val_loss_;
    if (improved) {
        best_val_loss_ = *val_loss;
    }

    ProgressEvent saved = make_event(EventKind::Checkpoint, step);
    saved.checkpoint_path = save_latest(worker, step);
    saved.message = "Saved checkpoint at step " + std::to_string(step);
    channel_.publish(std::move(saved));

    if (improved && tc.save_best_val_checkpoint) {
        ProgressEvent best = make_event(EventKind::Checkpoint, step);
        best.checkpoint_path = store_.save_best(make_checkpoint(worker, step));
        best.val_loss = val_loss;
        best.message = "New best validation loss " + std::to_string(*val_loss);
        std::cout << "Saving best checkpoint to " << best.checkpoint_path << std::endl;
        channel_.publish(std::move(best));
    }
}

void TrainingOrchestrator::finish(Worker& worker, TrainingState state, size_t step, const std::string& message,
                                  const nlohmann::json& error) {
    worker.outcome.state = state;
    worker.outcome.final_step = step;
    if (!error.is_null()) {
        worker.outcome.error = error;
    }
    if (!worker.comm->is_main()) {
        return;
    }

    worker.outcome.last_checkpoint = last_checkpoint_;
    if (std::isfinite(best_val_loss_)) {
        worker.outcome.best_val_loss = best_val_loss_;
    }

    EventKind kind = EventKind::Completed;
    if (state == TrainingState::Failed) {
        kind = EventKind::Failed;
    } else if (state == TrainingState::Cancelled) {
        kind = EventKind::Cancelled;
    }

    ProgressEvent event = make_event(kind, step);
    event.message = message;
    event.checkpoint_path = last_checkpoint_;
    if (worker.outcome.best_val_loss) {
        event.val_loss = worker.outcome.best_val_loss;
    }
    event.error = worker.outcome.error;
    channel_.publish(std::move(event));
}

void TrainingOrchestrator::run_worker(size_t index) {
    Worker& worker = workers_[index];
    distributed::Communicator& comm = *worker.comm;
    const bool main = comm.is_main();
    const TrainingConfig& tc = config_.training;
    const LrSchedule& schedule = *schedule_;

    size_t step = start_step_;
    // Set while the main worker runs code its peers do not mirror
    bool main_only = false;
    try {
        BatchSampler sampler(dataset_->train(), "train", model_config_.block_size, tc.batch_size);
        std::vector<Eigen::MatrixXf> grads;
        std::vector<Eigen::MatrixXf> micro_grads;
        auto last_log = std::chrono::steady_clock::now();

        while (true) {
            // Every worker must agree before leaving the loop
            if (comm.any(cancel_requested_.load())) {
                if (main) {
                    save_latest(worker, step);
                    std::cout << "Training cancelled at step " << step << std::endl;
                }
                finish(worker, TrainingState::Cancelled, step, "Training cancelled at step " + std::to_string(step),
                       CancellationError(step).to_json());
                break;
            }

            if (step >= tc.max_steps) {
                if (main) {
                    save_latest(worker, step);
                    std::cout << "Training complete after " << step << " steps" << std::endl;
                }
                finish(worker, TrainingState::Completed, step, "Training complete after " + std::to_string(step) + " steps");
                break;
            }

            const double lr = schedule(step);

            // Micro-batches are drawn one after another from the step's generator
            auto rng = BatchSampler::step_rng(tc.seed, step, static_cast<uint64_t>(comm.rank()));
            double local_loss = 0.0;
            for (size_t micro = 0; micro < micro_steps_; ++micro) {
                Batch batch = sampler.sample(rng);
                local_loss += worker.model->forward_backward(batch, micro == 0 ? grads : micro_grads);
                for (size_t i = 0; micro > 0 && i < grads.size(); ++i) {
                    grads[i] += micro_grads[i];
                }
            }
            if (micro_steps_ > 1) {
                const float scale = 1.0f / static_cast<float>(micro_steps_);
                for (auto& g : grads) {
                    g *= scale;
                }
                local_loss /= static_cast<double>(micro_steps_);
            }
            comm.all_reduce_mean(grads);
            const double loss = comm.all_reduce_mean(local_loss);

            // Identical on every worker after the reduction, so all of them stop together
            if (!std::isfinite(loss)) {
                throw NumericalInstabilityError(step, loss);
            }
            // A grad_clip of 0 only measures the norm
            const float norm = clip_grad_norm(grads, static_cast<float>(tc.grad_clip));
            if (!std::isfinite(norm)) {
                throw NumericalInstabilityError(step, loss, "gradient norm");
            }

            worker.optimizer.set_learning_rate(static_cast<float>(lr));
            worker.optimizer.update(worker.model->parameters(), grads);
            if (!all_finite(worker.model->parameters())) {
                throw NumericalInstabilityError(step, loss, "parameters");
            }
            ++step;

            if (!main) {
                continue;
            }
            main_only = true;

            ProgressEvent event = make_event(EventKind::Step, step);
            event.train_loss = loss;
            event.learning_rate = lr;
            channel_.publish(std::move(event));

            if (tc.verbose && step % tc.log_interval == 0) {
                auto now = std::chrono::steady_clock::now();
                double ms = std::chrono::duration<double, std::milli>(now - last_log).count() /
                            static_cast<double>(tc.log_interval);
                last_log = now;
                std::cout << "iter " << step << ": loss " << std::fixed << std::setprecision(4) << loss
                          << ", lr " << std::scientific << std::setprecision(2) << lr
                          << ", time " << std::fixed << std::setprecision(1) << ms << "ms"
                          << std::defaultfloat << std::endl;
            }

            if (step % tc.eval_interval == 0 || step == tc.max_steps) {
                evaluate_and_checkpoint(worker, step, lr);
            }

            if (tc.save_interval > 0 && step % tc.save_interval == 0) {
                ProgressEvent snapshot = make_event(EventKind::Checkpoint, step);
                snapshot.checkpoint_path = store_.save_step(make_checkpoint(worker, step));
                snapshot.message = "Saved step snapshot";
                channel_.publish(std::move(snapshot));
            }
            main_only = false;
        }
    } catch (const NumericalInstabilityError& e) {
        // Nothing is written; peers only need releasing when they did not see the failure
        if (main_only) {
            comm.abort();
        }
        std::cerr << "Error: " << e.what() << std::endl;
        finish(worker, TrainingState::Failed, step, e.what(), e.to_json());
        worker.outcome.exception = std::current_exception();
    } catch (const std::exception& e) {
        comm.abort();
        std::cerr << "Training failed on worker " << comm.rank() << ": " << e.what() << std::endl;
        finish(worker, TrainingState::Failed, step, e.what(), describe_error(e));
        worker.outcome.exception = std::current_exception();
    }

    if (index == 0) {
        state_ = worker.outcome.state;
    }
}

} // namespace training
} // namespace tinylm

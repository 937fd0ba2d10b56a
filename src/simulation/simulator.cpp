#include "simulation/simulator.hpp"
#include "simulation/thread_pool.hpp"
#include <algorithm>
#include <chrono>
#include <future>
#include <vector>

namespace duel {

DuelStatistics Simulator::simulate(
    const CombatantSpec& first,
    const CombatantSpec& second,
    ProgressCallback progress
) const {
    // Reject everything up front; no trial runs on bad input
    std::vector<std::string> problems = config_.validate();
    std::vector<std::string> matchup_problems = validate_matchup(first, second);
    problems.insert(problems.end(), matchup_problems.begin(), matchup_problems.end());
    if (!problems.empty()) {
        throw SpecError("invalid simulation", problems);
    }

    LocalStats totals = (config_.mode == ExecutionMode::Sequential)
        ? run_sequential(first, second, progress)
        : run_parallel(first, second, progress);

    return DuelStatistics::compute(totals, static_cast<u64>(config_.trials));
}

LocalStats Simulator::run_sequential(
    const CombatantSpec& first,
    const CombatantSpec& second,
    const ProgressCallback& progress
) const {
    auto start_time = std::chrono::steady_clock::now();

    const u64 total_trials = static_cast<u64>(config_.trials);
    DiceRoller dice = config_.seed ? DiceRoller(*config_.seed) : DiceRoller::from_entropy();
    DuelSimulator sim(first, second, dice, config_.tie_break);

    LocalStats stats;
    sim.run_batch(total_trials, stats);

    if (progress) {
        f64 elapsed = std::chrono::duration<f64>(std::chrono::steady_clock::now() - start_time).count();
        f64 rate = elapsed > 0.0 ? total_trials / elapsed : 0.0;
        progress(total_trials, total_trials, rate);
    }

    return stats;
}

LocalStats Simulator::run_parallel(
    const CombatantSpec& first,
    const CombatantSpec& second,
    const ProgressCallback& progress
) const {
    const u64 total_trials = static_cast<u64>(config_.trials);
    const u64 batch_size = config_.batch_size;
    const u64 num_batches = total_trials / batch_size + (total_trials % batch_size != 0);

    size_t threads = config_.worker_count ? config_.worker_count : ThreadPool::default_thread_count();
    threads = static_cast<size_t>(std::min<u64>(threads, num_batches));

    ThreadPool pool(threads);
    std::vector<std::future<LocalStats>> futures;
    futures.reserve(num_batches);

    // Batch k draws from the master stream advanced by k jumps, so the
    // result depends only on (seed, trials, batch_size)
    std::optional<DiceRoller> master;
    if (config_.seed) master.emplace(*config_.seed);

    const InitiativeTieBreak tie_break = config_.tie_break;
    auto start_time = std::chrono::steady_clock::now();

    for (u64 b = 0; b < num_batches; ++b) {
        u64 batch_trials = std::min(batch_size, total_trials - b * batch_size);

        DiceRoller stream = master ? *master : DiceRoller::from_entropy();
        if (master) master->jump();

        futures.push_back(pool.submit([&first, &second, stream, batch_trials, tie_break]() {
            LocalStats local;
            DuelSimulator sim(first, second, stream, tie_break);
            sim.run_batch(batch_trials, local);
            return local;
        }));
    }

    // Join point: partial sums are only combined here
    LocalStats totals;
    u64 done = 0;
    for (auto& future : futures) {
        LocalStats local = future.get();
        totals += local;
        done += local.trials();

        if (progress) {
            f64 elapsed = std::chrono::duration<f64>(std::chrono::steady_clock::now() - start_time).count();
            f64 rate = elapsed > 0.0 ? done / elapsed : 0.0;
            progress(done, total_trials, rate);
        }
    }

    return totals;
}

f64 estimate_win_probability(
    const CombatantSpec& first,
    const CombatantSpec& second,
    i64 trials,
    std::optional<u64> seed
) {
    SimulationConfig config;
    config.trials = trials;
    config.seed = seed;
    config.mode = seed ? ExecutionMode::Sequential : ExecutionMode::Parallel;

    Simulator sim(config);
    return sim.simulate(first, second).first_win_rate;
}

} // namespace duel
